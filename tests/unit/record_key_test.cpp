#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using geocache::util::RecordKey;

void TestSha256KnownVector() {
  assert(geocache::util::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestRecordKeyIsCaseInsensitive() {
  const auto key = RecordKey("Main St", "Oak Ave", "Kermit", "Winkler");
  assert(key.size() == 64);
  assert(key == RecordKey("MAIN ST", "oak ave", "KERMIT", "winkler"));
  assert(key == geocache::util::Sha256Hex("MAIN ST|OAK AVE|KERMIT|WINKLER"));
}

void TestRecordKeyDistinguishesFields() {
  // the separator keeps shifted field boundaries apart
  assert(RecordKey("A", "B", "C", "D") != RecordKey("A|B", "", "C", "D"));
  assert(RecordKey("Main St", "Oak Ave", "Kermit", "Winkler") != RecordKey("Oak Ave", "Main St", "Kermit", "Winkler"));
  assert(RecordKey("Main St", "", "Kermit", "Winkler") != RecordKey("Main St", "", "Pyote", "Ward"));
}

void TestIso8601() {
  using geocache::util::FromIso8601;
  using geocache::util::ToIso8601;

  assert(ToIso8601(0) == "1970-01-01T00:00:00.000Z");
  assert(ToIso8601(1709294400250ULL) == "2024-03-01T12:00:00.250Z");
  assert(FromIso8601("2024-03-01T12:00:00.250Z") == 1709294400250ULL);

  const auto now = geocache::util::NowMillis();
  assert(FromIso8601(ToIso8601(now)) == now);

  bool threw = false;
  try {
    (void)FromIso8601("yesterday");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRunIdsAreUuid4() {
  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    const auto id = geocache::util::GenerateRunId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    seen.insert(id);
  }
  assert(seen.size() == 100);
}

} // namespace

int main() {
  TestSha256KnownVector();
  TestRecordKeyIsCaseInsensitive();
  TestRecordKeyDistinguishesFields();
  TestIso8601();
  TestRunIdsAreUuid4();

  std::cout << "geocache_unit_record_key: pass\n";
  return 0;
}
