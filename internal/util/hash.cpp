#include "hash.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>

namespace geocache::util {

std::string Sha256Hex(const std::string& data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(SHA256_DIGEST_LENGTH * 2);
  for (unsigned char byte : digest) {
    out.push_back(kHex[(byte >> 4) & 0x0F]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::string RecordKey(const std::string& street, const std::string& intersection, const std::string& city, const std::string& county) {
  return Sha256Hex(ToUpper(street + "|" + intersection + "|" + city + "|" + county));
}

} // namespace geocache::util
