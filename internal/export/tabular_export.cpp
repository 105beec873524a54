#include "tabular_export.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

#if GEOCACHE_ENABLE_ARROW

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>

#include "internal/db/model/json_fields.hpp"
#include "internal/export/arrow_utils.hpp"
#include "internal/util/time.hpp"

namespace geocache::exporter {

using db::model::GeocodeRecord;

namespace {

// ------------------------------------------------------------------
// Writing
// ------------------------------------------------------------------

/*
  Column-at-a-time table assembly. Fields are appended in schema order.
*/
class TableBuilder {
 public:
  void String(const std::string& name, const std::vector<std::string>& values) {
    arrow::StringBuilder builder;
    for (const auto& v : values) {
      Unwrap(builder.Append(v), "csv export");
    }
    Add(arrow::field(name, arrow::utf8(), false), builder);
  }

  void Int64(const std::string& name, const std::vector<std::optional<int64_t>>& values) {
    arrow::Int64Builder builder;
    for (const auto& v : values) {
      Unwrap(v ? builder.Append(*v) : builder.AppendNull(), "csv export");
    }
    Add(arrow::field(name, arrow::int64()), builder);
  }

  void Double(const std::string& name, const std::vector<std::optional<double>>& values) {
    arrow::DoubleBuilder builder;
    for (const auto& v : values) {
      Unwrap(v ? builder.Append(*v) : builder.AppendNull(), "csv export");
    }
    Add(arrow::field(name, arrow::float64()), builder);
  }

  void Bool(const std::string& name, const std::vector<bool>& values) {
    arrow::BooleanBuilder builder;
    for (const bool v : values) {
      Unwrap(builder.Append(v), "csv export");
    }
    Add(arrow::field(name, arrow::boolean(), false), builder);
  }

  std::shared_ptr<arrow::Table> Finish() const {
    return arrow::Table::Make(arrow::schema(fields_), arrays_);
  }

 private:
  void Add(std::shared_ptr<arrow::Field> field, arrow::ArrayBuilder& builder) {
    fields_.push_back(std::move(field));
    arrays_.push_back(Unwrap(builder.Finish(), "csv export"));
  }

  std::vector<std::shared_ptr<arrow::Field>> fields_;
  std::vector<std::shared_ptr<arrow::Array>> arrays_;
};

template <typename T, typename Fn>
auto Column(const std::vector<GeocodeRecord>& records, Fn&& fn) {
  std::vector<T> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(fn(r));
  }
  return out;
}

std::optional<double> Latitude(const GeocodeRecord& r) {
  return r.coordinates ? std::optional<double>(r.coordinates->latitude) : std::nullopt;
}

std::optional<double> Longitude(const GeocodeRecord& r) {
  return r.coordinates ? std::optional<double>(r.coordinates->longitude) : std::nullopt;
}

std::string JoinFlags(const std::vector<std::string>& flags) {
  std::string out;
  for (const auto& f : flags) {
    if (!out.empty()) out += ",";
    out += f;
  }
  return out;
}

void WriteTable(const arrow::Table& table, const std::string& path) {
  auto out = Unwrap(arrow::io::FileOutputStream::Open(path), "open " + path);
  Unwrap(arrow::csv::WriteCSV(table, arrow::csv::WriteOptions::Defaults(), out.get()), "write " + path);
  Unwrap(out->Close(), "close " + path);
}

// ------------------------------------------------------------------
// Reading
// ------------------------------------------------------------------

const std::vector<std::pair<std::string, std::shared_ptr<arrow::DataType>>>& RecordColumns() {
  static const std::vector<std::pair<std::string, std::shared_ptr<arrow::DataType>>> columns = {
      {"record_id", arrow::int64()},
      {"ticket_key", arrow::utf8()},
      {"record_key", arrow::utf8()},
      {"street", arrow::utf8()},
      {"intersection", arrow::utf8()},
      {"city", arrow::utf8()},
      {"county", arrow::utf8()},
      {"ticket_type", arrow::utf8()},
      {"duration", arrow::utf8()},
      {"work_type", arrow::utf8()},
      {"excavator", arrow::utf8()},
      {"latitude", arrow::float64()},
      {"longitude", arrow::float64()},
      {"confidence", arrow::float64()},
      {"technique", arrow::utf8()},
      {"approach", arrow::utf8()},
      {"rationale", arrow::utf8()},
      {"error_message", arrow::utf8()},
      {"quality_tier", arrow::utf8()},
      {"review_priority", arrow::utf8()},
      {"validation_flags", arrow::utf8()},
      {"version", arrow::int64()},
      {"supersedes_record_id", arrow::int64()},
      {"is_current", arrow::boolean()},
      {"created_at", arrow::utf8()},
      {"created_by_stage", arrow::utf8()},
      {"locked", arrow::boolean()},
      {"lock_reason", arrow::utf8()},
      {"locked_at", arrow::utf8()},
      {"locked_by", arrow::utf8()},
      {"metadata", arrow::utf8()},
      {"processing_time_ms", arrow::float64()},
  };
  return columns;
}

template <typename ArrayType>
std::shared_ptr<ArrayType> Get(const arrow::Table& table, const std::string& name) {
  auto column = table.GetColumnByName(name);
  if (!column) {
    throw util::InvalidRecord("csv import: missing column '" + name + "'");
  }
  if (column->num_chunks() != 1) {
    throw util::InvalidRecord("csv import: unexpected layout for column '" + name + "'");
  }
  return std::static_pointer_cast<ArrayType>(column->chunk(0));
}

class RowReader {
 public:
  explicit RowReader(const arrow::Table& table) : table_(table) {
  }

  std::string Str(const std::string& name, int64_t row) {
    auto a = Cached<arrow::StringArray>(name);
    return a->IsNull(row) ? std::string() : a->GetString(row);
  }

  std::optional<int64_t> I64(const std::string& name, int64_t row) {
    auto a = Cached<arrow::Int64Array>(name);
    return a->IsNull(row) ? std::nullopt : std::optional<int64_t>(a->Value(row));
  }

  std::optional<double> F64(const std::string& name, int64_t row) {
    auto a = Cached<arrow::DoubleArray>(name);
    return a->IsNull(row) ? std::nullopt : std::optional<double>(a->Value(row));
  }

  bool Bool(const std::string& name, int64_t row) {
    auto a = Cached<arrow::BooleanArray>(name);
    return !a->IsNull(row) && a->Value(row);
  }

 private:
  template <typename ArrayType>
  std::shared_ptr<ArrayType> Cached(const std::string& name) {
    auto& slot = arrays_[name];
    if (!slot) {
      slot = Get<ArrayType>(table_, name);
    }
    return std::static_pointer_cast<ArrayType>(slot);
  }

  const arrow::Table&                                   table_;
  std::map<std::string, std::shared_ptr<arrow::Array>> arrays_;
};

uint64_t ParseTimestamp(const std::string& text, const std::string& column, int64_t row) {
  try {
    return util::FromIso8601(text);
  } catch (const std::invalid_argument&) {
    throw util::InvalidRecord("csv import: row " + std::to_string(row + 1) + ": bad " + column + " '" + text + "'");
  }
}

GeocodeRecord ReadRow(RowReader& in, int64_t row) {
  GeocodeRecord r;
  const auto    id      = in.I64("record_id", row);
  const auto    version = in.I64("version", row);
  if (!id || !version || *id <= 0 || *version <= 0) {
    throw util::InvalidRecord("csv import: row " + std::to_string(row + 1) + ": record_id and version are required");
  }
  r.record_id    = static_cast<uint64_t>(*id);
  r.ticket_key   = in.Str("ticket_key", row);
  r.record_key   = in.Str("record_key", row);
  r.street       = in.Str("street", row);
  r.intersection = in.Str("intersection", row);
  r.city         = in.Str("city", row);
  r.county       = in.Str("county", row);
  r.ticket_type  = in.Str("ticket_type", row);
  r.duration     = in.Str("duration", row);
  r.work_type    = in.Str("work_type", row);
  r.excavator    = in.Str("excavator", row);

  const auto lat = in.F64("latitude", row);
  const auto lon = in.F64("longitude", row);
  if (lat && lon) {
    r.coordinates = model::Coordinates{*lat, *lon};
  }
  r.confidence    = in.F64("confidence", row);
  r.technique     = in.Str("technique", row);
  r.approach      = in.Str("approach", row);
  r.rationale     = in.Str("rationale", row);
  r.error_message = in.Str("error_message", row);

  const auto tier     = model::ParseQualityTier(in.Str("quality_tier", row));
  const auto priority = model::ParseReviewPriority(in.Str("review_priority", row));
  if (!tier || !priority) {
    throw util::InvalidRecord("csv import: row " + std::to_string(row + 1) + ": unknown quality tier or review priority");
  }
  r.quality_tier     = *tier;
  r.review_priority  = *priority;
  r.validation_flags = db::model::DecodeFlags(in.Str("validation_flags", row));

  r.version = static_cast<uint64_t>(*version);
  if (const auto supersedes = in.I64("supersedes_record_id", row)) {
    r.supersedes_record_id = static_cast<uint64_t>(*supersedes);
  }
  r.is_current       = in.Bool("is_current", row);
  r.created_at_ms    = ParseTimestamp(in.Str("created_at", row), "created_at", row);
  r.created_by_stage = in.Str("created_by_stage", row);

  r.locked      = in.Bool("locked", row);
  r.lock_reason = in.Str("lock_reason", row);
  if (const auto locked_at = in.Str("locked_at", row); !locked_at.empty()) {
    r.locked_at_ms = ParseTimestamp(locked_at, "locked_at", row);
  }
  r.locked_by = in.Str("locked_by", row);

  r.metadata           = db::model::DecodeMetadata(in.Str("metadata", row));
  r.processing_time_ms = in.F64("processing_time_ms", row);
  return r;
}

} // namespace

void WriteRecordsCsv(const std::vector<GeocodeRecord>& records, const std::string& path) {
  using R = GeocodeRecord;
  TableBuilder t;
  t.Int64("record_id", Column<std::optional<int64_t>>(records, [](const R& r) { return std::optional<int64_t>(r.record_id); }));
  t.String("ticket_key", Column<std::string>(records, [](const R& r) { return r.ticket_key; }));
  t.String("record_key", Column<std::string>(records, [](const R& r) { return r.record_key; }));
  t.String("street", Column<std::string>(records, [](const R& r) { return r.street; }));
  t.String("intersection", Column<std::string>(records, [](const R& r) { return r.intersection; }));
  t.String("city", Column<std::string>(records, [](const R& r) { return r.city; }));
  t.String("county", Column<std::string>(records, [](const R& r) { return r.county; }));
  t.String("ticket_type", Column<std::string>(records, [](const R& r) { return r.ticket_type; }));
  t.String("duration", Column<std::string>(records, [](const R& r) { return r.duration; }));
  t.String("work_type", Column<std::string>(records, [](const R& r) { return r.work_type; }));
  t.String("excavator", Column<std::string>(records, [](const R& r) { return r.excavator; }));
  t.Double("latitude", Column<std::optional<double>>(records, Latitude));
  t.Double("longitude", Column<std::optional<double>>(records, Longitude));
  t.Double("confidence", Column<std::optional<double>>(records, [](const R& r) { return r.confidence; }));
  t.String("technique", Column<std::string>(records, [](const R& r) { return r.technique; }));
  t.String("approach", Column<std::string>(records, [](const R& r) { return r.approach; }));
  t.String("rationale", Column<std::string>(records, [](const R& r) { return r.rationale; }));
  t.String("error_message", Column<std::string>(records, [](const R& r) { return r.error_message; }));
  t.String("quality_tier", Column<std::string>(records, [](const R& r) { return std::string(model::ToString(r.quality_tier)); }));
  t.String("review_priority", Column<std::string>(records, [](const R& r) { return std::string(model::ToString(r.review_priority)); }));
  t.String("validation_flags", Column<std::string>(records, [](const R& r) { return db::model::EncodeFlags(r.validation_flags); }));
  t.Int64("version", Column<std::optional<int64_t>>(records, [](const R& r) { return std::optional<int64_t>(r.version); }));
  t.Int64("supersedes_record_id", Column<std::optional<int64_t>>(records, [](const R& r) {
            return r.supersedes_record_id ? std::optional<int64_t>(*r.supersedes_record_id) : std::nullopt;
          }));
  t.Bool("is_current", Column<bool>(records, [](const R& r) { return r.is_current; }));
  t.String("created_at", Column<std::string>(records, [](const R& r) { return util::ToIso8601(r.created_at_ms); }));
  t.String("created_by_stage", Column<std::string>(records, [](const R& r) { return r.created_by_stage; }));
  t.Bool("locked", Column<bool>(records, [](const R& r) { return r.locked; }));
  t.String("lock_reason", Column<std::string>(records, [](const R& r) { return r.lock_reason; }));
  t.String("locked_at", Column<std::string>(records, [](const R& r) {
             return r.locked_at_ms ? util::ToIso8601(*r.locked_at_ms) : std::string();
           }));
  t.String("locked_by", Column<std::string>(records, [](const R& r) { return r.locked_by; }));
  t.String("metadata", Column<std::string>(records, [](const R& r) { return db::model::EncodeMetadata(r.metadata); }));
  t.Double("processing_time_ms", Column<std::optional<double>>(records, [](const R& r) { return r.processing_time_ms; }));

  WriteTable(*t.Finish(), path);
}

std::vector<GeocodeRecord> ReadRecordsCsv(const std::string& path) {
  auto input = Unwrap(arrow::io::ReadableFile::Open(path), "open " + path);

  auto read_options  = arrow::csv::ReadOptions::Defaults();
  auto parse_options = arrow::csv::ParseOptions::Defaults();
  parse_options.newlines_in_values = true;
  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  convert_options.strings_can_be_null = false;
  for (const auto& [name, type] : RecordColumns()) {
    convert_options.column_types[name] = type;
  }

  auto reader = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options),
                       "csv reader " + path);
  auto table = Unwrap(reader->Read(), "read " + path);

  std::vector<GeocodeRecord> records;
  if (table->num_rows() == 0) {
    return records;
  }
  table = Unwrap(table->CombineChunks(), "combine " + path);

  RowReader in(*table);
  records.reserve(static_cast<std::size_t>(table->num_rows()));
  for (int64_t row = 0; row < table->num_rows(); ++row) {
    records.push_back(ReadRow(in, row));
  }
  return records;
}

std::size_t ExportCurrent(cache::RecordStore& store, const std::string& path) {
  const auto records = store.Query({});
  WriteRecordsCsv(records, path);
  GEOCACHE_LOG_INFO("exported current records", {observability::StringField("path", path),
                                                 observability::IntField("records", static_cast<int64_t>(records.size()))});
  return records.size();
}

std::size_t ExportAll(cache::RecordStore& store, const std::string& path) {
  const auto records = store.ListAll();
  WriteRecordsCsv(records, path);
  GEOCACHE_LOG_INFO("exported all record versions", {observability::StringField("path", path),
                                                     observability::IntField("records", static_cast<int64_t>(records.size()))});
  return records.size();
}

std::size_t ExportReviewQueue(cache::RecordStore& store, const std::string& path, const std::set<model::ReviewPriority>& priorities) {
  const auto queue = store.ReviewQueue(priorities);

  TableBuilder t;
  t.String("ticket_key", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.ticket_key; }));
  t.String("review_priority",
           Column<std::string>(queue, [](const GeocodeRecord& r) { return std::string(model::ToString(r.review_priority)); }));
  t.String("quality_tier", Column<std::string>(queue, [](const GeocodeRecord& r) { return std::string(model::ToString(r.quality_tier)); }));
  t.Double("confidence", Column<std::optional<double>>(queue, [](const GeocodeRecord& r) { return r.confidence; }));
  t.String("validation_flags", Column<std::string>(queue, [](const GeocodeRecord& r) { return JoinFlags(r.validation_flags); }));
  t.Double("latitude", Column<std::optional<double>>(queue, Latitude));
  t.Double("longitude", Column<std::optional<double>>(queue, Longitude));
  t.String("street", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.street; }));
  t.String("intersection", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.intersection; }));
  t.String("city", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.city; }));
  t.String("county", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.county; }));
  t.String("technique", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.technique; }));
  t.String("approach", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.approach; }));
  t.String("error_message", Column<std::string>(queue, [](const GeocodeRecord& r) { return r.error_message; }));
  t.String("created_at", Column<std::string>(queue, [](const GeocodeRecord& r) { return util::ToIso8601(r.created_at_ms); }));

  WriteTable(*t.Finish(), path);
  GEOCACHE_LOG_INFO("exported review queue", {observability::StringField("path", path),
                                              observability::IntField("records", static_cast<int64_t>(queue.size()))});
  return queue.size();
}

std::size_t ImportCsv(cache::RecordStore& store, const std::string& path) {
  const auto records = ReadRecordsCsv(path);
  store.ImportRecords(records);
  return records.size();
}

} // namespace geocache::exporter

#else

namespace geocache::exporter {

namespace {

[[noreturn]] void NotEnabled() {
  throw util::ConfigurationError("tabular export requested but Arrow support is not enabled at build time");
}

} // namespace

std::size_t ExportCurrent(cache::RecordStore&, const std::string&) {
  NotEnabled();
}

std::size_t ExportAll(cache::RecordStore&, const std::string&) {
  NotEnabled();
}

std::size_t ExportReviewQueue(cache::RecordStore&, const std::string&, const std::set<model::ReviewPriority>&) {
  NotEnabled();
}

std::size_t ImportCsv(cache::RecordStore&, const std::string&) {
  NotEnabled();
}

void WriteRecordsCsv(const std::vector<db::model::GeocodeRecord>&, const std::string&) {
  NotEnabled();
}

std::vector<db::model::GeocodeRecord> ReadRecordsCsv(const std::string&) {
  NotEnabled();
}

} // namespace geocache::exporter

#endif
