#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/cache/record_store.hpp"
#include "internal/db/model/geocode_record.hpp"

namespace geocache::exporter {

/*
  Flat CSV export and re-import of geocode records (Apache Arrow CSV).

  One row per record version with every persisted field. Coordinates and
  confidence are numeric columns left empty when absent; timestamps are
  ISO-8601 UTC; validation flags and metadata are JSON text.

  Import expects a full version set (ExportAll); a current-only export
  is not a complete version chain.
*/

// Returns the number of rows written.
std::size_t ExportCurrent(cache::RecordStore& store, const std::string& path);
std::size_t ExportAll(cache::RecordStore& store, const std::string& path);

// Human review queue, most urgent first.
std::size_t ExportReviewQueue(cache::RecordStore& store, const std::string& path,
                              const std::set<model::ReviewPriority>& priorities = cache::RecordStore::DefaultReviewPriorities());

// Reads a file written by ExportAll and stores it; returns the number of records.
std::size_t ImportCsv(cache::RecordStore& store, const std::string& path);

void                                  WriteRecordsCsv(const std::vector<db::model::GeocodeRecord>& records, const std::string& path);
std::vector<db::model::GeocodeRecord> ReadRecordsCsv(const std::string& path);

} // namespace geocache::exporter
