#pragma once

#include <map>
#include <string>
#include <vector>

namespace geocache::db::model {

/*
  JSON encoding of the list/map columns.

    validation_flags -> ["low_confidence","fallback_used"]
    metadata         -> {"source":"api"}

  Empty text decodes to an empty container. Malformed text throws
  std::runtime_error.
*/

std::string EncodeFlags(const std::vector<std::string>& flags);
std::vector<std::string> DecodeFlags(const std::string& json);

std::string EncodeMetadata(const std::map<std::string, std::string>& metadata);
std::map<std::string, std::string> DecodeMetadata(const std::string& json);

} // namespace geocache::db::model
