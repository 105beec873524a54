#pragma once

#include <string>

namespace geocache::util {

// Lowercase hex SHA-256 of `data`.
std::string Sha256Hex(const std::string& data);

/*
  Content key of a ticket's location inputs.

  SHA-256 of "STREET|INTERSECTION|CITY|COUNTY" after upper-casing, so
  tickets describing the same place share a key regardless of ticket number.
*/
std::string RecordKey(const std::string& street, const std::string& intersection, const std::string& city, const std::string& county);

std::string ToUpper(std::string value);

} // namespace geocache::util
