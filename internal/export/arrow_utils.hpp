#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace geocache::exporter {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) throw util::StorageError(context + ": " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) throw util::StorageError(context + ": " + status.ToString());
}

} // namespace geocache::exporter
