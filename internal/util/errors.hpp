#pragma once

#include <stdexcept>
#include <string>

namespace geocache::util {

/*
  Central error types.

  Repository backends report db::Result codes; the record store and the
  pipeline translate them into these exceptions.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidRecord : public std::runtime_error {
 public:
  explicit InvalidRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Append refused because the current version is human-locked.
class RecordLocked : public std::runtime_error {
 public:
  explicit RecordLocked(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Optimistic commit lost against a concurrent writer; safe to retry.
class TransactionConflict : public StorageError {
 public:
  explicit TransactionConflict(const std::string& msg) : StorageError(msg) {
  }
};

// Thrown by a stage when its technique cannot resolve a ticket.
class StageFailure : public std::runtime_error {
 public:
  explicit StageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace geocache::util
