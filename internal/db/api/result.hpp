#pragma once

#include <string>

namespace graphflow::db {

/*
  Outcome of a single repository write.

  Backends map their native failures (sqlite3 result codes, pqxx
  exceptions) onto ErrorCode so that the state store, breakpoint manager
  and trace recorder never see driver types.

  Busy, Conflict and SerializationFailure are transient: ThrowIfDbError
  raises them as util::TransactionConflict so RunInTransaction retries.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  // transient
  Conflict,
  Busy,
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,
  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool Retryable() const {
    return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ErrorCodeName(ErrorCode code);

// Throws NotFound, AlreadyExists, TransactionConflict (retryable codes) or PersistenceError.
void ThrowIfDbError(const Result& result, const std::string& what);

} // namespace graphflow::db
