#include "result.hpp"

#include "internal/util/errors.hpp"

namespace graphflow::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfDbError(const Result& result, const std::string& what) {
  if (result) return;

  const auto msg = what + " failed (" + ErrorCodeName(result.code) + ")" + (result.message.empty() ? "" : ": " + result.message);
  if (result.Retryable()) throw util::TransactionConflict(msg);
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    default:
      throw util::PersistenceError(msg);
  }
}

} // namespace graphflow::db
