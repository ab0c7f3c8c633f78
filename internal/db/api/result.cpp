#include "result.hpp"

namespace caretask::db {

const char* ToString(ErrorCode code) {
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

} // namespace caretask::db
