#include "core/error.hpp"
#include <cerrno>
#include <cstring>
#include <sstream>

namespace netfs {

//==============================================
// ERROR DESCRIPTION
//==============================================

bool Error::is_retryable() const {
  if (kind != ErrorKind::CONNECTION_ERROR) {
    return false;
  }
  return reason == ErrorReason::TIMEOUT || reason == ErrorReason::DISCONNECTED;
}

std::string Error::to_string() const {
  std::ostringstream out;
  out << error_kind_to_string(kind);
  if (reason != ErrorReason::UNSPECIFIED) {
    out << " (" << error_reason_to_string(reason) << ")";
  }
  out << ": " << message;
  if (!cause.empty()) {
    out << " [cause: " << cause << "]";
  }
  return out.str();
}

const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::CONNECTION_ERROR: return "Connection error";
    case ErrorKind::PROTOCOL_ERROR: return "Protocol error";
    case ErrorKind::IO_ERROR: return "I/O error";
    case ErrorKind::VALIDATION_ERROR: return "Validation error";
    case ErrorKind::CANCELLED: return "Cancelled";
    default: return "Undefined error";
  }
}

const char* error_reason_to_string(ErrorReason reason) {
  switch (reason) {
    case ErrorReason::UNSPECIFIED: return "unspecified";
    case ErrorReason::AUTH_FAILED: return "authentication failed";
    case ErrorReason::TIMEOUT: return "timeout";
    case ErrorReason::UNREACHABLE: return "host unreachable";
    case ErrorReason::DISCONNECTED: return "disconnected";
    case ErrorReason::NOT_FOUND: return "not found";
    case ErrorReason::PERMISSION_DENIED: return "permission denied";
    case ErrorReason::QUOTA_EXCEEDED: return "quota exceeded";
    case ErrorReason::UNSUPPORTED: return "unsupported";
    case ErrorReason::DISK_FULL: return "disk full";
    case ErrorReason::INTERRUPTED: return "interrupted";
    case ErrorReason::MISSING_CREDENTIALS: return "missing credentials";
    case ErrorReason::MALFORMED_URI: return "malformed URI";
    case ErrorReason::DESTINATION_EXISTS: return "destination exists";
    case ErrorReason::NO_STRATEGY: return "no transfer strategy";
    case ErrorReason::SIZE_MISMATCH: return "size mismatch";
    case ErrorReason::CROSS_DEVICE: return "cross device";
    default: return "undefined";
  }
}

Error make_error(ErrorKind kind, ErrorReason reason, std::string message, std::string cause) {
  Error error;
  error.kind = kind;
  error.reason = reason;
  error.message = std::move(message);
  error.cause = std::move(cause);
  return error;
}


//==============================================
// ERRNO MAPPING
//==============================================

Error error_from_errno(int err, const std::string& context) {
  const std::string cause = std::strerror(err);

  switch (err) {
    case ENOENT:
    case ENOTDIR:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::NOT_FOUND, context, cause);
    case EACCES:
    case EPERM:
    case EROFS:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::PERMISSION_DENIED, context, cause);
    case EDQUOT:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::QUOTA_EXCEEDED, context, cause);
    case EXDEV:
      return make_error(ErrorKind::IO_ERROR, ErrorReason::CROSS_DEVICE, context, cause);
    case ENOSPC:
      return make_error(ErrorKind::IO_ERROR, ErrorReason::DISK_FULL, context, cause);
    case EINTR:
      return make_error(ErrorKind::IO_ERROR, ErrorReason::INTERRUPTED, context, cause);
    case EEXIST:
      return make_error(ErrorKind::VALIDATION_ERROR, ErrorReason::DESTINATION_EXISTS, context, cause);
    case ETIMEDOUT:
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::TIMEOUT, context, cause);
    case ECONNREFUSED:
    case EHOSTUNREACH:
    case ENETUNREACH:
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::UNREACHABLE, context, cause);
    case ECONNRESET:
    case ENOTCONN:
    case EPIPE:
    case ECONNABORTED:
      return make_error(ErrorKind::CONNECTION_ERROR, ErrorReason::DISCONNECTED, context, cause);
    case ENOTSUP:
      return make_error(ErrorKind::PROTOCOL_ERROR, ErrorReason::UNSUPPORTED, context, cause);
    default:
      return make_error(ErrorKind::IO_ERROR, ErrorReason::UNSPECIFIED, context, cause);
  }
}

} // namespace netfs
