#ifndef NETFS_ERROR_HPP
#define NETFS_ERROR_HPP

#include <string>

namespace netfs {

// Top level failure category, the part callers branch on
enum class ErrorKind {
  CONNECTION_ERROR,
  PROTOCOL_ERROR,
  IO_ERROR,
  VALIDATION_ERROR,
  CANCELLED
};

// Finer detail inside a kind, used for user facing messages
enum class ErrorReason {
  UNSPECIFIED,
  AUTH_FAILED,
  TIMEOUT,
  UNREACHABLE,
  DISCONNECTED,
  NOT_FOUND,
  PERMISSION_DENIED,
  QUOTA_EXCEEDED,
  UNSUPPORTED,
  DISK_FULL,
  INTERRUPTED,
  MISSING_CREDENTIALS,
  MALFORMED_URI,
  DESTINATION_EXISTS,
  NO_STRATEGY,
  SIZE_MISMATCH,
  CROSS_DEVICE
};

struct Error {
  ErrorKind kind{ErrorKind::IO_ERROR};
  ErrorReason reason{ErrorReason::UNSPECIFIED};
  std::string message;
  // Original cause as reported by the library or OS
  std::string cause;

  // Timeouts and dropped transports may succeed on a fresh session
  bool is_retryable() const;
  bool is_connection_error() const { return kind == ErrorKind::CONNECTION_ERROR; }
  std::string to_string() const;
};

const char* error_kind_to_string(ErrorKind kind);
const char* error_reason_to_string(ErrorReason reason);

Error make_error(ErrorKind kind, ErrorReason reason, std::string message, std::string cause = {});

// Maps a POSIX errno value from local disk or libsmbclient calls
Error error_from_errno(int err, const std::string& context);

} // namespace netfs

#endif // NETFS_ERROR_HPP
