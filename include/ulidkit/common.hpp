#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace ulidkit {

// Error handling - using std::expected pattern
enum class ErrorCode {
  kSuccess = 0,
  kInvalidArgument,
  kParseError,
  kValidationError,
  kConfigError,
  kFileNotFound,
  kFileReadError,
  kInvalidState,
  kUnknownError
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// Who is expected to act on an error
enum class Audience {
  kUser,    // Presentable to the person who supplied the input
  kSystem   // Operational problem, goes to the log
};

// Error class for detailed error information
class Error {
 public:
  Error(ErrorCode code, std::string message, Audience audience = Audience::kUser)
      : code_(code), message_(std::move(message)), audience_(audience) {}

  static Error forUser(ErrorCode code, std::string message) {
    return Error(code, std::move(message), Audience::kUser);
  }

  static Error forSystem(ErrorCode code, std::string message) {
    return Error(code, std::move(message), Audience::kSystem);
  }

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  Audience audience() const { return audience_; }

  bool isUser() const { return audience_ == Audience::kUser; }
  bool isSystem() const { return audience_ == Audience::kSystem; }

  bool operator==(const Error& other) const = default;

 private:
  ErrorCode code_;
  std::string message_;
  Audience audience_;
};

// Result type alias
template <typename T>
using Result = std::expected<T, Error>;

// Convenience function for creating errors
inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

// Convenience function for creating error results
template<typename T>
inline Result<T> makeErrorResult(ErrorCode code, const std::string& message) {
  return std::unexpected(makeError(code, message));
}

// Version information
struct Version {
  int major;
  int minor;
  int patch;
  std::string build;

  std::string toString() const;
};

// Get version information
Version getVersion();

}  // namespace ulidkit
