#include "ulidkit/common.hpp"

#include <sstream>

#ifndef ULIDKIT_VERSION_MAJOR
#define ULIDKIT_VERSION_MAJOR 0
#define ULIDKIT_VERSION_MINOR 1
#define ULIDKIT_VERSION_PATCH 0
#endif

namespace ulidkit {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef ULIDKIT_VERSION_BUILD
  return Version{ULIDKIT_VERSION_MAJOR, ULIDKIT_VERSION_MINOR, ULIDKIT_VERSION_PATCH,
                 ULIDKIT_VERSION_BUILD};
#else
  return Version{ULIDKIT_VERSION_MAJOR, ULIDKIT_VERSION_MINOR, ULIDKIT_VERSION_PATCH, ""};
#endif
}

}  // namespace ulidkit
