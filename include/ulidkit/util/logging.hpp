#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "ulidkit/common.hpp"

namespace ulidkit::util {

struct LogOptions {
  spdlog::level::level_enum level = spdlog::level::warn;
  std::filesystem::path file;  // Empty: console only
  bool color = true;
};

// Map a level name ("trace" .. "critical", "off") to spdlog
Result<spdlog::level::level_enum> parseLogLevel(const std::string& name);

// Install the "ulidkit" logger as spdlog's default.
// Safe to call again; the previous default logger is replaced.
void setupLogging(const LogOptions& options);

// User-audience errors are logged at warn, system errors at error
void logError(const Error& error);

}  // namespace ulidkit::util
