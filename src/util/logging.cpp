#include "ulidkit/util/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <vector>

namespace ulidkit::util {

namespace {

constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr size_t kMaxLogFiles = 3;                   // 3 backups
constexpr char kLoggerName[] = "ulidkit";
constexpr char kPattern[] = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

}  // namespace

Result<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return makeErrorResult<spdlog::level::level_enum>(ErrorCode::kInvalidArgument,
                                                    "Unknown log level: " + name);
}

void setupLogging(const LogOptions& options) {
  std::vector<spdlog::sink_ptr> sinks;

  if (options.color) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
  }

  std::string file_warning;
  if (!options.file.empty()) {
    try {
      if (options.file.has_parent_path()) {
        std::filesystem::create_directories(options.file.parent_path());
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file.string(), kMaxLogFileSize, kMaxLogFiles));
    } catch (const std::exception& e) {
      // Fall back to console-only logging
      file_warning = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(options.level);
  spdlog::set_default_logger(logger);

  if (!file_warning.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_warning);
  }
}

void logError(const Error& error) {
  auto code = errorCodeToString(error.code());
  if (error.isSystem()) {
    spdlog::error("[{}] {}", code, error.message());
  } else {
    spdlog::warn("[{}] {}", code, error.message());
  }
}

}  // namespace ulidkit::util
