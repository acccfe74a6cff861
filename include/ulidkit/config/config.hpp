#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "ulidkit/common.hpp"

namespace ulidkit::config {

// Configuration for the ulidkit tool
class Config {
 public:
  // Default constructor holds built-in defaults only
  Config() = default;

  // Output configuration
  enum class OutputFormat {
    kText,
    kJson
  };
  OutputFormat output_format = OutputFormat::kText;
  int json_indent = 2;

  // Logging configuration
  std::string log_level = "warn";   // spdlog level name
  std::filesystem::path log_file;   // Empty disables the file sink

  // Validation configuration
  bool strict_leading_char = false; // Reject a first character above '7'

  // Load settings from a TOML file, overriding current values
  Result<void> load(const std::filesystem::path& config_path);

  // Defaults, overlaid with the default config file when one exists
  static Result<Config> loadDefault();

  // Validate configuration
  Result<void> validate() const;

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  // Log file with relative paths resolved against the XDG state directory
  std::filesystem::path resolvedLogFile() const;

  const std::optional<std::filesystem::path>& loadedFrom() const { return config_path_; }

  // Convert enum values to/from strings
  static Result<OutputFormat> stringToOutputFormat(const std::string& str);
  static std::string outputFormatToString(OutputFormat format);

 private:
  std::optional<std::filesystem::path> config_path_;
};

}  // namespace ulidkit::config
