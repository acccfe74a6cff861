#include "ulidkit/config/config.hpp"

#include <toml++/toml.hpp>

#include "ulidkit/util/logging.hpp"
#include "ulidkit/util/xdg.hpp"

namespace ulidkit::config {

namespace {

constexpr int kMaxJsonIndent = 8;

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(Error::forSystem(ErrorCode::kConfigError,
                                            "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Output
    if (auto output_table = config_data["output"].as_table()) {
      if (auto value = (*output_table)["format"].value<std::string>()) {
        auto format = stringToOutputFormat(*value);
        if (!format.has_value()) {
          return std::unexpected(format.error());
        }
        output_format = *format;
      }
      if (auto value = (*output_table)["json_indent"].value<int64_t>()) {
        if (*value < 0 || *value > kMaxJsonIndent) {
          return std::unexpected(Error::forSystem(
              ErrorCode::kConfigError,
              "output.json_indent must be between 0 and " + std::to_string(kMaxJsonIndent)));
        }
        json_indent = static_cast<int>(*value);
      }
    }

    // Logging
    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        log_level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        log_file = *value;
      }
    }

    // Validation
    if (auto validate_table = config_data["validate"].as_table()) {
      if (auto value = (*validate_table)["strict_leading_char"].value<bool>()) {
        strict_leading_char = *value;
      }
    }

    config_path_ = config_path;
    return validate();

  } catch (const toml::parse_error& e) {
    return std::unexpected(Error::forSystem(ErrorCode::kConfigError,
                                            "TOML parse error: " + std::string(e.what())));
  }
}

Result<Config> Config::loadDefault() {
  Config config;

  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = config.load(default_path);
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
  }

  return config;
}

Result<void> Config::validate() const {
  if (json_indent < 0 || json_indent > kMaxJsonIndent) {
    return std::unexpected(Error::forSystem(
        ErrorCode::kConfigError,
        "output.json_indent must be between 0 and " + std::to_string(kMaxJsonIndent)));
  }

  auto level = util::parseLogLevel(log_level);
  if (!level.has_value()) {
    return std::unexpected(Error::forSystem(ErrorCode::kConfigError,
                                            "logging.level: " + level.error().message()));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

std::filesystem::path Config::resolvedLogFile() const {
  if (log_file.empty() || log_file.is_absolute()) {
    return log_file;
  }
  return util::Xdg::stateHome() / log_file;
}

Result<Config::OutputFormat> Config::stringToOutputFormat(const std::string& str) {
  if (str == "text") return OutputFormat::kText;
  if (str == "json") return OutputFormat::kJson;
  return std::unexpected(Error::forSystem(ErrorCode::kConfigError,
                                          "Unknown output format: " + str));
}

std::string Config::outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::kText: return "text";
    case OutputFormat::kJson: return "json";
  }
  return "text";
}

}  // namespace ulidkit::config
