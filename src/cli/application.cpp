#include "ulidkit/cli/application.hpp"

#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ulidkit/util/logging.hpp"

// Command includes
#include "ulidkit/cli/commands/inspect_command.hpp"
#include "ulidkit/cli/commands/compose_command.hpp"
#include "ulidkit/cli/commands/increment_command.hpp"
#include "ulidkit/cli/commands/validate_command.hpp"
#include "ulidkit/cli/commands/sort_command.hpp"

namespace ulidkit::cli {

Application::Application()
    : app_("ulidkit", "Inspect, compose and validate ULIDs")
    , services_initialized_(false) {

  // Set up the application
  app_.set_version_flag("--version", ulidkit::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (repeat for trace)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored log output");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<InspectCommand>(*this));
  registerCommand(std::make_unique<ComposeCommand>(*this));
  registerCommand(std::make_unique<IncrementCommand>(*this));
  registerCommand(std::make_unique<ValidateCommand>(*this));
  registerCommand(std::make_unique<SortCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  ulidkit inspect 01ARZ3NDEKTSV4RRFFQ69G5FAV
  ulidkit inspect --hex 0x0155f1cdb47ced3c962b5ff3da82fcb7
  ulidkit compose --time 2024-01-01T00:00:00Z --random 0xdeadbeef
  ulidkit increment 01BX5ZZKBKAZZZZZZZZZZZZZZZ -n 3
  ulidkit validate --strict 7ZZZZZZZZZZZZZZZZZZZZZZZZZ 8ZZZZZZZZZZZZZZZZZZZZZZZZZ
  cat ids.txt | ulidkit sort --unique

For more information on a specific command, run:
  ulidkit <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    spdlog::debug("Running command '{}'", cmd_ptr->name());
    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      util::logError(result.error());
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  config::Config config;
  if (!global_options_.config_file.empty()) {
    auto load_result = config.load(global_options_.config_file);
    if (!load_result.has_value()) {
      return std::unexpected(load_result.error());
    }
  } else {
    auto default_result = config::Config::loadDefault();
    if (!default_result.has_value()) {
      return std::unexpected(default_result.error());
    }
    config = std::move(*default_result);
  }

  util::LogOptions log_options;
  auto level = util::parseLogLevel(config.log_level);
  if (level.has_value()) {
    log_options.level = *level;
  }
  if (global_options_.verbose >= 2) {
    log_options.level = spdlog::level::trace;
  } else if (global_options_.verbose == 1) {
    log_options.level = spdlog::level::debug;
  } else if (global_options_.quiet) {
    log_options.level = spdlog::level::err;
  }
  log_options.file = config.resolvedLogFile();
  log_options.color = !global_options_.no_color;
  util::setupLogging(log_options);

  if (config.loadedFrom()) {
    spdlog::debug("Loaded config from {}", config.loadedFrom()->string());
  }

  config_ = std::move(config);
  services_initialized_ = true;
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

const config::Config& Application::config() const {
  if (!config_) {
    throw std::runtime_error("Services not initialized");
  }
  return *config_;
}

bool Application::jsonOutput() const {
  if (global_options_.json) {
    return true;
  }
  return config_ && config_->output_format == config::Config::OutputFormat::kJson;
}

int Application::jsonIndent() const {
  return config_ ? config_->json_indent : 2;
}

void Application::reportError(const Error& error) const {
  if (jsonOutput()) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    output["kind"] = std::string(errorCodeToString(error.code()));
    std::cout << output.dump(jsonIndent()) << std::endl;
  } else {
    std::cerr << "Error: " << error.message() << std::endl;
  }
}

Result<core::Ulid> parseUlidArgument(const std::string& text) {
  auto parsed = core::Ulid::fromString(text);
  if (!parsed.has_value()) {
    return std::unexpected(core::base32::toError(parsed.error(), text));
  }
  return *parsed;
}

} // namespace ulidkit::cli
