#include "ulidkit/cli/commands/validate_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ulidkit::cli {

namespace {

struct Verdict {
  bool valid = true;
  bool canonical = true;
  std::string reason;
};

Verdict check(const std::string& value, bool strict) {
  Verdict verdict;

  auto parsed = core::Ulid::fromString(value);
  if (!parsed.has_value()) {
    verdict.valid = false;
    verdict.canonical = false;
    verdict.reason = std::string(core::base32::describe(parsed.error()));
    return verdict;
  }

  // Decoding a leading digit above 7 silently drops two bits
  if (!core::base32::hasCanonicalLeadingChar(value)) {
    verdict.canonical = false;
    verdict.reason = "leading character above 7";
    if (strict) {
      verdict.valid = false;
    }
  }

  return verdict;
}

}  // namespace

ValidateCommand::ValidateCommand(Application& app) : app_(app) {
}

Result<int> ValidateCommand::execute(const GlobalOptions& options) {
  const bool strict = strict_ || app_.config().strict_leading_char;

  bool all_valid = true;
  nlohmann::json results = nlohmann::json::array();

  for (const auto& value : values_) {
    auto verdict = check(value, strict);
    all_valid = all_valid && verdict.valid;

    if (!verdict.valid) {
      spdlog::debug("Rejected '{}': {}", value, verdict.reason);
    }

    if (app_.jsonOutput()) {
      nlohmann::json entry;
      entry["input"] = value;
      entry["valid"] = verdict.valid;
      entry["canonical"] = verdict.canonical;
      if (!verdict.reason.empty()) {
        entry["reason"] = verdict.reason;
      }
      results.push_back(entry);
      continue;
    }

    if (options.quiet) {
      continue;
    }

    std::cout << value << ": ";
    if (!verdict.valid) {
      std::cout << "invalid (" << verdict.reason << ")";
    } else if (!verdict.canonical) {
      std::cout << "valid, non-canonical (" << verdict.reason << ")";
    } else {
      std::cout << "valid";
    }
    std::cout << std::endl;
  }

  if (app_.jsonOutput()) {
    nlohmann::json output;
    output["valid"] = all_valid;
    output["strict"] = strict;
    output["results"] = results;
    std::cout << output.dump(app_.jsonIndent()) << std::endl;
  }

  return all_valid ? 0 : 1;
}

void ValidateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("values", values_, "Strings to validate")->required();
  cmd->add_flag("--strict", strict_, "Reject a leading character above 7");
}

} // namespace ulidkit::cli
