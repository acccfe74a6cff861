#include "ulidkit/cli/commands/increment_command.hpp"

#include <iostream>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ulidkit::cli {

namespace {

// Output is buffered (a JSON array needs the whole run), so bound it
constexpr size_t kMaxCount = 1000000;

}  // namespace

IncrementCommand::IncrementCommand(Application& app) : app_(app) {
}

Result<int> IncrementCommand::execute(const GlobalOptions& options) {
  (void)options;

  if (count_ == 0 || count_ > kMaxCount) {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                "Count must be between 1 and " + std::to_string(kMaxCount));
  }

  auto parsed = parseUlidArgument(value_);
  if (!parsed.has_value()) {
    return std::unexpected(parsed.error());
  }

  std::vector<core::Ulid> sequence;
  sequence.reserve(count_);

  core::Ulid current = *parsed;
  for (size_t i = 0; i < count_; ++i) {
    auto next = current.increment();
    if (!next) {
      return makeErrorResult<int>(
          ErrorCode::kInvalidState,
          "Random field of " + current.toString() + " is exhausted after " + std::to_string(i) +
              " increment(s); a new timestamp is required");
    }
    current = *next;
    sequence.push_back(current);
  }

  spdlog::debug("Produced {} increment(s) of {}", sequence.size(), parsed->toString());

  if (app_.jsonOutput()) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& id : sequence) {
      result.push_back(id.toString());
    }
    std::cout << result.dump(app_.jsonIndent()) << std::endl;
    return 0;
  }

  for (const auto& id : sequence) {
    std::cout << id << std::endl;
  }
  return 0;
}

void IncrementCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("ulid", value_, "ULID to start from")->required();
  cmd->add_option("-n,--count", count_, "Number of increments to print (default 1, at most 1000000)");
}

} // namespace ulidkit::cli
