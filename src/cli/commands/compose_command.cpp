#include "ulidkit/cli/commands/compose_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ulidkit/util/time.hpp"

namespace ulidkit::cli {

ComposeCommand::ComposeCommand(Application& app) : app_(app) {
}

Result<int> ComposeCommand::execute(const GlobalOptions& options) {
  (void)options;

  auto random = core::Uint128::fromHex(random_);
  if (!random.has_value()) {
    return std::unexpected(random.error());
  }

  core::Ulid id;
  if (time_ms_) {
    id = core::Ulid::fromParts(*time_ms_, *random);
    if (id.timestampMs() != *time_ms_) {
      spdlog::warn("Timestamp {} does not fit in 48 bits; truncated to {}", *time_ms_,
                   id.timestampMs());
    }
  } else if (!time_.empty()) {
    auto time_point = util::Time::fromRfc3339(time_);
    if (!time_point.has_value()) {
      return std::unexpected(time_point.error());
    }
    id = core::Ulid::fromParts(*time_point, *random);
  } else {
    return makeErrorResult<int>(ErrorCode::kInvalidArgument,
                                "One of --time-ms or --time is required");
  }

  if (id.random() != *random) {
    spdlog::warn("Random value {} does not fit in 80 bits; high bits discarded", random_);
  }

  spdlog::debug("Composed {} from time={} random=0x{}", id.toString(), id.timestampMs(),
                id.random().toHex());

  if (app_.jsonOutput()) {
    nlohmann::json result;
    result["ulid"] = id.toString();
    result["timestamp_ms"] = id.timestampMs();
    result["random"] = "0x" + id.random().toHex().substr(12);
    std::cout << result.dump(app_.jsonIndent()) << std::endl;
    return 0;
  }

  std::cout << id.toString() << std::endl;
  return 0;
}

void ComposeCommand::setupCommand(CLI::App* cmd) {
  auto* time_ms = cmd->add_option("--time-ms", time_ms_, "Milliseconds since the Unix epoch");
  auto* time = cmd->add_option("--time", time_, "RFC3339 UTC timestamp");
  time_ms->excludes(time);
  cmd->add_option("--random", random_, "Random field as hex (default 0)");
}

} // namespace ulidkit::cli
