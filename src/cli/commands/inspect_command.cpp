#include "ulidkit/cli/commands/inspect_command.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ulidkit/util/time.hpp"

namespace ulidkit::cli {

namespace {

// 80-bit random field as 20 hex digits
std::string randomHex(const core::Ulid& id) {
  return id.random().toHex().substr(12);
}

std::string bytesHex(const core::Ulid::Bytes& bytes, const char* separator) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) oss << separator;
    oss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

}  // namespace

InspectCommand::InspectCommand(Application& app) : app_(app) {
}

Result<int> InspectCommand::execute(const GlobalOptions& options) {
  core::Ulid id;
  bool canonical_input = true;

  if (hex_input_) {
    auto value = core::Uint128::fromHex(value_);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    id = core::Ulid::fromUint128(*value);
  } else {
    auto parsed = parseUlidArgument(value_);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    id = *parsed;
    canonical_input = core::base32::hasCanonicalLeadingChar(value_);
  }

  spdlog::debug("Inspecting {} (input '{}')", id.toString(), value_);
  if (!canonical_input) {
    spdlog::warn("Leading character of '{}' exceeds 7; the top two bits were discarded", value_);
  }

  auto timestamp = util::Time::toRfc3339(id.timestamp());

  if (app_.jsonOutput()) {
    nlohmann::json result;
    result["ulid"] = id.toString();
    result["integer"] = "0x" + id.toUint128().toHex();
    result["timestamp_ms"] = id.timestampMs();
    result["timestamp"] = timestamp;
    result["random"] = "0x" + randomHex(id);
    result["bytes"] = bytesHex(id.toBytes(), "");
    result["nil"] = id.isNil();
    result["canonical_input"] = canonical_input;

    std::cout << result.dump(app_.jsonIndent()) << std::endl;
    return 0;
  }

  if (options.quiet) {
    std::cout << id.toString() << std::endl;
    return 0;
  }

  std::cout << "ULID:      " << id.toString() << std::endl;
  std::cout << "Integer:   0x" << id.toUint128().toHex() << std::endl;
  std::cout << "Timestamp: " << id.timestampMs() << " (" << timestamp << ")" << std::endl;
  std::cout << "Random:    0x" << randomHex(id) << std::endl;
  std::cout << "Bytes:     " << bytesHex(id.toBytes(), " ") << std::endl;
  std::cout << "Nil:       " << (id.isNil() ? "yes" : "no") << std::endl;
  if (!canonical_input) {
    std::cout << "Canonical: no (leading character above 7)" << std::endl;
  }

  return 0;
}

void InspectCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("value", value_, "ULID text (or hex integer with --hex)")->required();
  cmd->add_flag("--hex", hex_input_, "Treat the value as a 128-bit hex integer");
}

} // namespace ulidkit::cli
