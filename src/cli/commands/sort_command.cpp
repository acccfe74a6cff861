#include "ulidkit/cli/commands/sort_command.hpp"

#include <algorithm>
#include <functional>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ulidkit::cli {

namespace {

std::string trim(const std::string& line) {
  const auto first = line.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = line.find_last_not_of(" \t\r\n");
  return line.substr(first, last - first + 1);
}

}  // namespace

SortCommand::SortCommand(Application& app) : app_(app) {
}

Result<int> SortCommand::execute(const GlobalOptions& options) {
  (void)options;

  std::vector<std::string> inputs = values_;
  if (inputs.empty()) {
    std::string line;
    while (std::getline(std::cin, line)) {
      auto token = trim(line);
      if (!token.empty()) {
        inputs.push_back(std::move(token));
      }
    }
  }

  std::vector<core::Ulid> ids;
  ids.reserve(inputs.size());
  for (const auto& input : inputs) {
    auto parsed = parseUlidArgument(input);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    ids.push_back(*parsed);
  }

  if (reverse_) {
    std::sort(ids.begin(), ids.end(), std::greater<core::Ulid>());
  } else {
    std::sort(ids.begin(), ids.end());
  }

  if (unique_) {
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  }

  spdlog::debug("Sorted {} of {} input(s)", ids.size(), inputs.size());

  if (app_.jsonOutput()) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& id : ids) {
      result.push_back(id.toString());
    }
    std::cout << result.dump(app_.jsonIndent()) << std::endl;
    return 0;
  }

  for (const auto& id : ids) {
    std::cout << id << std::endl;
  }
  return 0;
}

void SortCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("values", values_, "ULIDs to sort (reads stdin when omitted)");
  cmd->add_flag("-u,--unique", unique_, "Drop duplicates");
  cmd->add_flag("-r,--reverse", reverse_, "Newest first");
}

} // namespace ulidkit::cli
