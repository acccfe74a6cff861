#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <CLI/CLI.hpp>
#include "ulidkit/cli/application.hpp"

namespace ulidkit::cli {

class ComposeCommand : public Command {
public:
  explicit ComposeCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "compose"; }
  std::string description() const override { return "Build a ULID from a timestamp and random bits"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::optional<std::uint64_t> time_ms_;
  std::string time_;
  std::string random_ = "0";
};

} // namespace ulidkit::cli
