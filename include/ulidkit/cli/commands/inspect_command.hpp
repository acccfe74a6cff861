#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "ulidkit/cli/application.hpp"

namespace ulidkit::cli {

class InspectCommand : public Command {
public:
  explicit InspectCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "inspect"; }
  std::string description() const override { return "Show every representation of a ULID"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string value_;
  bool hex_input_ = false;
};

} // namespace ulidkit::cli
