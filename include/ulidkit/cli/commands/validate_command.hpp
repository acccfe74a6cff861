#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "ulidkit/cli/application.hpp"

namespace ulidkit::cli {

class ValidateCommand : public Command {
public:
  explicit ValidateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "validate"; }
  std::string description() const override { return "Check that strings are well-formed ULIDs"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> values_;
  bool strict_ = false;
};

} // namespace ulidkit::cli
