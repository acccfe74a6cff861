#pragma once

#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "ulidkit/cli/application.hpp"

namespace ulidkit::cli {

class SortCommand : public Command {
public:
  explicit SortCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "sort"; }
  std::string description() const override { return "Sort ULIDs (arguments or stdin) by time, then randomness"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::vector<std::string> values_;
  bool unique_ = false;
  bool reverse_ = false;
};

} // namespace ulidkit::cli
