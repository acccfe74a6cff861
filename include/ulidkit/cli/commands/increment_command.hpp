#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "ulidkit/cli/application.hpp"

namespace ulidkit::cli {

class IncrementCommand : public Command {
public:
  explicit IncrementCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "increment"; }
  std::string description() const override { return "Print the next ULIDs within the same millisecond"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string value_;
  size_t count_ = 1;
};

} // namespace ulidkit::cli
