#pragma once

#include <string>

#include "runewrap/cli/application.hpp"
#include "runewrap/common.hpp"

namespace runewrap::cli {

/**
 * Command for inspecting configuration
 *
 * Subcommands:
 * - list: Print the effective configuration (default)
 * - get <key>: Get one configuration value
 * - path: Show configuration file path
 * - validate: Validate current configuration
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "config";
  std::string description_ = "Show configuration settings";

  // Subcommand flags
  bool get_mode_ = false;
  bool path_mode_ = false;
  bool validate_mode_ = false;

  // Command arguments
  std::string key_;

  Result<int> executeList(bool json_output);
  Result<int> executeGet(bool json_output);
  Result<int> executePath(bool json_output);
  Result<int> executeValidate(bool json_output);
};

}  // namespace runewrap::cli
