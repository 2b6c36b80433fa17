#include "runewrap/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "runewrap/config/config.hpp"

namespace runewrap::cli {

namespace {

nlohmann::json toJson(const config::Config& config) {
  nlohmann::json output;
  output["wrap"]["width"] = config.width;
  output["wrap"]["first_indent"] = config.first_indent;
  output["wrap"]["indent"] = config.indent;
  output["wrap"]["fold_line_breaks"] = config.fold_line_breaks;
  output["wrap"]["tabstop"] = config.tabstop;
  output["wrap"]["line_separator"] = config.line_separator;
  output["input"]["chunk_size"] = config.chunk_size;
  output["log"]["level"] = config.log_level;
  output["log"]["file"] = config.log_file.string();
  return output;
}

}  // namespace

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  cmd->add_subcommand("list", "Print the effective configuration");

  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  cmd->require_subcommand(0, 1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (get_mode_) {
    return executeGet(options.json);
  } else if (path_mode_) {
    return executePath(options.json);
  } else if (validate_mode_) {
    return executeValidate(options.json);
  }
  return executeList(options.json);
}

Result<int> ConfigCommand::executeList(bool json_output) {
  const auto& config = app_.config();

  if (json_output) {
    std::cout << toJson(config).dump(2) << "\n";
  } else {
    std::cout << config.toToml() << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeGet(bool json_output) {
  auto value = app_.config().get(key_);
  if (!value) {
    return std::unexpected(value.error());
  }

  if (json_output) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *value;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath(bool json_output) {
  const auto& loaded_from = app_.config().sourcePath();
  auto config_path = loaded_from.empty() ? config::Config::defaultConfigPath() : loaded_from;
  std::error_code ec;
  bool exists = std::filesystem::exists(config_path, ec);

  if (json_output) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration file: " << config_path.string() << "\n";
    std::cout << "Status: " << (exists ? "file exists" : "file not found (using defaults)") << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(bool json_output) {
  auto result = app_.config().validate();
  if (!result) {
    return std::unexpected(result.error());
  }

  if (json_output) {
    nlohmann::json output;
    output["valid"] = true;
    output["message"] = "Configuration is valid";
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << "Configuration is valid\n";
  }
  return 0;
}

}  // namespace runewrap::cli
