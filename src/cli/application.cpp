#include "runewrap/cli/application.hpp"

#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "runewrap/cli/commands/config_command.hpp"
#include "runewrap/cli/commands/wrap_command.hpp"
#include "runewrap/util/log.hpp"

namespace runewrap::cli {

Application::Application()
    : app_("runewrap", "Wrap UTF-8 text to a fixed column width") {

  app_.set_version_flag("--version", runewrap::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);
  app_.fallthrough();

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (repeat for more)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored log output");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<WrapCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  runewrap wrap -w 72 README.txt
  cat notes.txt | runewrap wrap --width 40 --indent "  "
  runewrap wrap --no-fold --separator '\r\n' letter.txt
  runewrap wrap --json -w 30 -
  runewrap config get wrap.width

For more information on a specific command, run:
  runewrap <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::debug("{} failed: {}", cmd_ptr->name(), result.error().describe());
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

void Application::reportError(const Error& error) const {
  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    output["kind"] = std::string(errorCodeToString(error.code()));
    std::cout << output.dump() << "\n";
  } else {
    std::cerr << "Error: " << error.message() << "\n";
  }
}

Result<void> Application::initializeServices() {
  if (config_) {
    return {};
  }

  // Flags decide the level until the config file has been read
  util::LogOptions log_options;
  log_options.level = util::effectiveLogLevel(spdlog::level::warn,
                                              global_options_.verbose, global_options_.quiet);
  log_options.color = !global_options_.no_color;
  util::initializeLogging(log_options);

  std::optional<std::filesystem::path> config_path;
  if (!global_options_.config_file.empty()) {
    config_path = global_options_.config_file;
  }

  auto loaded = config::Config::loadFrom(config_path);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }

  auto configured_level = util::parseLogLevel(loaded->log_level);
  if (!configured_level) {
    return std::unexpected(configured_level.error());
  }
  log_options.level = util::effectiveLogLevel(*configured_level,
                                              global_options_.verbose, global_options_.quiet);
  log_options.file = loaded->log_file;
  util::initializeLogging(log_options);

  if (!loaded->sourcePath().empty()) {
    spdlog::info("Using configuration {}", loaded->sourcePath().string());
  }

  config_ = std::move(*loaded);
  return {};
}

const config::Config& Application::config() const {
  if (!config_) {
    throw std::runtime_error("Configuration not loaded");
  }
  return *config_;
}

} // namespace runewrap::cli
