#include "runewrap/cli/commands/wrap_command.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "runewrap/wrap/chunk_source.hpp"

namespace runewrap::cli {

namespace {

constexpr const char* kStdinName = "-";

nlohmann::json splitLines(const std::string& wrapped, const std::string& separator) {
  nlohmann::json lines = nlohmann::json::array();
  if (wrapped.empty()) {
    return lines;
  }

  size_t start = 0;
  while (true) {
    size_t end = wrapped.find(separator, start);
    if (end == std::string::npos) {
      lines.push_back(wrapped.substr(start));
      break;
    }
    lines.push_back(wrapped.substr(start, end - start));
    start = end + separator.size();
  }
  return lines;
}

}  // namespace

WrapCommand::WrapCommand(Application& app) : app_(app) {}

void WrapCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("inputs", inputs_, "Files to wrap (\"-\" or none for stdin)");

  cmd->add_option("-w,--width", width_, "Column width in runes, indent included")
      ->check(CLI::PositiveNumber);
  cmd->add_option("--first-indent", first_indent_, "Indent of the first line");
  cmd->add_option("--indent", indent_, "Indent of every following line");
  auto* fold = cmd->add_flag("--fold", fold_, "Fold line breaks into spaces");
  auto* no_fold = cmd->add_flag("--no-fold", no_fold_,
                                "Keep line breaks instead of folding them into spaces");
  fold->excludes(no_fold);
  cmd->add_option("--tabstop", tabstop_, "Columns per tab")
      ->check(CLI::PositiveNumber);
  cmd->add_option("--separator", separator_, "Line separator (accepts \\n, \\r, \\t escapes)");
  cmd->add_option("--chunk-size", chunk_size_, "Read size in bytes")
      ->check(CLI::PositiveNumber);
}

Result<int> WrapCommand::execute(const GlobalOptions& options) {
  auto config = effectiveConfig();
  if (!config) {
    return std::unexpected(config.error());
  }

  auto wrapper = wrap::Wrapper::create(config->toWrapConfig());
  if (!wrapper) {
    return std::unexpected(wrapper.error());
  }

  std::vector<std::string> inputs = inputs_;
  if (inputs.empty()) {
    inputs.push_back(kStdinName);
  }

  nlohmann::json wrapped_inputs = nlohmann::json::array();
  for (const auto& input : inputs) {
    auto wrapped = wrapInput(input, *wrapper, config->chunk_size);
    if (!wrapped) {
      return std::unexpected(wrapped.error());
    }

    if (options.json) {
      nlohmann::json entry;
      entry["source"] = input == kStdinName ? std::string("<stdin>") : input;
      entry["lines"] = splitLines(*wrapped, config->line_separator);
      wrapped_inputs.push_back(std::move(entry));
    } else if (!wrapped->empty()) {
      std::cout << *wrapped << config->line_separator;
    }
  }

  if (options.json) {
    nlohmann::json output;
    output["width"] = config->width;
    output["inputs"] = std::move(wrapped_inputs);
    std::cout << output.dump(2) << "\n";
  }
  std::cout.flush();
  return 0;
}

Result<std::string> WrapCommand::unescape(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '\\') {
      result.push_back(text[i]);
      continue;
    }
    if (i + 1 == text.size()) {
      return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                          "Trailing backslash in \"" + std::string(text) + "\"");
    }
    switch (text[++i]) {
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case '\\': result.push_back('\\'); break;
      default:
        return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
            "Unknown escape \\" + std::string(1, text[i]) + " in \"" + std::string(text) + "\"");
    }
  }
  return result;
}

Result<config::Config> WrapCommand::effectiveConfig() const {
  config::Config config = app_.config();

  if (width_) config.width = *width_;
  if (tabstop_) config.tabstop = *tabstop_;
  if (chunk_size_) config.chunk_size = *chunk_size_;
  if (fold_) config.fold_line_breaks = true;
  if (no_fold_) config.fold_line_breaks = false;

  if (first_indent_) {
    auto value = unescape(*first_indent_);
    if (!value) return std::unexpected(value.error());
    config.first_indent = *value;
  }
  if (indent_) {
    auto value = unescape(*indent_);
    if (!value) return std::unexpected(value.error());
    config.indent = *value;
  }
  if (separator_) {
    auto value = unescape(*separator_);
    if (!value) return std::unexpected(value.error());
    config.line_separator = *value;
  }

  auto valid = config.validate();
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return config;
}

Result<std::string> WrapCommand::wrapInput(const std::string& input, const wrap::Wrapper& wrapper,
                                           size_t chunk_size) const {
  if (input == kStdinName) {
    wrap::IstreamChunkSource source(std::cin, "<stdin>", chunk_size);
    return wrapper.wrapFromStream(source);
  }

  std::filesystem::path path(input);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return makeErrorResult<std::string>(ErrorCode::kFileNotFound,
                                        "Input file not found: " + input);
  }
  if (std::filesystem::is_directory(path, ec)) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                        "Input is a directory: " + input);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return makeErrorResult<std::string>(ErrorCode::kIoError, "Cannot open input file: " + input);
  }

  spdlog::info("Wrapping {} at width {}", input, wrapper.config().column_width);
  wrap::IstreamChunkSource source(in, input, chunk_size);
  return wrapper.wrapFromStream(source);
}

}  // namespace runewrap::cli
