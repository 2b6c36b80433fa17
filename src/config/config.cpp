#include "runewrap/config/config.hpp"

#include <cstdint>
#include <sstream>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "runewrap/util/log.hpp"
#include "runewrap/util/xdg.hpp"

namespace runewrap::config {

namespace {

const std::vector<std::string> kWrapKeys = {
    "width", "first_indent", "indent", "fold_line_breaks", "tabstop", "line_separator"};
const std::vector<std::string> kInputKeys = {"chunk_size"};
const std::vector<std::string> kLogKeys = {"level", "file"};

std::string dotted(std::string_view section, std::string_view key) {
  return std::string(section) + "." + std::string(key);
}

Result<void> readSize(const toml::table& data, std::string_view section, std::string_view key,
                      size_t& target) {
  auto node = data[section][key];
  if (!node) {
    return {};
  }
  if (!node.is_integer()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     dotted(section, key) + " must be an integer"));
  }
  auto value = *node.value<int64_t>();
  if (value < 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     dotted(section, key) + " must not be negative"));
  }
  target = static_cast<size_t>(value);
  return {};
}

Result<void> readString(const toml::table& data, std::string_view section, std::string_view key,
                        std::string& target) {
  auto node = data[section][key];
  if (!node) {
    return {};
  }
  if (!node.is_string()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     dotted(section, key) + " must be a string"));
  }
  target = *node.value<std::string>();
  return {};
}

Result<void> readBool(const toml::table& data, std::string_view section, std::string_view key,
                      bool& target) {
  auto node = data[section][key];
  if (!node) {
    return {};
  }
  if (!node.is_boolean()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     dotted(section, key) + " must be a boolean"));
  }
  target = *node.value<bool>();
  return {};
}

bool isKnownKey(const std::vector<std::string>& keys, std::string_view key) {
  for (const auto& known : keys) {
    if (known == key) return true;
  }
  return false;
}

// Unknown entries are ignored with a warning so newer files still load
void warnUnknownKeys(const toml::table& data, const std::string& source) {
  for (auto&& [name, node] : data) {
    const std::vector<std::string>* keys = nullptr;
    if (name == "wrap") keys = &kWrapKeys;
    else if (name == "input") keys = &kInputKeys;
    else if (name == "log") keys = &kLogKeys;

    if (!keys) {
      spdlog::warn("Ignoring unknown configuration entry '{}' in {}", name.str(), source);
      continue;
    }
    if (auto* section = node.as_table()) {
      for (auto&& [key, value] : *section) {
        if (!isKnownKey(*keys, key.str())) {
          spdlog::warn("Ignoring unknown configuration key '{}.{}' in {}",
                       name.str(), key.str(), source);
        }
      }
    }
  }
}

Result<void> apply(Config& config, const toml::table& data, const std::string& source) {
  for (std::string_view section : {"wrap", "input", "log"}) {
    auto node = data[section];
    if (node && !node.is_table()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "[" + std::string(section) + "] must be a table"));
    }
  }
  warnUnknownKeys(data, source);

  Result<void> step;
  if (!(step = readSize(data, "wrap", "width", config.width))) return step;
  if (!(step = readString(data, "wrap", "first_indent", config.first_indent))) return step;
  if (!(step = readString(data, "wrap", "indent", config.indent))) return step;
  if (!(step = readBool(data, "wrap", "fold_line_breaks", config.fold_line_breaks))) return step;
  if (!(step = readSize(data, "wrap", "tabstop", config.tabstop))) return step;
  if (!(step = readString(data, "wrap", "line_separator", config.line_separator))) return step;
  if (!(step = readSize(data, "input", "chunk_size", config.chunk_size))) return step;
  if (!(step = readString(data, "log", "level", config.log_level))) return step;

  std::string log_file = config.log_file.string();
  if (!(step = readString(data, "log", "file", log_file))) return step;
  config.log_file = log_file;

  return config.validate();
}

std::string parseErrorMessage(const toml::parse_error& e) {
  std::ostringstream message;
  message << "TOML parse error";
  if (e.source().path) {
    message << " in " << *e.source().path;
  }
  message << " at line " << e.source().begin.line << ": " << e.description();
  return message.str();
}

}  // namespace

Result<Config> Config::loadFrom(const std::optional<std::filesystem::path>& explicit_path) {
  Config config;

  if (explicit_path) {
    auto result = config.load(*explicit_path);
    if (!result) {
      return std::unexpected(result.error());
    }
    return config;
  }

  auto default_path = defaultConfigPath();
  std::error_code ec;
  if (std::filesystem::exists(default_path, ec)) {
    auto result = config.load(default_path);
    if (!result) {
      return std::unexpected(result.error());
    }
  } else {
    spdlog::debug("No configuration file at {}, using defaults", default_path.string());
  }
  return config;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  std::error_code ec;
  if (!std::filesystem::exists(config_path, ec)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());
    config_path_ = config_path;
    spdlog::debug("Loading configuration from {}", config_path.string());
    return apply(*this, config_data, config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError, parseErrorMessage(e)));
  }
}

Result<void> Config::loadFromString(std::string_view toml_text, std::string_view source_name) {
  try {
    auto config_data = toml::parse(toml_text, source_name);
    return apply(*this, config_data, std::string(source_name));
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError, parseErrorMessage(e)));
  }
}

Result<void> Config::validate() const {
  if (chunk_size == 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "input.chunk_size must be positive"));
  }

  auto level = util::parseLogLevel(log_level);
  if (!level) {
    return std::unexpected(level.error());
  }

  auto wrap_check = toWrapConfig().validate();
  if (!wrap_check) {
    return std::unexpected(wrap_check.error());
  }
  return {};
}

wrap::WrapConfig Config::toWrapConfig() const {
  wrap::WrapConfig wrap_config;
  wrap_config.column_width = width;
  wrap_config.first_row_indent = first_indent;
  wrap_config.subsequent_row_indent = indent;
  wrap_config.fold_line_breaks = fold_line_breaks;
  wrap_config.tabstop_width = tabstop;
  wrap_config.line_separator = line_separator;
  return wrap_config;
}

std::string Config::toToml() const {
  toml::table wrap_table{
      {"width", static_cast<int64_t>(width)},
      {"first_indent", first_indent},
      {"indent", indent},
      {"fold_line_breaks", fold_line_breaks},
      {"tabstop", static_cast<int64_t>(tabstop)},
      {"line_separator", line_separator},
  };
  toml::table input_table{
      {"chunk_size", static_cast<int64_t>(chunk_size)},
  };
  toml::table log_table{
      {"level", log_level},
      {"file", log_file.string()},
  };

  toml::table config_data;
  config_data.insert_or_assign("wrap", std::move(wrap_table));
  config_data.insert_or_assign("input", std::move(input_table));
  config_data.insert_or_assign("log", std::move(log_table));

  std::stringstream ss;
  ss << config_data;
  return ss.str();
}

Result<std::string> Config::get(const std::string& key) const {
  if (key == "wrap.width") return std::to_string(width);
  if (key == "wrap.first_indent") return first_indent;
  if (key == "wrap.indent") return indent;
  if (key == "wrap.fold_line_breaks") return std::string(fold_line_breaks ? "true" : "false");
  if (key == "wrap.tabstop") return std::to_string(tabstop);
  if (key == "wrap.line_separator") return line_separator;
  if (key == "input.chunk_size") return std::to_string(chunk_size);
  if (key == "log.level") return log_level;
  if (key == "log.file") return log_file.string();

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + key));
}

std::vector<std::string> Config::keys() {
  std::vector<std::string> all;
  for (const auto& key : kWrapKeys) all.push_back(dotted("wrap", key));
  for (const auto& key : kInputKeys) all.push_back(dotted("input", key));
  for (const auto& key : kLogKeys) all.push_back(dotted("log", key));
  return all;
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

}  // namespace runewrap::config
