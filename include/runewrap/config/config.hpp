#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "runewrap/common.hpp"
#include "runewrap/wrap/chunk_source.hpp"
#include "runewrap/wrap/wrap_config.hpp"

namespace runewrap::config {

// Configuration for the runewrap command line tool
class Config {
 public:
  // Built-in defaults, nothing loaded
  Config() = default;

  // [wrap]
  size_t width = wrap::WrapConfig::kDefaultColumnWidth;
  std::string first_indent;
  std::string indent;
  bool fold_line_breaks = true;
  size_t tabstop = wrap::WrapConfig::kDefaultTabstopWidth;
  std::string line_separator = "\n";

  // [input]
  size_t chunk_size = wrap::ChunkSource::kDefaultChunkSize;

  // [log]
  std::string log_level = "warn";
  std::filesystem::path log_file;

  // Load the explicit file when given (it must exist), otherwise the default
  // location when a file is present there, otherwise built-in defaults
  static Result<Config> loadFrom(const std::optional<std::filesystem::path>& explicit_path);

  // Load configuration from file, overriding the values it names
  Result<void> load(const std::filesystem::path& config_path);

  // Same as load() for TOML text already in memory
  Result<void> loadFromString(std::string_view toml_text, std::string_view source_name = "<string>");

  // Validate configuration
  Result<void> validate() const;

  // Wrap options carried by this configuration
  wrap::WrapConfig toWrapConfig() const;

  // Effective configuration rendered as TOML
  std::string toToml() const;

  // Get a value using dot notation ("wrap.width")
  Result<std::string> get(const std::string& key) const;

  // Every key accepted by get(), in file order
  static std::vector<std::string> keys();

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  // File this configuration was loaded from (empty for defaults)
  const std::filesystem::path& sourcePath() const { return config_path_; }

 private:
  std::filesystem::path config_path_;
};

}  // namespace runewrap::config
