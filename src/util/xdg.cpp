#include "runewrap/util/xdg.hpp"

#include <cstdlib>
#include <system_error>

namespace runewrap::util {

std::filesystem::path Xdg::configHome() {
  if (auto xdg_config_home = getEnvVar("XDG_CONFIG_HOME"); !xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "runewrap";
  }
  if (auto home = getEnvVar("HOME"); !home.empty()) {
    return std::filesystem::path(home) / ".config" / "runewrap";
  }
  return std::filesystem::current_path() / ".runewrap_config";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

Result<void> Xdg::ensureDirectory(const std::filesystem::path& path,
                                  std::filesystem::perms perms) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return {};
  }
  if (std::filesystem::exists(path, ec)) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Not a directory: " + path.string());
  }

  std::filesystem::create_directories(path, ec);
  if (ec) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Cannot create directory " + path.string() + ": " + ec.message());
  }
  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return makeErrorResult<void>(ErrorCode::kIoError,
                                 "Cannot set permissions on " + path.string() + ": " + ec.message());
  }
  return {};
}

std::string Xdg::getEnvVar(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : std::string();
}

}  // namespace runewrap::util
