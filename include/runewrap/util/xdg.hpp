#pragma once

#include <filesystem>
#include <string>

#include "runewrap/common.hpp"

namespace runewrap::util {

// XDG Base Directory lookups for runewrap's files
class Xdg {
 public:
  // $XDG_CONFIG_HOME/runewrap, else ~/.config/runewrap
  static std::filesystem::path configHome();

  // configHome()/config.toml
  static std::filesystem::path configFile();

  // Create path and missing parents, then apply perms to path.
  // kIoError when it cannot be created or exists as a non-directory.
  static Result<void> ensureDirectory(const std::filesystem::path& path,
                                      std::filesystem::perms perms);

 private:
  static std::string getEnvVar(const std::string& name);
};

}  // namespace runewrap::util
