#pragma once

#include <filesystem>
#include <string_view>

#include <spdlog/common.h>

#include "runewrap/common.hpp"

namespace runewrap::util {

struct LogOptions {
  spdlog::level::level_enum level = spdlog::level::warn;
  std::filesystem::path file;  // empty: stderr only
  bool color = true;
};

// Install the default "runewrap" logger: stderr sink plus an optional
// rotating file sink (5MB files, 3 backups). Falls back to stderr only when
// the file cannot be opened.
void initializeLogging(const LogOptions& options);

// Map a level name ("trace" .. "critical", "off") to an spdlog level
Result<spdlog::level::level_enum> parseLogLevel(std::string_view name);

// Effective level from the configured name and the -v / -q flags
spdlog::level::level_enum effectiveLogLevel(spdlog::level::level_enum configured,
                                            int verbose, bool quiet);

}  // namespace runewrap::util
