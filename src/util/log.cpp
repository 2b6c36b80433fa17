#include "runewrap/util/log.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "runewrap/util/xdg.hpp"

namespace runewrap::util {

namespace {

constexpr const char* kLoggerName = "runewrap";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;
constexpr size_t kMaxLogFiles = 3;

spdlog::sink_ptr makeConsoleSink(bool color) {
  return std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
      color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
}

}  // namespace

void initializeLogging(const LogOptions& options) {
  std::vector<spdlog::sink_ptr> sinks = {makeConsoleSink(options.color)};
  std::string file_error;

  if (!options.file.empty()) {
    auto parent = options.file.parent_path();
    auto directory = parent.empty()
        ? Result<void>{}
        : Xdg::ensureDirectory(parent, std::filesystem::perms::owner_all);
    if (!directory) {
      file_error = directory.error().message();
    } else {
      try {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file.string(), kMaxLogFileSize, kMaxLogFiles));
      } catch (const spdlog::spdlog_ex& e) {
        file_error = e.what();
      }
    }
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(options.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging at {}: {}", options.file.string(), file_error);
  }
}

Result<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;

  return makeErrorResult<spdlog::level::level_enum>(
      ErrorCode::kInvalidArgument, "Unknown log level: " + std::string(name));
}

spdlog::level::level_enum effectiveLogLevel(spdlog::level::level_enum configured,
                                            int verbose, bool quiet) {
  if (quiet) {
    return spdlog::level::err;
  }
  if (verbose >= 3) {
    return spdlog::level::trace;
  }
  if (verbose == 2) {
    return spdlog::level::debug;
  }
  if (verbose == 1) {
    return std::min(configured, spdlog::level::info);
  }
  return configured;
}

}  // namespace runewrap::util
