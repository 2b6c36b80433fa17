#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "runewrap/cli/application.hpp"
#include "runewrap/common.hpp"
#include "runewrap/config/config.hpp"
#include "runewrap/wrap/wrapper.hpp"

namespace runewrap::cli {

/**
 * Command for wrapping files or standard input
 *
 * Each input is wrapped on its own; "-" (or no input at all) reads stdin.
 * Command line options override the configuration file.
 */
class WrapCommand : public Command {
public:
  explicit WrapCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

  // Expand \n, \r, \t and \\ escapes typed on the command line
  static Result<std::string> unescape(std::string_view text);

private:
  Application& app_;
  std::string name_ = "wrap";
  std::string description_ = "Wrap text files or stdin to a column width";

  // Command arguments
  std::vector<std::string> inputs_;

  // Options
  std::optional<size_t> width_;
  std::optional<std::string> first_indent_;
  std::optional<std::string> indent_;
  bool fold_ = false;
  bool no_fold_ = false;
  std::optional<size_t> tabstop_;
  std::optional<std::string> separator_;
  std::optional<size_t> chunk_size_;

  Result<config::Config> effectiveConfig() const;
  Result<std::string> wrapInput(const std::string& input, const wrap::Wrapper& wrapper,
                                size_t chunk_size) const;
};

}  // namespace runewrap::cli
