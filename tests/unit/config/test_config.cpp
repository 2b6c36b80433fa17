#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "runewrap/config/config.hpp"
#include "runewrap/util/xdg.hpp"
#include "runewrap/wrap/wrapper.hpp"
#include "test_helpers.hpp"

using namespace runewrap::config;
using namespace runewrap::test;
using runewrap::ErrorCode;

class ConfigTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    if (previous) {
      saved_xdg_ = previous;
    }
    setenv("XDG_CONFIG_HOME", (temp_dir_ / "xdg").c_str(), 1);
  }

  void TearDown() override {
    if (saved_xdg_) {
      setenv("XDG_CONFIG_HOME", saved_xdg_->c_str(), 1);
    } else {
      unsetenv("XDG_CONFIG_HOME");
    }
    TempDirTest::TearDown();
  }

  std::optional<std::string> saved_xdg_;
};

TEST_F(ConfigTest, Defaults) {
  Config config;

  EXPECT_EQ(config.width, 80u);
  EXPECT_EQ(config.tabstop, 1u);
  EXPECT_TRUE(config.fold_line_breaks);
  EXPECT_EQ(config.line_separator, "\n");
  EXPECT_EQ(config.chunk_size, 4096u);
  EXPECT_EQ(config.log_level, "warn");
  EXPECT_TRUE(config.log_file.empty());
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadAllSections) {
  auto path = createFile("config.toml", R"(
[wrap]
width = 30
first_indent = "----"
indent = "  "
fold_line_breaks = false
tabstop = 4
line_separator = "\r\n"

[input]
chunk_size = 512

[log]
level = "debug"
file = "/tmp/runewrap-test.log"
)");

  Config config;
  ASSERT_OK(config.load(path));

  EXPECT_EQ(config.width, 30u);
  EXPECT_EQ(config.first_indent, "----");
  EXPECT_EQ(config.indent, "  ");
  EXPECT_FALSE(config.fold_line_breaks);
  EXPECT_EQ(config.tabstop, 4u);
  EXPECT_EQ(config.line_separator, "\r\n");
  EXPECT_EQ(config.chunk_size, 512u);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_EQ(config.log_file, "/tmp/runewrap-test.log");
  EXPECT_EQ(config.sourcePath(), path);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
  Config config;
  ASSERT_OK(config.loadFromString("[wrap]\nwidth = 72\n"));

  EXPECT_EQ(config.width, 72u);
  EXPECT_EQ(config.tabstop, 1u);
  EXPECT_EQ(config.chunk_size, 4096u);
}

TEST_F(ConfigTest, ToWrapConfig) {
  Config config;
  ASSERT_OK(config.loadFromString(
      "[wrap]\nwidth = 30\nfirst_indent = \"----\"\nindent = \"  \"\n"));

  auto wrapper = runewrap::wrap::Wrapper::create(config.toWrapConfig());
  ASSERT_OK(wrapper);
  auto wrapped = wrapper->wrapText("one two three four five six seven eight nine");
  ASSERT_OK(wrapped);
  EXPECT_EQ(*wrapped, "----one two three four five\n  six seven eight nine");
}

TEST_F(ConfigTest, MissingExplicitFile) {
  Config config;
  EXPECT_ERROR(config.load(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
  EXPECT_ERROR(Config::loadFrom(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MissingDefaultFileUsesDefaults) {
  auto config = Config::loadFrom(std::nullopt);

  ASSERT_OK(config);
  EXPECT_EQ(config->width, 80u);
  EXPECT_TRUE(config->sourcePath().empty());
}

TEST_F(ConfigTest, DefaultFileFromXdgConfigHome) {
  EXPECT_EQ(Config::defaultConfigPath(), temp_dir_ / "xdg" / "runewrap" / "config.toml");

  std::filesystem::create_directories(temp_dir_ / "xdg" / "runewrap");
  createFile("xdg/runewrap/config.toml", "[wrap]\nwidth = 50\n");

  auto config = Config::loadFrom(std::nullopt);
  ASSERT_OK(config);
  EXPECT_EQ(config->width, 50u);
  EXPECT_EQ(config->sourcePath(), Config::defaultConfigPath());
}

TEST_F(ConfigTest, SyntaxErrorIsAParseError) {
  Config config;
  auto result = config.loadFromString("[wrap\nwidth = ", "broken.toml");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kParseError);
  EXPECT_NE(result.error().message().find("broken.toml"), std::string::npos);
}

TEST_F(ConfigTest, WrongTypesAndRanges) {
  EXPECT_ERROR(Config().loadFromString("[wrap]\nwidth = \"wide\"\n"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Config().loadFromString("[wrap]\nwidth = -3\n"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Config().loadFromString("[wrap]\nfold_line_breaks = 1\n"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Config().loadFromString("[input]\nchunk_size = 0\n"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Config().loadFromString("[log]\nlevel = \"loud\"\n"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Config().loadFromString("wrap = 3\n"), ErrorCode::kInvalidArgument);
}

TEST_F(ConfigTest, WrapOptionsAreValidated) {
  EXPECT_ERROR(Config().loadFromString("[wrap]\nwidth = 4\nindent = \"    \"\n"),
               ErrorCode::kIndentTooWide);
  EXPECT_ERROR(Config().loadFromString("[wrap]\ntabstop = 0\n"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(Config().loadFromString("[wrap]\nline_separator = \"\"\n"),
               ErrorCode::kInvalidArgument);
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
  Config config;
  ASSERT_OK(config.loadFromString("[wrap]\nwidth = 20\njustify = true\n\n[colors]\nfg = 1\n"));
  EXPECT_EQ(config.width, 20u);
}

TEST_F(ConfigTest, TomlRoundTrip) {
  Config original;
  original.width = 33;
  original.first_indent = "* ";
  original.line_separator = "\r\n";
  original.fold_line_breaks = false;
  original.log_level = "info";

  Config reloaded;
  ASSERT_OK(reloaded.loadFromString(original.toToml()));

  EXPECT_EQ(reloaded.width, 33u);
  EXPECT_EQ(reloaded.first_indent, "* ");
  EXPECT_EQ(reloaded.line_separator, "\r\n");
  EXPECT_FALSE(reloaded.fold_line_breaks);
  EXPECT_EQ(reloaded.log_level, "info");
}

TEST_F(ConfigTest, GetByDottedKey) {
  Config config;
  config.width = 64;

  auto width = config.get("wrap.width");
  ASSERT_OK(width);
  EXPECT_EQ(*width, "64");

  auto fold = config.get("wrap.fold_line_breaks");
  ASSERT_OK(fold);
  EXPECT_EQ(*fold, "true");

  EXPECT_ERROR(config.get("wrap.colour"), ErrorCode::kConfigError);

  for (const auto& key : Config::keys()) {
    EXPECT_OK(config.get(key));
  }
  EXPECT_EQ(Config::keys().size(), 9u);
}
