#include "test_helpers.hpp"

#include <fstream>
#include <random>

#include "runewrap/text/utf8.hpp"

namespace runewrap::test {

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "runewrap_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  if (std::filesystem::exists(temp_dir_)) {
    std::filesystem::remove_all(temp_dir_);
  }
}

std::filesystem::path TempDirTest::createFile(const std::string& name, std::string_view content) {
  auto file_path = temp_dir_ / name;
  std::ofstream file(file_path, std::ios::binary);
  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  return file_path;
}

ListChunkSource::ListChunkSource(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

Result<std::optional<std::string_view>> ListChunkSource::read() {
  if (next_ >= chunks_.size()) {
    return std::optional<std::string_view>{};
  }
  return std::optional<std::string_view>(chunks_[next_++]);
}

FailingChunkSource::FailingChunkSource(std::vector<std::string> chunks, ErrorCode code,
                                       std::string message)
    : chunks_(std::move(chunks)), code_(code), message_(std::move(message)) {}

Result<std::optional<std::string_view>> FailingChunkSource::read() {
  if (!exhausted_) {
    auto chunk = chunks_.read();
    if (chunk && chunk->has_value()) {
      return chunk;
    }
    exhausted_ = true;
  }
  return makeErrorResult<std::optional<std::string_view>>(code_, message_);
}

std::vector<std::string> chunked(std::string_view text, size_t size) {
  std::vector<std::string> pieces;
  for (size_t i = 0; i < text.size(); i += size) {
    pieces.emplace_back(text.substr(i, size));
  }
  return pieces;
}

std::vector<std::string> splitAt(std::string_view text, const std::vector<size_t>& offsets) {
  std::vector<std::string> pieces;
  size_t start = 0;
  for (size_t offset : offsets) {
    pieces.emplace_back(text.substr(start, offset - start));
    start = offset;
  }
  pieces.emplace_back(text.substr(start));
  return pieces;
}

std::vector<std::string> splitLines(const std::string& text, const std::string& separator) {
  std::vector<std::string> lines;
  if (text.empty()) {
    return lines;
  }
  size_t start = 0;
  while (true) {
    size_t end = text.find(separator, start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      return lines;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + separator.size();
  }
}

size_t runeCount(std::string_view text) {
  auto count = runewrap::text::Utf8::runeLength(text);
  return count ? *count : 0;
}

std::string randomText(unsigned seed, size_t words) {
  static const std::vector<std::string> vocabulary = {
      "a", "wrap", "column", "Grüße", "∀∁∂∃", "ложка", "λόγος", "数据",
      "supercalifragilisticexpialidocious", "x", "runes", "line", "break"};
  static const std::vector<std::string> gaps = {" ", "  ", "\t", "\n", " \r\n ", " ", "   "};

  std::mt19937 gen(seed);
  std::uniform_int_distribution<size_t> word_pick(0, vocabulary.size() - 1);
  std::uniform_int_distribution<size_t> gap_pick(0, gaps.size() - 1);

  std::string text;
  for (size_t i = 0; i < words; ++i) {
    if (i > 0) {
      text += gaps[gap_pick(gen)];
    }
    text += vocabulary[word_pick(gen)];
  }
  return text;
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

}  // namespace runewrap::test
