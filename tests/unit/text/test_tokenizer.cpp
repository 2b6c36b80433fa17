#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "runewrap/text/tokenizer.hpp"
#include "test_helpers.hpp"

using namespace runewrap::text;
using namespace runewrap::test;
using runewrap::ErrorCode;

class TokenizerTest : public ::testing::Test {
 protected:
  // Feed chunks the way a wrap session does and collect every token
  std::vector<Token> tokenize(Tokenizer& tokenizer, const std::vector<std::string>& chunks) {
    std::vector<Token> tokens;
    std::string carry;

    for (const auto& chunk : chunks) {
      std::string input = carry + chunk;
      std::string_view rest = input;
      while (true) {
        auto step = tokenizer.scan(rest);
        EXPECT_TRUE(step.has_value());
        if (!step) return tokens;
        rest.remove_prefix(step->bytes_consumed);
        if (!step->token) break;
        tokens.push_back(std::move(*step->token));
      }
      carry.assign(rest);
    }
    EXPECT_TRUE(carry.empty());
    if (auto last = tokenizer.finish()) {
      tokens.push_back(std::move(*last));
    }
    return tokens;
  }

  // Joins word fragments so results can be compared across chunkings
  std::vector<std::string> describe(const std::vector<Token>& tokens) {
    std::vector<std::string> out;
    bool joining = false;
    for (const auto& token : tokens) {
      std::string text;
      if (token.kind == TokenKind::kWord) {
        text = "W:" + std::string(token.runes.bytes());
      } else {
        text = "S:" + std::to_string(token.width) + "/" + std::to_string(token.line_breaks);
      }
      if (joining && token.kind == TokenKind::kWord) {
        out.back() += std::string(token.runes.bytes());
      } else {
        out.push_back(text);
      }
      joining = token.kind == TokenKind::kWord && token.continues;
    }
    return out;
  }
};

TEST_F(TokenizerTest, AlternatingRuns) {
  Tokenizer tokenizer(RuneClassifier(1, true), 80);
  auto tokens = tokenize(tokenizer, {"  one two\t\tthree "});

  ASSERT_EQ(tokens.size(), 7u);
  EXPECT_EQ(tokens[0].kind, TokenKind::kWhitespace);
  EXPECT_EQ(tokens[0].width, 2u);
  EXPECT_EQ(tokens[1].runes.bytes(), "one");
  EXPECT_EQ(tokens[1].rune_count, 3u);
  EXPECT_EQ(tokens[3].runes.bytes(), "two");
  EXPECT_EQ(tokens[4].width, 2u);
  EXPECT_EQ(tokens[5].runes.bytes(), "three");
  EXPECT_EQ(tokens[6].kind, TokenKind::kWhitespace);
  EXPECT_FALSE(tokens[5].continues);
}

TEST_F(TokenizerTest, WordWidthCountsRunes) {
  Tokenizer tokenizer(RuneClassifier(1, true), 80);
  auto tokens = tokenize(tokenizer, {"\xE2\x88\x80\xE2\x88\x81\xE2\x88\x82"});  // ∀∁∂

  ASSERT_EQ(tokens.size(), 1u);
  EXPECT_EQ(tokens[0].width, 3u);
  EXPECT_EQ(tokens[0].runes.size(), 3u);
  EXPECT_EQ(tokens[0].runes.byteSize(), 9u);
}

TEST_F(TokenizerTest, WhitespaceNormalization) {
  Tokenizer folding(RuneClassifier(4, true), 80);
  auto folded = tokenize(folding, {"a \t\r\n\n b"});
  ASSERT_EQ(folded.size(), 3u);
  // space + tab(4) + one column for the \r\n\n run + space
  EXPECT_EQ(folded[1].width, 7u);
  EXPECT_EQ(folded[1].line_breaks, 0u);
  EXPECT_EQ(folded[1].rune_count, 6u);

  Tokenizer preserving(RuneClassifier(4, false), 80);
  auto preserved = tokenize(preserving, {"a \t\r\n\n b"});
  ASSERT_EQ(preserved.size(), 3u);
  EXPECT_EQ(preserved[1].width, 6u);
  EXPECT_EQ(preserved[1].line_breaks, 2u);
}

TEST_F(TokenizerTest, LongWordsArriveInFragments) {
  Tokenizer tokenizer(RuneClassifier(1, true), 4);
  auto tokens = tokenize(tokenizer, {"abcdefghij k"});

  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0].runes.bytes(), "abcd");
  EXPECT_TRUE(tokens[0].continues);
  EXPECT_EQ(tokens[1].runes.bytes(), "efgh");
  EXPECT_TRUE(tokens[1].continues);
  EXPECT_EQ(tokens[2].runes.bytes(), "ij");
  EXPECT_FALSE(tokens[2].continues);
  EXPECT_EQ(tokens[3].kind, TokenKind::kWhitespace);
  EXPECT_EQ(tokens[4].runes.bytes(), "k");
}

TEST_F(TokenizerTest, IncompleteRuneIsLeftForTheNextChunk) {
  Tokenizer tokenizer(RuneClassifier(1, true), 80);

  auto step = tokenizer.scan("ab\xE2\x88");
  ASSERT_OK(step);
  EXPECT_FALSE(step->token.has_value());
  EXPECT_EQ(step->bytes_consumed, 2u);
  EXPECT_TRUE(step->needs_more_input);
  EXPECT_EQ(tokenizer.offset(), 2u);

  auto resumed = tokenizer.scan("\xE2\x88\x80 ");
  ASSERT_OK(resumed);
  ASSERT_TRUE(resumed->token.has_value());
  EXPECT_EQ(resumed->token->runes.bytes(), "ab\xE2\x88\x80");
  EXPECT_EQ(resumed->bytes_consumed, 3u);
}

TEST_F(TokenizerTest, TokensDoNotDependOnChunking) {
  const std::string text = randomText(7, 60);

  Tokenizer whole(RuneClassifier(2, false), 5);
  auto expected = describe(tokenize(whole, {text}));

  for (size_t size : {1u, 2u, 3u, 5u, 13u}) {
    Tokenizer tokenizer(RuneClassifier(2, false), 5);
    EXPECT_EQ(describe(tokenize(tokenizer, chunked(text, size))), expected)
        << "chunk size " << size;
  }
}

TEST_F(TokenizerTest, MalformedInputReportsAbsoluteOffset) {
  Tokenizer tokenizer(RuneClassifier(1, true), 80);

  auto first = tokenizer.scan("hello");
  ASSERT_OK(first);
  EXPECT_EQ(tokenizer.offset(), 5u);

  auto bad = tokenizer.scan("wo\x80rld");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().code(), ErrorCode::kDecodingError);
  EXPECT_NE(bad.error().message().find("byte 7"), std::string::npos);
}

TEST_F(TokenizerTest, FinishWithoutPendingRun) {
  Tokenizer tokenizer(RuneClassifier(1, true), 80);

  EXPECT_FALSE(tokenizer.finish().has_value());

  auto step = tokenizer.scan("");
  ASSERT_OK(step);
  EXPECT_FALSE(step->token.has_value());
  EXPECT_EQ(step->bytes_consumed, 0u);
  EXPECT_FALSE(tokenizer.finish().has_value());
}

TEST_F(TokenizerTest, ResetForgetsPendingRun) {
  Tokenizer tokenizer(RuneClassifier(1, true), 80);

  ASSERT_OK(tokenizer.scan("pending"));
  tokenizer.reset();

  EXPECT_EQ(tokenizer.offset(), 0u);
  EXPECT_FALSE(tokenizer.finish().has_value());
}
