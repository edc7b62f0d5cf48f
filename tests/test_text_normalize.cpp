/**
 * @file test_text_normalize.cpp
 * @brief Unit tests for word normalization and lyrics parsing
 */

#include "align_errors.h"
#include "text_normalize.h"

#include <gtest/gtest.h>

// ============================================================
// normalize_word
// ============================================================

TEST(NormalizeWordTest, LowercasesAndStripsPunctuation) {
  EXPECT_EQ(normalize_word("Hello,"), "hello");
  EXPECT_EQ(normalize_word("  Don't! "), "dont");
  EXPECT_EQ(normalize_word("(Tree)"), "tree");
  EXPECT_EQ(normalize_word("R2-D2"), "r2d2");
}

TEST(NormalizeWordTest, FoldsNonAsciiCapitals) {
  EXPECT_EQ(normalize_word("\xC3\x89" "COLE"), "\xC3\xA9" "cole");  // ÉCOLE -> école
  EXPECT_EQ(normalize_word("\xD0\x9C\xD0\x98\xD0\xA0"), "\xD0\xBC\xD0\xB8\xD1\x80");  // МИР -> мир
}

TEST(NormalizeWordTest, StripsUnicodePunctuation) {
  EXPECT_EQ(normalize_word("\xE2\x80\x9Cyes\xE2\x80\x9D"), "yes");  // curly quotes
  EXPECT_EQ(normalize_word("wait\xE2\x80\xA6"), "wait");             // ellipsis
  EXPECT_EQ(normalize_word("\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x82"), "\xE4\xBD\xA0\xE5\xA5\xBD");  // 你好。
}

TEST(NormalizeWordTest, UnknownScriptsPassThrough) {
  EXPECT_EQ(normalize_word("\xE4\xBD\xA0\xE5\xA5\xBD"), "\xE4\xBD\xA0\xE5\xA5\xBD");
  EXPECT_EQ(normalize_word("\xE3\x81\x82\xE3\x82\xA2"), "\xE3\x81\x82\xE3\x82\xA2");  // あア
}

TEST(NormalizeWordTest, PunctuationOnlyBecomesEmpty) {
  EXPECT_EQ(normalize_word("..."), "");
  EXPECT_EQ(normalize_word("-"), "");
  EXPECT_EQ(normalize_word(""), "");
}

TEST(NormalizeLineTest, JoinsNormalizedWords) {
  EXPECT_EQ(normalize_line("Hello,  World - again!"), "hello world again");
  EXPECT_EQ(normalize_line("  "), "");
}

TEST(SplitWordsTest, KeepsSurfaceForms) {
  const auto words = split_words("  Don't\tstop,\nbelievin' ");
  ASSERT_EQ(words.size(), 3u);
  EXPECT_EQ(words[0], "Don't");
  EXPECT_EQ(words[1], "stop,");
  EXPECT_EQ(words[2], "believin'");
}

// ============================================================
// parse_lyrics
// ============================================================

TEST(ParseLyricsTest, SkipsBlankLinesAndMarksStanzas) {
  const auto lines = parse_lyrics("Line one\n\n\nLine two\r\n  \nLine three");
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].index, 0);
  EXPECT_EQ(lines[1].index, 1);
  EXPECT_EQ(lines[2].index, 2);
  EXPECT_EQ(lines[0].text, "Line one");
  EXPECT_EQ(lines[1].text, "Line two");
  EXPECT_FALSE(lines[0].stanza_break);
  EXPECT_TRUE(lines[1].stanza_break);
  EXPECT_TRUE(lines[2].stanza_break);
  ASSERT_EQ(lines[0].words.size(), 2u);
  EXPECT_EQ(lines[0].words[1], "one");
}

TEST(ParseLyricsTest, LeadingBlankLinesAreNotStanzaBreaks) {
  const auto lines = parse_lyrics("\n\n  First line  \nSecond");
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_FALSE(lines[0].stanza_break);
  EXPECT_EQ(lines[0].text, "First line");
  EXPECT_FALSE(lines[1].stanza_break);
}

TEST(ParseLyricsTest, StripsByteOrderMark) {
  const auto lines = parse_lyrics("\xEF\xBB\xBFHello there");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].words[0], "Hello");
}

TEST(ParseLyricsTest, EmptyLyricsIsInputError) {
  EXPECT_THROW(parse_lyrics(""), InputError);
  EXPECT_THROW(parse_lyrics(" \n\t\n\r\n"), InputError);
}
