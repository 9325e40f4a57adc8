#include <gtest/gtest.h>

#include <sstream>
#include "shelf/text_io.hpp"

namespace {

constexpr int kNoInt = -999999;

int read_int_or_none(std::istream& in) {
  return shelf::read_int(in).value_or(kNoInt);
}

TEST(TextIoTest, ReadWordSkipsLeadingWhitespace) {
  std::istringstream in("  \n\tDVD  The Matrix");
  EXPECT_EQ(shelf::read_word(in), "DVD");
  EXPECT_EQ(shelf::read_word(in), "The");
  EXPECT_EQ(shelf::read_word(in), "Matrix");
  EXPECT_EQ(shelf::read_word(in), "");
}

TEST(TextIoTest, ReadIntAcceptsSigns) {
  std::istringstream in("42 +7 -3");
  EXPECT_EQ(read_int_or_none(in), 42);
  EXPECT_EQ(read_int_or_none(in), 7);
  EXPECT_EQ(read_int_or_none(in), -3);
  EXPECT_FALSE(shelf::read_int(in).has_value());
}

TEST(TextIoTest, ReadIntStopsAtFirstNonDigit) {
  std::istringstream in("12abc");
  EXPECT_EQ(read_int_or_none(in), 12);
  EXPECT_EQ(shelf::read_word(in), "abc");
}

TEST(TextIoTest, ReadIntRejectsNonNumbers) {
  for (const char* text : {"abc", "-", "+", "- 5", "99999999999999999999"}) {
    std::istringstream in(text);
    EXPECT_FALSE(shelf::read_int(in).has_value()) << text;
  }
}

TEST(TextIoTest, ReadLineDropsNewline) {
  std::istringstream in("first line\nsecond");
  EXPECT_EQ(shelf::read_line(in), "first line");
  EXPECT_EQ(shelf::read_line(in), "second");
  EXPECT_EQ(shelf::read_line(in), "");
}

TEST(TextIoTest, NormalizeTitleCollapsesWhitespace) {
  EXPECT_EQ(shelf::normalize_title("  The   Good,\tthe Bad  "), "The Good, the Bad");
  EXPECT_EQ(shelf::normalize_title("Alien"), "Alien");
  EXPECT_EQ(shelf::normalize_title(" \t "), "");
}

TEST(TextIoTest, NormalizeTitleCollapsesUnicodeSpaces) {
  // no-break space, ideographic space, em space
  EXPECT_EQ(shelf::normalize_title("\u00A0Le\u00A0 Samoura\u00EF\u3000\u2003"), "Le Samoura\u00EF");
  EXPECT_EQ(shelf::normalize_title("\u00A0\u3000"), "");
}

TEST(TextIoTest, NormalizeTitleKeepsMalformedBytes) {
  EXPECT_EQ(shelf::normalize_title(" A\xff  B "), "A\xff B");
}

TEST(TextIoTest, FoldUtf8LowercasesCodePoints) {
  EXPECT_EQ(shelf::fold_utf8("AbC"), U"abc");
  EXPECT_EQ(shelf::fold_utf8("\u00C9COLE"), U"\u00E9cole");
  EXPECT_EQ(shelf::fold_utf8("\xC3"), U"\uFFFD");
}

} // namespace
