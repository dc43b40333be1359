#include <gtest/gtest.h>

#include <popup_lib/TextLayout.h>

#include "FakeHost.h"

using namespace Popup_lib;
using Popup_lib::test::tenPerChar;

namespace
{
  std::string rejoin(const std::string& s, const std::vector<TextLine>& lines)
  {
    std::string out;
    for (const TextLine& l : lines) out += s.substr(l.start, l.end - l.start);
    return out;
  }
}

TEST(TextLayout, EmptyTextIsOneEmptyLine)
{
  auto lines = wrapText("", 100.f, tenPerChar);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].text, "");
  EXPECT_EQ(lines[0].start, 0u);
  EXPECT_EQ(lines[0].end, 0u);
}

TEST(TextLayout, ShortTextStaysOnOneLine)
{
  auto lines = wrapText("hello world", 1000.f, tenPerChar);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].text, "hello world");
  EXPECT_EQ(lines[0].end, 11u);
}

TEST(TextLayout, BreaksBeforeTheWordThatOverflows)
{
  auto lines = wrapText("hello world", 60.f, tenPerChar);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].text, "hello ");
  EXPECT_EQ(lines[0].start, 0u);
  EXPECT_EQ(lines[0].end, 6u);
  EXPECT_EQ(lines[1].text, "world");
  EXPECT_EQ(lines[1].start, 6u);
  EXPECT_EQ(lines[1].end, 11u);
}

TEST(TextLayout, HardNewlinesKeepEmptyParagraphs)
{
  const std::string s = "ab\n\ncd\n";
  auto lines = wrapText(s, 100.f, tenPerChar);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].text, "ab");
  EXPECT_EQ(lines[0].end, 3u); // span owns the newline
  EXPECT_EQ(lines[1].text, "");
  EXPECT_EQ(lines[1].start, 3u);
  EXPECT_EQ(lines[1].end, 4u);
  EXPECT_EQ(lines[2].text, "cd");
  EXPECT_EQ(lines[3].text, "");
  EXPECT_EQ(lines[3].start, 7u);
  EXPECT_EQ(lines[3].end, 7u);
}

TEST(TextLayout, OverlongWordIsChunked)
{
  auto lines = wrapText("abcdefghij", 35.f, tenPerChar);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].text, "abc");
  EXPECT_EQ(lines[1].text, "def");
  EXPECT_EQ(lines[2].text, "ghi");
  EXPECT_EQ(lines[3].text, "j");
  EXPECT_EQ(lines[3].start, 9u);
}

TEST(TextLayout, ChunksNeverSplitACodePoint)
{
  const std::string s = "h\xC3\xA9llo"; // "héllo", é is two bytes
  auto lines = wrapText(s, 20.f, tenPerChar);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].text, "h\xC3\xA9");
  EXPECT_EQ(lines[0].end, 3u);
  EXPECT_EQ(lines[1].text, "ll");
  EXPECT_EQ(lines[2].text, "o");
}

TEST(TextLayout, ZeroWidthStillTerminates)
{
  auto lines = wrapText("abc", 0.f, tenPerChar);
  EXPECT_EQ(lines.size(), 3u);
}

TEST(TextLayout, SpansReconstructTheSource)
{
  const std::vector<std::string> samples = {
    "The quick brown fox jumps over the lazy dog",
    "  leading and trailing  ",
    "tabs\tand\nnewlines\n\n",
    "aVeryLongWordWithoutAnySpacesThatMustBeChunked and more",
    "mixed \xC3\xA9\xC3\xA8 accents \xE2\x82\xAC here",
  };
  for (const std::string& s : samples) {
    for (float w : { 15.f, 40.f, 75.f, 200.f, 1000.f }) {
      auto lines = wrapText(s, w, tenPerChar);
      ASSERT_FALSE(lines.empty());
      EXPECT_EQ(lines.front().start, 0u);
      EXPECT_EQ(lines.back().end, s.size());
      for (size_t i = 1; i < lines.size(); ++i)
        EXPECT_EQ(lines[i].start, lines[i - 1].end) << s << " @" << w;
      EXPECT_EQ(rejoin(s, lines), s) << " @" << w;
    }
  }
}

TEST(TextLayout, LinesFitUnlessASingleCodePointIsWider)
{
  auto lines = wrapText("one two three four five six", 55.f, tenPerChar);
  for (const TextLine& l : lines)
    EXPECT_LE(tenPerChar(l.text), 55.f) << l.text;
}

TEST(TextLayout, CursorOnSharedBoundaryBelongsToLaterLine)
{
  auto lines = wrapText("hello world", 60.f, tenPerChar);
  EXPECT_EQ(lineForCursor(lines, 0), 0u);
  EXPECT_EQ(lineForCursor(lines, 5), 0u);
  EXPECT_EQ(lineForCursor(lines, 6), 1u);
  EXPECT_EQ(lineForCursor(lines, 11), 1u);

  auto nl = wrapText("ab\n", 100.f, tenPerChar);
  EXPECT_EQ(lineForCursor(nl, 2), 0u);
  EXPECT_EQ(lineForCursor(nl, 3), 1u);
}

TEST(TextLayout, ElideFrontKeepsTheTail)
{
  EXPECT_EQ(elideFront("abcdef", 35.f, tenPerChar), "def");
  EXPECT_EQ(elideFront("abc", 100.f, tenPerChar), "abc");
  EXPECT_EQ(elideFront("abc", 5.f, tenPerChar), "");
}
