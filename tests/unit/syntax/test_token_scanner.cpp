// tests/unit/syntax/test_token_scanner.cpp - Component token scanning

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "compdoc/syntax/token_scanner.hpp"

using compdoc::syntax::scan_tokens;
using compdoc::syntax::TokenOccurrence;
using compdoc::syntax::TokenScanner;

namespace
{

std::vector<std::string> keys_of(const std::vector<TokenOccurrence> & toks)
{
  std::vector<std::string> out;
  for (const auto & t : toks) {
    out.emplace_back(t.key);
  }
  return out;
}

}  // namespace

TEST(SyntaxTokenScanner, FindsTokensLeftToRight)
{
  const std::string_view body = "Hello {{name}}, see {{intro}} and {{outro}}.";
  const auto toks = scan_tokens(body);

  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(keys_of(toks), (std::vector<std::string>{"name", "intro", "outro"}));
  EXPECT_EQ(toks[0].text, "{{name}}");
  EXPECT_EQ(toks[0].range.get_begin().get_offset(), 6u);
  EXPECT_EQ(toks[0].range.get_end().get_offset(), 14u);
  EXPECT_EQ(toks[0].range.slice(body), "{{name}}");
}

TEST(SyntaxTokenScanner, ReportsDuplicatesOncePerOccurrence)
{
  const auto toks = scan_tokens("{{a}}-{{a}}-{{b}}-{{a}}");
  EXPECT_EQ(keys_of(toks), (std::vector<std::string>{"a", "a", "b", "a"}));
}

TEST(SyntaxTokenScanner, KeyIsAnyRunWithoutClosingBrace)
{
  const auto toks = scan_tokens("{{ spaced key }} {{group:x:y}} {{a.b}} {{{c}}}");

  ASSERT_EQ(toks.size(), 4u);
  EXPECT_EQ(toks[0].key, " spaced key ");
  EXPECT_EQ(toks[1].key, "group:x:y");
  EXPECT_EQ(toks[2].key, "a.b");
  // "{{{c}}}": the first "{{" is followed by "{c", which is a valid key.
  EXPECT_EQ(toks[3].key, "{c");
  EXPECT_EQ(toks[3].text, "{{{c}}");
}

TEST(SyntaxTokenScanner, IgnoresIncompleteAndEmptyTokens)
{
  EXPECT_TRUE(scan_tokens("").empty());
  EXPECT_TRUE(scan_tokens("plain text").empty());
  EXPECT_TRUE(scan_tokens("{{}}").empty());
  EXPECT_TRUE(scan_tokens("{{open").empty());
  EXPECT_TRUE(scan_tokens("{{half}").empty());
  EXPECT_TRUE(scan_tokens("{single}").empty());
}

TEST(SyntaxTokenScanner, RecoversAfterBrokenToken)
{
  const auto toks = scan_tokens("{{broken} then {{ok}}");
  ASSERT_EQ(toks.size(), 1u);
  EXPECT_EQ(toks[0].key, "ok");
}

TEST(SyntaxTokenScanner, KeyMaySpanLines)
{
  const auto toks = scan_tokens("{{multi\nline}}");
  ASSERT_EQ(toks.size(), 1u);
  EXPECT_EQ(toks[0].key, "multi\nline");
}

TEST(SyntaxTokenScanner, ScannerCanBeRerun)
{
  TokenScanner scanner("{{x}}{{y}}");
  const auto first = scanner.scan_all();
  const auto second = scanner.scan_all();
  EXPECT_EQ(keys_of(first), keys_of(second));
  EXPECT_EQ(first.size(), 2u);
}

TEST(SyntaxTokenScanner, RecordsByteOffsetOfEachToken)
{
  const std::string_view body = "ab {{x}} cd {{yy}}";
  const auto toks = scan_tokens(body);

  ASSERT_EQ(toks.size(), 2u);
  EXPECT_EQ(toks[0].offset, 3u);
  EXPECT_EQ(toks[1].offset, 12u);
  EXPECT_EQ(body.substr(toks[1].offset, toks[1].text.size()), "{{yy}}");
  EXPECT_EQ(toks[1].range.get_begin().get_offset(), 12u);
}

TEST(SyntaxTokenScanner, RangeIsInvalidPastThirtyTwoBitOffsets)
{
  using compdoc::make_source_range;
  using compdoc::SourceLocation;

  const auto small = make_source_range(6, 14);
  EXPECT_TRUE(small.is_valid());
  EXPECT_EQ(small.get_end().get_offset(), 14u);

  // A 4 GiB body would otherwise wrap to small offsets.
  const size_t past = size_t{SourceLocation::k_invalid_offset} + 6;
  EXPECT_TRUE(make_source_range(past, past + 8).is_invalid());
  EXPECT_TRUE(make_source_range(6, SourceLocation::k_invalid_offset).is_invalid());
  EXPECT_TRUE(make_source_range(
                SourceLocation::k_invalid_offset - 2, SourceLocation::k_invalid_offset - 1)
                .is_valid());
}
