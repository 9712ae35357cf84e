// compdoc/syntax/token_scanner.hpp - Component token scanner
//
// Finds every {{key}} occurrence in a document body, left to right. The key is
// any non-empty run of characters other than '}'. No validation of the key is
// done here; keys nothing resolves are ignored downstream.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "compdoc/basic/source_range.hpp"

namespace compdoc::syntax
{

struct TokenOccurrence
{
  /// Full match including the braces, e.g. "{{intro}}"
  std::string_view text;
  /// Token key between the braces, e.g. "intro"
  std::string_view key;
  /// Byte offset of `text` in the scanned body
  size_t offset = 0;
  /// Byte range of `text` in the scanned body
  SourceRange range;
};

/**
 * Scans a body for component tokens.
 *
 * The returned views point into the scanned body, which must outlive them.
 */
class TokenScanner
{
public:
  explicit TokenScanner(std::string_view src) : src_(src) {}

  /// All occurrences in order; duplicates are reported once per occurrence.
  [[nodiscard]] std::vector<TokenOccurrence> scan_all();

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s, size_t at) const noexcept;

  /// Try to match a token at pos_; on success fills `out` and advances past it.
  bool try_match(TokenOccurrence & out);

  std::string_view src_;
  size_t pos_ = 0;
};

/// Convenience wrapper around TokenScanner.
[[nodiscard]] std::vector<TokenOccurrence> scan_tokens(std::string_view body);

}  // namespace compdoc::syntax
