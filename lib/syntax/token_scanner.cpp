// compdoc/syntax/token_scanner.cpp - Component token scanner implementation
#include "compdoc/syntax/token_scanner.hpp"

namespace compdoc::syntax
{

namespace
{

constexpr std::string_view k_open = "{{";
constexpr std::string_view k_close = "}}";

}  // namespace

bool TokenScanner::starts_with(std::string_view s, size_t at) const noexcept
{
  return src_.size() >= at + s.size() && src_.substr(at, s.size()) == s;
}

bool TokenScanner::try_match(TokenOccurrence & out)
{
  if (!starts_with(k_open, pos_)) {
    return false;
  }

  // The key cannot contain '}', so the first '}' after the opener is the
  // only place the closer can start.
  const size_t key_start = pos_ + k_open.size();
  size_t key_end = key_start;
  while (key_end < src_.size() && src_[key_end] != '}') {
    ++key_end;
  }

  if (key_end == key_start || !starts_with(k_close, key_end)) {
    return false;
  }

  const size_t match_end = key_end + k_close.size();
  out.text = src_.substr(pos_, match_end - pos_);
  out.key = src_.substr(key_start, key_end - key_start);
  out.offset = pos_;
  out.range = make_source_range(pos_, match_end);
  pos_ = match_end;
  return true;
}

std::vector<TokenOccurrence> TokenScanner::scan_all()
{
  std::vector<TokenOccurrence> out;
  pos_ = 0;

  while (!eof()) {
    if (peek() == '{' && peek(1) == '{') {
      TokenOccurrence occ;
      if (try_match(occ)) {
        out.push_back(occ);
        continue;
      }
    }
    ++pos_;
  }

  return out;
}

std::vector<TokenOccurrence> scan_tokens(std::string_view body)
{
  TokenScanner scanner(body);
  return scanner.scan_all();
}

}  // namespace compdoc::syntax
