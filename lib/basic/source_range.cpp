// compdoc/basic/source_range.cpp - Line table implementation
#include "compdoc/basic/source_range.hpp"

#include <algorithm>

namespace compdoc
{

LineIndex::LineIndex(std::string_view text) : text_(text)
{
  line_offsets_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn LineIndex::get_line_column(uint32_t offset) const noexcept
{
  if (offset > text_.size()) {
    offset = static_cast<uint32_t>(text_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view LineIndex::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(text_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && text_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && text_[end - 1] == '\r') {
    --end;
  }

  return text_.substr(start, end - start);
}

}  // namespace compdoc
