// compdoc/basic/source_range.hpp - Byte ranges inside a document body
//
// Diagnostics point at token occurrences inside a document's content. A range
// is a pair of byte offsets into that content; line/column information is
// computed on demand by LineIndex.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace compdoc
{

// ============================================================================
// SourceLocation - Compact body position
// ============================================================================

/**
 * A byte offset into a document body.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * Half-open byte range [start, end) inside a document body.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

  /// Slice `text` by this range (clamped; empty when invalid)
  [[nodiscard]] std::string_view slice(std::string_view text) const noexcept
  {
    if (is_invalid()) return {};
    const auto start = start_.get_offset();
    auto end = end_.get_offset();
    if (start >= text.size()) return {};
    if (end > text.size()) end = static_cast<uint32_t>(text.size());
    return text.substr(start, end - start);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

/**
 * Range for size_t byte offsets.
 *
 * Offsets at or past the 32-bit sentinel cannot be encoded; the range is
 * invalid then, so diagnostics lose their location instead of pointing at a
 * wrapped offset.
 */
[[nodiscard]] constexpr SourceRange make_source_range(size_t start, size_t end) noexcept
{
  if (start >= SourceLocation::k_invalid_offset || end >= SourceLocation::k_invalid_offset) {
    return {};
  }
  return {static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
}

// ============================================================================
// LineIndex - Offset to line/column conversion
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Pre-computed line start table over a body of text.
 *
 * The text is not owned; it must outlive the index.
 */
class LineIndex
{
public:
  explicit LineIndex(std::string_view text);

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without the trailing newline
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

private:
  std::string_view text_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace compdoc
