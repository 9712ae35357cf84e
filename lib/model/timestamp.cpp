// compdoc/model/timestamp.cpp - ISO-8601 timestamp parsing
#include "compdoc/model/timestamp.hpp"

#include <cstddef>

namespace compdoc
{

namespace
{

class Cursor
{
public:
  explicit Cursor(std::string_view text) : text_(text) {}

  [[nodiscard]] bool eof() const noexcept { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text_[pos_]; }

  bool expect(char c) noexcept
  {
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  /// Read exactly `count` decimal digits.
  bool digits(size_t count, int & out) noexcept
  {
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
      const char c = peek();
      if (c < '0' || c > '9') return false;
      value = value * 10 + (c - '0');
      ++pos_;
    }
    out = value;
    return true;
  }

  /// Read 1-9 fraction digits, scaled to nanoseconds.
  bool fraction(uint32_t & nanos) noexcept
  {
    uint32_t value = 0;
    size_t count = 0;
    while (!eof() && peek() >= '0' && peek() <= '9') {
      if (count == 9) return false;
      value = value * 10 + static_cast<uint32_t>(peek() - '0');
      ++count;
      ++pos_;
    }
    if (count == 0) return false;
    for (; count < 9; ++count) {
      value *= 10;
    }
    nanos = value;
    return true;
  }

private:
  std::string_view text_;
  size_t pos_ = 0;
};

constexpr bool is_leap(int year) noexcept
{
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr int days_in_month(int year, int month) noexcept
{
  constexpr int k_days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return month == 2 && is_leap(year) ? 29 : k_days[month - 1];
}

/// Days since 1970-01-01 for a proleptic Gregorian date.
constexpr int64_t days_from_civil(int64_t y, int m, int d) noexcept
{
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

static_assert(days_from_civil(1970, 1, 1) == 0);
static_assert(days_from_civil(2000, 3, 1) == 11017);

}  // namespace

std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept
{
  Cursor c(text);
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;

  if (
    !c.digits(4, year) || !c.expect('-') || !c.digits(2, month) || !c.expect('-') ||
    !c.digits(2, day)) {
    return std::nullopt;
  }
  if (!c.expect('T') && !c.expect(' ')) {
    return std::nullopt;
  }
  if (
    !c.digits(2, hour) || !c.expect(':') || !c.digits(2, minute) || !c.expect(':') ||
    !c.digits(2, second)) {
    return std::nullopt;
  }

  uint32_t nanos = 0;
  if (c.expect('.') && !c.fraction(nanos)) {
    return std::nullopt;
  }

  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
    return std::nullopt;
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  int offset_seconds = 0;
  if (!c.expect('Z')) {
    int sign = 0;
    if (c.expect('+')) {
      sign = 1;
    } else if (c.expect('-')) {
      sign = -1;
    } else {
      return std::nullopt;
    }
    int off_h = 0;
    int off_m = 0;
    if (!c.digits(2, off_h)) {
      return std::nullopt;
    }
    c.expect(':');
    if (!c.digits(2, off_m) || off_h > 23 || off_m > 59) {
      return std::nullopt;
    }
    offset_seconds = sign * (off_h * 3600 + off_m * 60);
  }

  if (!c.eof()) {
    return std::nullopt;
  }

  Timestamp ts;
  ts.seconds = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second -
               offset_seconds;
  ts.nanos = nanos;
  return ts;
}

}  // namespace compdoc
