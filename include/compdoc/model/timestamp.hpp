// compdoc/model/timestamp.hpp - ISO-8601 creation timestamps
//
// Documents carry `created_at` as text. Exports mix precisions and offsets
// ("...10:00:00Z", "...10:00:00.500Z", "...11:00:00+01:00"), so ordering is
// done on the UTC instant, never on the raw string.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace compdoc
{

/**
 * A UTC instant with nanosecond precision.
 */
struct Timestamp
{
  /// Seconds since 1970-01-01T00:00:00Z
  int64_t seconds = 0;
  uint32_t nanos = 0;

  [[nodiscard]] constexpr bool operator==(const Timestamp & other) const noexcept
  {
    return seconds == other.seconds && nanos == other.nanos;
  }
  [[nodiscard]] constexpr bool operator!=(const Timestamp & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(const Timestamp & other) const noexcept
  {
    return seconds != other.seconds ? seconds < other.seconds : nanos < other.nanos;
  }
  [[nodiscard]] constexpr bool operator>(const Timestamp & other) const noexcept
  {
    return other < *this;
  }
};

/**
 * Parse `YYYY-MM-DD(T| )hh:mm:ss[.fraction](Z|+hh:mm|-hh:mm|+hhmm|-hhmm)`.
 *
 * The fraction may have 1 to 9 digits. A missing zone is rejected.
 * Returns std::nullopt for anything else, including out-of-range fields.
 */
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text) noexcept;

}  // namespace compdoc
