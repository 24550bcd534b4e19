// entity_resolver/time/moment.hpp - Point in time with a fixed UTC offset
//
// Calendar arithmetic uses the proleptic Gregorian calendar evaluated on
// the moment's wall clock (epoch seconds shifted by the UTC offset).
//
#pragma once

#include <cstdint>
#include <string>

#include "entity_resolver/time/grain.hpp"

namespace entity_resolver
{

class Period;

/**
 * Wall clock decomposition of a Moment.
 */
struct CivilTime
{
  int64_t year = 1970;
  int month = 1;  ///< 1..12
  int day = 1;    ///< 1..31
  int hour = 0;
  int minute = 0;
  int second = 0;
};

// ============================================================================
// Calendar helpers
// ============================================================================

/// Days since 1970-01-01 for a civil date
[[nodiscard]] int64_t days_from_civil(int64_t year, int month, int day) noexcept;

/// Civil date (time fields zero) for a day count since 1970-01-01
[[nodiscard]] CivilTime civil_from_days(int64_t days) noexcept;

[[nodiscard]] bool is_leap_year(int64_t year) noexcept;

[[nodiscard]] int days_in_month(int64_t year, int month) noexcept;

// ============================================================================
// Moment
// ============================================================================

class Moment
{
public:
  Moment() = default;

  explicit Moment(int64_t epoch_seconds, int32_t utc_offset = 0) noexcept
  : epoch_seconds_(epoch_seconds), utc_offset_(utc_offset)
  {
  }

  /// Build a moment from wall clock fields interpreted at `utc_offset`
  [[nodiscard]] static Moment from_civil(const CivilTime & civil, int32_t utc_offset = 0) noexcept;

  [[nodiscard]] int64_t epoch_seconds() const noexcept { return epoch_seconds_; }
  [[nodiscard]] int32_t utc_offset() const noexcept { return utc_offset_; }

  [[nodiscard]] CivilTime civil() const noexcept;

  /// ISO weekday: 1 = Monday ... 7 = Sunday
  [[nodiscard]] int weekday() const noexcept;

  /// Truncate to the start of the enclosing grain (weeks start on Monday)
  [[nodiscard]] Moment start_of(Grain grain) const noexcept;

  /// Shift by `count` grains; month-based grains clamp the day of month
  [[nodiscard]] Moment add(Grain grain, int64_t count) const noexcept;

  [[nodiscard]] Moment add(const Period & period) const noexcept;

  /// e.g. "2013-02-12T04:30:00+01:00"
  [[nodiscard]] std::string to_iso_string() const;

  bool operator==(const Moment & other) const noexcept
  {
    return epoch_seconds_ == other.epoch_seconds_ && utc_offset_ == other.utc_offset_;
  }
  bool operator!=(const Moment & other) const noexcept { return !(*this == other); }
  bool operator<(const Moment & other) const noexcept
  {
    return epoch_seconds_ < other.epoch_seconds_;
  }
  bool operator<=(const Moment & other) const noexcept
  {
    return epoch_seconds_ <= other.epoch_seconds_;
  }
  bool operator>(const Moment & other) const noexcept
  {
    return epoch_seconds_ > other.epoch_seconds_;
  }
  bool operator>=(const Moment & other) const noexcept
  {
    return epoch_seconds_ >= other.epoch_seconds_;
  }

private:
  [[nodiscard]] int64_t local_seconds() const noexcept { return epoch_seconds_ + utc_offset_; }

  int64_t epoch_seconds_ = 0;
  int32_t utc_offset_ = 0;
};

}  // namespace entity_resolver
