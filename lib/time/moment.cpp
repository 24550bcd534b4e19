// entity_resolver/time/moment.cpp - Calendar arithmetic
//
#include "entity_resolver/time/moment.hpp"

#include <fmt/core.h>

#include <cstdlib>

#include "entity_resolver/time/period.hpp"

namespace entity_resolver
{

namespace
{

constexpr int64_t k_seconds_per_day = 86400;

int64_t floor_div(int64_t a, int64_t b) noexcept
{
  const int64_t q = a / b;
  return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

}  // namespace

// ============================================================================
// Calendar helpers
// ============================================================================

// Day counting after H. Hinnant's chrono-compatible civil algorithms.
int64_t days_from_civil(int64_t year, int month, int day) noexcept
{
  year -= month <= 2 ? 1 : 0;
  const int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<int64_t>(year - era * 400);
  const int64_t mp = month > 2 ? month - 3 : month + 9;
  const int64_t doy = (153 * mp + 2) / 5 + day - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilTime civil_from_days(int64_t days) noexcept
{
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const int64_t doe = days - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;

  CivilTime c;
  c.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  c.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  c.year = yoe + era * 400 + (c.month <= 2 ? 1 : 0);
  return c;
}

bool is_leap_year(int64_t year) noexcept
{
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int64_t year, int month) noexcept
{
  static constexpr int k_days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return k_days[month - 1];
}

// ============================================================================
// Moment
// ============================================================================

Moment Moment::from_civil(const CivilTime & civil, int32_t utc_offset) noexcept
{
  const int64_t days = days_from_civil(civil.year, civil.month, civil.day);
  const int64_t local =
    days * k_seconds_per_day + civil.hour * 3600 + civil.minute * 60 + civil.second;
  return Moment(local - utc_offset, utc_offset);
}

CivilTime Moment::civil() const noexcept
{
  const int64_t local = local_seconds();
  const int64_t days = floor_div(local, k_seconds_per_day);
  const int64_t sod = local - days * k_seconds_per_day;

  CivilTime c = civil_from_days(days);
  c.hour = static_cast<int>(sod / 3600);
  c.minute = static_cast<int>((sod % 3600) / 60);
  c.second = static_cast<int>(sod % 60);
  return c;
}

int Moment::weekday() const noexcept
{
  const int64_t days = floor_div(local_seconds(), k_seconds_per_day);
  // 1970-01-01 was a Thursday
  return static_cast<int>(((days % 7) + 7 + 3) % 7) + 1;
}

Moment Moment::start_of(Grain grain) const noexcept
{
  CivilTime c = civil();
  switch (grain) {
    case Grain::Second:
      return *this;
    case Grain::Minute:
      c.second = 0;
      break;
    case Grain::Hour:
      c.minute = c.second = 0;
      break;
    case Grain::Day:
      c.hour = c.minute = c.second = 0;
      break;
    case Grain::Week:
      return start_of(Grain::Day).add(Grain::Day, -(weekday() - 1));
    case Grain::Month:
      c.day = 1;
      c.hour = c.minute = c.second = 0;
      break;
    case Grain::Quarter:
      c.month = ((c.month - 1) / 3) * 3 + 1;
      c.day = 1;
      c.hour = c.minute = c.second = 0;
      break;
    case Grain::Year:
      c.month = 1;
      c.day = 1;
      c.hour = c.minute = c.second = 0;
      break;
  }
  return from_civil(c, utc_offset_);
}

Moment Moment::add(Grain grain, int64_t count) const noexcept
{
  if (count == 0) {
    return *this;
  }

  const int64_t fixed = fixed_grain_seconds(grain);
  if (fixed != 0) {
    return Moment(epoch_seconds_ + fixed * count, utc_offset_);
  }

  CivilTime c = civil();
  const int64_t month_index = c.year * 12 + (c.month - 1) + grain_months(grain) * count;
  c.year = floor_div(month_index, 12);
  c.month = static_cast<int>(month_index - c.year * 12) + 1;
  const int last_day = days_in_month(c.year, c.month);
  if (c.day > last_day) {
    c.day = last_day;
  }
  return from_civil(c, utc_offset_);
}

Moment Moment::add(const Period & period) const noexcept
{
  Moment m = *this;
  // Calendar components first so that day clamping happens before fixed shifts
  for (const Grain g : {Grain::Year, Grain::Quarter, Grain::Month}) {
    m = m.add(g, period.get(g));
  }
  for (const Grain g : {Grain::Week, Grain::Day, Grain::Hour, Grain::Minute, Grain::Second}) {
    m = m.add(g, period.get(g));
  }
  return m;
}

std::string Moment::to_iso_string() const
{
  const CivilTime c = civil();
  const char sign = utc_offset_ < 0 ? '-' : '+';
  const int32_t abs_offset = std::abs(utc_offset_);
  return fmt::format(
    "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}{:02}:{:02}", c.year, c.month, c.day, c.hour, c.minute,
    c.second, sign, abs_offset / 3600, (abs_offset % 3600) / 60);
}

}  // namespace entity_resolver
