// entity_resolver/time/grain.hpp - Calendar granularity
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace entity_resolver
{

/**
 * Unit of calendar granularity an Interval is aligned to.
 * Ordered from finest to coarsest.
 */
enum class Grain : uint8_t {
  Second,
  Minute,
  Hour,
  Day,
  Week,
  Month,
  Quarter,
  Year,
};

inline constexpr size_t k_grain_count = 8;

[[nodiscard]] constexpr size_t grain_index(Grain g) noexcept { return static_cast<size_t>(g); }

/// True when `a` is strictly finer than `b`
[[nodiscard]] constexpr bool is_finer(Grain a, Grain b) noexcept
{
  return grain_index(a) < grain_index(b);
}

[[nodiscard]] constexpr Grain finer_of(Grain a, Grain b) noexcept { return is_finer(a, b) ? a : b; }

[[nodiscard]] constexpr Grain coarser_of(Grain a, Grain b) noexcept
{
  return is_finer(a, b) ? b : a;
}

/// Length in seconds for fixed-length grains (Second..Week), 0 otherwise
[[nodiscard]] constexpr int64_t fixed_grain_seconds(Grain g) noexcept
{
  switch (g) {
    case Grain::Second:
      return 1;
    case Grain::Minute:
      return 60;
    case Grain::Hour:
      return 3600;
    case Grain::Day:
      return 86400;
    case Grain::Week:
      return 7 * 86400;
    case Grain::Month:
    case Grain::Quarter:
    case Grain::Year:
      return 0;
  }
  return 0;
}

/// Number of months for calendar grains (Month..Year), 0 otherwise
[[nodiscard]] constexpr int64_t grain_months(Grain g) noexcept
{
  switch (g) {
    case Grain::Month:
      return 1;
    case Grain::Quarter:
      return 3;
    case Grain::Year:
      return 12;
    default:
      return 0;
  }
}

[[nodiscard]] constexpr std::string_view to_string(Grain g) noexcept
{
  switch (g) {
    case Grain::Second:
      return "second";
    case Grain::Minute:
      return "minute";
    case Grain::Hour:
      return "hour";
    case Grain::Day:
      return "day";
    case Grain::Week:
      return "week";
    case Grain::Month:
      return "month";
    case Grain::Quarter:
      return "quarter";
    case Grain::Year:
      return "year";
  }
  return "";
}

[[nodiscard]] std::optional<Grain> grain_from_string(std::string_view name) noexcept;

}  // namespace entity_resolver
