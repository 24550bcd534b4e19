// entity_resolver/time/period.hpp - Calendar period (duration by grain)
#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "entity_resolver/time/grain.hpp"

namespace entity_resolver
{

/**
 * A calendar duration expressed as signed per-grain components,
 * e.g. "2 days and 3 hours". Components are kept separate because
 * months and years have no fixed length in seconds.
 */
class Period
{
public:
  Period() = default;

  /// Create a period with a single component
  static Period of(Grain grain, int64_t count)
  {
    Period p;
    p.add(grain, count);
    return p;
  }

  Period & add(Grain grain, int64_t count) noexcept
  {
    comps_[grain_index(grain)] += count;
    return *this;
  }

  [[nodiscard]] int64_t get(Grain grain) const noexcept { return comps_[grain_index(grain)]; }

  [[nodiscard]] bool empty() const noexcept;

  /// Finest grain with a non-zero component (Second for an empty period)
  [[nodiscard]] Grain finest_grain() const noexcept;

  [[nodiscard]] Period operator+(const Period & other) const noexcept;
  [[nodiscard]] Period operator-() const noexcept;

  bool operator==(const Period & other) const noexcept { return comps_ == other.comps_; }
  bool operator!=(const Period & other) const noexcept { return !(*this == other); }

  /// ISO-8601 duration, e.g. "P1Y2M1W3DT4H5M6S" (quarters folded into months)
  [[nodiscard]] std::string to_iso_string() const;

private:
  std::array<int64_t, k_grain_count> comps_{};
};

}  // namespace entity_resolver
