// entity_resolver/time/interval.hpp - Span of calendar time tagged with a grain
#pragma once

#include <optional>
#include <string>

#include "entity_resolver/time/grain.hpp"
#include "entity_resolver/time/moment.hpp"

namespace entity_resolver
{

/**
 * A span `[start, end)` aligned to a grain.
 *
 * When `end` is absent the interval covers exactly one grain starting at
 * `start` (see end_moment()).
 */
struct Interval
{
  Moment start;
  std::optional<Moment> end;
  Grain grain = Grain::Second;

  [[nodiscard]] static Interval starting_at(Moment start, Grain grain) noexcept
  {
    return Interval{start, std::nullopt, grain};
  }

  /// Explicit end, or `start` shifted by one grain
  [[nodiscard]] Moment end_moment() const noexcept;

  /// Overlap of both intervals at the finer grain, nullopt when disjoint
  [[nodiscard]] std::optional<Interval> intersect(const Interval & other) const noexcept;

  /// `[start, other.end_moment())` at the finer grain, always with an explicit end
  [[nodiscard]] Interval span_to(const Interval & other) const noexcept;

  [[nodiscard]] bool contains(const Moment & m) const noexcept
  {
    return start <= m && m < end_moment();
  }

  /// e.g. "[1970-01-05T00:00:00+00:00, 1970-01-06T00:00:00+00:00) day"
  [[nodiscard]] std::string to_string() const;

  bool operator==(const Interval & other) const noexcept
  {
    return start == other.start && end == other.end && grain == other.grain;
  }
  bool operator!=(const Interval & other) const noexcept { return !(*this == other); }
};

}  // namespace entity_resolver
