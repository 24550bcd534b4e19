// entity_resolver/time/interval.cpp - Interval implementation
//
#include "entity_resolver/time/interval.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace entity_resolver
{

Moment Interval::end_moment() const noexcept
{
  if (end) {
    return *end;
  }
  return start.add(grain, 1);
}

std::optional<Interval> Interval::intersect(const Interval & other) const noexcept
{
  const Moment s = std::max(start, other.start);
  const Moment e = std::min(end_moment(), other.end_moment());
  if (e <= s) {
    return std::nullopt;
  }

  Interval result = Interval::starting_at(s, finer_of(grain, other.grain));
  if (result.end_moment() != e) {
    result.end = e;
  }
  return result;
}

Interval Interval::span_to(const Interval & other) const noexcept
{
  return Interval{start, other.end_moment(), finer_of(grain, other.grain)};
}

std::string Interval::to_string() const
{
  return fmt::format(
    "[{}, {}) {}{}", start.to_iso_string(), end_moment().to_iso_string(),
    entity_resolver::to_string(grain), end ? "" : " (implicit end)");
}

}  // namespace entity_resolver
