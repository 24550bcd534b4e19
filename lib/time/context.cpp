// entity_resolver/time/context.cpp - Context construction
//
#include "entity_resolver/time/context.hpp"

#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace entity_resolver
{

int32_t local_utc_offset(int64_t epoch_seconds)
{
  if (
    epoch_seconds < static_cast<int64_t>(std::numeric_limits<std::time_t>::min()) ||
    epoch_seconds > static_cast<int64_t>(std::numeric_limits<std::time_t>::max())) {
    throw std::out_of_range(
      "timestamp not representable by the platform clock: " + std::to_string(epoch_seconds));
  }

  const auto t = static_cast<std::time_t>(epoch_seconds);
  std::tm local{};
#ifdef _WIN32
  if (localtime_s(&local, &t) != 0) {
    throw std::out_of_range("local time lookup failed for " + std::to_string(epoch_seconds));
  }
  // Re-encode the wall clock as if it were UTC; the difference is the offset
  const std::time_t as_utc = _mkgmtime(&local);
  return static_cast<int32_t>(static_cast<int64_t>(as_utc) - epoch_seconds);
#else
  if (localtime_r(&t, &local) == nullptr) {
    throw std::out_of_range("local time lookup failed for " + std::to_string(epoch_seconds));
  }
  return static_cast<int32_t>(local.tm_gmtoff);
#endif
}

namespace
{

void check_representable(const char * what, const Moment & m)
{
  const int64_t secs = m.epoch_seconds();
  if (
    secs < -Context::k_max_abs_epoch_seconds || secs > Context::k_max_abs_epoch_seconds) {
    throw std::out_of_range(
      std::string(what) + " too far from the epoch: " + std::to_string(secs));
  }
}

}  // namespace

Context::Context(Interval reference, Interval min, Interval max)
: reference_(std::move(reference)), min_(std::move(min)), max_(std::move(max))
{
  check_representable("reference", reference_.start);
  check_representable("window min", min_.start);
  check_representable("window max", max_.start);
  if (reference_.start < min_.start || max_.start < reference_.start) {
    throw std::invalid_argument(
      "reference " + reference_.to_string() + " is outside the window [" +
      min_.start.to_iso_string() + ", " + max_.start.to_iso_string() + "]");
  }
}

Context Context::for_reference(const Interval & now)
{
  check_representable("reference", now.start);
  const Interval min =
    Interval::starting_at(now.start.add(Grain::Year, -k_default_window_years), Grain::Second);
  const Interval max =
    Interval::starting_at(now.start.add(Grain::Year, k_default_window_years), Grain::Second);
  // The window may reach past the epoch limit by k_default_window_years
  return Context(Unchecked{}, now, min, max);
}

Context Context::bounded_by(const Moment & end) const
{
  if (!(end < max_.end_moment())) {
    return *this;
  }
  return Context(
    Unchecked{}, reference_, min_, Interval::starting_at(end.add(Grain::Second, -1), Grain::Second));
}

Context Context::from_secs(int64_t epoch_seconds)
{
  return from_secs(epoch_seconds, local_utc_offset(epoch_seconds));
}

Context Context::from_secs(int64_t epoch_seconds, int32_t utc_offset)
{
  const Interval anchor =
    Interval::starting_at(Moment(epoch_seconds, utc_offset), Grain::Second);
  return for_reference(anchor);
}

}  // namespace entity_resolver
