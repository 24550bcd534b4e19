// entity_resolver/time/context.hpp - Per-request resolution context
#pragma once

#include <cstdint>
#include <utility>

#include "entity_resolver/time/interval.hpp"

namespace entity_resolver
{

/**
 * Reference "now" plus the admissible resolution window.
 *
 * A Context is built once per request and passed by const reference to
 * every resolution call. It holds no mutable state and may be shared
 * across threads.
 *
 * Invariant: min.start <= reference.start <= max.start, except for
 * contexts narrowed with bounded_by().
 */
class Context
{
public:
  /// Width of the default window on each side of the reference, in years
  static constexpr int64_t k_default_window_years = 1000;

  /// Largest reference distance from the epoch, about a billion years
  static constexpr int64_t k_max_abs_epoch_seconds = 31'556'952'000'000'000;

  /**
   * Context with an explicit window.
   *
   * @throws std::invalid_argument if the reference lies outside [min, max]
   * @throws std::out_of_range if a bound is further than
   *         k_max_abs_epoch_seconds from the epoch
   */
  Context(Interval reference, Interval min, Interval max);

  /**
   * Context anchored at `now` with the default window of
   * k_default_window_years before and after it.
   *
   * @throws std::out_of_range if `now` is further than
   *         k_max_abs_epoch_seconds from the epoch
   */
  [[nodiscard]] static Context for_reference(const Interval & now);

  /**
   * Context anchored at a second-grain interval starting at `epoch_seconds`,
   * interpreted in the local clock.
   *
   * The local UTC offset is looked up with the platform's time functions,
   * which are guaranteed to cover 1970 to 2038 on both 32-bit and 64-bit
   * time representations.
   *
   * @throws std::out_of_range if the platform cannot represent the instant
   */
  [[nodiscard]] static Context from_secs(int64_t epoch_seconds);

  /// Same as from_secs() with an explicit UTC offset in seconds
  [[nodiscard]] static Context from_secs(int64_t epoch_seconds, int32_t utc_offset);

  /**
   * Same reference, with forward walks stopping at `end`.
   *
   * Used for searches confined to one enclosing candidate. The result may
   * end before its reference.
   */
  [[nodiscard]] Context bounded_by(const Moment & end) const;

  [[nodiscard]] const Interval & reference() const noexcept { return reference_; }
  [[nodiscard]] const Interval & min() const noexcept { return min_; }
  [[nodiscard]] const Interval & max() const noexcept { return max_; }

  /// True when a candidate starting at `m` may still be produced by a forward walk
  [[nodiscard]] bool before_upper_bound(const Moment & m) const noexcept
  {
    return m < max_.end_moment();
  }

  /// True when a candidate ending at `m` may still be produced by a backward walk
  [[nodiscard]] bool after_lower_bound(const Moment & m) const noexcept
  {
    return m > min_.start;
  }

  bool operator==(const Context & other) const noexcept
  {
    return reference_ == other.reference_ && min_ == other.min_ && max_ == other.max_;
  }
  bool operator!=(const Context & other) const noexcept { return !(*this == other); }

private:
  struct Unchecked
  {
  };

  Context(Unchecked, Interval reference, Interval min, Interval max)
  : reference_(std::move(reference)), min_(std::move(min)), max_(std::move(max))
  {
  }

  Interval reference_;
  Interval min_;
  Interval max_;
};

/// UTC offset (seconds) of the local clock at `epoch_seconds`
[[nodiscard]] int32_t local_utc_offset(int64_t epoch_seconds);

}  // namespace entity_resolver
