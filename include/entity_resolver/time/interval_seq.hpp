// entity_resolver/time/interval_seq.hpp - Lazy candidate interval sequences
//
// Candidates are produced on demand by a generator. Producing the next
// element may run an arbitrary amount of calendar arithmetic, so callers
// pull only what they need.
//
#pragma once

#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "entity_resolver/time/interval.hpp"

namespace entity_resolver
{

/**
 * Pull-based, non-restartable sequence of intervals.
 *
 * Once the generator reports exhaustion (nullopt) it is released and
 * never called again. Combinators consume the sequence they are
 * applied to.
 */
class IntervalSeq
{
public:
  using Generator = std::function<std::optional<Interval>()>;
  using Predicate = std::function<bool(const Interval &)>;
  using Mapper = std::function<std::optional<Interval>(const Interval &)>;
  using Expander = std::function<IntervalSeq(const Interval &)>;

  /// An exhausted sequence
  IntervalSeq() = default;

  explicit IntervalSeq(Generator gen) : gen_(std::move(gen)) {}

  [[nodiscard]] static IntervalSeq empty() { return IntervalSeq(); }

  [[nodiscard]] static IntervalSeq from_vector(std::vector<Interval> items);

  /// All of `first`, then all of `second`
  [[nodiscard]] static IntervalSeq chain(IntervalSeq first, IntervalSeq second);

  /// Pull the next interval, nullopt once the sequence is exhausted
  std::optional<Interval> next();

  [[nodiscard]] bool exhausted() const noexcept { return !gen_; }

  // ===========================================================================
  // Combinators
  // ===========================================================================

  /// Stops at the first interval not satisfying `pred`
  [[nodiscard]] IntervalSeq take_while(Predicate pred) &&;

  [[nodiscard]] IntervalSeq filter(Predicate pred) &&;

  [[nodiscard]] IntervalSeq filter_map(Mapper fn) &&;

  /// Concatenates the sequences produced for each interval, in order
  [[nodiscard]] IntervalSeq flat_map(Expander fn) &&;

private:
  Generator gen_;
};

/**
 * Paired candidate sequences derived from a constraint and a reference.
 *
 * `forward` yields candidates at or after the reference in increasing
 * start order; `backward` yields earlier candidates in decreasing start
 * order. A Walker belongs to a single resolution call.
 */
struct Walker
{
  IntervalSeq forward;
  IntervalSeq backward;

  [[nodiscard]] static Walker empty() { return Walker{}; }
};

}  // namespace entity_resolver
