// entity_resolver/time/constraint.hpp - Temporal constraints
//
// A constraint is an abstract, not yet anchored temporal expression
// ("monday", "march 15th", "next week"). Given a reference interval it
// produces a Walker over the concrete intervals that satisfy it.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "entity_resolver/time/context.hpp"
#include "entity_resolver/time/grain.hpp"
#include "entity_resolver/time/interval.hpp"
#include "entity_resolver/time/interval_seq.hpp"

namespace entity_resolver
{

/**
 * Base class of all temporal constraints.
 *
 * Constraints are immutable and may be shared across threads. A Walker
 * refers to the constraint that produced it and must not outlive it.
 *
 * Walkers never leave the context window: forward walks stop after
 * `context.max()`, backward walks stop before `context.min()`.
 */
class Constraint
{
public:
  virtual ~Constraint() = default;

  /// Grain of the intervals this constraint produces
  [[nodiscard]] virtual Grain grain() const noexcept = 0;

  /**
   * Build the candidate walker around `reference`.
   *
   * `forward` yields candidates ending after `reference.start` in
   * increasing order, `backward` the remaining ones in decreasing order.
   */
  [[nodiscard]] virtual Walker to_walker(
    const Interval & reference, const Context & context) const = 0;

  /// Short human readable form, e.g. "day-of-week(1)"
  [[nodiscard]] virtual std::string describe() const = 0;
};

using ConstraintPtr = std::shared_ptr<const Constraint>;

// ============================================================================
// Periodic constraints
// ============================================================================

/**
 * Constraint matching at most one interval per fixed calendar period
 * (a day of week per week, a month per year, ...).
 */
class PeriodicConstraint : public Constraint
{
public:
  [[nodiscard]] Walker to_walker(
    const Interval & reference, const Context & context) const final;

protected:
  /// Start of the period enclosing `m`
  [[nodiscard]] virtual Moment period_start(const Moment & m) const = 0;

  /// `start` shifted by `count` periods
  [[nodiscard]] virtual Moment advance_period(const Moment & start, int64_t count) const = 0;

  /// The matching interval inside the period beginning at `start`, if any
  [[nodiscard]] virtual std::optional<Interval> candidate_in(const Moment & start) const = 0;
};

/// ISO weekday, 1 = Monday ... 7 = Sunday
class DayOfWeek final : public PeriodicConstraint
{
public:
  explicit DayOfWeek(int weekday);

  [[nodiscard]] Grain grain() const noexcept override { return Grain::Day; }
  [[nodiscard]] std::string describe() const override;
  [[nodiscard]] int weekday() const noexcept { return weekday_; }

protected:
  [[nodiscard]] Moment period_start(const Moment & m) const override;
  [[nodiscard]] Moment advance_period(const Moment & start, int64_t count) const override;
  [[nodiscard]] std::optional<Interval> candidate_in(const Moment & start) const override;

private:
  int weekday_;
};

/// Day of month 1..31; months without that day are skipped
class DayOfMonth final : public PeriodicConstraint
{
public:
  explicit DayOfMonth(int day);

  [[nodiscard]] Grain grain() const noexcept override { return Grain::Day; }
  [[nodiscard]] std::string describe() const override;

protected:
  [[nodiscard]] Moment period_start(const Moment & m) const override;
  [[nodiscard]] Moment advance_period(const Moment & start, int64_t count) const override;
  [[nodiscard]] std::optional<Interval> candidate_in(const Moment & start) const override;

private:
  int day_;
};

/// Month of year 1..12
class MonthOfYear final : public PeriodicConstraint
{
public:
  explicit MonthOfYear(int month);

  [[nodiscard]] Grain grain() const noexcept override { return Grain::Month; }
  [[nodiscard]] std::string describe() const override;

protected:
  [[nodiscard]] Moment period_start(const Moment & m) const override;
  [[nodiscard]] Moment advance_period(const Moment & start, int64_t count) const override;
  [[nodiscard]] std::optional<Interval> candidate_in(const Moment & start) const override;

private:
  int month_;
};

/**
 * Hour of day. With the twelve hour clock, `hour` is 1..12 and matches
 * twice a day ("at 5" is 5am and 5pm).
 */
class HourOfDay final : public PeriodicConstraint
{
public:
  HourOfDay(int hour, bool twelve_hour_clock);

  [[nodiscard]] Grain grain() const noexcept override { return Grain::Hour; }
  [[nodiscard]] std::string describe() const override;

protected:
  [[nodiscard]] Moment period_start(const Moment & m) const override;
  [[nodiscard]] Moment advance_period(const Moment & start, int64_t count) const override;
  [[nodiscard]] std::optional<Interval> candidate_in(const Moment & start) const override;

private:
  int hour_;
  bool twelve_hour_clock_;
};

class MinuteOfHour final : public PeriodicConstraint
{
public:
  explicit MinuteOfHour(int minute);

  [[nodiscard]] Grain grain() const noexcept override { return Grain::Minute; }
  [[nodiscard]] std::string describe() const override;

protected:
  [[nodiscard]] Moment period_start(const Moment & m) const override;
  [[nodiscard]] Moment advance_period(const Moment & start, int64_t count) const override;
  [[nodiscard]] std::optional<Interval> candidate_in(const Moment & start) const override;

private:
  int minute_;
};

// ============================================================================
// Single candidate constraints
// ============================================================================

/// A whole calendar year, at most k_max_abs_year away from year zero
class Year final : public Constraint
{
public:
  static constexpr int64_t k_max_abs_year = 1'000'000'000;

  explicit Year(int64_t year);

  [[nodiscard]] Grain grain() const noexcept override { return Grain::Year; }
  [[nodiscard]] Walker to_walker(
    const Interval & reference, const Context & context) const override;
  [[nodiscard]] std::string describe() const override;

private:
  int64_t year_;
};

/**
 * The grain-aligned interval enclosing the context reference, shifted by
 * `offset` grains: "this week" (0), "next month" (1), "last year" (-1).
 *
 * The anchor is always `context.reference()`, also when the walk starts
 * elsewhere inside an intersection or span.
 */
class Cycle final : public Constraint
{
public:
  static constexpr int64_t k_max_abs_offset = 1'000'000'000;

  Cycle(Grain grain, int64_t offset);

  [[nodiscard]] Grain grain() const noexcept override { return grain_; }
  [[nodiscard]] Walker to_walker(
    const Interval & reference, const Context & context) const override;
  [[nodiscard]] std::string describe() const override;

private:
  Grain grain_;
  int64_t offset_;
};

// ============================================================================
// Composite constraints
// ============================================================================

/**
 * Intervals satisfying both constraints ("monday the 15th", "march 3rd").
 *
 * Walks the coarser constraint and searches the finer one inside each of
 * its candidates.
 */
class Intersection final : public Constraint
{
public:
  Intersection(ConstraintPtr lhs, ConstraintPtr rhs);

  [[nodiscard]] Grain grain() const noexcept override;
  [[nodiscard]] Walker to_walker(
    const Interval & reference, const Context & context) const override;
  [[nodiscard]] std::string describe() const override;

private:
  ConstraintPtr lhs_;
  ConstraintPtr rhs_;
};

/**
 * Explicit span "from X to Y": each candidate of `from` extended to the
 * end of the first `to` candidate that ends after it starts.
 */
class Span final : public Constraint
{
public:
  Span(ConstraintPtr from, ConstraintPtr to);

  [[nodiscard]] Grain grain() const noexcept override;
  [[nodiscard]] Walker to_walker(
    const Interval & reference, const Context & context) const override;
  [[nodiscard]] std::string describe() const override;

private:
  ConstraintPtr from_;
  ConstraintPtr to_;
};

}  // namespace entity_resolver
