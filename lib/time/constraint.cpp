// entity_resolver/time/constraint.cpp - Temporal constraint walkers
//
#include "entity_resolver/time/constraint.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace entity_resolver
{

namespace
{

void check_range(const char * what, int64_t value, int64_t lo, int64_t hi)
{
  if (value < lo || value > hi) {
    throw std::invalid_argument(
      fmt::format("{} out of range: {} (expected {}..{})", what, value, lo, hi));
  }
}

/// Walker over a single interval, placed on the side it belongs to
Walker single_candidate_walker(
  const Interval & candidate, const Interval & reference, const Context & context)
{
  Walker w;
  if (candidate.end_moment() > reference.start) {
    if (context.before_upper_bound(candidate.start)) {
      w.forward = IntervalSeq::from_vector({candidate});
    }
  } else if (context.after_lower_bound(candidate.end_moment())) {
    w.backward = IntervalSeq::from_vector({candidate});
  }
  return w;
}

/// Candidates of `inner` clipped to `outer`, in increasing order
IntervalSeq candidates_within(
  const Constraint & inner, const Interval & outer, const Context & context)
{
  const Moment outer_end = outer.end_moment();
  Walker w = inner.to_walker(
    Interval::starting_at(outer.start, Grain::Second), context.bounded_by(outer_end));
  return std::move(w.forward)
    .take_while([outer_end](const Interval & c) { return c.start < outer_end; })
    .filter_map([outer](const Interval & c) { return c.intersect(outer); });
}

/// Same as candidates_within() in decreasing order
IntervalSeq candidates_within_reversed(
  const Constraint & inner, const Interval & outer, const Context & context)
{
  IntervalSeq seq = candidates_within(inner, outer, context);
  std::vector<Interval> items;
  while (std::optional<Interval> c = seq.next()) {
    items.push_back(*c);
  }
  std::reverse(items.begin(), items.end());
  return IntervalSeq::from_vector(std::move(items));
}

}  // namespace

// ============================================================================
// PeriodicConstraint
// ============================================================================

Walker PeriodicConstraint::to_walker(const Interval & reference, const Context & context) const
{
  const Moment origin = period_start(reference.start);
  const Moment ref_start = reference.start;

  IntervalSeq forward([self = this, origin, ref_start, context, k = int64_t{0}]() mutable {
    while (true) {
      const Moment start = self->advance_period(origin, k++);
      if (!context.before_upper_bound(start)) {
        return std::optional<Interval>{};
      }
      std::optional<Interval> c = self->candidate_in(start);
      if (c && c->end_moment() > ref_start) {
        if (!context.before_upper_bound(c->start)) {
          return std::optional<Interval>{};
        }
        return c;
      }
    }
  });

  IntervalSeq backward([self = this, origin, ref_start, context, k = int64_t{0}]() mutable {
    while (true) {
      const Moment start = self->advance_period(origin, k--);
      if (!context.after_lower_bound(self->advance_period(start, 1))) {
        return std::optional<Interval>{};
      }
      std::optional<Interval> c = self->candidate_in(start);
      if (c && c->end_moment() <= ref_start) {
        if (!context.after_lower_bound(c->end_moment())) {
          return std::optional<Interval>{};
        }
        return c;
      }
    }
  });

  return Walker{std::move(forward), std::move(backward)};
}

// ============================================================================
// DayOfWeek
// ============================================================================

DayOfWeek::DayOfWeek(int weekday) : weekday_(weekday) { check_range("weekday", weekday, 1, 7); }

std::string DayOfWeek::describe() const { return fmt::format("day-of-week({})", weekday_); }

Moment DayOfWeek::period_start(const Moment & m) const { return m.start_of(Grain::Week); }

Moment DayOfWeek::advance_period(const Moment & start, int64_t count) const
{
  return start.add(Grain::Week, count);
}

std::optional<Interval> DayOfWeek::candidate_in(const Moment & start) const
{
  return Interval::starting_at(start.add(Grain::Day, weekday_ - 1), Grain::Day);
}

// ============================================================================
// DayOfMonth
// ============================================================================

DayOfMonth::DayOfMonth(int day) : day_(day) { check_range("day of month", day, 1, 31); }

std::string DayOfMonth::describe() const { return fmt::format("day-of-month({})", day_); }

Moment DayOfMonth::period_start(const Moment & m) const { return m.start_of(Grain::Month); }

Moment DayOfMonth::advance_period(const Moment & start, int64_t count) const
{
  return start.add(Grain::Month, count);
}

std::optional<Interval> DayOfMonth::candidate_in(const Moment & start) const
{
  const CivilTime c = start.civil();
  if (day_ > days_in_month(c.year, c.month)) {
    return std::nullopt;
  }
  return Interval::starting_at(start.add(Grain::Day, day_ - 1), Grain::Day);
}

// ============================================================================
// MonthOfYear
// ============================================================================

MonthOfYear::MonthOfYear(int month) : month_(month) { check_range("month", month, 1, 12); }

std::string MonthOfYear::describe() const { return fmt::format("month({})", month_); }

Moment MonthOfYear::period_start(const Moment & m) const { return m.start_of(Grain::Year); }

Moment MonthOfYear::advance_period(const Moment & start, int64_t count) const
{
  return start.add(Grain::Year, count);
}

std::optional<Interval> MonthOfYear::candidate_in(const Moment & start) const
{
  return Interval::starting_at(start.add(Grain::Month, month_ - 1), Grain::Month);
}

// ============================================================================
// HourOfDay
// ============================================================================

HourOfDay::HourOfDay(int hour, bool twelve_hour_clock)
: hour_(hour), twelve_hour_clock_(twelve_hour_clock)
{
  if (twelve_hour_clock_) {
    check_range("hour", hour, 1, 12);
  } else {
    check_range("hour", hour, 0, 23);
  }
}

std::string HourOfDay::describe() const
{
  return fmt::format("hour({}{})", hour_, twelve_hour_clock_ ? ", 12h" : "");
}

Moment HourOfDay::period_start(const Moment & m) const
{
  const Moment day = m.start_of(Grain::Day);
  if (twelve_hour_clock_ && m.civil().hour >= 12) {
    return day.add(Grain::Hour, 12);
  }
  return day;
}

Moment HourOfDay::advance_period(const Moment & start, int64_t count) const
{
  if (twelve_hour_clock_) {
    return start.add(Grain::Hour, 12 * count);
  }
  return start.add(Grain::Day, count);
}

std::optional<Interval> HourOfDay::candidate_in(const Moment & start) const
{
  const int offset = twelve_hour_clock_ ? hour_ % 12 : hour_;
  return Interval::starting_at(start.add(Grain::Hour, offset), Grain::Hour);
}

// ============================================================================
// MinuteOfHour
// ============================================================================

MinuteOfHour::MinuteOfHour(int minute) : minute_(minute)
{
  check_range("minute", minute, 0, 59);
}

std::string MinuteOfHour::describe() const { return fmt::format("minute({})", minute_); }

Moment MinuteOfHour::period_start(const Moment & m) const { return m.start_of(Grain::Hour); }

Moment MinuteOfHour::advance_period(const Moment & start, int64_t count) const
{
  return start.add(Grain::Hour, count);
}

std::optional<Interval> MinuteOfHour::candidate_in(const Moment & start) const
{
  return Interval::starting_at(start.add(Grain::Minute, minute_), Grain::Minute);
}

// ============================================================================
// Year / Cycle
// ============================================================================

Year::Year(int64_t year) : year_(year)
{
  check_range("year", year, -k_max_abs_year, k_max_abs_year);
}

Walker Year::to_walker(const Interval & reference, const Context & context) const
{
  CivilTime jan_first;
  jan_first.year = year_;
  const Moment start = Moment::from_civil(jan_first, reference.start.utc_offset());
  return single_candidate_walker(Interval::starting_at(start, Grain::Year), reference, context);
}

std::string Year::describe() const { return fmt::format("year({})", year_); }

Cycle::Cycle(Grain grain, int64_t offset) : grain_(grain), offset_(offset)
{
  check_range("cycle offset", offset, -k_max_abs_offset, k_max_abs_offset);
}

Walker Cycle::to_walker(const Interval & reference, const Context & context) const
{
  const Moment start = context.reference().start.start_of(grain_).add(grain_, offset_);
  return single_candidate_walker(Interval::starting_at(start, grain_), reference, context);
}

std::string Cycle::describe() const
{
  return fmt::format("cycle({}, {:+})", to_string(grain_), offset_);
}

// ============================================================================
// Intersection
// ============================================================================

Intersection::Intersection(ConstraintPtr lhs, ConstraintPtr rhs)
: lhs_(std::move(lhs)), rhs_(std::move(rhs))
{
  if (!lhs_ || !rhs_) {
    throw std::invalid_argument("intersection requires two constraints");
  }
}

Grain Intersection::grain() const noexcept { return finer_of(lhs_->grain(), rhs_->grain()); }

Walker Intersection::to_walker(const Interval & reference, const Context & context) const
{
  // Search the finer constraint inside each candidate of the coarser one
  const bool lhs_is_outer = !is_finer(lhs_->grain(), rhs_->grain());
  const Constraint * outer = lhs_is_outer ? lhs_.get() : rhs_.get();
  const Constraint * inner = lhs_is_outer ? rhs_.get() : lhs_.get();
  const Moment ref_start = reference.start;

  Walker outer_fwd = outer->to_walker(reference, context);
  IntervalSeq forward =
    std::move(outer_fwd.forward)
      .flat_map([inner, context](const Interval & o) {
        return candidates_within(*inner, o, context);
      })
      .filter([ref_start](const Interval & c) { return c.end_moment() > ref_start; });

  // The outer candidate enclosing the reference also holds earlier matches
  Walker outer_bwd = outer->to_walker(reference, context);
  IntervalSeq enclosing = std::move(outer_bwd.forward).take_while([ref_start](const Interval & o) {
    return o.start < ref_start;
  });
  IntervalSeq backward =
    IntervalSeq::chain(std::move(enclosing), std::move(outer_bwd.backward))
      .flat_map([inner, context](const Interval & o) {
        return candidates_within_reversed(*inner, o, context);
      })
      .filter([ref_start](const Interval & c) { return c.end_moment() <= ref_start; });

  return Walker{std::move(forward), std::move(backward)};
}

std::string Intersection::describe() const
{
  return fmt::format("intersect({}, {})", lhs_->describe(), rhs_->describe());
}

// ============================================================================
// Span
// ============================================================================

Span::Span(ConstraintPtr from, ConstraintPtr to) : from_(std::move(from)), to_(std::move(to))
{
  if (!from_ || !to_) {
    throw std::invalid_argument("span requires two constraints");
  }
}

Grain Span::grain() const noexcept { return finer_of(from_->grain(), to_->grain()); }

Walker Span::to_walker(const Interval & reference, const Context & context) const
{
  const Constraint * to = to_.get();
  auto extend = [to, context](const Interval & from) -> std::optional<Interval> {
    Walker w = to->to_walker(Interval::starting_at(from.start, Grain::Second), context);
    std::optional<Interval> until = w.forward.next();
    if (!until) {
      return std::nullopt;
    }
    return from.span_to(*until);
  };

  Walker from_walker = from_->to_walker(reference, context);

  // A later start cannot find an end candidate an earlier one missed
  IntervalSeq forward(
    [from_fwd = std::move(from_walker.forward), extend]() mutable -> std::optional<Interval> {
      const std::optional<Interval> from = from_fwd.next();
      if (!from) {
        return std::nullopt;
      }
      return extend(*from);
    });
  return Walker{std::move(forward), std::move(from_walker.backward).filter_map(extend)};
}

std::string Span::describe() const
{
  return fmt::format("span({}, {})", from_->describe(), to_->describe());
}

}  // namespace entity_resolver
