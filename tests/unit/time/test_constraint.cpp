// tests/unit/time/test_constraint.cpp - Unit tests for constraint walkers
//
// Unless stated otherwise the reference is 1970-01-01T00:00:00+00:00
// (a Thursday) with the default window.
//

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "entity_resolver/time/constraint.hpp"

using namespace entity_resolver;

namespace
{

constexpr int64_t k_day = 86400;

Moment utc(int64_t year, int month, int day, int hour = 0, int minute = 0)
{
  CivilTime c;
  c.year = year;
  c.month = month;
  c.day = day;
  c.hour = hour;
  c.minute = minute;
  return Moment::from_civil(c);
}

/// Start times of the first `n` candidates of `seq`
std::vector<std::string> take(IntervalSeq & seq, size_t n)
{
  std::vector<std::string> out;
  while (out.size() < n) {
    const auto c = seq.next();
    if (!c) {
      break;
    }
    out.push_back(c->start.to_iso_string());
  }
  return out;
}

struct WalkFixture
{
  Context context = Context::from_secs(0, 0);

  Walker walk(const Constraint & c) const { return c.to_walker(context.reference(), context); }
};

}  // namespace

// ============================================================================
// Periodic constraints
// ============================================================================

TEST(ConstraintTest, DayOfWeekForwardAndBackward)
{
  WalkFixture f;
  const DayOfWeek monday(1);
  Walker w = f.walk(monday);

  EXPECT_EQ(
    take(w.forward, 2), (std::vector<std::string>{
                          "1970-01-05T00:00:00+00:00", "1970-01-12T00:00:00+00:00"}));
  EXPECT_EQ(
    take(w.backward, 2), (std::vector<std::string>{
                           "1969-12-29T00:00:00+00:00", "1969-12-22T00:00:00+00:00"}));
}

TEST(ConstraintTest, DayOfWeekContainingReferenceIsForward)
{
  WalkFixture f;
  const DayOfWeek thursday(4);
  Walker w = f.walk(thursday);

  const auto first = w.forward.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->start, Moment(0));
  EXPECT_EQ(first->grain, Grain::Day);
  EXPECT_FALSE(first->end.has_value());

  const auto before = w.backward.next();
  ASSERT_TRUE(before.has_value());
  EXPECT_EQ(before->start, utc(1969, 12, 25));
}

TEST(ConstraintTest, DayOfMonthSkipsShortMonths)
{
  const Context ctx = Context::from_secs(utc(1970, 2, 1).epoch_seconds(), 0);
  const DayOfMonth thirty_first(31);
  Walker w = thirty_first.to_walker(ctx.reference(), ctx);

  EXPECT_EQ(
    take(w.forward, 2), (std::vector<std::string>{
                          "1970-03-31T00:00:00+00:00", "1970-05-31T00:00:00+00:00"}));
  EXPECT_EQ(take(w.backward, 1), (std::vector<std::string>{"1970-01-31T00:00:00+00:00"}));
}

TEST(ConstraintTest, MonthOfYear)
{
  WalkFixture f;
  const MonthOfYear march(3);
  Walker w = f.walk(march);

  const auto first = w.forward.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->start, utc(1970, 3, 1));
  EXPECT_EQ(first->grain, Grain::Month);
  EXPECT_EQ(first->end_moment(), utc(1970, 4, 1));

  EXPECT_EQ(take(w.backward, 1), (std::vector<std::string>{"1969-03-01T00:00:00+00:00"}));
}

TEST(ConstraintTest, HourOfDayTwelveHourClock)
{
  WalkFixture f;
  const HourOfDay five(5, true);
  Walker w = f.walk(five);

  EXPECT_EQ(
    take(w.forward, 3),
    (std::vector<std::string>{
      "1970-01-01T05:00:00+00:00", "1970-01-01T17:00:00+00:00", "1970-01-02T05:00:00+00:00"}));
}

TEST(ConstraintTest, HourOfDayTwentyFourHourClock)
{
  WalkFixture f;
  const HourOfDay seventeen(17, false);
  Walker w = f.walk(seventeen);

  EXPECT_EQ(
    take(w.forward, 2), (std::vector<std::string>{
                          "1970-01-01T17:00:00+00:00", "1970-01-02T17:00:00+00:00"}));
  EXPECT_EQ(take(w.backward, 1), (std::vector<std::string>{"1969-12-31T17:00:00+00:00"}));
}

TEST(ConstraintTest, MinuteOfHour)
{
  WalkFixture f;
  const MinuteOfHour half(30);
  Walker w = f.walk(half);

  const auto first = w.forward.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->start, Moment(1800));
  EXPECT_EQ(first->grain, Grain::Minute);
}

TEST(ConstraintTest, HonoursUtcOffset)
{
  // 1970-01-01T00:00:00+02:00 is still Wednesday in UTC
  const Context ctx = Context::from_secs(-7200, 7200);
  const DayOfWeek thursday(4);
  Walker w = thursday.to_walker(ctx.reference(), ctx);

  EXPECT_EQ(take(w.forward, 1), (std::vector<std::string>{"1970-01-01T00:00:00+02:00"}));
}

TEST(ConstraintTest, RangeChecks)
{
  EXPECT_THROW(DayOfWeek(0), std::invalid_argument);
  EXPECT_THROW(DayOfWeek(8), std::invalid_argument);
  EXPECT_THROW(DayOfMonth(32), std::invalid_argument);
  EXPECT_THROW(MonthOfYear(13), std::invalid_argument);
  EXPECT_THROW(HourOfDay(0, true), std::invalid_argument);
  EXPECT_THROW(HourOfDay(24, false), std::invalid_argument);
  EXPECT_THROW(MinuteOfHour(60), std::invalid_argument);
  EXPECT_NO_THROW(HourOfDay(0, false));
  EXPECT_NO_THROW(HourOfDay(12, true));

  EXPECT_THROW(Year(4000000000000000000), std::invalid_argument);
  EXPECT_THROW(Year(-Year::k_max_abs_year - 1), std::invalid_argument);
  EXPECT_NO_THROW(static_cast<void>(Year(Year::k_max_abs_year)));
  EXPECT_THROW(Cycle(Grain::Day, 200000000000000), std::invalid_argument);
  EXPECT_THROW(Cycle(Grain::Second, -Cycle::k_max_abs_offset - 1), std::invalid_argument);
  EXPECT_NO_THROW(Cycle(Grain::Year, Cycle::k_max_abs_offset));
}

TEST(ConstraintTest, ExtremeYearAndCycleStayOutsideWindow)
{
  WalkFixture f;
  const Year year(Year::k_max_abs_year);
  Walker far_year = f.walk(year);
  EXPECT_FALSE(far_year.forward.next().has_value());
  EXPECT_FALSE(far_year.backward.next().has_value());

  const Cycle cycle(Grain::Week, -Cycle::k_max_abs_offset);
  Walker far_cycle = f.walk(cycle);
  EXPECT_FALSE(far_cycle.forward.next().has_value());
  EXPECT_FALSE(far_cycle.backward.next().has_value());
}

// ============================================================================
// Single candidate constraints
// ============================================================================

TEST(ConstraintTest, YearContainingReference)
{
  WalkFixture f;
  const Year year(1970);
  Walker w = f.walk(year);

  const auto first = w.forward.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->start, Moment(0));
  EXPECT_EQ(first->grain, Grain::Year);
  EXPECT_FALSE(w.forward.next().has_value());
  EXPECT_FALSE(w.backward.next().has_value());
}

TEST(ConstraintTest, PastYearIsBackwardOnly)
{
  WalkFixture f;
  const Year year(1969);
  Walker w = f.walk(year);

  EXPECT_FALSE(w.forward.next().has_value());
  EXPECT_EQ(take(w.backward, 2), (std::vector<std::string>{"1969-01-01T00:00:00+00:00"}));
}

TEST(ConstraintTest, Cycle)
{
  WalkFixture f;

  const Cycle next_week(Grain::Week, 1);
  Walker w = f.walk(next_week);
  const auto week = w.forward.next();
  ASSERT_TRUE(week.has_value());
  EXPECT_EQ(week->start, utc(1970, 1, 5));
  EXPECT_EQ(week->grain, Grain::Week);

  const Cycle yesterday(Grain::Day, -1);
  Walker y = f.walk(yesterday);
  EXPECT_FALSE(y.forward.next().has_value());
  EXPECT_EQ(take(y.backward, 1), (std::vector<std::string>{"1969-12-31T00:00:00+00:00"}));

  EXPECT_EQ(next_week.describe(), "cycle(week, +1)");
}

// ============================================================================
// Composite constraints
// ============================================================================

TEST(ConstraintTest, IntersectionOfMonthAndDay)
{
  WalkFixture f;
  const Intersection ides_of_march(
    std::make_shared<MonthOfYear>(3), std::make_shared<DayOfMonth>(15));
  EXPECT_EQ(ides_of_march.grain(), Grain::Day);

  Walker w = f.walk(ides_of_march);
  EXPECT_EQ(
    take(w.forward, 2), (std::vector<std::string>{
                          "1970-03-15T00:00:00+00:00", "1971-03-15T00:00:00+00:00"}));
  EXPECT_EQ(take(w.backward, 1), (std::vector<std::string>{"1969-03-15T00:00:00+00:00"}));
}

TEST(ConstraintTest, IntersectionOrderIndependent)
{
  WalkFixture f;
  const Intersection a(std::make_shared<DayOfWeek>(1), std::make_shared<HourOfDay>(9, false));
  const Intersection b(std::make_shared<HourOfDay>(9, false), std::make_shared<DayOfWeek>(1));

  Walker wa = f.walk(a);
  Walker wb = f.walk(b);
  const auto ca = wa.forward.next();
  const auto cb = wb.forward.next();
  ASSERT_TRUE(ca.has_value());
  ASSERT_TRUE(cb.has_value());
  EXPECT_EQ(*ca, *cb);
  EXPECT_EQ(ca->start, utc(1970, 1, 5, 9));
  EXPECT_EQ(ca->grain, Grain::Hour);
}

TEST(ConstraintTest, IntersectionBackwardSearchesEnclosingPeriod)
{
  // Thursday noon: this morning's 9 o'clock is already past
  const Context ctx = Context::from_secs(12 * 3600, 0);
  const Intersection thursday_nine(
    std::make_shared<DayOfWeek>(4), std::make_shared<HourOfDay>(9, false));
  Walker w = thursday_nine.to_walker(ctx.reference(), ctx);

  EXPECT_EQ(take(w.forward, 1), (std::vector<std::string>{"1970-01-08T09:00:00+00:00"}));
  EXPECT_EQ(
    take(w.backward, 2), (std::vector<std::string>{
                           "1970-01-01T09:00:00+00:00", "1969-12-25T09:00:00+00:00"}));
}

TEST(ConstraintTest, EmptyIntersectionTerminates)
{
  // February 30th never exists; a narrow window keeps the walk short
  const Interval now = Interval::starting_at(Moment(0), Grain::Second);
  const Context ctx(
    now, Interval::starting_at(utc(1960, 1, 1), Grain::Second),
    Interval::starting_at(utc(1980, 1, 1), Grain::Second));
  const Intersection feb_30(std::make_shared<MonthOfYear>(2), std::make_shared<DayOfMonth>(30));
  Walker w = feb_30.to_walker(ctx.reference(), ctx);

  EXPECT_FALSE(w.forward.next().has_value());
  EXPECT_FALSE(w.backward.next().has_value());
}

TEST(ConstraintTest, NestedEmptyIntersectionIsFast)
{
  // "friday february 30th" over the default thousand year window
  const Context ctx = Context::from_secs(1500000000, 0);
  const Intersection friday_feb_30(
    std::make_shared<DayOfWeek>(5),
    std::make_shared<Intersection>(
      std::make_shared<DayOfMonth>(30), std::make_shared<MonthOfYear>(2)));

  const auto started = std::chrono::steady_clock::now();
  Walker w = friday_feb_30.to_walker(ctx.reference(), ctx);
  EXPECT_FALSE(w.forward.next().has_value());
  EXPECT_FALSE(w.backward.next().has_value());
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 5);
}

TEST(ConstraintTest, CycleInsideIntersectionKeepsReference)
{
  // 2017-07-14, "this month" stays July 2017 whatever the enclosing year
  const Context ctx = Context::from_secs(1500000000, 0);
  const auto this_month = std::make_shared<Cycle>(Grain::Month, 0);

  const Intersection in_2017(std::make_shared<Year>(2017), this_month);
  Walker w = in_2017.to_walker(ctx.reference(), ctx);
  EXPECT_EQ(take(w.forward, 2), (std::vector<std::string>{"2017-07-01T00:00:00+00:00"}));

  const Intersection in_2020(std::make_shared<Year>(2020), this_month);
  Walker none = in_2020.to_walker(ctx.reference(), ctx);
  EXPECT_FALSE(none.forward.next().has_value());
  EXPECT_FALSE(none.backward.next().has_value());
}

TEST(ConstraintTest, SpanToCycleKeepsReference)
{
  // From a monday until the end of the week after next
  WalkFixture f;
  const Span until_week_after_next(
    std::make_shared<DayOfWeek>(1), std::make_shared<Cycle>(Grain::Week, 2));
  Walker w = f.walk(until_week_after_next);

  const auto first = w.forward.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->start, utc(1970, 1, 5));
  ASSERT_TRUE(first->end.has_value());
  EXPECT_EQ(*first->end, utc(1970, 1, 19));

  const auto second = w.forward.next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->start, utc(1970, 1, 12));
  EXPECT_EQ(*second->end, utc(1970, 1, 19));

  // Later mondays start after the end of that week
  EXPECT_FALSE(w.forward.next().has_value());
}

TEST(ConstraintTest, SpanExtendsToFirstEndCandidate)
{
  WalkFixture f;
  const Span monday_to_wednesday(std::make_shared<DayOfWeek>(1), std::make_shared<DayOfWeek>(3));
  Walker w = f.walk(monday_to_wednesday);

  const auto first = w.forward.next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->start, utc(1970, 1, 5));
  ASSERT_TRUE(first->end.has_value());
  EXPECT_EQ(*first->end, utc(1970, 1, 8));
  EXPECT_EQ(first->grain, Grain::Day);
}

TEST(ConstraintTest, CompositesRejectNull)
{
  EXPECT_THROW(Intersection(nullptr, std::make_shared<DayOfWeek>(1)), std::invalid_argument);
  EXPECT_THROW(Span(std::make_shared<DayOfWeek>(1), nullptr), std::invalid_argument);
}

// ============================================================================
// Window bounds
// ============================================================================

TEST(ConstraintTest, WindowStopsWalks)
{
  const Interval now = Interval::starting_at(Moment(0), Grain::Second);
  const Context ctx(
    now, Interval::starting_at(Moment(-3 * k_day), Grain::Second),
    Interval::starting_at(Moment(10 * k_day), Grain::Second));
  const DayOfWeek monday(1);
  Walker w = monday.to_walker(ctx.reference(), ctx);

  EXPECT_EQ(take(w.forward, 5), (std::vector<std::string>{"1970-01-05T00:00:00+00:00"}));
  EXPECT_EQ(take(w.backward, 5), (std::vector<std::string>{"1969-12-29T00:00:00+00:00"}));
}

TEST(ConstraintTest, Describe)
{
  EXPECT_EQ(DayOfWeek(1).describe(), "day-of-week(1)");
  EXPECT_EQ(HourOfDay(5, true).describe(), "hour(5, 12h)");
  EXPECT_EQ(
    Intersection(std::make_shared<MonthOfYear>(3), std::make_shared<DayOfMonth>(15)).describe(),
    "intersect(month(3), day-of-month(15))");
}
