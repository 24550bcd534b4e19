// tests/unit/time/test_context.cpp - Unit tests for Context construction
//

#include <gtest/gtest.h>

#include <stdexcept>

#include "entity_resolver/time/context.hpp"

using namespace entity_resolver;

namespace
{

Interval at(int64_t secs, int32_t offset = 0)
{
  return Interval::starting_at(Moment(secs, offset), Grain::Second);
}

}  // namespace

TEST(ContextTest, ForReferenceDefaultWindow)
{
  const Interval now = at(1500000000);
  const Context ctx = Context::for_reference(now);

  EXPECT_EQ(ctx.reference(), now);
  EXPECT_EQ(ctx.min().start, now.start.add(Grain::Year, -Context::k_default_window_years));
  EXPECT_EQ(ctx.max().start, now.start.add(Grain::Year, Context::k_default_window_years));
  EXPECT_EQ(ctx.min().grain, Grain::Second);
  EXPECT_EQ(ctx.min().start.civil().year, 1017);
  EXPECT_EQ(ctx.max().start.civil().year, 3017);
}

TEST(ContextTest, FromSecsWithOffset)
{
  const Context ctx = Context::from_secs(0, 3600);
  EXPECT_EQ(ctx.reference(), at(0, 3600));
  EXPECT_EQ(ctx.reference().grain, Grain::Second);
  EXPECT_EQ(ctx.reference().start.to_iso_string(), "1970-01-01T01:00:00+01:00");
}

TEST(ContextTest, FromSecsLocalClockIsSecondGrain)
{
  const Context ctx = Context::from_secs(1500000000);
  EXPECT_EQ(ctx.reference().start.epoch_seconds(), 1500000000);
  EXPECT_EQ(ctx.reference().start.utc_offset(), local_utc_offset(1500000000));
  EXPECT_FALSE(ctx.reference().end.has_value());
}

TEST(ContextTest, ExplicitWindow)
{
  const Context ctx(at(100), at(0), at(200));
  EXPECT_EQ(ctx.min(), at(0));
  EXPECT_EQ(ctx.max(), at(200));

  // Bounds are inclusive
  EXPECT_NO_THROW(static_cast<void>(Context(at(0), at(0), at(0))));
}

TEST(ContextTest, ExplicitWindowRejectsOutsideReference)
{
  EXPECT_THROW(static_cast<void>(Context(at(-1), at(0), at(200))), std::invalid_argument);
  EXPECT_THROW(static_cast<void>(Context(at(201), at(0), at(200))), std::invalid_argument);
}

TEST(ContextTest, WalkBounds)
{
  const Context ctx(at(100), at(0), at(200));
  EXPECT_TRUE(ctx.before_upper_bound(Moment(200)));
  EXPECT_FALSE(ctx.before_upper_bound(Moment(201)));
  EXPECT_TRUE(ctx.after_lower_bound(Moment(1)));
  EXPECT_FALSE(ctx.after_lower_bound(Moment(0)));
}

TEST(ContextTest, Equality)
{
  EXPECT_EQ(Context::from_secs(0, 0), Context::for_reference(at(0)));
  EXPECT_NE(Context::from_secs(0, 0), Context::from_secs(1, 0));
}

TEST(ContextTest, RejectsReferenceTooFarFromEpoch)
{
  const int64_t too_far = Context::k_max_abs_epoch_seconds + 1;
  EXPECT_THROW(static_cast<void>(Context::from_secs(too_far, 0)), std::out_of_range);
  EXPECT_THROW(static_cast<void>(Context::for_reference(at(-too_far))), std::out_of_range);
  EXPECT_THROW(static_cast<void>(Context(at(0), at(-too_far), at(200))), std::out_of_range);
  EXPECT_NO_THROW(static_cast<void>(Context::from_secs(Context::k_max_abs_epoch_seconds, 0)));
}

TEST(ContextTest, BoundedByKeepsReference)
{
  const Context ctx(at(100), at(0), at(200));

  const Context narrowed = ctx.bounded_by(Moment(50));
  EXPECT_EQ(narrowed.reference(), ctx.reference());
  EXPECT_EQ(narrowed.min(), ctx.min());
  EXPECT_TRUE(narrowed.before_upper_bound(Moment(49)));
  EXPECT_FALSE(narrowed.before_upper_bound(Moment(50)));

  // Never widens
  EXPECT_EQ(ctx.bounded_by(Moment(500)), ctx);
}
