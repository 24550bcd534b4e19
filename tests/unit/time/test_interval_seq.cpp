// tests/unit/time/test_interval_seq.cpp - Unit tests for IntervalSeq
//

#include <gtest/gtest.h>

#include <vector>

#include "entity_resolver/time/interval_seq.hpp"

using namespace entity_resolver;

namespace
{

Interval hour(int64_t index)
{
  return Interval::starting_at(Moment(index * 3600), Grain::Hour);
}

std::vector<int64_t> drain_hours(IntervalSeq seq)
{
  std::vector<int64_t> out;
  while (auto i = seq.next()) {
    out.push_back(i->start.epoch_seconds() / 3600);
  }
  return out;
}

/// Infinite sequence of consecutive hours, counting generator calls
IntervalSeq counting_hours(int & calls)
{
  return IntervalSeq([&calls, k = int64_t{0}]() mutable -> std::optional<Interval> {
    ++calls;
    return hour(k++);
  });
}

}  // namespace

TEST(IntervalSeqTest, EmptyIsExhausted)
{
  IntervalSeq seq = IntervalSeq::empty();
  EXPECT_TRUE(seq.exhausted());
  EXPECT_FALSE(seq.next().has_value());
}

TEST(IntervalSeqTest, FromVector)
{
  EXPECT_EQ(drain_hours(IntervalSeq::from_vector({hour(1), hour(2)})), (std::vector<int64_t>{1, 2}));
}

TEST(IntervalSeqTest, GeneratorReleasedOnExhaustion)
{
  int calls = 0;
  IntervalSeq seq([&calls]() -> std::optional<Interval> {
    ++calls;
    return std::nullopt;
  });
  EXPECT_FALSE(seq.exhausted());
  EXPECT_FALSE(seq.next().has_value());
  EXPECT_TRUE(seq.exhausted());
  EXPECT_FALSE(seq.next().has_value());
  EXPECT_EQ(calls, 1);
}

TEST(IntervalSeqTest, Chain)
{
  IntervalSeq seq = IntervalSeq::chain(
    IntervalSeq::from_vector({hour(1)}), IntervalSeq::from_vector({hour(5), hour(6)}));
  EXPECT_EQ(drain_hours(std::move(seq)), (std::vector<int64_t>{1, 5, 6}));
}

TEST(IntervalSeqTest, TakeWhileStopsInfiniteSequence)
{
  int calls = 0;
  IntervalSeq seq = counting_hours(calls).take_while(
    [](const Interval & i) { return i.start < Moment(3 * 3600); });
  EXPECT_EQ(drain_hours(std::move(seq)), (std::vector<int64_t>{0, 1, 2}));
  EXPECT_EQ(calls, 4);
}

TEST(IntervalSeqTest, PullsLazily)
{
  int calls = 0;
  IntervalSeq seq = counting_hours(calls).filter(
    [](const Interval & i) { return i.start.epoch_seconds() % 7200 == 0; });
  EXPECT_EQ(calls, 0);
  ASSERT_TRUE(seq.next().has_value());
  EXPECT_EQ(calls, 1);
  const auto second = seq.next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->start, Moment(7200));
  EXPECT_EQ(calls, 3);
}

TEST(IntervalSeqTest, FilterMapDropsNullopt)
{
  IntervalSeq seq =
    IntervalSeq::from_vector({hour(0), hour(1), hour(2), hour(3)})
      .filter_map([](const Interval & i) -> std::optional<Interval> {
        if (i.start.epoch_seconds() == 3600) {
          return std::nullopt;
        }
        return Interval::starting_at(i.start.add(Grain::Hour, 10), Grain::Hour);
      });
  EXPECT_EQ(drain_hours(std::move(seq)), (std::vector<int64_t>{10, 12, 13}));
}

TEST(IntervalSeqTest, FlatMapConcatenatesInOrder)
{
  IntervalSeq seq = IntervalSeq::from_vector({hour(0), hour(10), hour(20)})
                      .flat_map([](const Interval & i) {
                        if (i.start == Moment(10 * 3600)) {
                          return IntervalSeq::empty();
                        }
                        return IntervalSeq::from_vector(
                          {i, Interval::starting_at(i.start.add(Grain::Hour, 1), Grain::Hour)});
                      });
  EXPECT_EQ(drain_hours(std::move(seq)), (std::vector<int64_t>{0, 1, 20, 21}));
}
