// entity_resolver/time/interval_seq.cpp - Lazy sequence combinators
//
#include "entity_resolver/time/interval_seq.hpp"

namespace entity_resolver
{

IntervalSeq IntervalSeq::from_vector(std::vector<Interval> items)
{
  if (items.empty()) {
    return empty();
  }
  return IntervalSeq([items = std::move(items), pos = size_t{0}]() mutable {
    if (pos >= items.size()) {
      return std::optional<Interval>{};
    }
    return std::optional<Interval>{items[pos++]};
  });
}

IntervalSeq IntervalSeq::chain(IntervalSeq first, IntervalSeq second)
{
  return IntervalSeq([first = std::move(first), second = std::move(second)]() mutable {
    if (std::optional<Interval> v = first.next()) {
      return v;
    }
    return second.next();
  });
}

std::optional<Interval> IntervalSeq::next()
{
  if (!gen_) {
    return std::nullopt;
  }
  std::optional<Interval> value = gen_();
  if (!value) {
    gen_ = nullptr;
  }
  return value;
}

IntervalSeq IntervalSeq::take_while(Predicate pred) &&
{
  return IntervalSeq([src = std::move(*this), pred = std::move(pred)]() mutable {
    std::optional<Interval> v = src.next();
    if (v && !pred(*v)) {
      src = IntervalSeq();
      return std::optional<Interval>{};
    }
    return v;
  });
}

IntervalSeq IntervalSeq::filter(Predicate pred) &&
{
  return IntervalSeq([src = std::move(*this), pred = std::move(pred)]() mutable {
    while (std::optional<Interval> v = src.next()) {
      if (pred(*v)) {
        return v;
      }
    }
    return std::optional<Interval>{};
  });
}

IntervalSeq IntervalSeq::filter_map(Mapper fn) &&
{
  return IntervalSeq([src = std::move(*this), fn = std::move(fn)]() mutable {
    while (std::optional<Interval> v = src.next()) {
      if (std::optional<Interval> mapped = fn(*v)) {
        return mapped;
      }
    }
    return std::optional<Interval>{};
  });
}

IntervalSeq IntervalSeq::flat_map(Expander fn) &&
{
  return IntervalSeq(
    [src = std::move(*this), fn = std::move(fn), inner = IntervalSeq()]() mutable {
      while (true) {
        if (std::optional<Interval> v = inner.next()) {
          return v;
        }
        std::optional<Interval> outer = src.next();
        if (!outer) {
          return std::optional<Interval>{};
        }
        inner = fn(*outer);
      }
    });
}

}  // namespace entity_resolver
