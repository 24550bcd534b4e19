// entity_resolver/resolve/resolver.cpp - Dimension resolution
//
#include "entity_resolver/resolve/resolver.hpp"

#include <fmt/core.h>

#include <type_traits>
#include <utility>

namespace entity_resolver
{

namespace
{

// ============================================================================
// Temporal candidate selection
// ============================================================================

/// Pulls at most two forward candidates and one backward candidate
std::optional<Interval> select_candidate(
  Walker & walker, const DatetimeValue & value, const Context & context)
{
  std::optional<Interval> chosen = walker.forward.next();
  if (
    chosen && value.form.is_not_immediate() &&
    chosen->intersect(context.reference()).has_value()) {
    chosen = walker.forward.next();
  }
  if (!chosen) {
    chosen = walker.backward.next();
  }
  return chosen;
}

Moment anchor_moment(const Interval & interval, const Bound & bound)
{
  if (bound.kind == BoundKind::Start) {
    return interval.start;
  }
  if (bound.only_interval) {
    return interval.end.value_or(interval.start);
  }
  return interval.end_moment();
}

Output directed_output(
  const Interval & interval, const DatetimeValue & value, const BoundedDirection & direction)
{
  const DatetimeOutput payload{
    anchor_moment(interval, direction.bound), interval.grain, value.precision, value.latent,
    value.datetime_kind};

  DatetimeIntervalOutput out;
  // Outer kind comes from the payload, not from the value
  out.datetime_kind = payload.datetime_kind;
  switch (direction.direction) {
    case Direction::After:
      out.interval_kind = AfterInterval{payload};
      break;
    case Direction::Before:
      out.interval_kind = BeforeInterval{payload};
      break;
  }
  return out;
}

Output spanning_output(
  const Interval & interval, const Moment & end, const DatetimeValue & value,
  DiagnosticBag * diags)
{
  if (
    diags != nullptr &&
    (value.datetime_kind == DatetimeKind::Date || value.datetime_kind == DatetimeKind::Time)) {
    diags->report_warning(fmt::format("{} kind with an interval", to_string(value.datetime_kind)))
      .with_code(diag_codes::k_kind_with_interval)
      .with_note(interval.to_string())
      .with_help("the grammar rule likely declared the wrong datetime kind");
  }

  DatetimeIntervalOutput out;
  out.interval_kind = BetweenInterval{interval.start, end, value.precision, value.latent};
  out.datetime_kind = value.datetime_kind;
  return out;
}

std::optional<Output> resolve_datetime(
  const Context & context, const DatetimeValue & value, DiagnosticBag * diags)
{
  if (!value.constraint) {
    return std::nullopt;
  }

  Walker walker = value.constraint->to_walker(context.reference(), context);
  const std::optional<Interval> interval = select_candidate(walker, value, context);
  if (!interval) {
    return std::nullopt;
  }

  if (value.direction) {
    return directed_output(*interval, value, *value.direction);
  }
  if (interval->end) {
    return spanning_output(*interval, *interval->end, value, diags);
  }
  return DatetimeOutput{
    interval->start, interval->grain, value.precision, value.latent, value.datetime_kind};
}

// ============================================================================
// Scalar mapping
// ============================================================================

Output resolve_number(const NumberValue & number)
{
  if (const auto * i = std::get_if<IntegerValue>(&number)) {
    return IntegerOutput{i->value};
  }
  return FloatOutput{std::get<FloatValue>(number).value};
}

}  // namespace

std::optional<Output> resolve(const Context & context, const Dimension & dim, DiagnosticBag * diags)
{
  return std::visit(
    [&](const auto & value) -> std::optional<Output> {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, DatetimeValue>) {
        return resolve_datetime(context, value, diags);
      } else if constexpr (std::is_same_v<T, NumberValue>) {
        return resolve_number(value);
      } else if constexpr (std::is_same_v<T, OrdinalValue>) {
        return OrdinalOutput{value.value};
      } else if constexpr (std::is_same_v<T, AmountOfMoneyValue>) {
        return AmountOfMoneyOutput{value.value, value.precision, value.unit};
      } else if constexpr (std::is_same_v<T, TemperatureValue>) {
        return TemperatureOutput{value.value, value.unit, value.latent};
      } else if constexpr (std::is_same_v<T, DurationValue>) {
        return DurationOutput{value.period, value.precision};
      } else if constexpr (std::is_same_v<T, PercentageValue>) {
        return PercentageOutput{value.value};
      } else {
        // Grammar building blocks have no concrete output
        return std::nullopt;
      }
    },
    dim);
}

std::vector<std::optional<Output>> ResolverContext::resolve_all(
  gsl::span<const Dimension> dims) const
{
  std::vector<std::optional<Output>> outputs;
  outputs.reserve(static_cast<size_t>(dims.size()));

  size_t index = 0;
  for (const Dimension & dim : dims) {
    if (diags_ == nullptr) {
      outputs.push_back(entity_resolver::resolve(ctx_, dim));
    } else {
      DiagnosticBag local;
      outputs.push_back(entity_resolver::resolve(ctx_, dim, &local));
      for (const auto & d : local) {
        Diagnostic tagged = d;
        tagged.value_index = index;
        diags_->add(std::move(tagged));
      }
    }
    ++index;
  }
  return outputs;
}

}  // namespace entity_resolver
