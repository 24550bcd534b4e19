// entity_resolver/values/output.hpp - Concrete resolved values
//
// Outputs are created fresh by each resolution and owned by the caller.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "entity_resolver/time/grain.hpp"
#include "entity_resolver/time/moment.hpp"
#include "entity_resolver/time/period.hpp"
#include "entity_resolver/values/value_enums.hpp"

namespace entity_resolver
{

// ============================================================================
// Temporal outputs
// ============================================================================

struct DatetimeOutput
{
  Moment moment;
  Grain grain = Grain::Second;
  Precision precision = Precision::Exact;
  bool latent = false;
  DatetimeKind datetime_kind = DatetimeKind::Empty;

  bool operator==(const DatetimeOutput & o) const noexcept
  {
    return moment == o.moment && grain == o.grain && precision == o.precision &&
           latent == o.latent && datetime_kind == o.datetime_kind;
  }
  bool operator!=(const DatetimeOutput & o) const noexcept { return !(*this == o); }
};

/// Closed span `[start, end)`
struct BetweenInterval
{
  Moment start;
  Moment end;
  Precision precision = Precision::Exact;
  bool latent = false;

  bool operator==(const BetweenInterval & o) const noexcept
  {
    return start == o.start && end == o.end && precision == o.precision && latent == o.latent;
  }
  bool operator!=(const BetweenInterval & o) const noexcept { return !(*this == o); }
};

/// Open-ended span ending at the payload moment
struct BeforeInterval
{
  DatetimeOutput value;

  bool operator==(const BeforeInterval & o) const noexcept { return value == o.value; }
  bool operator!=(const BeforeInterval & o) const noexcept { return !(*this == o); }
};

/// Open-ended span starting at the payload moment
struct AfterInterval
{
  DatetimeOutput value;

  bool operator==(const AfterInterval & o) const noexcept { return value == o.value; }
  bool operator!=(const AfterInterval & o) const noexcept { return !(*this == o); }
};

using DatetimeIntervalKind = std::variant<BetweenInterval, BeforeInterval, AfterInterval>;

struct DatetimeIntervalOutput
{
  DatetimeIntervalKind interval_kind;
  DatetimeKind datetime_kind = DatetimeKind::Empty;

  bool operator==(const DatetimeIntervalOutput & o) const noexcept
  {
    return interval_kind == o.interval_kind && datetime_kind == o.datetime_kind;
  }
  bool operator!=(const DatetimeIntervalOutput & o) const noexcept { return !(*this == o); }
};

// ============================================================================
// Scalar outputs
// ============================================================================

struct IntegerOutput
{
  int64_t value = 0;

  bool operator==(const IntegerOutput & o) const noexcept { return value == o.value; }
  bool operator!=(const IntegerOutput & o) const noexcept { return !(*this == o); }
};

struct FloatOutput
{
  double value = 0.0;

  bool operator==(const FloatOutput & o) const noexcept { return value == o.value; }
  bool operator!=(const FloatOutput & o) const noexcept { return !(*this == o); }
};

struct OrdinalOutput
{
  int64_t value = 0;

  bool operator==(const OrdinalOutput & o) const noexcept { return value == o.value; }
  bool operator!=(const OrdinalOutput & o) const noexcept { return !(*this == o); }
};

struct AmountOfMoneyOutput
{
  double value = 0.0;
  Precision precision = Precision::Exact;
  std::optional<std::string> unit;

  bool operator==(const AmountOfMoneyOutput & o) const
  {
    return value == o.value && precision == o.precision && unit == o.unit;
  }
  bool operator!=(const AmountOfMoneyOutput & o) const { return !(*this == o); }
};

struct TemperatureOutput
{
  double value = 0.0;
  std::optional<std::string> unit;
  bool latent = false;

  bool operator==(const TemperatureOutput & o) const
  {
    return value == o.value && unit == o.unit && latent == o.latent;
  }
  bool operator!=(const TemperatureOutput & o) const { return !(*this == o); }
};

struct DurationOutput
{
  Period period;
  Precision precision = Precision::Exact;

  bool operator==(const DurationOutput & o) const noexcept
  {
    return period == o.period && precision == o.precision;
  }
  bool operator!=(const DurationOutput & o) const noexcept { return !(*this == o); }
};

struct PercentageOutput
{
  double value = 0.0;

  bool operator==(const PercentageOutput & o) const noexcept { return value == o.value; }
  bool operator!=(const PercentageOutput & o) const noexcept { return !(*this == o); }
};

// ============================================================================
// Output
// ============================================================================

using Output = std::variant<
  DatetimeOutput, DatetimeIntervalOutput, IntegerOutput, FloatOutput, OrdinalOutput,
  AmountOfMoneyOutput, TemperatureOutput, DurationOutput, PercentageOutput>;

/// Name of the output kind, e.g. "datetime_interval"
[[nodiscard]] std::string_view output_kind_name(const Output & out) noexcept;

/// Latent flag of the output (false for kinds without one)
[[nodiscard]] bool is_latent(const Output & out) noexcept;

}  // namespace entity_resolver
