// entity_resolver/values/dimension.hpp - Abstract semantic values produced by the grammar
//
// A Dimension is what a grammar rule recognized in the text before it is
// anchored to a reference time. The set of kinds is closed.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "entity_resolver/time/constraint.hpp"
#include "entity_resolver/time/grain.hpp"
#include "entity_resolver/time/period.hpp"
#include "entity_resolver/values/value_enums.hpp"

namespace entity_resolver
{

// ============================================================================
// Temporal values
// ============================================================================

struct Form
{
  FormKind kind = FormKind::Empty;

  /// Set by forms that may exclude the current occurrence ("next monday")
  std::optional<bool> not_immediate;

  [[nodiscard]] static Form of(FormKind kind, std::optional<bool> not_immediate = std::nullopt)
  {
    return Form{kind, not_immediate};
  }

  /// Whether the occurrence overlapping the reference must be skipped
  [[nodiscard]] bool is_not_immediate() const noexcept { return not_immediate.value_or(false); }
};

struct Bound
{
  BoundKind kind = BoundKind::Start;

  /// For End bounds: use the explicit interval end only, never a grain-derived one
  bool only_interval = false;

  [[nodiscard]] static Bound start() noexcept { return Bound{BoundKind::Start, false}; }
  [[nodiscard]] static Bound end(bool only_interval) noexcept
  {
    return Bound{BoundKind::End, only_interval};
  }
};

/**
 * Marks an open-ended expression ("after monday", "before 5pm").
 */
struct BoundedDirection
{
  Bound bound;
  Direction direction = Direction::After;
};

struct DatetimeValue
{
  ConstraintPtr constraint;
  Form form;
  std::optional<BoundedDirection> direction;
  Precision precision = Precision::Exact;
  bool latent = false;
  DatetimeKind datetime_kind = DatetimeKind::Empty;
};

// ============================================================================
// Scalar values
// ============================================================================

struct IntegerValue
{
  int64_t value = 0;
  bool latent = false;
};

struct FloatValue
{
  double value = 0.0;
  bool latent = false;
};

using NumberValue = std::variant<IntegerValue, FloatValue>;

struct OrdinalValue
{
  int64_t value = 0;
};

struct AmountOfMoneyValue
{
  double value = 0.0;
  Precision precision = Precision::Exact;
  std::optional<std::string> unit;  ///< ISO 4217 code or currency symbol
};

struct TemperatureValue
{
  double value = 0.0;
  std::optional<std::string> unit;  ///< "celsius", "fahrenheit", "kelvin", "degree"
  bool latent = false;
};

struct DurationValue
{
  Period period;
  Precision precision = Precision::Exact;
};

struct PercentageValue
{
  double value = 0.0;
};

// ============================================================================
// Intermediate values (grammar building blocks, never resolved)
// ============================================================================

struct UnitOfDurationValue
{
  Grain grain = Grain::Second;
};

struct CycleValue
{
  Grain grain = Grain::Second;
};

struct MoneyUnitValue
{
  std::string unit;
};

struct RelativeMinuteValue
{
  int32_t minutes = 0;
};

// ============================================================================
// Dimension
// ============================================================================

using Dimension = std::variant<
  DatetimeValue, NumberValue, OrdinalValue, AmountOfMoneyValue, TemperatureValue, DurationValue,
  PercentageValue, UnitOfDurationValue, CycleValue, MoneyUnitValue, RelativeMinuteValue>;

/// Name of the dimension kind, e.g. "datetime", "amount_of_money"
[[nodiscard]] std::string_view dimension_kind_name(const Dimension & dim) noexcept;

}  // namespace entity_resolver
