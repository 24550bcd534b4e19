// entity_resolver/values/value_enums.hpp - Enumerations shared by dimensions and outputs
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace entity_resolver
{

// ============================================================================
// Flags forwarded verbatim into outputs
// ============================================================================

/**
 * How exact a resolved value is claimed to be.
 */
enum class Precision : uint8_t {
  Exact,        ///< "at 5pm", "42 dollars"
  Approximate,  ///< "around 5pm", "about 42 dollars"
};

/**
 * Kind of temporal expression, as declared by the grammar rule that built it.
 */
enum class DatetimeKind : uint8_t {
  Date,            ///< "march 3rd"
  Time,            ///< "at 5pm"
  DatePeriod,      ///< "from monday to friday"
  TimePeriod,      ///< "between 9 and 11am"
  DatetimePeriod,  ///< "from monday 9am to tuesday 5pm"
  Datetime,        ///< "monday at 5pm"
  Empty,           ///< not yet classified
};

// ============================================================================
// Temporal form and direction
// ============================================================================

/**
 * Syntactic shape of a temporal expression.
 */
enum class FormKind : uint8_t {
  Empty,
  Month,
  MonthDay,
  YearMonthDay,
  DayOfWeek,
  TimeOfDay,
  PartOfDay,
  Cycle,
  Celebration,
};

/**
 * Which edge of the chosen interval anchors an open-ended output.
 */
enum class BoundKind : uint8_t {
  Start,
  End,
};

/**
 * Whether an open-ended output extends after or before its anchor.
 */
enum class Direction : uint8_t {
  After,
  Before,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(Precision p) noexcept
{
  switch (p) {
    case Precision::Exact:
      return "exact";
    case Precision::Approximate:
      return "approximate";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(DatetimeKind k) noexcept
{
  switch (k) {
    case DatetimeKind::Date:
      return "date";
    case DatetimeKind::Time:
      return "time";
    case DatetimeKind::DatePeriod:
      return "date_period";
    case DatetimeKind::TimePeriod:
      return "time_period";
    case DatetimeKind::DatetimePeriod:
      return "datetime_period";
    case DatetimeKind::Datetime:
      return "datetime";
    case DatetimeKind::Empty:
      return "empty";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(FormKind k) noexcept
{
  switch (k) {
    case FormKind::Empty:
      return "empty";
    case FormKind::Month:
      return "month";
    case FormKind::MonthDay:
      return "month_day";
    case FormKind::YearMonthDay:
      return "year_month_day";
    case FormKind::DayOfWeek:
      return "day_of_week";
    case FormKind::TimeOfDay:
      return "time_of_day";
    case FormKind::PartOfDay:
      return "part_of_day";
    case FormKind::Cycle:
      return "cycle";
    case FormKind::Celebration:
      return "celebration";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Direction d) noexcept
{
  switch (d) {
    case Direction::After:
      return "after";
    case Direction::Before:
      return "before";
  }
  return "";
}

// ============================================================================
// from_string() Helper Functions
// ============================================================================

[[nodiscard]] std::optional<Precision> precision_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<DatetimeKind> datetime_kind_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<FormKind> form_kind_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<Direction> direction_from_string(std::string_view s) noexcept;

}  // namespace entity_resolver
