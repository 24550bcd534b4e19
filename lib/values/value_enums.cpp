// entity_resolver/values/value_enums.cpp - Enumeration parsing
//
#include "entity_resolver/values/value_enums.hpp"

#include <cstddef>

namespace entity_resolver
{

namespace
{

template <typename E, size_t N>
std::optional<E> lookup(std::string_view s, const E (&all)[N]) noexcept
{
  for (const E e : all) {
    if (to_string(e) == s) {
      return e;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<Precision> precision_from_string(std::string_view s) noexcept
{
  static constexpr Precision k_all[] = {Precision::Exact, Precision::Approximate};
  return lookup(s, k_all);
}

std::optional<DatetimeKind> datetime_kind_from_string(std::string_view s) noexcept
{
  static constexpr DatetimeKind k_all[] = {
    DatetimeKind::Date,       DatetimeKind::Time,           DatetimeKind::DatePeriod,
    DatetimeKind::TimePeriod, DatetimeKind::DatetimePeriod, DatetimeKind::Datetime,
    DatetimeKind::Empty};
  return lookup(s, k_all);
}

std::optional<FormKind> form_kind_from_string(std::string_view s) noexcept
{
  static constexpr FormKind k_all[] = {
    FormKind::Empty,        FormKind::Month,     FormKind::MonthDay,
    FormKind::YearMonthDay, FormKind::DayOfWeek, FormKind::TimeOfDay,
    FormKind::PartOfDay,    FormKind::Cycle,     FormKind::Celebration};
  return lookup(s, k_all);
}

std::optional<Direction> direction_from_string(std::string_view s) noexcept
{
  static constexpr Direction k_all[] = {Direction::After, Direction::Before};
  return lookup(s, k_all);
}

}  // namespace entity_resolver
