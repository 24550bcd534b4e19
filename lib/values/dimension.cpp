// entity_resolver/values/dimension.cpp - Dimension helpers
//
#include "entity_resolver/values/dimension.hpp"

#include <type_traits>

namespace entity_resolver
{

std::string_view dimension_kind_name(const Dimension & dim) noexcept
{
  return std::visit(
    [](const auto & value) -> std::string_view {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, DatetimeValue>) {
        return "datetime";
      } else if constexpr (std::is_same_v<T, NumberValue>) {
        return "number";
      } else if constexpr (std::is_same_v<T, OrdinalValue>) {
        return "ordinal";
      } else if constexpr (std::is_same_v<T, AmountOfMoneyValue>) {
        return "amount_of_money";
      } else if constexpr (std::is_same_v<T, TemperatureValue>) {
        return "temperature";
      } else if constexpr (std::is_same_v<T, DurationValue>) {
        return "duration";
      } else if constexpr (std::is_same_v<T, PercentageValue>) {
        return "percentage";
      } else if constexpr (std::is_same_v<T, UnitOfDurationValue>) {
        return "unit_of_duration";
      } else if constexpr (std::is_same_v<T, CycleValue>) {
        return "cycle";
      } else if constexpr (std::is_same_v<T, MoneyUnitValue>) {
        return "money_unit";
      } else {
        static_assert(std::is_same_v<T, RelativeMinuteValue>, "unhandled dimension kind");
        return "relative_minute";
      }
    },
    dim);
}

}  // namespace entity_resolver
