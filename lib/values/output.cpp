// entity_resolver/values/output.cpp - Output helpers
//
#include "entity_resolver/values/output.hpp"

#include <type_traits>

namespace entity_resolver
{

std::string_view output_kind_name(const Output & out) noexcept
{
  return std::visit(
    [](const auto & value) -> std::string_view {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, DatetimeOutput>) {
        return "datetime";
      } else if constexpr (std::is_same_v<T, DatetimeIntervalOutput>) {
        return "datetime_interval";
      } else if constexpr (std::is_same_v<T, IntegerOutput>) {
        return "integer";
      } else if constexpr (std::is_same_v<T, FloatOutput>) {
        return "float";
      } else if constexpr (std::is_same_v<T, OrdinalOutput>) {
        return "ordinal";
      } else if constexpr (std::is_same_v<T, AmountOfMoneyOutput>) {
        return "amount_of_money";
      } else if constexpr (std::is_same_v<T, TemperatureOutput>) {
        return "temperature";
      } else if constexpr (std::is_same_v<T, DurationOutput>) {
        return "duration";
      } else {
        static_assert(std::is_same_v<T, PercentageOutput>, "unhandled output kind");
        return "percentage";
      }
    },
    out);
}

bool is_latent(const Output & out) noexcept
{
  if (const auto * dt = std::get_if<DatetimeOutput>(&out)) {
    return dt->latent;
  }
  if (const auto * interval = std::get_if<DatetimeIntervalOutput>(&out)) {
    return std::visit(
      [](const auto & kind) {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, BetweenInterval>) {
          return kind.latent;
        } else {
          return kind.value.latent;
        }
      },
      interval->interval_kind);
  }
  if (const auto * temp = std::get_if<TemperatureOutput>(&out)) {
    return temp->latent;
  }
  return false;
}

}  // namespace entity_resolver
