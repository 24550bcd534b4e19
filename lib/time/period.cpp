// entity_resolver/time/period.cpp - Period and grain helpers
//
#include "entity_resolver/time/period.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace entity_resolver
{

std::optional<Grain> grain_from_string(std::string_view name) noexcept
{
  for (size_t i = 0; i < k_grain_count; ++i) {
    const auto g = static_cast<Grain>(i);
    if (to_string(g) == name) {
      return g;
    }
  }
  return std::nullopt;
}

bool Period::empty() const noexcept
{
  return std::all_of(comps_.begin(), comps_.end(), [](int64_t c) { return c == 0; });
}

Grain Period::finest_grain() const noexcept
{
  for (size_t i = 0; i < k_grain_count; ++i) {
    if (comps_[i] != 0) {
      return static_cast<Grain>(i);
    }
  }
  return Grain::Second;
}

Period Period::operator+(const Period & other) const noexcept
{
  Period result = *this;
  for (size_t i = 0; i < k_grain_count; ++i) {
    result.comps_[i] += other.comps_[i];
  }
  return result;
}

Period Period::operator-() const noexcept
{
  Period result;
  for (size_t i = 0; i < k_grain_count; ++i) {
    result.comps_[i] = -comps_[i];
  }
  return result;
}

std::string Period::to_iso_string() const
{
  if (empty()) {
    return "PT0S";
  }

  std::string out = "P";
  const int64_t months = get(Grain::Month) + 3 * get(Grain::Quarter);
  if (get(Grain::Year) != 0) out += fmt::format("{}Y", get(Grain::Year));
  if (months != 0) out += fmt::format("{}M", months);
  if (get(Grain::Week) != 0) out += fmt::format("{}W", get(Grain::Week));
  if (get(Grain::Day) != 0) out += fmt::format("{}D", get(Grain::Day));

  if (get(Grain::Hour) != 0 || get(Grain::Minute) != 0 || get(Grain::Second) != 0) {
    out += "T";
    if (get(Grain::Hour) != 0) out += fmt::format("{}H", get(Grain::Hour));
    if (get(Grain::Minute) != 0) out += fmt::format("{}M", get(Grain::Minute));
    if (get(Grain::Second) != 0) out += fmt::format("{}S", get(Grain::Second));
  }
  return out;
}

}  // namespace entity_resolver
