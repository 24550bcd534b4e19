// entity_resolver/values/json_codec.cpp - JSON encoding implementation
//
#include "entity_resolver/values/json_codec.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

namespace entity_resolver
{

namespace
{

using nlohmann::json;

// ============================================================================
// Field readers
// ============================================================================

const json * field(const json & node, const char * key)
{
  const auto it = node.find(key);
  return it == node.end() ? nullptr : &*it;
}

/// Unsigned values above INT64_MAX are rejected rather than wrapped
bool fits_int64(const json & value)
{
  return !value.is_number_unsigned() ||
         value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}

bool read_int(const json & node, const char * key, int64_t & out, std::string & error)
{
  const json * f = field(node, key);
  if (f == nullptr) {
    error = std::string("missing field '") + key + "'";
    return false;
  }
  if (!f->is_number_integer()) {
    error = std::string("field '") + key + "' must be an integer";
    return false;
  }
  if (!fits_int64(*f)) {
    error = std::string("field '") + key + "' out of range: " + f->dump();
    return false;
  }
  out = f->get<int64_t>();
  return true;
}

/// read_int() for fields stored as `int`
bool read_small_int(const json & node, const char * key, int & out, std::string & error)
{
  int64_t n = 0;
  if (!read_int(node, key, n, error)) {
    return false;
  }
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
    error = std::string("field '") + key + "' out of range: " + std::to_string(n);
    return false;
  }
  out = static_cast<int>(n);
  return true;
}

bool read_number(const json & node, const char * key, double & out, std::string & error)
{
  const json * f = field(node, key);
  if (f == nullptr) {
    error = std::string("missing field '") + key + "'";
    return false;
  }
  if (!f->is_number()) {
    error = std::string("field '") + key + "' must be a number";
    return false;
  }
  out = f->get<double>();
  return true;
}

bool read_optional_bool(const json & node, const char * key, bool & out, std::string & error)
{
  const json * f = field(node, key);
  if (f == nullptr || f->is_null()) {
    return true;
  }
  if (!f->is_boolean()) {
    error = std::string("field '") + key + "' must be a boolean";
    return false;
  }
  out = f->get<bool>();
  return true;
}

bool read_optional_string(
  const json & node, const char * key, std::optional<std::string> & out, std::string & error)
{
  const json * f = field(node, key);
  if (f == nullptr || f->is_null()) {
    return true;
  }
  if (!f->is_string()) {
    error = std::string("field '") + key + "' must be a string";
    return false;
  }
  out = f->get<std::string>();
  return true;
}

/// Reads an optional enumeration field through `parse`, keeping `out` when absent
template <typename E, typename Parse>
bool read_enum(const json & node, const char * key, E & out, Parse parse, std::string & error)
{
  const json * f = field(node, key);
  if (f == nullptr || f->is_null()) {
    return true;
  }
  if (!f->is_string()) {
    error = std::string("field '") + key + "' must be a string";
    return false;
  }
  const auto name = f->get<std::string>();
  const std::optional<E> parsed = parse(name);
  if (!parsed) {
    error = std::string("invalid ") + key + ": '" + name + "'";
    return false;
  }
  out = *parsed;
  return true;
}

bool read_grain(const json & node, const char * key, Grain & out, std::string & error)
{
  if (field(node, key) == nullptr) {
    error = std::string("missing field '") + key + "'";
    return false;
  }
  return read_enum(node, key, out, grain_from_string, error);
}

std::optional<int> weekday_from_name(std::string_view name)
{
  static constexpr std::string_view k_names[] = {"monday", "tuesday",  "wednesday", "thursday",
                                                 "friday", "saturday", "sunday"};
  for (int i = 0; i < 7; ++i) {
    if (k_names[i] == name) {
      return i + 1;
    }
  }
  return std::nullopt;
}

// ============================================================================
// Constraint decoding
// ============================================================================

ConstraintPtr decode_constraint(const json & node, std::string & error)
{
  if (!node.is_object()) {
    error = "constraint must be an object";
    return nullptr;
  }
  const json * type_field = field(node, "type");
  if (type_field == nullptr || !type_field->is_string()) {
    error = "constraint requires a string 'type'";
    return nullptr;
  }
  const auto type = type_field->get<std::string>();
  int64_t n = 0;
  int small = 0;

  if (type == "day_of_week") {
    const json * wd = field(node, "weekday");
    if (wd != nullptr && wd->is_string()) {
      const auto day = weekday_from_name(wd->get<std::string>());
      if (!day) {
        error = "invalid weekday: '" + wd->get<std::string>() + "'";
        return nullptr;
      }
      return std::make_shared<DayOfWeek>(*day);
    }
    if (!read_small_int(node, "weekday", small, error)) return nullptr;
    return std::make_shared<DayOfWeek>(small);
  }

  if (type == "day_of_month") {
    if (!read_small_int(node, "day", small, error)) return nullptr;
    return std::make_shared<DayOfMonth>(small);
  }

  if (type == "month") {
    if (!read_small_int(node, "month", small, error)) return nullptr;
    return std::make_shared<MonthOfYear>(small);
  }

  if (type == "year") {
    if (!read_int(node, "year", n, error)) return nullptr;
    return std::make_shared<Year>(n);
  }

  if (type == "hour") {
    bool twelve_hour_clock = false;
    if (!read_small_int(node, "hour", small, error)) return nullptr;
    if (!read_optional_bool(node, "twelve_hour_clock", twelve_hour_clock, error)) return nullptr;
    return std::make_shared<HourOfDay>(small, twelve_hour_clock);
  }

  if (type == "minute") {
    if (!read_small_int(node, "minute", small, error)) return nullptr;
    return std::make_shared<MinuteOfHour>(small);
  }

  if (type == "cycle") {
    Grain grain = Grain::Second;
    if (!read_grain(node, "grain", grain, error)) return nullptr;
    if (field(node, "offset") != nullptr && !read_int(node, "offset", n, error)) return nullptr;
    return std::make_shared<Cycle>(grain, n);
  }

  if (type == "intersect") {
    const json * parts = field(node, "constraints");
    if (parts == nullptr || !parts->is_array() || parts->size() < 2) {
      error = "intersect requires a 'constraints' array with at least two entries";
      return nullptr;
    }
    ConstraintPtr acc;
    for (const auto & part : *parts) {
      ConstraintPtr c = decode_constraint(part, error);
      if (!c) return nullptr;
      if (acc) {
        acc = std::make_shared<Intersection>(std::move(acc), std::move(c));
      } else {
        acc = std::move(c);
      }
    }
    return acc;
  }

  if (type == "span") {
    const json * from = field(node, "from");
    const json * to = field(node, "to");
    if (from == nullptr || to == nullptr) {
      error = "span requires 'from' and 'to'";
      return nullptr;
    }
    ConstraintPtr from_c = decode_constraint(*from, error);
    if (!from_c) return nullptr;
    ConstraintPtr to_c = decode_constraint(*to, error);
    if (!to_c) return nullptr;
    return std::make_shared<Span>(std::move(from_c), std::move(to_c));
  }

  error = "unknown constraint type: '" + type + "'";
  return nullptr;
}

// ============================================================================
// Dimension decoding
// ============================================================================

std::optional<Dimension> decode_datetime(const json & node, std::string & error)
{
  DatetimeValue value;

  const json * constraint = field(node, "constraint");
  if (constraint == nullptr) {
    error = "datetime requires a 'constraint'";
    return std::nullopt;
  }
  value.constraint = constraint_from_json(*constraint, error);
  if (!value.constraint) return std::nullopt;

  if (const json * form = field(node, "form"); form != nullptr && !form->is_null()) {
    if (!form->is_object()) {
      error = "'form' must be an object";
      return std::nullopt;
    }
    if (!read_enum(*form, "kind", value.form.kind, form_kind_from_string, error)) {
      return std::nullopt;
    }
    if (const json * ni = field(*form, "not_immediate"); ni != nullptr && !ni->is_null()) {
      bool flag = false;
      if (!read_optional_bool(*form, "not_immediate", flag, error)) return std::nullopt;
      value.form.not_immediate = flag;
    }
  }

  if (const json * dir = field(node, "direction"); dir != nullptr && !dir->is_null()) {
    if (!dir->is_object()) {
      error = "'direction' must be an object";
      return std::nullopt;
    }
    BoundedDirection bd;
    std::optional<std::string> bound;
    if (!read_optional_string(*dir, "bound", bound, error)) return std::nullopt;
    if (!bound || *bound == "start") {
      bd.bound = Bound::start();
    } else if (*bound == "end") {
      bool only_interval = false;
      if (!read_optional_bool(*dir, "only_interval", only_interval, error)) return std::nullopt;
      bd.bound = Bound::end(only_interval);
    } else {
      error = "invalid bound: '" + *bound + "'";
      return std::nullopt;
    }
    if (field(*dir, "direction") == nullptr) {
      error = "'direction' requires a 'direction' of after or before";
      return std::nullopt;
    }
    if (!read_enum(*dir, "direction", bd.direction, direction_from_string, error)) {
      return std::nullopt;
    }
    value.direction = bd;
  }

  if (
    !read_enum(node, "precision", value.precision, precision_from_string, error) ||
    !read_optional_bool(node, "latent", value.latent, error) ||
    !read_enum(node, "datetime_kind", value.datetime_kind, datetime_kind_from_string, error)) {
    return std::nullopt;
  }
  return Dimension{std::move(value)};
}

std::optional<Dimension> decode_number(const json & node, std::string & error)
{
  const json * f = field(node, "value");
  bool latent = false;
  if (!read_optional_bool(node, "latent", latent, error)) return std::nullopt;
  if (f != nullptr && f->is_number_integer()) {
    int64_t v = 0;
    if (!read_int(node, "value", v, error)) return std::nullopt;
    return Dimension{NumberValue{IntegerValue{v, latent}}};
  }
  double v = 0.0;
  if (!read_number(node, "value", v, error)) return std::nullopt;
  return Dimension{NumberValue{FloatValue{v, latent}}};
}

std::optional<Dimension> decode_duration(const json & node, std::string & error)
{
  DurationValue value;
  const json * period = field(node, "period");
  if (period == nullptr || !period->is_object()) {
    error = "duration requires a 'period' object";
    return std::nullopt;
  }
  for (const auto & item : period->items()) {
    const std::optional<Grain> grain = grain_from_string(item.key());
    if (!grain) {
      error = "invalid period grain: '" + item.key() + "'";
      return std::nullopt;
    }
    if (!item.value().is_number_integer()) {
      error = "period component '" + item.key() + "' must be an integer";
      return std::nullopt;
    }
    if (!fits_int64(item.value())) {
      error = "period component '" + item.key() + "' out of range: " + item.value().dump();
      return std::nullopt;
    }
    value.period.add(*grain, item.value().get<int64_t>());
  }
  if (!read_enum(node, "precision", value.precision, precision_from_string, error)) {
    return std::nullopt;
  }
  return Dimension{std::move(value)};
}

std::optional<Dimension> decode_dimension(const json & node, std::string & error)
{
  if (!node.is_object()) {
    error = "dimension must be an object";
    return std::nullopt;
  }
  const json * kind_field = field(node, "kind");
  if (kind_field == nullptr || !kind_field->is_string()) {
    error = "dimension requires a string 'kind'";
    return std::nullopt;
  }
  const auto kind = kind_field->get<std::string>();

  if (kind == "datetime") {
    return decode_datetime(node, error);
  }
  if (kind == "number") {
    return decode_number(node, error);
  }
  if (kind == "ordinal") {
    int64_t v = 0;
    if (!read_int(node, "value", v, error)) return std::nullopt;
    return Dimension{OrdinalValue{v}};
  }
  if (kind == "amount_of_money") {
    AmountOfMoneyValue value;
    if (
      !read_number(node, "value", value.value, error) ||
      !read_enum(node, "precision", value.precision, precision_from_string, error) ||
      !read_optional_string(node, "unit", value.unit, error)) {
      return std::nullopt;
    }
    return Dimension{std::move(value)};
  }
  if (kind == "temperature") {
    TemperatureValue value;
    if (
      !read_number(node, "value", value.value, error) ||
      !read_optional_string(node, "unit", value.unit, error) ||
      !read_optional_bool(node, "latent", value.latent, error)) {
      return std::nullopt;
    }
    return Dimension{std::move(value)};
  }
  if (kind == "duration") {
    return decode_duration(node, error);
  }
  if (kind == "percentage") {
    double v = 0.0;
    if (!read_number(node, "value", v, error)) return std::nullopt;
    return Dimension{PercentageValue{v}};
  }
  if (kind == "unit_of_duration" || kind == "cycle") {
    Grain grain = Grain::Second;
    if (!read_grain(node, "grain", grain, error)) return std::nullopt;
    if (kind == "cycle") {
      return Dimension{CycleValue{grain}};
    }
    return Dimension{UnitOfDurationValue{grain}};
  }
  if (kind == "money_unit") {
    std::optional<std::string> unit;
    if (!read_optional_string(node, "unit", unit, error)) return std::nullopt;
    if (!unit) {
      error = "missing field 'unit'";
      return std::nullopt;
    }
    return Dimension{MoneyUnitValue{*unit}};
  }
  if (kind == "relative_minute") {
    int minutes = 0;
    if (!read_small_int(node, "minutes", minutes, error)) return std::nullopt;
    return Dimension{RelativeMinuteValue{minutes}};
  }

  error = "unknown dimension kind: '" + kind + "'";
  return std::nullopt;
}

// ============================================================================
// Output encoding
// ============================================================================

json j_optional_string(const std::optional<std::string> & s)
{
  return s ? json(*s) : json(nullptr);
}

json j_datetime(const DatetimeOutput & out)
{
  return json{
    {"value", out.moment.to_iso_string()},
    {"grain", std::string(to_string(out.grain))},
    {"precision", std::string(to_string(out.precision))},
    {"latent", out.latent},
    {"datetime_kind", std::string(to_string(out.datetime_kind))}};
}

json j_interval_kind(const DatetimeIntervalKind & kind)
{
  return std::visit(
    [](const auto & k) -> json {
      using T = std::decay_t<decltype(k)>;
      if constexpr (std::is_same_v<T, BetweenInterval>) {
        return json{
          {"interval_kind", "between"},
          {"from", k.start.to_iso_string()},
          {"to", k.end.to_iso_string()},
          {"precision", std::string(to_string(k.precision))},
          {"latent", k.latent}};
      } else if constexpr (std::is_same_v<T, AfterInterval>) {
        return json{{"interval_kind", "after"}, {"from", j_datetime(k.value)}};
      } else {
        static_assert(std::is_same_v<T, BeforeInterval>, "unhandled interval kind");
        return json{{"interval_kind", "before"}, {"to", j_datetime(k.value)}};
      }
    },
    kind);
}

json j_period(const Period & period)
{
  json components = json::object();
  for (size_t i = 0; i < k_grain_count; ++i) {
    const auto g = static_cast<Grain>(i);
    if (period.get(g) != 0) {
      components[std::string(to_string(g))] = period.get(g);
    }
  }
  return json{{"iso", period.to_iso_string()}, {"components", components}};
}

}  // namespace

ConstraintPtr constraint_from_json(const nlohmann::json & node, std::string & error)
{
  try {
    return decode_constraint(node, error);
  } catch (const std::invalid_argument & e) {
    // Range checks in constraint constructors
    error = e.what();
    return nullptr;
  }
}

std::optional<Dimension> dimension_from_json(const nlohmann::json & node, std::string & error)
{
  return decode_dimension(node, error);
}

nlohmann::json to_json(const Output & out)
{
  json j = std::visit(
    [](const auto & value) -> json {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, DatetimeOutput>) {
        return j_datetime(value);
      } else if constexpr (std::is_same_v<T, DatetimeIntervalOutput>) {
        json k = j_interval_kind(value.interval_kind);
        k["datetime_kind"] = std::string(to_string(value.datetime_kind));
        return k;
      } else if constexpr (
        std::is_same_v<T, IntegerOutput> || std::is_same_v<T, FloatOutput> ||
        std::is_same_v<T, OrdinalOutput> || std::is_same_v<T, PercentageOutput>) {
        return json{{"value", value.value}};
      } else if constexpr (std::is_same_v<T, AmountOfMoneyOutput>) {
        return json{
          {"value", value.value},
          {"precision", std::string(to_string(value.precision))},
          {"unit", j_optional_string(value.unit)}};
      } else if constexpr (std::is_same_v<T, TemperatureOutput>) {
        return json{
          {"value", value.value}, {"unit", j_optional_string(value.unit)}, {"latent", value.latent}};
      } else {
        static_assert(std::is_same_v<T, DurationOutput>, "unhandled output kind");
        return json{
          {"period", j_period(value.period)},
          {"precision", std::string(to_string(value.precision))}};
      }
    },
    out);
  j["kind"] = std::string(output_kind_name(out));
  return j;
}

}  // namespace entity_resolver
