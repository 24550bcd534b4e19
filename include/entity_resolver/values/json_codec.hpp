// entity_resolver/values/json_codec.hpp - JSON encoding of values
//
// Decodes dimensions (and their constraints) from JSON documents and
// encodes resolved outputs back to JSON, using nlohmann::json.
//
// Dimension document examples:
//   {"kind": "datetime", "datetime_kind": "date",
//    "constraint": {"type": "day_of_week", "weekday": 1},
//    "form": {"kind": "day_of_week", "not_immediate": true}}
//   {"kind": "amount_of_money", "value": 42.5, "precision": "approximate", "unit": "USD"}
//
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "entity_resolver/time/constraint.hpp"
#include "entity_resolver/values/dimension.hpp"
#include "entity_resolver/values/output.hpp"

namespace entity_resolver
{

/**
 * Decode a constraint.
 *
 * Supported types: day_of_week, day_of_month, month, year, hour, minute,
 * cycle, intersect, span.
 *
 * @param error Receives a description of the first problem found
 * @return The constraint, or nullptr on error
 */
[[nodiscard]] ConstraintPtr constraint_from_json(const nlohmann::json & node, std::string & error);

/**
 * Decode a dimension.
 *
 * @param error Receives a description of the first problem found
 * @return The dimension, or nullopt on error
 */
[[nodiscard]] std::optional<Dimension> dimension_from_json(
  const nlohmann::json & node, std::string & error);

/// Encode a resolved output
[[nodiscard]] nlohmann::json to_json(const Output & out);

}  // namespace entity_resolver
