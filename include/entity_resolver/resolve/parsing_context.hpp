// entity_resolver/resolve/parsing_context.hpp - Value resolution interface
#pragma once

#include <optional>

namespace entity_resolver
{

/**
 * Turns an abstract value of type V into a concrete output of type O.
 *
 * Implementations must be pure with respect to their own state:
 * resolve() may be called concurrently on a shared instance.
 */
template <typename V, typename O>
class ParsingContext
{
public:
  using value_type = V;
  using output_type = O;

  virtual ~ParsingContext() = default;

  /// Concrete output for `value`, nullopt when it cannot be resolved
  [[nodiscard]] virtual std::optional<O> resolve(const V & value) const = 0;
};

/**
 * Resolves every value to itself. Used where the grammar output is
 * consumed as-is (tests, debugging dumps).
 */
template <typename V>
class IdentityContext final : public ParsingContext<V, V>
{
public:
  [[nodiscard]] std::optional<V> resolve(const V & value) const override { return value; }
};

}  // namespace entity_resolver
