// entity_resolver/resolve/resolver.hpp - Resolution of dimensions into outputs
//
// Anchors abstract values to the reference time of a Context and turns
// them into concrete outputs.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <vector>

#include "entity_resolver/basic/diagnostic.hpp"
#include "entity_resolver/resolve/parsing_context.hpp"
#include "entity_resolver/time/context.hpp"
#include "entity_resolver/values/dimension.hpp"
#include "entity_resolver/values/output.hpp"

namespace entity_resolver
{

/**
 * Resolve one dimension against a context.
 *
 * ## Temporal values
 * The constraint's walker is driven as follows:
 * 1. Take the first forward candidate. If the form is not-immediate and
 *    that candidate overlaps the reference, take the next one instead.
 * 2. Without a forward candidate, take the first backward candidate.
 * 3. The chosen interval becomes an open-ended interval output when the
 *    value has a direction, a Between output when it has an explicit end,
 *    and a plain datetime output otherwise.
 *
 * At most two forward and one backward candidates are pulled.
 *
 * ## Other values
 * Fields are copied into the matching output. Intermediate grammar kinds
 * (unit of duration, cycle, ...) have no output.
 *
 * @param context Reference time and window
 * @param dim Value to resolve (never modified)
 * @param diags Receives a W001 warning when a date or time kind resolves to
 *              a spanning interval (nullptr for silent mode)
 * @return The output, or nullopt when the kind has no output or no
 *         candidate interval exists
 */
[[nodiscard]] std::optional<Output> resolve(
  const Context & context, const Dimension & dim, DiagnosticBag * diags = nullptr);

/**
 * ParsingContext resolving dimensions against a fixed Context.
 *
 * ## Usage
 * ```cpp
 * DiagnosticBag diags;
 * ResolverContext ctx(Context::from_secs(now), &diags);
 * if (auto out = ctx.resolve(dimension)) {
 *   ...
 * }
 * ```
 *
 * The DiagnosticBag is not synchronized; share a ResolverContext across
 * threads only in silent mode.
 */
class ResolverContext final : public ParsingContext<Dimension, Output>
{
public:
  explicit ResolverContext(Context ctx, DiagnosticBag * diags = nullptr)
  : ctx_(ctx), diags_(diags)
  {
  }

  /// Anchored at `epoch_seconds` in the local clock (see Context::from_secs)
  [[nodiscard]] static ResolverContext from_secs(int64_t epoch_seconds)
  {
    return ResolverContext(Context::from_secs(epoch_seconds));
  }

  [[nodiscard]] static ResolverContext for_reference(const Interval & now)
  {
    return ResolverContext(Context::for_reference(now));
  }

  /// Explicit window; throws std::invalid_argument if `now` lies outside it
  ResolverContext(const Interval & now, const Interval & min, const Interval & max)
  : ctx_(now, min, max)
  {
  }

  [[nodiscard]] std::optional<Output> resolve(const Dimension & dim) const override
  {
    return entity_resolver::resolve(ctx_, dim, diags_);
  }

  /**
   * Resolve a batch. Each element is resolved independently; a nullopt
   * entry does not affect the others. Diagnostics carry the value index.
   */
  [[nodiscard]] std::vector<std::optional<Output>> resolve_all(
    gsl::span<const Dimension> dims) const;

  [[nodiscard]] const Context & context() const noexcept { return ctx_; }

  void set_diagnostics(DiagnosticBag * diags) noexcept { diags_ = diags; }

private:
  Context ctx_;
  DiagnosticBag * diags_ = nullptr;
};

}  // namespace entity_resolver
