// entity_resolver/driver/batch_resolver.hpp - Batch resolution driver
//
// Single entry point for resolving JSON documents of dimensions.
// Used by the CLI and usable from other tools.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>

#include "entity_resolver/basic/diagnostic.hpp"
#include "entity_resolver/project/resolver_config.hpp"
#include "entity_resolver/time/context.hpp"

namespace entity_resolver
{

// ============================================================================
// Resolve Options
// ============================================================================

struct ResolveOptions
{
  /// Reference instant in epoch seconds (overrides config, default: current time)
  std::optional<int64_t> now;

  /// UTC offset in seconds (overrides config, default: local clock)
  std::optional<int32_t> utc_offset;

  /// Loaded resolver.yaml, if any
  std::optional<ResolverConfig> config;

  /// Replace latent outputs by null (ORed with the config setting)
  bool drop_latent = false;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Resolve Result
// ============================================================================

struct ResolveResult
{
  /// Whether the document was resolved without errors
  bool success = false;

  /// Collected diagnostics, tagged with the index of the value they concern
  DiagnosticBag diagnostics;

  /// One entry per input value, null when unresolved
  nlohmann::json outputs = nlohmann::json::array();

  /// Number of non-null entries in `outputs`
  size_t resolved_count = 0;
};

// ============================================================================
// BatchResolver
// ============================================================================

/**
 * Resolves every dimension of a document against one shared Context.
 *
 * Accepted documents are either a JSON array of dimensions or an object
 * with a "values" array. Values that fail to decode are reported (E102)
 * and produce null; they do not stop the remaining values.
 */
class BatchResolver
{
public:
  /**
   * Resolve a JSON file.
   *
   * @param file Path to the JSON document
   * @param options Resolve options
   * @return ResolveResult with outputs and diagnostics
   */
  [[nodiscard]] static ResolveResult resolve_file(
    const std::filesystem::path & file, const ResolveOptions & options);

  /// Resolve an already parsed document
  [[nodiscard]] static ResolveResult resolve_document(
    const nlohmann::json & document, const ResolveOptions & options);

  /**
   * Build the resolution context from options and configuration.
   *
   * Precedence is options, then config, then the current time and local
   * clock. Failures are reported as E103 errors.
   */
  [[nodiscard]] static std::optional<Context> build_context(
    const ResolveOptions & options, DiagnosticBag & diags);
};

}  // namespace entity_resolver
