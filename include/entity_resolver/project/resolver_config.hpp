// entity_resolver/project/resolver_config.hpp - Resolver configuration (resolver.yaml)
//
// Parses and validates resolver.yaml files. Shared by the batch driver and
// the CLI.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace entity_resolver
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Explicit resolution window, in epoch seconds.
 */
struct WindowConfig
{
  int64_t min = 0;
  int64_t max = 0;
};

/**
 * Context configuration section.
 */
struct ContextConfig
{
  /// Reference instant (epoch seconds); current time when absent
  std::optional<int64_t> reference;

  /// UTC offset in seconds; local clock when absent
  std::optional<int32_t> utc_offset;

  /// Explicit window; default window around the reference when absent
  std::optional<WindowConfig> window;
};

/**
 * Output configuration section.
 */
struct OutputConfig
{
  /// JSON indentation, -1 for compact output
  int indent = 2;

  /// Omit latent outputs (replaced by null)
  bool drop_latent = false;
};

/**
 * Complete resolver configuration (resolver.yaml).
 */
struct ResolverConfig
{
  ContextConfig context;
  OutputConfig output;

  /// Directory containing resolver.yaml
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a resolver configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ResolverConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ResolverConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a resolver configuration from a resolver.yaml file.
 *
 * @param config_path Path to resolver.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_resolver_config(const std::filesystem::path & config_path);

/**
 * Find a resolver configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to resolver.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_resolver_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_resolver_config_file_name = "resolver.yaml";

}  // namespace entity_resolver
