// entity_resolver/project/resolver_config.cpp - Resolver configuration implementation
//
#include "entity_resolver/project/resolver_config.hpp"

#include <yaml-cpp/yaml.h>

namespace entity_resolver
{

namespace
{

/// Read a scalar of type T, reporting conversion failures as `key` errors
template <typename T>
bool read_scalar(const YAML::Node & node, const std::string & key, T & out, std::string & error)
{
  if (!node.IsScalar()) {
    error = key + " must be a scalar";
    return false;
  }
  try {
    out = node.as<T>();
  } catch (const YAML::BadConversion &) {
    error = "invalid " + key + ": '" + node.Scalar() + "'";
    return false;
  }
  return true;
}

bool parse_context(const YAML::Node & node, ContextConfig & ctx, std::string & error)
{
  if (!node.IsMap()) {
    error = "context must be a map";
    return false;
  }

  if (node["reference"]) {
    int64_t reference = 0;
    if (!read_scalar(node["reference"], "context.reference", reference, error)) {
      return false;
    }
    ctx.reference = reference;
  }

  if (node["utc_offset"]) {
    int32_t offset = 0;
    if (!read_scalar(node["utc_offset"], "context.utc_offset", offset, error)) {
      return false;
    }
    // Real-world offsets lie within [-14h, +14h]
    if (offset < -14 * 3600 || offset > 14 * 3600) {
      error = "context.utc_offset out of range: " + std::to_string(offset);
      return false;
    }
    ctx.utc_offset = offset;
  }

  if (node["window"]) {
    const auto & win = node["window"];
    if (!win.IsMap() || !win["min"] || !win["max"]) {
      error = "context.window must be a map with 'min' and 'max'";
      return false;
    }
    WindowConfig window;
    if (
      !read_scalar(win["min"], "context.window.min", window.min, error) ||
      !read_scalar(win["max"], "context.window.max", window.max, error)) {
      return false;
    }
    if (window.min > window.max) {
      error = "context.window.min must not be after context.window.max";
      return false;
    }
    ctx.window = window;
  }

  return true;
}

bool parse_output(const YAML::Node & node, OutputConfig & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "output must be a map";
    return false;
  }
  if (node["indent"]) {
    if (!read_scalar(node["indent"], "output.indent", out.indent, error)) {
      return false;
    }
    if (out.indent < -1) {
      error = "output.indent must be -1 or greater";
      return false;
    }
  }
  if (node["drop_latent"]) {
    if (!read_scalar(node["drop_latent"], "output.drop_latent", out.drop_latent, error)) {
      return false;
    }
  }
  return true;
}

}  // namespace

ConfigLoadResult load_resolver_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ResolverConfig config;
  config.config_root = fs::absolute(config_path).parent_path();

  // An empty file is a valid, default configuration
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  if (root["context"] && !parse_context(root["context"], config.context, error)) {
    return ConfigLoadResult::fail(error);
  }
  if (root["output"] && !parse_output(root["output"], config.output, error)) {
    return ConfigLoadResult::fail(error);
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_resolver_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_resolver_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace entity_resolver
