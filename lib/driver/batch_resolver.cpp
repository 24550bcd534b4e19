// entity_resolver/driver/batch_resolver.cpp - Batch resolution driver implementation
//
#include "entity_resolver/driver/batch_resolver.hpp"

#include <fmt/core.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "entity_resolver/resolve/resolver.hpp"
#include "entity_resolver/values/json_codec.hpp"

namespace entity_resolver
{

namespace
{

using nlohmann::json;

int64_t current_epoch_seconds()
{
  return std::chrono::duration_cast<std::chrono::seconds>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

/// The array of dimensions inside `document`, nullptr if it has none
const json * values_of(const json & document)
{
  if (document.is_array()) {
    return &document;
  }
  if (document.is_object()) {
    const auto it = document.find("values");
    if (it != document.end() && it->is_array()) {
      return &*it;
    }
  }
  return nullptr;
}

}  // namespace

std::optional<Context> BatchResolver::build_context(
  const ResolveOptions & options, DiagnosticBag & diags)
{
  std::optional<int64_t> reference = options.now;
  std::optional<int32_t> utc_offset = options.utc_offset;
  std::optional<WindowConfig> window;

  if (options.config) {
    const ContextConfig & cfg = options.config->context;
    if (!reference) {
      reference = cfg.reference;
    }
    if (!utc_offset) {
      utc_offset = cfg.utc_offset;
    }
    window = cfg.window;
  }

  const int64_t now = reference.value_or(current_epoch_seconds());

  try {
    const int32_t offset = utc_offset ? *utc_offset : local_utc_offset(now);
    if (!window) {
      return Context::from_secs(now, offset);
    }
    const auto at = [offset](int64_t secs) {
      return Interval::starting_at(Moment(secs, offset), Grain::Second);
    };
    return Context(at(now), at(window->min), at(window->max));
  } catch (const std::invalid_argument & e) {
    diags.report_error(fmt::format("invalid resolution context: {}", e.what()))
      .with_code(diag_codes::k_invalid_context)
      .with_help("the reference must lie inside context.window");
  } catch (const std::out_of_range & e) {
    diags.report_error(fmt::format("invalid resolution context: {}", e.what()))
      .with_code(diag_codes::k_invalid_context);
  }
  return std::nullopt;
}

ResolveResult BatchResolver::resolve_file(
  const std::filesystem::path & file, const ResolveOptions & options)
{
  ResolveResult result;

  std::ifstream in(file);
  if (!in.is_open()) {
    result.diagnostics.report_error("failed to open file: " + file.string())
      .with_code(diag_codes::k_malformed_document);
    return result;
  }

  if (options.verbose) {
    std::cerr << "Resolving: " << file.string() << "\n";
  }

  // Parse without exceptions; a discarded value signals a syntax error
  const json document = json::parse(in, nullptr, false);
  if (document.is_discarded()) {
    result.diagnostics.report_error("failed to parse JSON: " + file.string())
      .with_code(diag_codes::k_malformed_document);
    return result;
  }

  return resolve_document(document, options);
}

ResolveResult BatchResolver::resolve_document(
  const nlohmann::json & document, const ResolveOptions & options)
{
  ResolveResult result;

  const json * values = values_of(document);
  if (values == nullptr) {
    result.diagnostics
      .report_error("document must be an array of values or an object with a \"values\" array")
      .with_code(diag_codes::k_malformed_document);
    return result;
  }

  const std::optional<Context> context = build_context(options, result.diagnostics);
  if (!context) {
    return result;
  }

  if (options.verbose) {
    std::cerr << "Reference: " << context->reference().to_string() << "\n";
  }

  // Decode; positions[i] is the document index of dims[i]
  std::vector<Dimension> dims;
  std::vector<size_t> positions;
  dims.reserve(values->size());
  positions.reserve(values->size());

  size_t index = 0;
  for (const auto & node : *values) {
    std::string error;
    if (auto dim = dimension_from_json(node, error)) {
      dims.push_back(std::move(*dim));
      positions.push_back(index);
    } else {
      result.diagnostics.report_error("invalid dimension: " + error)
        .with_code(diag_codes::k_invalid_dimension)
        .for_value(index);
    }
    ++index;
  }

  DiagnosticBag local;
  const ResolverContext resolver(*context, &local);
  const std::vector<std::optional<Output>> outputs = resolver.resolve_all(dims);

  // Map diagnostics back to document indices
  for (const auto & d : local) {
    Diagnostic tagged = d;
    if (tagged.value_index) {
      tagged.value_index = positions[*tagged.value_index];
    }
    result.diagnostics.add(std::move(tagged));
  }

  const bool drop_latent =
    options.drop_latent || (options.config && options.config->output.drop_latent);

  std::vector<json> slots(values->size(), json(nullptr));
  for (size_t i = 0; i < outputs.size(); ++i) {
    const auto & out = outputs[i];
    if (!out) {
      result.diagnostics
        .report_info(fmt::format("{} value could not be resolved", dimension_kind_name(dims[i])))
        .with_code(diag_codes::k_unresolved_value)
        .for_value(positions[i]);
      continue;
    }
    if (drop_latent && is_latent(*out)) {
      continue;
    }
    slots[positions[i]] = to_json(*out);
    ++result.resolved_count;
  }

  for (auto & slot : slots) {
    result.outputs.push_back(std::move(slot));
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace entity_resolver
