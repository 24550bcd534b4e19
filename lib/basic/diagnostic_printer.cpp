// entity_resolver/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "entity_resolver/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace entity_resolver
{

namespace
{

struct SeverityStyle
{
  const char * name;
  rang::fg color;
};

SeverityStyle style_of(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return {"error", rang::fg::red};
    case Severity::Warning:
      return {"warning", rang::fg::yellow};
    case Severity::Info:
      return {"info", rang::fg::cyan};
    case Severity::Hint:
      return {"hint", rang::fg::green};
  }
  return {"error", rang::fg::red};
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view input_name)
{
  print_severity_header(diag);

  const std::string location = diag.value_index
                                 ? fmt::format("{}[{}]", input_name, *diag.value_index)
                                 : std::string(input_name);
  print_gutter("  -->");
  fmt::print(os_, " {}\n", location);

  for (const auto & note : diag.notes) {
    print_trailer("note", note);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view input_name)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }

  // Document-level diagnostics first, then by value position
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    if (a->value_index.has_value() != b->value_index.has_value()) {
      return !a->value_index.has_value();
    }
    return a->value_index.value_or(0) < b->value_index.value_or(0);
  });

  for (const Diagnostic * d : ordered) {
    print(*d, input_name);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const SeverityStyle style = style_of(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (use_color_) {
    os_ << rang::style::bold << style.color << style.name << code << rang::fg::reset;
    fmt::print(os_, ": {}", diag.message);
    os_ << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}{}: {}\n", style.name, code, diag.message);
  }
}

void DiagnosticPrinter::print_trailer(std::string_view label, std::string_view message)
{
  print_gutter("      |");
  os_ << "\n";
  print_gutter("   =");
  fmt::print(os_, " {}: {}\n", label, message);
}

void DiagnosticPrinter::print_gutter(std::string_view text)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << text << rang::style::reset << rang::fg::reset;
  } else {
    os_ << text;
  }
}

}  // namespace entity_resolver
