// entity_resolver/basic/diagnostic_printer.hpp
//
// Prints diagnostics with the originating input and value position
// in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "entity_resolver/basic/diagnostic.hpp"

namespace entity_resolver
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W001]: date kind with an interval
 *     --> values.json[3]
 *      |
 *      = note: [1970-01-05T00:00:00+00:00, 1970-01-07T00:00:00+00:00) day
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param input_name Name of the input document shown in the location line
   */
  void print(const Diagnostic & diag, std::string_view input_name);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by value index.
   */
  void print_all(const DiagnosticBag & diags, std::string_view input_name);

private:
  void print_severity_header(const Diagnostic & diag);

  /// Gutter line followed by "= label: message"
  void print_trailer(std::string_view label, std::string_view message);

  /// Gutter text, cyan and bold with colors enabled
  void print_gutter(std::string_view text);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace entity_resolver
