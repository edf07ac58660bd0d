// tshl/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "tshl/basic/diagnostic.hpp"
#include "tshl/basic/source_manager.hpp"

namespace tshl
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E101]: inconsistent dedent
 *     --> rules/python.rules:12:3
 *      |
 *   12 |   string DocString
 *      |   ^ does not match any enclosing indentation level
 *      |
 *      = help: align the line with an enclosing block
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

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by location.
   */
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace tshl
