// pg_sema/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/basic/source_manager.hpp"

namespace pg_sema
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0203]: unknown column "id"
 *     --> sql/views.sql:5:12
 *      |
 *    5 | SELECT id FROM t1 JOIN t2 ON t1.id = t2.id
 *      |        ^^ column reference is ambiguous
 *      |
 *      = note: in view public.v
 *      = help: qualify the column with a relation name or alias
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /**
   * Print every diagnostic in the bag, ordered by primary location.
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
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace pg_sema
