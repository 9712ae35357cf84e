// compdoc/basic/diagnostic_printer.hpp
//
// Prints diagnostics with document context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "compdoc/basic/diagnostic.hpp"
#include "compdoc/store/document_store.hpp"

namespace compdoc
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W003]: component document 'intro' not found
 *     --> doc:chapter-1:3:9
 *      |
 *    3 | Welcome {{intro}}
 *      |         ^^^^^^^^^ token left unexpanded
 *      |
 *      = help: check the component map of 'chapter-1'
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
   * Label ranges are resolved against the body of the labelled document,
   * fetched from `store`. Without a store only the location header is shown.
   */
  void print(const Diagnostic & diag, const DocumentStore * store = nullptr);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags, const DocumentStore * store = nullptr);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const DocumentStore * store);

  void print_source_line(
    std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace compdoc
