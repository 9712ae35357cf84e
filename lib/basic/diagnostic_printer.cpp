// compdoc/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "compdoc/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

#include "compdoc/basic/source_range.hpp"

namespace compdoc
{

namespace
{

int severity_rank(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return 0;
    case Severity::Warning:
      return 1;
    case Severity::Info:
      return 2;
    case Severity::Hint:
      return 3;
  }
  return 4;
}

std::string expand_tabs(std::string_view line)
{
  std::string cleaned;
  cleaned.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned += c;
    }
  }
  return cleaned;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  } else {
    rang::setControlMode(rang::control::Force);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const DocumentStore * store)
{
  print_severity_header(diag);

  // === Location line: --> doc:<id>:line:col ===
  if (const Label * primary = diag.primary_label()) {
    std::string location = "doc:" + primary->document_id;
    if (store != nullptr && primary->range.is_valid()) {
      if (const auto doc = store->get_document(primary->document_id)) {
        const LineIndex index(doc->content);
        const LineColumn lc = index.get_line_column(primary->range.get_begin().get_offset());
        if (lc.is_valid()) {
          location += fmt::format(":{}:{}", lc.line, lc.column);
        }
      }
    }
    fmt::print(os_, "{} {}\n", gutter_arrow(), location);
    fmt::print(os_, "{}\n", gutter_pipe());
  }

  for (const auto & label : diag.labels) {
    print_label_context(label, store);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const DocumentStore * store)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return severity_rank(a.severity) < severity_rank(b.severity);
    });

  for (const auto & d : sorted_diags) {
    print(d, store);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = to_string(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const DocumentStore * store)
{
  std::optional<Document> doc;
  if (store != nullptr && label.range.is_valid()) {
    doc = store->get_document(label.document_id);
  }

  if (!doc) {
    // No body to point into - print as a note if message exists
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const LineIndex index(doc->content);
  const LineColumn start = index.get_line_column(label.range.get_begin().get_offset());
  const LineColumn end = index.get_line_column(label.range.get_end().get_offset());
  if (!start.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const uint32_t end_col = (end.is_valid() && end.line == start.line && end.column > start.column)
                             ? end.column
                             : (start.column + 1);

  print_source_line(
    index.get_line(start.line - 1), start.line, start.column, end_col, label.style,
    label.message);
}

void DiagnosticPrinter::print_source_line(
  std::string_view line, uint32_t line_num, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  if (line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  fmt::print(os_, "      {} ", gutter_pipe_only());

  // Skip to start column (handle tabs)
  std::string marker_prefix;
  uint32_t col = 1;
  for (size_t i = 0; col < start_col && i < line.size(); ++i, ++col) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return "\033[1;36m  -->\033[0m";
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return "\033[1;36m      |\033[0m";
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return "\033[1;36m|\033[0m";
  }
  return "|";
}

}  // namespace compdoc
