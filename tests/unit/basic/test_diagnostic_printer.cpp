// tests/unit/basic/test_diagnostic_printer.cpp - Rust-style diagnostic output

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "compdoc/basic/diagnostic_printer.hpp"
#include "compdoc/test_support/store_helpers.hpp"

using namespace compdoc;
using test_support::TestStore;

TEST(BasicDiagnosticPrinter, PrintsLocationSourceLineAndMarker)
{
  TestStore store;
  store.add("A", "intro\nx {{missing}} y");

  DiagnosticBag diags;
  diags
    .report_warning(
      "A", SourceRange(8, 19), "no component reference for token 'missing'",
      "token left unresolved")
    .with_code(diag_code::k_unresolved_token);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, &store);

  const std::string text = out.str();
  EXPECT_NE(
    text.find("warning[W001]: no component reference for token 'missing'\n"), std::string::npos)
    << text;
  EXPECT_NE(text.find("  --> doc:A:2:3\n"), std::string::npos) << text;
  EXPECT_NE(text.find("    2 | x {{missing}} y\n"), std::string::npos) << text;
  EXPECT_NE(text.find("      |   ^^^^^^^^^^^ token left unresolved\n"), std::string::npos)
    << text;
}

TEST(BasicDiagnosticPrinter, HelpAndNoteLines)
{
  DiagnosticBag diags;
  diags
    .report_error(
      "A", {}, "Cyclic dependency detected: Document A would create a circular reference",
      "component 'me'")
    .with_code(diag_code::k_cyclic_dependency)
    .with_help("cycle: A -> A");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[E001]: Cyclic dependency detected"), std::string::npos) << text;
  EXPECT_NE(text.find("  --> doc:A\n"), std::string::npos) << text;
  EXPECT_NE(text.find("   = note: component 'me'\n"), std::string::npos) << text;
  EXPECT_NE(text.find("   = help: cycle: A -> A\n"), std::string::npos) << text;
}

TEST(BasicDiagnosticPrinter, DiagnosticWithoutLocation)
{
  DiagnosticBag diags;
  diags.report_error({}, {}, "document 'x' not found").with_code(diag_code::k_unknown_document);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);

  EXPECT_EQ(out.str(), "error[E002]: document 'x' not found\n\n");
}

TEST(BasicDiagnosticPrinter, ErrorsArePrintedFirst)
{
  DiagnosticBag diags;
  diags.report_warning({}, {}, "a warning");
  diags.report_error({}, {}, "an error");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags);

  const std::string text = out.str();
  EXPECT_LT(text.find("error: an error"), text.find("warning: a warning"));
}
