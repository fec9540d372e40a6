// tests/unit/basic/test_diagnostic.cpp - DiagnosticBag and DiagnosticPrinter

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "callscope/basic/diagnostic.hpp"
#include "callscope/basic/diagnostic_printer.hpp"

using namespace callscope;

TEST(BasicDiagnostic, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error("cannot read manifest");
    builder.with_code(diag_code::k_manifest_parse).with_location("a.json").with_note("line 3");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1u);

  const Diagnostic & d = bag.all().front();
  EXPECT_TRUE(d.is_error());
  EXPECT_EQ(d.code, "E002");
  EXPECT_EQ(d.location, "a.json");
  ASSERT_EQ(d.notes.size(), 1u);
  EXPECT_EQ(d.notes[0], "line 3");
  EXPECT_FALSE(d.help_message.has_value());
}

TEST(BasicDiagnostic, HasErrorsAndCodes)
{
  DiagnosticBag bag;
  bag.report_warning("class not found").with_code(diag_code::k_entry_not_found);
  bag.report_info("truncated");
  EXPECT_FALSE(bag.has_errors());

  bag.report_error("store failed").with_code(diag_code::k_storage);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.size(), 3u);
  EXPECT_TRUE(bag.has_code("W001"));
  EXPECT_TRUE(bag.has_code("E005"));
  EXPECT_FALSE(bag.has_code("E001"));
}

TEST(BasicDiagnosticPrinter, PlainLayout)
{
  DiagnosticBag bag;
  bag.report_warning("class not found: a.A").with_code(diag_code::k_entry_not_found);
  bag.report_error("failed to store call graph result")
    .with_code(diag_code::k_storage)
    .with_note("disk full")
    .with_help("check the output.store path");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  // Errors are printed before warnings
  const std::string expected =
    "error[E005]: failed to store call graph result\n"
    "      |\n"
    "   = note: disk full\n"
    "   = help: check the output.store path\n"
    "\n"
    "warning[W001]: class not found: a.A\n"
    "\n";
  EXPECT_EQ(out.str(), expected);
}

TEST(BasicDiagnosticPrinter, DiagnosticWithoutCode)
{
  Diagnostic d;
  d.severity = Severity::Info;
  d.message = "call tree was truncated";

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(d);
  EXPECT_EQ(out.str(), "info: call tree was truncated\n\n");
}
