// tests/unit/driver/test_diagnostic_printer.cpp - Rust-style diagnostic output
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/basic/diagnostic_printer.hpp"

using namespace pg_sema;

namespace
{

class DiagnosticPrinterTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    file_ = sources_.register_file("views.sql", "CREATE TABLE t (a int);\nSELECT\tb FROM t;\n");
  }

  std::string print_all()
  {
    std::ostringstream os;
    DiagnosticPrinter printer(os, false);
    printer.print_all(diags_, sources_);
    return os.str();
  }

  static bool contains(const std::string & haystack, const std::string & needle)
  {
    return haystack.find(needle) != std::string::npos;
  }

  SourceRegistry sources_;
  FileId file_;
  DiagnosticBag diags_;
};

}  // namespace

TEST_F(DiagnosticPrinterTest, HeaderLocationAndMarker)
{
  // `b` on line 2, after a tab.
  diags_.report_error(SourceRange(file_, 31, 32), "unknown column `b`", "not found")
    .with_code(diag_code::k_unknown_column);

  const std::string out = print_all();
  EXPECT_TRUE(contains(out, "error[E0203]: unknown column `b`\n")) << out;
  EXPECT_TRUE(contains(out, "  --> views.sql:2:8\n")) << out;
  EXPECT_TRUE(contains(out, "    2 | SELECT    b FROM t;\n")) << out;
  EXPECT_TRUE(contains(out, "      |           ^ not found\n")) << out;
  EXPECT_FALSE(contains(out, "\033[")) << out;
}

TEST_F(DiagnosticPrinterTest, MultiCharacterSpan)
{
  diags_.report_warning(SourceRange(file_, 13, 14), "short name").with_code("W9999");
  diags_.report_error(SourceRange(file_, 0, 12), "wide span");

  const std::string out = print_all();
  EXPECT_TRUE(contains(out, "error: wide span\n")) << out;
  EXPECT_TRUE(contains(out, "      | ^^^^^^^^^^^^\n")) << out;
  EXPECT_TRUE(contains(out, "warning[W9999]: short name\n")) << out;
  // Sorted by location: the span at offset 0 comes first.
  EXPECT_LT(out.find("wide span"), out.find("short name"));
}

TEST_F(DiagnosticPrinterTest, ObjectAndHelpTrailers)
{
  diags_.report_error(SourceRange(file_, 31, 32), "unknown column `b`")
    .with_object("public.v")
    .with_help("check the column list of `t`");

  const std::string out = print_all();
  EXPECT_TRUE(contains(out, "   = note: in public.v\n")) << out;
  EXPECT_TRUE(contains(out, "   = help: check the column list of `t`\n")) << out;
  EXPECT_LT(out.find("= note"), out.find("= help"));
}

TEST_F(DiagnosticPrinterTest, DiagnosticWithoutLocation)
{
  diags_.report_error(SourceRange{}, "no schema files in project");

  const std::string out = print_all();
  EXPECT_EQ(out, "error: no schema files in project\n\n");
}

TEST_F(DiagnosticPrinterTest, SecondaryLabelsUseDashes)
{
  diags_.report_error(SourceRange(file_, 13, 14), "duplicate object `t`")
    .with_secondary_label(SourceRange(file_, 13, 14), "first declared here");

  const std::string out = print_all();
  EXPECT_TRUE(contains(out, "^\n")) << out;
  EXPECT_TRUE(contains(out, "- first declared here\n")) << out;
}
