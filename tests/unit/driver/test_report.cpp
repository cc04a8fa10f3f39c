// tests/unit/driver/test_report.cpp - JSON reports
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/report/report.hpp"

using namespace pg_sema;
using json = nlohmann::json;

namespace
{

AnalysisResult analyze(const std::string & sql)
{
  std::vector<SourceInput> sources;
  sources.push_back(SourceInput{"schema.sql", sql});
  return Analyzer::analyze_sources(std::move(sources), AnalyzeOptions{});
}

const json * find_object(const json & report, const std::string & name)
{
  for (const auto & obj : report["objects"]) {
    if (obj["name"] == name) return &obj;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Shapes
// ============================================================================

TEST(Report, ShapeOfNullIsNull)
{
  EXPECT_TRUE(to_json(static_cast<const JsonType *>(nullptr)).is_null());
}

TEST(Report, StructuralShape)
{
  JsonTypeContext ctx;
  const JsonType * num = ctx.primitive(JsonPrimitive::Number);
  const JsonType * obj = ctx.object({{"ids", ctx.array(num)}}, true);

  const json j = to_json(obj);
  EXPECT_EQ(j["kind"], "object");
  EXPECT_EQ(j["nullable"], true);
  ASSERT_EQ(j["fields"].size(), 1U);
  EXPECT_EQ(j["fields"][0]["name"], "ids");
  EXPECT_EQ(j["fields"][0]["type"]["kind"], "array");
  EXPECT_EQ(j["fields"][0]["type"]["element"]["primitive"], "number");

  const json u = to_json(ctx.unite(num, ctx.primitive(JsonPrimitive::String, true)));
  EXPECT_EQ(u["kind"], "union");
  EXPECT_EQ(u["nullable"], true);
  EXPECT_EQ(u["members"].size(), 2U);
}

// ============================================================================
// Analysis reports
// ============================================================================

TEST(Report, SuccessfulRun)
{
  auto result = analyze(
    "CREATE TABLE t (id int PRIMARY KEY, tags text[], doc jsonb);\n"
    "CREATE VIEW v AS SELECT id, json_build_object('id', id) AS obj FROM t;");
  ASSERT_TRUE(result.success);

  const json report = to_json(result);
  EXPECT_EQ(report["success"], true);
  EXPECT_EQ(report["cancelled"], false);
  EXPECT_EQ(report["order"], json::array({"public.t", "public.v"}));
  EXPECT_TRUE(report["cycles"].empty());
  EXPECT_TRUE(report["failed"].empty());

  const json * t = find_object(report, "public.t");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ((*t)["kind"], "table");
  EXPECT_TRUE((*t)["dependencies"].empty());
  const json & cols = (*t)["fields"];
  ASSERT_EQ(cols.size(), 3U);
  EXPECT_EQ(cols[0]["name"], "id");
  EXPECT_EQ(cols[0]["type"], "int4");
  EXPECT_EQ(cols[0]["nullable"], false);
  EXPECT_EQ(cols[0]["ts_type"], "number");
  EXPECT_EQ(cols[1]["type"], "text[]");
  EXPECT_EQ(cols[1]["dims"], 1);
  EXPECT_EQ(cols[1]["ts_type"], "string[] | null");
  EXPECT_EQ(cols[2]["ts_type"], "JSON | null");

  const json * v = find_object(report, "public.v");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ((*v)["kind"], "view");
  EXPECT_EQ((*v)["dependencies"], json::array({"public.t"}));
  EXPECT_EQ((*v)["fields"][1]["type"], "json");
  EXPECT_EQ((*v)["fields"][1]["ts_type"], "{ id: number }");
  EXPECT_EQ((*v)["fields"][1]["shape"]["kind"], "object");
}

TEST(Report, FailuresAndDiagnostics)
{
  auto result = analyze(
    "CREATE TABLE t (a int);\n"
    "CREATE VIEW v AS SELECT b FROM t;");
  ASSERT_FALSE(result.success);

  const json report = to_json(result);
  EXPECT_EQ(report["success"], false);
  EXPECT_EQ(report["failed"], json::array({"public.v"}));
  ASSERT_EQ(report["objects"].size(), 1U);

  ASSERT_EQ(report["diagnostics"].size(), 1U);
  const json & d = report["diagnostics"][0];
  EXPECT_EQ(d["severity"], "error");
  EXPECT_EQ(d["code"].get<std::string>(), diag_code::k_unknown_column);
  EXPECT_EQ(d["object"], "public.v");
  EXPECT_FALSE(d["message"].get<std::string>().empty());
}

TEST(Report, CyclesAreListedByName)
{
  auto result = analyze(
    "CREATE VIEW a AS SELECT * FROM b;\n"
    "CREATE VIEW b AS SELECT * FROM a;");
  const json report = to_json(result);
  ASSERT_EQ(report["cycles"].size(), 1U);
  EXPECT_EQ(report["cycles"][0].size(), 2U);
  EXPECT_EQ(report["failed"].size(), 2U);
}

TEST(Report, RunStoppedBeforeInferenceHasNoObjects)
{
  auto result = analyze("CREATE TABLE t (a int);\nCREATE TABLE t (a int);");
  const json report = to_json(result);
  EXPECT_EQ(report["success"], false);
  EXPECT_TRUE(report["objects"].empty());
  ASSERT_FALSE(report["diagnostics"].empty());
  EXPECT_EQ(
    report["diagnostics"][0]["code"].get<std::string>(), diag_code::k_duplicate_object);
}
