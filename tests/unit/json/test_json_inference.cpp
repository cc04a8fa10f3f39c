// tests/unit/json/test_json_inference.cpp - JSON shapes of query expressions
#include <gtest/gtest.h>

#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/test_support/sema_helpers.hpp"

using namespace pg_sema;
using test_support::build_schema;
using test_support::SchemaFixture;

class JsonInferenceTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    schema_ = build_schema(
      "CREATE TABLE t (\n"
      "  id int PRIMARY KEY,\n"
      "  name text,\n"
      "  tags text[] NOT NULL,\n"
      "  big bigint NOT NULL,\n"
      "  matrix int[][]\n"
      ");\n"
      "CREATE FUNCTION doc() RETURNS jsonb LANGUAGE sql\n"
      "AS $$ SELECT jsonb_build_object('n', 1) $$;");
    ASSERT_FALSE(schema_->build_diags.has_errors());
  }

  /// Rendered shape of the first output column of `sql`.
  std::string shape(const std::string & sql)
  {
    auto q = schema_->infer(sql);
    EXPECT_TRUE(q->ok()) << sql
                         << (q->diags.empty() ? std::string() : ": " + q->diags.all()[0].message);
    if (!q->ok() || q->fields->empty()) return "<error>";
    return render_json_type(q->at(0).json_type);
  }

  const JsonType * shape_of(const std::string & sql)
  {
    auto q = schema_->infer(sql);
    EXPECT_TRUE(q->ok()) << sql;
    return q->ok() && !q->fields->empty() ? q->at(0).json_type : nullptr;
  }

  std::unique_ptr<SchemaFixture> schema_;
};

// ============================================================================
// CASE unions
// ============================================================================

TEST_F(JsonInferenceTest, CaseWithEqualObjectsIsASingleShape)
{
  const JsonType * t = shape_of(
    "SELECT CASE WHEN true THEN json_build_object('a', 1) ELSE json_build_object('a', 1) END");
  ASSERT_NE(t, nullptr);
  EXPECT_FALSE(t->is_union());
  EXPECT_EQ(t->kind, JsonKind::Object);
  EXPECT_EQ(render_json_type(t), "{ a: number }");

  // Different values of the same type make the same shape.
  EXPECT_EQ(
    shape(
      "SELECT CASE WHEN true THEN json_build_object('a', 1)\n"
      "            ELSE json_build_object('a', 2) END"),
    "{ a: number }");
}

TEST_F(JsonInferenceTest, CaseWithDifferentObjectsIsAUnion)
{
  const JsonType * t = shape_of(
    "SELECT CASE WHEN true THEN json_build_object('a', 1) ELSE json_build_object('b', 1) END");
  ASSERT_NE(t, nullptr);
  ASSERT_TRUE(t->is_union());
  EXPECT_EQ(t->members.size(), 2U);
  EXPECT_EQ(render_json_type(t), "{ a: number } | { b: number }");
}

TEST_F(JsonInferenceTest, CaseWithoutElseIsNullable)
{
  EXPECT_EQ(
    shape("SELECT CASE WHEN true THEN json_build_object('a', 1) END"), "{ a: number } | null");
  EXPECT_EQ(
    shape("SELECT CASE WHEN true THEN json_build_object('a', 1) ELSE NULL END"),
    "{ a: number } | null");
}

TEST_F(JsonInferenceTest, CaseObjectsDifferingInFieldNullabilityCollapse)
{
  const JsonType * t = shape_of(
    "SELECT CASE WHEN true THEN json_build_object('n', name)\n"
    "            ELSE json_build_object('n', 'x') END\n"
    "FROM t");
  ASSERT_NE(t, nullptr);
  EXPECT_FALSE(t->is_union());
  EXPECT_EQ(render_json_type(t), "{ n: string | null }");

  // Either branch order gives the same merged shape.
  EXPECT_EQ(
    shape(
      "SELECT CASE WHEN true THEN json_build_object('n', 'x')\n"
      "            ELSE json_build_object('n', name) END\n"
      "FROM t"),
    "{ n: string | null }");
}

TEST_F(JsonInferenceTest, UnionArmsUniteTheirShapes)
{
  EXPECT_EQ(
    shape("SELECT json_build_object('a', 1) UNION ALL SELECT json_build_object('b', 1)"),
    "{ a: number } | { b: number }");
}

// ============================================================================
// Constructors
// ============================================================================

TEST_F(JsonInferenceTest, BuildObjectClassifiesColumns)
{
  EXPECT_EQ(
    shape(
      "SELECT json_build_object('id', id, 'name', name, 'tags', tags, 'big', big,\n"
      "                         'nested', json_build_object('ok', true))\n"
      "FROM t"),
    "{ id: number, name: string | null, tags: string[], big: JSON, nested: { ok: boolean } }");
}

TEST_F(JsonInferenceTest, OnlyTheOutermostArrayLevelIsNullable)
{
  EXPECT_EQ(shape("SELECT json_build_object('m', matrix) FROM t"), "{ m: number[][] | null }");
}

TEST_F(JsonInferenceTest, NonLiteralKeyMakesAnOpaqueValue)
{
  EXPECT_EQ(shape("SELECT json_build_object(name, 1) FROM t"), "JSON");
  EXPECT_EQ(shape("SELECT json_build_object('a', 1, 'b')"), "JSON");
}

TEST_F(JsonInferenceTest, BuildArrayUnitesElements)
{
  EXPECT_EQ(shape("SELECT json_build_array(1, 'x', 2)"), "(number | string)[]");
  EXPECT_EQ(shape("SELECT jsonb_build_array(id, id) FROM t"), "number[]");
  EXPECT_EQ(shape("SELECT json_build_array()"), "JSON[]");
}

TEST_F(JsonInferenceTest, AggregatedArraysAreNullable)
{
  EXPECT_EQ(shape("SELECT json_agg(id) FROM t"), "number[] | null");
  EXPECT_EQ(
    shape("SELECT json_agg(json_build_object('n', name)) FROM t"),
    "{ n: string | null }[] | null");
}

TEST_F(JsonInferenceTest, WholeRowArgumentsBecomeObjects)
{
  const std::string row = "{ id: number, name: string | null, tags: string[], big: JSON, "
                          "matrix: number[][] | null }";
  EXPECT_EQ(shape("SELECT row_to_json(t) FROM t"), row);
  EXPECT_EQ(shape("SELECT to_jsonb(x) FROM t AS x"), row);
  EXPECT_EQ(shape("SELECT json_agg(t) FROM t"), row + "[] | null");
}

TEST_F(JsonInferenceTest, ToJsonKeepsTheArgumentShape)
{
  EXPECT_EQ(shape("SELECT to_json(name) FROM t"), "string | null");
  EXPECT_EQ(shape("SELECT to_json(tags) FROM t"), "string[]");
}

// ============================================================================
// Propagation
// ============================================================================

TEST_F(JsonInferenceTest, CastBetweenJsonTypesKeepsTheShape)
{
  EXPECT_EQ(shape("SELECT json_build_object('a', 1)::jsonb"), "{ a: number }");
}

TEST_F(JsonInferenceTest, ScalarSubLinkIsNullable)
{
  EXPECT_EQ(shape("SELECT (SELECT json_build_object('a', 1))"), "{ a: number } | null");
}

TEST_F(JsonInferenceTest, ArrowWithLiteralKeyReachesTheMember)
{
  EXPECT_EQ(
    shape("SELECT json_build_object('a', json_build_object('b', 1)) -> 'a'"),
    "{ b: number } | null");
  // Unknown member: no shape.
  EXPECT_EQ(shape("SELECT json_build_object('a', 1) -> 'zzz'"), "JSON");
}

TEST_F(JsonInferenceTest, ShapesFlowThroughCtes)
{
  EXPECT_EQ(
    shape("WITH c AS (SELECT json_build_object('k', id) AS j FROM t) SELECT j FROM c"),
    "{ k: number }");
}

TEST_F(JsonInferenceTest, CommittedRoutineShapeIsUsedByCallers)
{
  const auto * fn = schema_->get<RoutineObject>("doc");
  ASSERT_NE(fn, nullptr);

  DiagnosticBag diags;
  QueryInferrer inferrer(*schema_->metadata, *schema_->json, diags);
  auto fields = inferrer.infer_routine(fn);
  ASSERT_TRUE(fields.has_value());
  schema_->metadata->commit_fields(fn, *fields);

  EXPECT_EQ(shape("SELECT doc()"), "{ n: number }");
}

TEST_F(JsonInferenceTest, PlainJsonColumnsAreOpaque)
{
  auto schema = build_schema("CREATE TABLE docs (body jsonb NOT NULL);");
  auto q = schema->infer("SELECT json_build_object('body', body) FROM docs");
  ASSERT_TRUE(q->ok());
  EXPECT_EQ(render_json_type(q->at(0).json_type), "{ body: JSON }");
  EXPECT_EQ(q->at(0).type_oid, oid::k_json);
}
