// tests/unit/sema/test_object_inference.cpp - Column checks, views and routines
#include <gtest/gtest.h>

#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/test_support/sema_helpers.hpp"

using namespace pg_sema;
using test_support::build_schema;
using test_support::SchemaFixture;

namespace
{

struct Inferred
{
  DiagnosticBag diags;
  std::optional<std::vector<Field>> fields;
};

std::unique_ptr<Inferred> infer_view(SchemaFixture & schema, std::string_view name)
{
  auto out = std::make_unique<Inferred>();
  const auto * view = schema.get<ViewObject>(name);
  EXPECT_NE(view, nullptr) << name;
  if (!view) return out;
  QueryInferrer inferrer(*schema.metadata, *schema.json, out->diags);
  out->fields = inferrer.infer_view(view);
  return out;
}

std::unique_ptr<Inferred> infer_routine(SchemaFixture & schema, std::string_view name)
{
  auto out = std::make_unique<Inferred>();
  const auto * routine = schema.get<RoutineObject>(name);
  EXPECT_NE(routine, nullptr) << name;
  if (!routine) return out;
  QueryInferrer inferrer(*schema.metadata, *schema.json, out->diags);
  out->fields = inferrer.infer_routine(routine);
  return out;
}

bool check_table(SchemaFixture & schema, std::string_view name, DiagnosticBag & diags)
{
  const auto * table = schema.get<TableObject>(name);
  EXPECT_NE(table, nullptr) << name;
  if (!table) return false;
  QueryInferrer inferrer(*schema.metadata, *schema.json, diags);
  return inferrer.check_columns(table, table->columns);
}

}  // namespace

// ============================================================================
// Tables
// ============================================================================

TEST(ObjectInference, ColumnTypesMustResolve)
{
  auto schema = build_schema(
    "CREATE TABLE good (id int, tags text[]);\n"
    "CREATE TABLE bad (id int, x no_such_type);");

  DiagnosticBag good_diags;
  EXPECT_TRUE(check_table(*schema, "good", good_diags));
  EXPECT_TRUE(good_diags.empty());

  DiagnosticBag bad_diags;
  EXPECT_FALSE(check_table(*schema, "bad", bad_diags));
  ASSERT_TRUE(bad_diags.has_code(diag_code::k_unknown_type));
  EXPECT_NE(bad_diags.all()[0].message.find("public.no_such_type"), std::string::npos);
}

TEST(ObjectInference, ForeignKeyTargetsMustResolve)
{
  auto schema = build_schema(
    "CREATE TABLE nodes (id int PRIMARY KEY, parent_id int REFERENCES nodes (id));\n"
    "CREATE TABLE orphan (owner_id int REFERENCES owners (id));");

  DiagnosticBag self_diags;
  EXPECT_TRUE(check_table(*schema, "nodes", self_diags));

  DiagnosticBag orphan_diags;
  EXPECT_FALSE(check_table(*schema, "orphan", orphan_diags));
  EXPECT_TRUE(orphan_diags.has_code(diag_code::k_relation_not_found));
}

TEST(ObjectInference, ExtensionTypesNeedTheirExtension)
{
  auto with = build_schema(
    "CREATE EXTENSION citext;\n"
    "CREATE TABLE users (email citext);");
  DiagnosticBag with_diags;
  EXPECT_TRUE(check_table(*with, "users", with_diags));

  auto without = build_schema("CREATE TABLE users (email citext);");
  DiagnosticBag without_diags;
  EXPECT_FALSE(check_table(*without, "users", without_diags));
  EXPECT_TRUE(without_diags.has_code(diag_code::k_unknown_type));
}

// ============================================================================
// Views
// ============================================================================

TEST(ObjectInference, ViewColumnAliases)
{
  auto schema = build_schema(
    "CREATE TABLE t (a int NOT NULL, b text);\n"
    "CREATE VIEW v (x, y) AS SELECT a, b FROM t;\n"
    "CREATE VIEW partial (x) AS SELECT a, b FROM t;\n"
    "CREATE VIEW too_many (x, y, z) AS SELECT a FROM t;");

  auto v = infer_view(*schema, "v");
  ASSERT_TRUE(v->fields.has_value());
  ASSERT_EQ(v->fields->size(), 2U);
  EXPECT_EQ((*v->fields)[0].name, "x");
  EXPECT_EQ((*v->fields)[0].type_oid, oid::k_int4);
  EXPECT_FALSE((*v->fields)[0].nullable);
  EXPECT_EQ((*v->fields)[1].name, "y");

  auto partial = infer_view(*schema, "partial");
  ASSERT_TRUE(partial->fields.has_value());
  EXPECT_EQ((*partial->fields)[1].name, "b");

  auto too_many = infer_view(*schema, "too_many");
  EXPECT_FALSE(too_many->fields.has_value());
  EXPECT_TRUE(too_many->diags.has_code(diag_code::k_unknown_column));
}

TEST(ObjectInference, ViewOverView)
{
  auto schema = build_schema(
    "CREATE TABLE t (a int NOT NULL);\n"
    "CREATE VIEW base AS SELECT a, a + 1 AS next FROM t;\n"
    "CREATE VIEW top AS SELECT next FROM base;");
  auto top = infer_view(*schema, "top");
  ASSERT_TRUE(top->fields.has_value());
  ASSERT_EQ(top->fields->size(), 1U);
  EXPECT_EQ((*top->fields)[0].name, "next");
  EXPECT_EQ((*top->fields)[0].type_oid, oid::k_int4);
}

TEST(ObjectInference, FailedViewIsUnavailable)
{
  auto schema = build_schema(
    "CREATE TABLE t (a int);\n"
    "CREATE VIEW base AS SELECT a FROM t;\n"
    "CREATE VIEW top AS SELECT a FROM base;");
  schema->metadata->mark_failed(schema->get<ViewObject>("base"));

  auto top = infer_view(*schema, "top");
  EXPECT_FALSE(top->fields.has_value());
  EXPECT_TRUE(top->diags.has_code(diag_code::k_relation_not_found));
}

// ============================================================================
// Routines
// ============================================================================

TEST(ObjectInference, ReturnsTableUsesDeclaredColumns)
{
  auto schema = build_schema(
    "CREATE TABLE t (a int NOT NULL, b text);\n"
    "CREATE FUNCTION rows_of() RETURNS TABLE (id bigint, payload json) LANGUAGE sql\n"
    "AS $$ SELECT a, json_build_object('k', b) FROM t $$;");

  auto r = infer_routine(*schema, "rows_of");
  ASSERT_TRUE(r->fields.has_value());
  ASSERT_EQ(r->fields->size(), 2U);

  const Field & id = (*r->fields)[0];
  EXPECT_EQ(id.name, "id");
  EXPECT_EQ(id.type_oid, oid::k_int8);

  const Field & payload = (*r->fields)[1];
  EXPECT_EQ(payload.type_oid, oid::k_json);
  ASSERT_NE(payload.json_type, nullptr);
  EXPECT_EQ(render_json_type(payload.json_type), "{ k: string | null }");
}

TEST(ObjectInference, ScalarResultIsNamedAfterTheRoutine)
{
  auto schema = build_schema(
    "CREATE TABLE t (a int);\n"
    "CREATE FUNCTION total() RETURNS bigint LANGUAGE sql AS $$ SELECT count(*) FROM t $$;");

  auto r = infer_routine(*schema, "total");
  ASSERT_TRUE(r->fields.has_value());
  ASSERT_EQ(r->fields->size(), 1U);
  EXPECT_EQ((*r->fields)[0].name, "total");
  EXPECT_EQ((*r->fields)[0].type_oid, oid::k_int8);
}

TEST(ObjectInference, JsonResultTakesTheBodyShape)
{
  auto schema = build_schema(
    "CREATE FUNCTION doc() RETURNS jsonb LANGUAGE sql\n"
    "AS $$ SELECT jsonb_build_object('n', 1, 's', 'x') $$;");

  auto r = infer_routine(*schema, "doc");
  ASSERT_TRUE(r->fields.has_value());
  ASSERT_EQ(r->fields->size(), 1U);
  const Field & f = (*r->fields)[0];
  EXPECT_EQ(f.name, "doc");
  EXPECT_EQ(f.type_oid, oid::k_jsonb);
  EXPECT_FALSE(f.nullable);
  ASSERT_NE(f.json_type, nullptr);
  EXPECT_EQ(render_json_type(f.json_type), "{ n: number, s: string }");
}

TEST(ObjectInference, RecordResultNeedsAnSqlBody)
{
  auto schema = build_schema(
    "CREATE TABLE t (a int, b text);\n"
    "CREATE FUNCTION rec() RETURNS record LANGUAGE sql AS $$ SELECT a, b FROM t $$;\n"
    "CREATE FUNCTION opaque() RETURNS record LANGUAGE plpgsql\n"
    "AS $$ BEGIN RETURN NULL; END $$;");

  auto rec = infer_routine(*schema, "rec");
  ASSERT_TRUE(rec->fields.has_value());
  ASSERT_EQ(rec->fields->size(), 2U);
  EXPECT_EQ((*rec->fields)[1].name, "b");

  auto opaque = infer_routine(*schema, "opaque");
  EXPECT_FALSE(opaque->fields.has_value());
  EXPECT_TRUE(opaque->diags.has_code(diag_code::k_unsupported_construct));
}

TEST(ObjectInference, BodyResolvesParameters)
{
  auto schema = build_schema(
    "CREATE FUNCTION pair(x int, label text) RETURNS record LANGUAGE sql\n"
    "AS $$ SELECT x + 1 AS next, $2 AS tag $$;\n"
    "CREATE FUNCTION bad_param(x int) RETURNS record LANGUAGE sql\n"
    "AS $$ SELECT $2 AS missing $$;");

  auto pair = infer_routine(*schema, "pair");
  ASSERT_TRUE(pair->fields.has_value());
  ASSERT_EQ(pair->fields->size(), 2U);
  EXPECT_EQ((*pair->fields)[0].type_oid, oid::k_int4);
  EXPECT_TRUE((*pair->fields)[0].nullable);
  EXPECT_EQ((*pair->fields)[1].name, "tag");
  EXPECT_EQ((*pair->fields)[1].type_oid, oid::k_text);

  auto bad = infer_routine(*schema, "bad_param");
  EXPECT_FALSE(bad->fields.has_value());
  EXPECT_TRUE(bad->diags.has_code(diag_code::k_unknown_column));
}

TEST(ObjectInference, OutParametersAndVoid)
{
  auto schema = build_schema(
    "CREATE FUNCTION split(IN s text, OUT head text, OUT rest text) LANGUAGE sql\n"
    "AS $$ SELECT s, s $$;\n"
    "CREATE PROCEDURE cleanup() LANGUAGE sql AS $$ SELECT 1 $$;");

  auto split = infer_routine(*schema, "split");
  ASSERT_TRUE(split->fields.has_value());
  ASSERT_EQ(split->fields->size(), 2U);
  EXPECT_EQ((*split->fields)[0].name, "head");

  auto cleanup = infer_routine(*schema, "cleanup");
  ASSERT_TRUE(cleanup->fields.has_value());
  EXPECT_TRUE(cleanup->fields->empty());
}

TEST(ObjectInference, UnknownParameterType)
{
  auto schema = build_schema(
    "CREATE FUNCTION f(x no_such_type) RETURNS int LANGUAGE sql AS $$ SELECT 1 $$;");
  auto r = infer_routine(*schema, "f");
  EXPECT_FALSE(r->fields.has_value());
  EXPECT_TRUE(r->diags.has_code(diag_code::k_unknown_type));
}

TEST(ObjectInference, DescribeType)
{
  EXPECT_EQ(describe_type(TypeRef{Identifier("pg_catalog", "int4"), 0}), "int4");
  EXPECT_EQ(describe_type(TypeRef{Identifier("", "mood"), 2}), "public.mood[][]");
}
