// tests/unit/sema/test_expr_inference.cpp - Expression types and nullability
#include <gtest/gtest.h>

#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/test_support/sema_helpers.hpp"

using namespace pg_sema;
using test_support::build_schema;
using test_support::SchemaFixture;

class ExprInferenceTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    schema_ = build_schema(
      "CREATE TABLE items (\n"
      "  id int PRIMARY KEY,\n"
      "  title text NOT NULL,\n"
      "  price numeric NOT NULL,\n"
      "  qty int,\n"
      "  tags text[] NOT NULL,\n"
      "  doc jsonb\n"
      ");\n"
      "CREATE FUNCTION shout(s text) RETURNS text LANGUAGE sql AS $$ SELECT upper(s) $$;");
    ASSERT_FALSE(schema_->build_diags.has_errors());
  }

  /// Fields of `sql`, failing the test on an inference error.
  std::vector<Field> fields(const std::string & sql)
  {
    auto q = schema_->infer(sql);
    EXPECT_TRUE(q->ok()) << sql
                         << (q->diags.empty() ? std::string() : ": " + q->diags.all()[0].message);
    return q->ok() ? *q->fields : std::vector<Field>{};
  }

  std::string type_of(const Field & f) const { return schema_->type_name(f.type_oid); }

  std::unique_ptr<SchemaFixture> schema_;
};

// ============================================================================
// Literals and casts
// ============================================================================

TEST_F(ExprInferenceTest, Literals)
{
  const auto f = fields("SELECT 1, 3000000000, 99999999999999999999, 1.5, 'x', true, NULL");
  ASSERT_EQ(f.size(), 7U);
  EXPECT_EQ(type_of(f[0]), "int4");
  EXPECT_EQ(type_of(f[1]), "int8");
  EXPECT_EQ(type_of(f[2]), "numeric");
  EXPECT_EQ(type_of(f[3]), "float8");
  EXPECT_EQ(type_of(f[4]), "text");
  EXPECT_EQ(type_of(f[5]), "bool");
  EXPECT_EQ(type_of(f[6]), "unknown");

  for (size_t i = 0; i < 6; ++i) {
    EXPECT_FALSE(f[i].nullable) << i;
    EXPECT_EQ(f[i].name, "?column?");
  }
  EXPECT_TRUE(f[6].nullable);
}

TEST_F(ExprInferenceTest, CastNamesAndDimensions)
{
  const auto f = fields(
    "SELECT qty::text, '1'::int, upper(title)::varchar, (1 + 2)::bigint, tags::varchar[],\n"
    "       NULL::int, ARRAY[]::text[]\n"
    "FROM items");
  ASSERT_EQ(f.size(), 7U);

  EXPECT_EQ(f[0].name, "qty");
  EXPECT_EQ(type_of(f[0]), "text");
  EXPECT_TRUE(f[0].nullable);

  EXPECT_EQ(f[1].name, "int4");
  EXPECT_FALSE(f[1].nullable);

  EXPECT_EQ(f[2].name, "upper");
  EXPECT_EQ(type_of(f[2]), "varchar");

  EXPECT_EQ(f[3].name, "int8");

  EXPECT_EQ(f[4].name, "tags");
  EXPECT_EQ(f[4].dims, 1);
  EXPECT_EQ(type_of(f[4]), "varchar[]");

  EXPECT_TRUE(f[5].nullable);
  EXPECT_EQ(type_of(f[5]), "int4");

  EXPECT_EQ(type_of(f[6]), "text[]");
  EXPECT_EQ(f[6].dims, 1);
}

TEST_F(ExprInferenceTest, CastToUnknownTypeFails)
{
  auto q = schema_->infer("SELECT 1::no_such_type");
  EXPECT_FALSE(q->ok());
  EXPECT_TRUE(q->has_code(diag_code::k_unknown_type));
}

// ============================================================================
// Function calls
// ============================================================================

TEST_F(ExprInferenceTest, AggregatesAndNullRules)
{
  const auto f = fields(
    "SELECT count(*), sum(qty), sum(id), max(title), coalesce(qty, 0), coalesce(qty, qty),\n"
    "       nullif(id, 0), now(), lower(title), lower(doc ->> 'k')\n"
    "FROM items");
  ASSERT_EQ(f.size(), 10U);

  EXPECT_EQ(f[0].name, "count");
  EXPECT_EQ(type_of(f[0]), "int8");
  EXPECT_FALSE(f[0].nullable);

  EXPECT_EQ(type_of(f[1]), "int8");
  EXPECT_TRUE(f[1].nullable);
  EXPECT_TRUE(f[2].nullable);  // empty input

  EXPECT_EQ(type_of(f[3]), "text");
  EXPECT_TRUE(f[3].nullable);

  EXPECT_EQ(f[4].name, "coalesce");
  EXPECT_EQ(type_of(f[4]), "int4");
  EXPECT_FALSE(f[4].nullable);
  EXPECT_TRUE(f[5].nullable);

  EXPECT_TRUE(f[6].nullable);

  EXPECT_EQ(type_of(f[7]), "timestamptz");
  EXPECT_FALSE(f[7].nullable);

  EXPECT_FALSE(f[8].nullable);
  EXPECT_TRUE(f[9].nullable);
}

TEST_F(ExprInferenceTest, SetReturningAndArrayFunctions)
{
  const auto f = fields(
    "SELECT string_to_array(title, ','), array_position(tags, 'x'), unnest(tags),\n"
    "       array_agg(id)\n"
    "FROM items");
  ASSERT_EQ(f.size(), 4U);
  EXPECT_EQ(type_of(f[0]), "text[]");
  EXPECT_EQ(f[0].dims, 1);
  EXPECT_TRUE(f[1].nullable);
  EXPECT_EQ(type_of(f[2]), "text");
  EXPECT_EQ(f[2].dims, 0);
  EXPECT_EQ(type_of(f[3]), "int4[]");
  EXPECT_EQ(f[3].dims, 1);
}

TEST_F(ExprInferenceTest, UserDefinedFunction)
{
  const auto f = fields("SELECT shout(title), shout(NULL) FROM items");
  ASSERT_EQ(f.size(), 2U);
  EXPECT_EQ(f[0].name, "shout");
  EXPECT_EQ(type_of(f[0]), "text");
  EXPECT_FALSE(f[0].nullable);
  EXPECT_TRUE(f[1].nullable);
}

TEST_F(ExprInferenceTest, UnknownFunction)
{
  auto q = schema_->infer("SELECT no_such_fn(id) FROM items");
  EXPECT_FALSE(q->ok());
  ASSERT_TRUE(q->has_code(diag_code::k_unknown_function));
  EXPECT_NE(q->diags.all()[0].message.find("no_such_fn"), std::string::npos);
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(ExprInferenceTest, ComparisonAndBooleanOperators)
{
  const auto f = fields(
    "SELECT id = 1, qty > 1, qty IS NULL, qty IS DISTINCT FROM 1, NOT (id = 1),\n"
    "       qty BETWEEN 1 AND 2, id IN (1, 2), title LIKE 'a%', id = ANY (ARRAY[1, 2])\n"
    "FROM items");
  ASSERT_EQ(f.size(), 9U);
  for (const auto & field : f) {
    EXPECT_EQ(type_of(field), "bool");
    EXPECT_EQ(field.name, "?column?");
  }
  EXPECT_FALSE(f[0].nullable);
  EXPECT_TRUE(f[1].nullable);
  EXPECT_FALSE(f[2].nullable);
  EXPECT_FALSE(f[3].nullable);
  EXPECT_FALSE(f[4].nullable);
  EXPECT_TRUE(f[5].nullable);
  EXPECT_FALSE(f[6].nullable);
  EXPECT_FALSE(f[7].nullable);
  EXPECT_FALSE(f[8].nullable);
}

TEST_F(ExprInferenceTest, ArithmeticKeepsTheColumnType)
{
  const auto f = fields("SELECT price * 2, 2 * price, qty + 1, -qty FROM items");
  ASSERT_EQ(f.size(), 4U);
  EXPECT_EQ(type_of(f[0]), "numeric");
  EXPECT_EQ(type_of(f[1]), "numeric");
  EXPECT_FALSE(f[1].nullable);
  EXPECT_EQ(type_of(f[2]), "int4");
  EXPECT_TRUE(f[2].nullable);
  EXPECT_EQ(type_of(f[3]), "int4");
}

TEST_F(ExprInferenceTest, ConcatenationAndJsonAccess)
{
  const auto f = fields(
    "SELECT title || '!', tags || 'x', doc -> 'k', doc ->> 'k', doc #>> '{a,b}', doc || doc\n"
    "FROM items");
  ASSERT_EQ(f.size(), 6U);
  EXPECT_EQ(type_of(f[0]), "text");
  EXPECT_FALSE(f[0].nullable);

  EXPECT_EQ(type_of(f[1]), "text[]");
  EXPECT_EQ(f[1].dims, 1);

  EXPECT_EQ(type_of(f[2]), "jsonb");
  EXPECT_TRUE(f[2].nullable);

  EXPECT_EQ(type_of(f[3]), "text");
  EXPECT_TRUE(f[3].nullable);
  EXPECT_EQ(type_of(f[4]), "text");

  EXPECT_EQ(type_of(f[5]), "jsonb");
}

// ============================================================================
// CASE, ARRAY, sub-links, subscripts
// ============================================================================

TEST_F(ExprInferenceTest, CaseTakesTheFirstTypedBranch)
{
  const auto f = fields(
    "SELECT CASE WHEN qty > 1 THEN 'big' ELSE 'small' END,\n"
    "       CASE WHEN qty > 1 THEN 'big' END,\n"
    "       CASE WHEN qty > 1 THEN NULL ELSE 1 END,\n"
    "       CASE qty WHEN 1 THEN title ELSE 'many' END\n"
    "FROM items");
  ASSERT_EQ(f.size(), 4U);
  EXPECT_EQ(f[0].name, "case");
  EXPECT_EQ(type_of(f[0]), "text");
  EXPECT_FALSE(f[0].nullable);

  EXPECT_TRUE(f[1].nullable);  // no ELSE

  EXPECT_EQ(type_of(f[2]), "int4");
  EXPECT_TRUE(f[2].nullable);

  EXPECT_EQ(type_of(f[3]), "text");
  EXPECT_FALSE(f[3].nullable);
}

TEST_F(ExprInferenceTest, ArrayConstructors)
{
  const auto f = fields("SELECT ARRAY[1, 2], ARRAY[NULL, 'a'], ARRAY[[1], [2]]");
  ASSERT_EQ(f.size(), 3U);
  EXPECT_EQ(f[0].name, "array");
  EXPECT_EQ(type_of(f[0]), "int4[]");
  EXPECT_EQ(f[0].dims, 1);
  EXPECT_FALSE(f[0].nullable);

  EXPECT_EQ(type_of(f[1]), "text[]");
  EXPECT_EQ(f[2].dims, 2);

  auto empty = schema_->infer("SELECT ARRAY[]");
  EXPECT_FALSE(empty->ok());
  EXPECT_TRUE(empty->has_code(diag_code::k_unsupported_construct));
}

TEST_F(ExprInferenceTest, SubLinks)
{
  const auto f = fields(
    "SELECT (SELECT id FROM items LIMIT 1),\n"
    "       ARRAY(SELECT title FROM items),\n"
    "       EXISTS (SELECT 1 FROM items),\n"
    "       1 IN (SELECT id FROM items)");
  ASSERT_EQ(f.size(), 4U);

  EXPECT_EQ(f[0].name, "id");
  EXPECT_EQ(type_of(f[0]), "int4");
  EXPECT_TRUE(f[0].nullable);  // no row

  EXPECT_EQ(f[1].name, "array");
  EXPECT_EQ(type_of(f[1]), "text[]");
  EXPECT_FALSE(f[1].nullable);

  EXPECT_EQ(f[2].name, "exists");
  EXPECT_EQ(type_of(f[2]), "bool");
  EXPECT_FALSE(f[2].nullable);

  EXPECT_EQ(type_of(f[3]), "bool");
}

TEST_F(ExprInferenceTest, CorrelatedSubLinkCannotSeeOuterRelation)
{
  auto q = schema_->infer("SELECT (SELECT i.title) FROM items i");
  EXPECT_FALSE(q->ok());
  EXPECT_TRUE(q->has_code(diag_code::k_relation_not_found));
}

TEST_F(ExprInferenceTest, Subscripts)
{
  const auto f = fields("SELECT tags[1], tags[1:2], doc['k'] FROM items");
  ASSERT_EQ(f.size(), 3U);
  EXPECT_EQ(type_of(f[0]), "text");
  EXPECT_EQ(f[0].dims, 0);
  EXPECT_TRUE(f[0].nullable);

  EXPECT_EQ(type_of(f[1]), "text[]");
  EXPECT_EQ(f[1].dims, 1);

  EXPECT_EQ(type_of(f[2]), "jsonb");
  EXPECT_TRUE(f[2].nullable);

  auto scalar = schema_->infer("SELECT id[1] FROM items");
  EXPECT_FALSE(scalar->ok());
  EXPECT_TRUE(scalar->has_code(diag_code::k_unsupported_construct));
}

// ============================================================================
// Whole rows and parameters
// ============================================================================

TEST_F(ExprInferenceTest, WholeRowReferencesExpand)
{
  const auto bare = fields("SELECT i FROM items i");
  EXPECT_EQ(bare.size(), 6U);

  const auto star = fields("SELECT i.*, 1 AS extra FROM items i");
  ASSERT_EQ(star.size(), 7U);
  EXPECT_EQ(star[0].name, "id");
  EXPECT_EQ(star[6].name, "extra");
}

TEST_F(ExprInferenceTest, WholeRowAsFunctionArgumentIsTheRowType)
{
  auto schema = build_schema(
    "CREATE TABLE people (id int, name text);\n"
    "CREATE FUNCTION label(p people) RETURNS text LANGUAGE sql AS $$ SELECT p.name $$;");
  auto q = schema->infer("SELECT label(p), p::text FROM people p");
  ASSERT_TRUE(q->ok());
  EXPECT_EQ(schema->type_name(q->at(0).type_oid), "text");
  EXPECT_FALSE(q->at(1).nullable);
}

TEST_F(ExprInferenceTest, ParameterOutsideARoutineIsUnknown)
{
  const auto f = fields("SELECT $1");
  ASSERT_EQ(f.size(), 1U);
  EXPECT_EQ(type_of(f[0]), "unknown");
  EXPECT_TRUE(f[0].nullable);
}
