// tests/unit/sema/test_select_inference.cpp - WITH, FROM and target-list inference
#include <gtest/gtest.h>

#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/test_support/sema_helpers.hpp"

using namespace pg_sema;
using test_support::build_schema;
using test_support::SchemaFixture;

class SelectInferenceTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    schema_ = build_schema(
      "CREATE TABLE foo (a int NOT NULL, b text);\n"
      "CREATE TABLE t1 (id int PRIMARY KEY, name text);\n"
      "CREATE TABLE t2 (id int PRIMARY KEY, label text NOT NULL, t1_id int);\n"
      "CREATE VIEW foo_names AS SELECT a AS n, b FROM foo;");
    ASSERT_FALSE(schema_->build_diags.has_errors());
  }

  std::unique_ptr<SchemaFixture> schema_;
};

// ============================================================================
// WITH
// ============================================================================

TEST_F(SelectInferenceTest, CteMayReferenceEarlierCte)
{
  auto q = schema_->infer("WITH a AS (SELECT 1), b AS (SELECT * FROM a) SELECT * FROM b");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 1U);
  EXPECT_EQ(q->at(0).name, "?column?");
  EXPECT_EQ(q->at(0).type_oid, oid::k_int4);
  EXPECT_FALSE(q->at(0).nullable);
}

TEST_F(SelectInferenceTest, CteCannotReferenceLaterCte)
{
  auto q = schema_->infer("WITH a AS (SELECT * FROM b), b AS (SELECT 1) SELECT * FROM a");
  EXPECT_FALSE(q->ok());
  EXPECT_TRUE(q->has_code(diag_code::k_relation_not_found));
}

TEST_F(SelectInferenceTest, CteColumnAliasesRenamePositionally)
{
  auto q = schema_->infer("WITH c(x) AS (SELECT a, b FROM foo) SELECT * FROM c");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 2U);
  EXPECT_EQ(q->at(0).name, "x");
  EXPECT_EQ(q->at(1).name, "b");
}

TEST_F(SelectInferenceTest, TooManyCteColumnAliases)
{
  auto q = schema_->infer("WITH c(x, y, z) AS (SELECT a FROM foo) SELECT * FROM c");
  EXPECT_FALSE(q->ok());
  EXPECT_TRUE(q->has_code(diag_code::k_unknown_column));
}

TEST_F(SelectInferenceTest, CteShadowsTable)
{
  auto q = schema_->infer("WITH foo AS (SELECT 'x' AS only_col) SELECT * FROM foo");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 1U);
  EXPECT_EQ(q->at(0).name, "only_col");
  EXPECT_EQ(q->at(0).type_oid, oid::k_text);
}

// ============================================================================
// FROM
// ============================================================================

TEST_F(SelectInferenceTest, StarExpandsEveryRelationInOrder)
{
  auto q = schema_->infer("SELECT * FROM t1, t2");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 5U);
  EXPECT_EQ(q->at(0).name, "id");
  EXPECT_EQ(q->at(1).name, "name");
  EXPECT_EQ(q->at(4).name, "t1_id");

  auto qualified = schema_->infer("SELECT t2.* FROM t1, t2");
  ASSERT_TRUE(qualified->ok());
  EXPECT_EQ(qualified->fields->size(), 3U);
}

TEST_F(SelectInferenceTest, PositionalAliasRenamesColumns)
{
  auto q = schema_->infer("SELECT * FROM foo f(x, y)");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 2U);
  EXPECT_EQ(q->at(0).name, "x");
  EXPECT_EQ(q->at(1).name, "y");
  EXPECT_EQ(q->at(0).type_oid, oid::k_int4);
  EXPECT_EQ(q->at(1).type_oid, oid::k_text);

  // The original names are gone.
  auto old_name = schema_->infer("SELECT a FROM foo f(x, y)");
  EXPECT_FALSE(old_name->ok());
  EXPECT_TRUE(old_name->has_code(diag_code::k_unknown_column));
}

TEST_F(SelectInferenceTest, PartialAliasListKeepsRemainingNames)
{
  auto q = schema_->infer("SELECT * FROM foo f(x)");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 2U);
  EXPECT_EQ(q->at(0).name, "x");
  EXPECT_EQ(q->at(1).name, "b");
}

TEST_F(SelectInferenceTest, UnknownRelation)
{
  auto q = schema_->infer("SELECT * FROM nope");
  EXPECT_FALSE(q->ok());
  ASSERT_TRUE(q->has_code(diag_code::k_relation_not_found));
  EXPECT_NE(q->diags.all()[0].message.find("public.nope"), std::string::npos);
}

TEST_F(SelectInferenceTest, ViewsAreInferredOnDemand)
{
  auto q = schema_->infer("SELECT n, b FROM foo_names");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 2U);
  EXPECT_EQ(q->at(0).type_oid, oid::k_int4);
  EXPECT_FALSE(q->at(0).nullable);
  EXPECT_TRUE(q->at(1).nullable);
}

TEST_F(SelectInferenceTest, SubqueryInFromNeedsAlias)
{
  auto missing = schema_->infer("SELECT * FROM (SELECT 1)");
  EXPECT_FALSE(missing->ok());
  EXPECT_TRUE(missing->has_code(diag_code::k_unsupported_construct));

  auto q = schema_->infer("SELECT s.x FROM (SELECT a AS x FROM foo) s");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 1U);
  EXPECT_EQ(q->at(0).name, "x");
  EXPECT_FALSE(q->at(0).nullable);
}

TEST_F(SelectInferenceTest, SubqueryDoesNotSeeOuterRelations)
{
  auto q = schema_->infer("SELECT * FROM foo, (SELECT a FROM t1) s");
  EXPECT_FALSE(q->ok());
  EXPECT_TRUE(q->has_code(diag_code::k_unknown_column));
}

TEST_F(SelectInferenceTest, FunctionInFromIsUnsupported)
{
  auto q = schema_->infer("SELECT * FROM generate_series(1, 3) AS g");
  EXPECT_FALSE(q->ok());
  EXPECT_TRUE(q->has_code(diag_code::k_unsupported_construct));
}

// ============================================================================
// Joins
// ============================================================================

TEST_F(SelectInferenceTest, UnqualifiedNameInBothRelationsIsAmbiguous)
{
  auto ambiguous = schema_->infer("SELECT id FROM t1 JOIN t2 ON t1.id = t2.t1_id");
  EXPECT_FALSE(ambiguous->ok());
  ASSERT_TRUE(ambiguous->has_code(diag_code::k_unknown_column));
  EXPECT_NE(ambiguous->diags.all()[0].message.find("ambiguous"), std::string::npos);

  auto qualified = schema_->infer("SELECT t1.id FROM t1 JOIN t2 ON t1.id = t2.t1_id");
  ASSERT_TRUE(qualified->ok());
  ASSERT_EQ(qualified->fields->size(), 1U);
  EXPECT_EQ(qualified->at(0).name, "id");
  EXPECT_FALSE(qualified->at(0).nullable);
}

TEST_F(SelectInferenceTest, UsingAndNaturalJoinsMergeColumns)
{
  auto using_join = schema_->infer("SELECT id FROM t1 JOIN t2 USING (id)");
  ASSERT_TRUE(using_join->ok());
  EXPECT_FALSE(using_join->at(0).nullable);

  auto natural = schema_->infer("SELECT id FROM t1 NATURAL JOIN t2");
  EXPECT_TRUE(natural->ok());

  auto bad = schema_->infer("SELECT * FROM t1 JOIN t2 USING (label)");
  EXPECT_FALSE(bad->ok());
  EXPECT_TRUE(bad->has_code(diag_code::k_unknown_column));
}

TEST_F(SelectInferenceTest, MergedColumnIsAmbiguousOutsideItsJoin)
{
  auto comma = schema_->infer("SELECT id FROM t1 JOIN t2 USING (id), t1 AS other");
  EXPECT_FALSE(comma->ok());
  EXPECT_TRUE(comma->has_code(diag_code::k_unknown_column));

  auto cross = schema_->infer("SELECT id FROM t1 JOIN t2 USING (id) CROSS JOIN t1 AS other");
  EXPECT_FALSE(cross->ok());
  EXPECT_TRUE(cross->has_code(diag_code::k_unknown_column));

  auto chained =
    schema_->infer("SELECT id FROM t1 JOIN t2 USING (id) JOIN t1 AS other USING (id)");
  ASSERT_TRUE(chained->ok());
  EXPECT_FALSE(chained->at(0).nullable);
}

TEST_F(SelectInferenceTest, OuterJoinsMakeTheOptionalSideNullable)
{
  auto left = schema_->infer("SELECT t1.id, t2.label FROM t1 LEFT JOIN t2 ON t2.t1_id = t1.id");
  ASSERT_TRUE(left->ok());
  EXPECT_FALSE(left->at(0).nullable);
  EXPECT_TRUE(left->at(1).nullable);

  auto right = schema_->infer("SELECT t1.id, t2.label FROM t1 RIGHT JOIN t2 ON t2.t1_id = t1.id");
  ASSERT_TRUE(right->ok());
  EXPECT_TRUE(right->at(0).nullable);
  EXPECT_FALSE(right->at(1).nullable);

  auto full = schema_->infer("SELECT t1.id, t2.label FROM t1 FULL JOIN t2 ON t2.t1_id = t1.id");
  ASSERT_TRUE(full->ok());
  EXPECT_TRUE(full->at(0).nullable);
  EXPECT_TRUE(full->at(1).nullable);

  auto inner = schema_->infer("SELECT t1.id, t2.label FROM t1 JOIN t2 ON t2.t1_id = t1.id");
  ASSERT_TRUE(inner->ok());
  EXPECT_FALSE(inner->at(0).nullable);
  EXPECT_FALSE(inner->at(1).nullable);
}

TEST_F(SelectInferenceTest, FullJoinUsingColumnIsNullable)
{
  auto q = schema_->infer("SELECT id FROM t1 FULL JOIN t2 USING (id)");
  ASSERT_TRUE(q->ok());
  EXPECT_TRUE(q->at(0).nullable);
}

// ============================================================================
// Targets and set operations
// ============================================================================

TEST_F(SelectInferenceTest, TargetAliasesNameTheField)
{
  auto q = schema_->infer("SELECT a AS total, b FROM foo");
  ASSERT_TRUE(q->ok());
  EXPECT_EQ(q->at(0).name, "total");
  EXPECT_EQ(q->at(1).name, "b");
}

TEST_F(SelectInferenceTest, SetOperationNamesComeFromTheLeftArm)
{
  auto q = schema_->infer("SELECT a AS first FROM foo UNION ALL SELECT id FROM t1");
  ASSERT_TRUE(q->ok());
  ASSERT_EQ(q->fields->size(), 1U);
  EXPECT_EQ(q->at(0).name, "first");
  EXPECT_EQ(q->at(0).type_oid, oid::k_int4);
  EXPECT_FALSE(q->at(0).nullable);
}

TEST_F(SelectInferenceTest, EverySetOperationArmIsChecked)
{
  auto missing = schema_->infer("SELECT a FROM foo UNION SELECT x FROM does_not_exist");
  EXPECT_FALSE(missing->ok());
  EXPECT_TRUE(missing->has_code(diag_code::k_relation_not_found));

  auto unknown = schema_->infer("SELECT a FROM foo EXCEPT SELECT nope FROM t1");
  EXPECT_FALSE(unknown->ok());
  EXPECT_TRUE(unknown->has_code(diag_code::k_unknown_column));

  auto third = schema_->infer(
    "SELECT a FROM foo UNION SELECT id FROM t1 UNION SELECT t1_id FROM missing");
  EXPECT_FALSE(third->ok());
  EXPECT_TRUE(third->has_code(diag_code::k_relation_not_found));
}

TEST_F(SelectInferenceTest, SetOperationArmsMustHaveEqualWidth)
{
  auto q = schema_->infer("SELECT a, b FROM foo UNION SELECT id FROM t1");
  EXPECT_FALSE(q->ok());
  EXPECT_TRUE(q->has_code(diag_code::k_unsupported_construct));
}

TEST_F(SelectInferenceTest, UnionIsNullableWhenAnyArmIs)
{
  auto null_arm = schema_->infer("SELECT id FROM t1 UNION ALL SELECT NULL");
  ASSERT_TRUE(null_arm->ok());
  EXPECT_EQ(null_arm->at(0).type_oid, oid::k_int4);
  EXPECT_TRUE(null_arm->at(0).nullable);

  auto null_first = schema_->infer("SELECT NULL AS n UNION SELECT a FROM foo");
  ASSERT_TRUE(null_first->ok());
  EXPECT_EQ(null_first->at(0).name, "n");
  EXPECT_EQ(null_first->at(0).type_oid, oid::k_int4);
  EXPECT_TRUE(null_first->at(0).nullable);

  auto column = schema_->infer("SELECT label FROM t2 UNION SELECT b FROM foo");
  ASSERT_TRUE(column->ok());
  EXPECT_TRUE(column->at(0).nullable);
}

TEST_F(SelectInferenceTest, IntersectAndExceptNullability)
{
  // INTERSECT keeps only rows found in both arms.
  auto both = schema_->infer("SELECT b FROM foo INTERSECT SELECT label FROM t2");
  ASSERT_TRUE(both->ok());
  EXPECT_FALSE(both->at(0).nullable);

  // EXCEPT only returns rows of the left arm.
  auto left = schema_->infer("SELECT label FROM t2 EXCEPT SELECT b FROM foo");
  ASSERT_TRUE(left->ok());
  EXPECT_FALSE(left->at(0).nullable);
}

TEST_F(SelectInferenceTest, UnknownColumnAndMissingFromEntry)
{
  auto unknown = schema_->infer("SELECT nope FROM foo");
  EXPECT_FALSE(unknown->ok());
  EXPECT_TRUE(unknown->has_code(diag_code::k_unknown_column));

  auto missing = schema_->infer("SELECT z.a FROM foo");
  EXPECT_FALSE(missing->ok());
  EXPECT_TRUE(missing->has_code(diag_code::k_relation_not_found));

  auto bad_member = schema_->infer("SELECT foo.nope FROM foo");
  EXPECT_FALSE(bad_member->ok());
  EXPECT_TRUE(bad_member->has_code(diag_code::k_unknown_column));
}

TEST_F(SelectInferenceTest, UserTypedColumnsGetSyntheticOids)
{
  auto schema = build_schema(
    "CREATE TYPE mood AS ENUM ('sad', 'happy');\n"
    "CREATE TABLE diary (feeling mood, history mood[]);");
  auto q = schema->infer("SELECT feeling, history FROM diary");
  ASSERT_TRUE(q->ok());
  EXPECT_GE(q->at(0).type_oid, oid::k_first_user);
  EXPECT_EQ(schema->type_name(q->at(0).type_oid), "public.mood");
  EXPECT_EQ(schema->type_name(q->at(1).type_oid), "public.mood[]");
  EXPECT_EQ(q->at(1).dims, 1);
}
