// tests/unit/sema/test_scope.cpp - Scope bindings, CTE visibility and lookup caching
#include <gtest/gtest.h>

#include <utility>

#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/sema/scope.hpp"

using namespace pg_sema;

namespace
{

/// Resolver that answers type lookups from the built-in table and counts calls.
class CountingResolver : public MetadataResolver
{
public:
  const RelationBinding * resolve_relation(const Identifier &) override { return nullptr; }

  std::optional<TypeInfo> get_type_name(uint32_t type_oid) override
  {
    ++name_calls;
    const BuiltinType * t = find_builtin_type(type_oid);
    if (!t) return std::nullopt;
    return TypeInfo{Identifier(k_system_schema, t->name), t->array_oid == type_oid};
  }

  std::optional<uint32_t> get_type_oid(const Identifier & id, bool array) override
  {
    ++oid_calls;
    const BuiltinType * t = find_builtin_type(id.name);
    if (!t || id.schema != k_system_schema) return std::nullopt;
    return array ? t->array_oid : t->oid;
  }

  std::optional<FunctionResult> get_function_result(
    std::string_view, std::string_view, gsl::span<const Field>) override
  {
    return std::nullopt;
  }

  int name_calls = 0;
  int oid_calls = 0;
};

Field field(std::string name, uint32_t type_oid = oid::k_int4)
{
  Field f;
  f.name = std::move(name);
  f.type_oid = type_oid;
  return f;
}

RelationBinding relation(std::vector<Field> fields)
{
  RelationBinding b;
  b.fields = std::move(fields);
  return b;
}

}  // namespace

TEST(Scope, BindAndFind)
{
  CountingResolver resolver;
  Scope scope(resolver);

  scope.bind("u", relation({field("id"), field("email", oid::k_text)}));
  ASSERT_NE(scope.find("u"), nullptr);
  EXPECT_EQ(scope.find("u")->fields.size(), 2U);
  EXPECT_EQ(scope.find("missing"), nullptr);
}

TEST(Scope, RebindingReplacesInPlace)
{
  CountingResolver resolver;
  Scope scope(resolver);

  scope.bind("a", relation({field("x")}));
  scope.bind("b", relation({field("y")}));
  scope.bind("a", relation({field("z")}));

  ASSERT_EQ(scope.references().size(), 2U);
  EXPECT_EQ(scope.references()[0].name, "a");
  EXPECT_EQ(scope.references()[0].binding.fields[0].name, "z");
}

TEST(Scope, UniqueFieldsExcludeAmbiguousNames)
{
  CountingResolver resolver;
  Scope scope(resolver);

  scope.bind("t1", relation({field("id"), field("name", oid::k_text)}));
  scope.bind("t2", relation({field("id"), field("label", oid::k_text)}));
  scope.bind("t3", relation({field("id")}));

  const FieldIndex index = scope.unique_fields();
  EXPECT_EQ(index.find("id"), nullptr);
  EXPECT_TRUE(index.is_ambiguous("id"));
  ASSERT_NE(index.find("name"), nullptr);
  ASSERT_NE(index.find("label"), nullptr);
  EXPECT_FALSE(index.is_ambiguous("label"));
}

TEST(Scope, MergedFieldsAreUnambiguous)
{
  CountingResolver resolver;
  Scope scope(resolver);

  scope.bind("a", relation({field("id")}));
  scope.bind("b", relation({field("id")}));
  Field merged = field("id");
  merged.nullable = false;
  scope.add_merged_field(merged, 0, 2);

  const FieldIndex index = scope.unique_fields();
  EXPECT_FALSE(index.is_ambiguous("id"));
  ASSERT_NE(index.find("id"), nullptr);
  EXPECT_FALSE(index.find("id")->nullable);
}

TEST(Scope, MergedFieldsOnlyCoverTheirJoin)
{
  CountingResolver resolver;
  Scope scope(resolver);

  scope.bind("a", relation({field("id")}));
  scope.bind("b", relation({field("id")}));
  scope.add_merged_field(field("id"), 0, 2);
  scope.bind("c", relation({field("id"), field("extra")}));

  const FieldIndex index = scope.unique_fields();
  EXPECT_TRUE(index.is_ambiguous("id"));
  EXPECT_EQ(index.find("id"), nullptr);
  EXPECT_NE(index.find("extra"), nullptr);

  // A merge over all three references makes it addressable again.
  scope.add_merged_field(field("id"), 0, 3);
  EXPECT_NE(scope.unique_fields().find("id"), nullptr);
  EXPECT_NE(scope.find_merged("id", 0, 3), nullptr);
  EXPECT_EQ(scope.find_merged("id", 0, 2), nullptr);
}

TEST(Scope, MarkNullableReachesMergedFields)
{
  CountingResolver resolver;
  Scope scope(resolver);

  scope.bind("a", relation({field("id")}));
  scope.bind("b", relation({field("id")}));
  Field merged = field("id");
  merged.nullable = false;
  scope.add_merged_field(merged, 0, 2);
  scope.bind("c", relation({field("x")}));
  for (auto & ref : scope.references()) {
    for (auto & f : ref.binding.fields) f.nullable = false;
  }

  scope.mark_nullable(2, 3);
  EXPECT_FALSE(scope.unique_fields().find("id")->nullable);
  EXPECT_TRUE(scope.unique_fields().find("x")->nullable);

  scope.mark_nullable(0, 2);
  EXPECT_TRUE(scope.unique_fields().find("id")->nullable);
  EXPECT_TRUE(scope.references()[0].binding.fields[0].nullable);
}

TEST(Scope, ForkSeesParentCtesButNotBindings)
{
  CountingResolver resolver;
  Scope root(resolver);
  root.register_cte("recent", relation({field("id")}));
  root.bind("u", relation({field("id")}));

  Scope child = root.fork();
  EXPECT_NE(child.find_cte("recent"), nullptr);
  EXPECT_EQ(child.find("u"), nullptr);
  EXPECT_TRUE(child.references().empty());

  // CTEs registered in a child stay local to it.
  child.register_cte("inner", relation({}));
  EXPECT_NE(child.find_cte("inner"), nullptr);
  EXPECT_EQ(root.find_cte("inner"), nullptr);
}

TEST(Scope, TypeLookupsAreCachedAcrossForks)
{
  CountingResolver resolver;
  Scope root(resolver);

  ASSERT_EQ(root.get_builtin_oid("text").value_or(0), oid::k_text);
  EXPECT_EQ(root.get_builtin_oid("text").value_or(0), oid::k_text);
  EXPECT_EQ(resolver.oid_calls, 1);

  Scope child = root.fork();
  EXPECT_EQ(child.get_builtin_oid("text").value_or(0), oid::k_text);
  EXPECT_EQ(resolver.oid_calls, 1);

  // Misses are cached too.
  EXPECT_FALSE(child.get_builtin_oid("no_such_type").has_value());
  EXPECT_FALSE(root.get_builtin_oid("no_such_type").has_value());
  EXPECT_EQ(resolver.oid_calls, 2);

  auto info = child.get_type_name(oid::k_int4);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->id.name, "int4");
  (void)root.get_type_name(oid::k_int4);
  EXPECT_EQ(resolver.name_calls, 1);
}

TEST(Scope, ArrayTypeLookup)
{
  CountingResolver resolver;
  Scope scope(resolver);

  const auto array_oid = scope.get_builtin_oid("int4", true);
  ASSERT_TRUE(array_oid.has_value());
  auto info = scope.get_type_name(*array_oid);
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->array);
  EXPECT_EQ(info->id.name, "int4");
}
