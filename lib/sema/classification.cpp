// pg_sema/sema/classification.cpp - Type classification table
#include "pg_sema/sema/classification.hpp"

namespace pg_sema
{
namespace
{

struct Classification
{
  std::string_view type_name;
  JsonPrimitive primitive;
};

constexpr Classification k_classifications[] = {
  {"bool", JsonPrimitive::Boolean},
  {"float4", JsonPrimitive::Number},
  {"float8", JsonPrimitive::Number},
  {"int2", JsonPrimitive::Number},
  {"int4", JsonPrimitive::Number},
  {"oid", JsonPrimitive::Number},
  {"json", JsonPrimitive::Json},
  {"jsonb", JsonPrimitive::Json},
  {"bpchar", JsonPrimitive::String},
  {"char", JsonPrimitive::String},
  {"citext", JsonPrimitive::String},
  {"name", JsonPrimitive::String},
  {"text", JsonPrimitive::String},
  {"uuid", JsonPrimitive::String},
  {"varchar", JsonPrimitive::String},
};

}  // namespace

JsonPrimitive classify_type(std::string_view pg_catalog_name) noexcept
{
  for (const auto & c : k_classifications) {
    if (c.type_name == pg_catalog_name) return c.primitive;
  }
  return JsonPrimitive::Json;
}

}  // namespace pg_sema
