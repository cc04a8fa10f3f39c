// pg_sema/catalog/builtin_types.cpp - pg_catalog type table
#include "pg_sema/catalog/builtin_types.hpp"

#include <algorithm>
#include <iterator>

namespace pg_sema
{
namespace
{

// Real pg_type OIDs (PostgreSQL 16).
constexpr BuiltinType k_builtin_types[] = {
  {"bool", 16, 1000},         {"bytea", 17, 1001},        {"char", 18, 1002},
  {"name", 19, 1003},         {"int8", 20, 1016},         {"int2", 21, 1005},
  {"int4", 23, 1007},         {"regproc", 24, 1008},      {"text", 25, 1009},
  {"oid", 26, 1028},          {"json", 114, 199},         {"xml", 142, 143},
  {"point", 600, 1017},       {"cidr", 650, 651},         {"float4", 700, 1021},
  {"float8", 701, 1022},      {"unknown", 705, 0},        {"money", 790, 791},
  {"macaddr", 829, 1040},     {"inet", 869, 1041},        {"bpchar", 1042, 1014},
  {"varchar", 1043, 1015},    {"date", 1082, 1182},       {"time", 1083, 1183},
  {"timestamp", 1114, 1115},  {"timestamptz", 1184, 1185}, {"interval", 1186, 1187},
  {"timetz", 1266, 1270},     {"bit", 1560, 1561},        {"varbit", 1562, 1563},
  {"numeric", 1700, 1231},    {"regclass", 2205, 2210},   {"record", 2249, 2287},
  {"cstring", 2275, 1263},    {"any", 2276, 0},           {"anyarray", 2277, 0},
  {"void", 2278, 0},          {"trigger", 2279, 0},       {"anyelement", 2283, 0},
  {"anynonarray", 2776, 0},   {"uuid", 2950, 2951},       {"tsvector", 3614, 3643},
  {"tsquery", 3615, 3645},    {"jsonb", 3802, 3807},      {"int4range", 3904, 3905},
  {"jsonpath", 4072, 4073},
};

struct ExtensionType
{
  std::string_view type_name;
  std::string_view extension;
};

constexpr ExtensionType k_extension_types[] = {
  {"citext", "citext"},
  {"hstore", "hstore"},
  {"ltree", "ltree"},
  {"lquery", "ltree"},
  {"cube", "cube"},
};

}  // namespace

gsl::span<const BuiltinType> builtin_types() noexcept
{
  return {std::begin(k_builtin_types), std::size(k_builtin_types)};
}

const BuiltinType * find_builtin_type(std::string_view name) noexcept
{
  const auto * it = std::find_if(
    std::begin(k_builtin_types), std::end(k_builtin_types),
    [&](const BuiltinType & t) { return t.name == name; });
  return it != std::end(k_builtin_types) ? it : nullptr;
}

const BuiltinType * find_builtin_type(uint32_t type_oid) noexcept
{
  if (type_oid == oid::k_invalid) return nullptr;
  const auto * it = std::find_if(
    std::begin(k_builtin_types), std::end(k_builtin_types),
    [&](const BuiltinType & t) { return t.oid == type_oid || t.array_oid == type_oid; });
  return it != std::end(k_builtin_types) ? it : nullptr;
}

std::string_view extension_for_type(std::string_view type_name) noexcept
{
  for (const auto & e : k_extension_types) {
    if (e.type_name == type_name) return e.extension;
  }
  return {};
}

std::vector<std::string_view> extension_types(std::string_view extension)
{
  std::vector<std::string_view> out;
  for (const auto & e : k_extension_types) {
    if (e.extension == extension) out.push_back(e.type_name);
  }
  return out;
}

}  // namespace pg_sema
