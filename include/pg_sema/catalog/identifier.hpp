// pg_sema/catalog/identifier.hpp - Canonical schema-qualified names
#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <tuple>

namespace pg_sema
{

inline constexpr std::string_view k_default_schema = "public";
inline constexpr std::string_view k_system_schema = "pg_catalog";

/**
 * A `(schema, name)` pair. An empty schema means `public`.
 *
 * Equality and ordering compare schema, then name, case-sensitively: names
 * arrive already folded by the lexer.
 */
struct Identifier
{
  std::string schema = std::string(k_default_schema);
  std::string name;

  Identifier() = default;
  Identifier(std::string_view s, std::string_view n)
  : schema(s.empty() ? k_default_schema : s), name(n)
  {
  }

  /// `schema.name`
  [[nodiscard]] std::string qualified() const { return schema + "." + name; }

  /// Objects of `pg_catalog` and `information_schema` are never linked.
  [[nodiscard]] bool is_system() const noexcept
  {
    return schema == k_system_schema || schema == "information_schema";
  }

  friend bool operator==(const Identifier & a, const Identifier & b)
  {
    return a.schema == b.schema && a.name == b.name;
  }
  friend bool operator!=(const Identifier & a, const Identifier & b) { return !(a == b); }
  friend bool operator<(const Identifier & a, const Identifier & b)
  {
    return std::tie(a.schema, a.name) < std::tie(b.schema, b.name);
  }
};

struct IdentifierHash
{
  size_t operator()(const Identifier & id) const noexcept
  {
    const size_t h = std::hash<std::string>{}(id.schema);
    return h ^ (std::hash<std::string>{}(id.name) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};

}  // namespace pg_sema
