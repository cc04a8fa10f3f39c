// pg_sema/sema/field.hpp - Inferred output columns and relation bindings
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "pg_sema/sema/json_type.hpp"

namespace pg_sema
{

/// Name PostgreSQL gives an output column it cannot name otherwise.
inline constexpr std::string_view k_unnamed_column = "?column?";

/**
 * One output column of an expression or query.
 *
 * `type_oid` is the array type's OID when `dims > 0`.
 */
struct Field
{
  std::string name;
  uint32_t type_oid = 0;
  bool nullable = true;
  int32_t dims = 0;
  const JsonType * json_type = nullptr;  ///< shape of a json/jsonb value, if known
};

enum class RelationKind : uint8_t {
  Table,
  View,
  CompositeType,
  Cte,
  Subquery,
};

[[nodiscard]] constexpr std::string_view to_string(RelationKind k) noexcept
{
  switch (k) {
    case RelationKind::Table:
      return "table";
    case RelationKind::View:
      return "view";
    case RelationKind::CompositeType:
      return "composite type";
    case RelationKind::Cte:
      return "cte";
    case RelationKind::Subquery:
      return "subquery";
  }
  return "relation";
}

/// The names a FROM-clause entry exposes.
struct RelationBinding
{
  RelationKind kind = RelationKind::Table;
  std::vector<Field> fields;
  uint32_t row_type_oid = 0;  ///< composite type of a catalog relation; 0 otherwise

  [[nodiscard]] const Field * find_field(std::string_view name) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == name) return &f;
    }
    return nullptr;
  }
};

}  // namespace pg_sema
