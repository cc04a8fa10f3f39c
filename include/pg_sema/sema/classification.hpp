// pg_sema/sema/classification.hpp - Scalar type -> output category
#pragma once

#include <string_view>

#include "pg_sema/sema/json_type.hpp"

namespace pg_sema
{

/**
 * Output category of a `pg_catalog` type name. Types outside the table
 * (int8, numeric, timestamps, ...) are opaque JSON.
 */
[[nodiscard]] JsonPrimitive classify_type(std::string_view pg_catalog_name) noexcept;

/// Whether `name` is `json` or `jsonb`.
[[nodiscard]] inline bool is_json_type_name(std::string_view name) noexcept
{
  return name == "json" || name == "jsonb";
}

}  // namespace pg_sema
