// pg_sema/catalog/builtin_types.hpp - pg_catalog scalar types and their OIDs
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <vector>

namespace pg_sema
{

/// Well-known type OIDs (pg_type.oid).
namespace oid
{
inline constexpr uint32_t k_invalid = 0;
inline constexpr uint32_t k_bool = 16;
inline constexpr uint32_t k_bytea = 17;
inline constexpr uint32_t k_int8 = 20;
inline constexpr uint32_t k_int2 = 21;
inline constexpr uint32_t k_int4 = 23;
inline constexpr uint32_t k_text = 25;
inline constexpr uint32_t k_json = 114;
inline constexpr uint32_t k_float4 = 700;
inline constexpr uint32_t k_float8 = 701;
inline constexpr uint32_t k_unknown = 705;
inline constexpr uint32_t k_varchar = 1043;
inline constexpr uint32_t k_date = 1082;
inline constexpr uint32_t k_timestamp = 1114;
inline constexpr uint32_t k_timestamptz = 1184;
inline constexpr uint32_t k_interval = 1186;
inline constexpr uint32_t k_numeric = 1700;
inline constexpr uint32_t k_record = 2249;
inline constexpr uint32_t k_void = 2278;
inline constexpr uint32_t k_uuid = 2950;
inline constexpr uint32_t k_jsonb = 3802;

/// First OID handed out to user-defined types.
inline constexpr uint32_t k_first_user = 16384;
}  // namespace oid

/**
 * A built-in `pg_catalog` type. `array_oid` is 0 for pseudo-types without
 * an array type.
 */
struct BuiltinType
{
  std::string_view name;
  uint32_t oid;
  uint32_t array_oid;
};

/// Every built-in type, in OID order.
[[nodiscard]] gsl::span<const BuiltinType> builtin_types() noexcept;

/// Look up a built-in type by catalog name (e.g. "int4").
[[nodiscard]] const BuiltinType * find_builtin_type(std::string_view name) noexcept;

/// Look up a built-in type by its OID or its array type's OID.
[[nodiscard]] const BuiltinType * find_builtin_type(uint32_t type_oid) noexcept;

/**
 * Name of the extension that provides `type_name` (e.g. "citext" for
 * citext), or an empty view for types no known extension provides.
 */
[[nodiscard]] std::string_view extension_for_type(std::string_view type_name) noexcept;

/// Types `extension` provides, in declaration order.
[[nodiscard]] std::vector<std::string_view> extension_types(std::string_view extension);

}  // namespace pg_sema
