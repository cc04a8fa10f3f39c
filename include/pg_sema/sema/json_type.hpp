// pg_sema/sema/json_type.hpp - Structural types of JSON-producing expressions
//
// A JsonType describes the shape of a json/jsonb value: a primitive, an array,
// an object with named fields, or a union of those. Shapes are interned by
// JsonTypeContext, so structurally equal shapes share one instance and can be
// compared by pointer.
//
#pragma once

#include <cstdint>
#include <deque>
#include <gsl/span>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pg_sema
{

// ============================================================================
// Kinds
// ============================================================================

enum class JsonKind : uint8_t {
  Primitive,
  Array,
  Object,
  Union,
};

/// Output category of a scalar value.
enum class JsonPrimitive : uint8_t {
  Number,
  String,
  Boolean,
  Json,  ///< opaque JSON value
};

[[nodiscard]] constexpr std::string_view to_string(JsonKind k) noexcept
{
  switch (k) {
    case JsonKind::Primitive:
      return "primitive";
    case JsonKind::Array:
      return "array";
    case JsonKind::Object:
      return "object";
    case JsonKind::Union:
      return "union";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(JsonPrimitive p) noexcept
{
  switch (p) {
    case JsonPrimitive::Number:
      return "number";
    case JsonPrimitive::String:
      return "string";
    case JsonPrimitive::Boolean:
      return "boolean";
    case JsonPrimitive::Json:
      return "JSON";
  }
  return "JSON";
}

// ============================================================================
// JsonType
// ============================================================================

struct JsonType;

struct JsonField
{
  std::string name;
  const JsonType * type = nullptr;
};

/**
 * Interned JSON shape. Only JsonTypeContext creates these.
 */
struct JsonType
{
  JsonKind kind = JsonKind::Primitive;
  JsonPrimitive primitive = JsonPrimitive::Json;  ///< Primitive only
  bool nullable = false;

  const JsonType * element = nullptr;     ///< Array only
  std::vector<JsonField> fields;          ///< Object only, declaration order
  std::vector<const JsonType *> members;  ///< Union only; never a Union

  /// Canonical key; equal keys mean structurally equal shapes.
  std::string key;
  /// Canonical key with nullability dropped at every depth.
  std::string shape;
  /// FNV-1a 64 of `key`.
  uint64_t hash = 0;

  [[nodiscard]] bool is_union() const noexcept { return kind == JsonKind::Union; }

  /// A union is nullable when it is marked so or any member is.
  [[nodiscard]] bool is_nullable() const noexcept
  {
    if (kind != JsonKind::Union) return nullable;
    if (nullable) return true;
    for (const JsonType * m : members) {
      if (m->nullable) return true;
    }
    return false;
  }

  /// Key ignoring nullability, both this shape's own and that of anything nested.
  [[nodiscard]] std::string_view shape_key() const noexcept { return shape; }

  [[nodiscard]] const JsonType * find_field(std::string_view name) const noexcept;
};

// ============================================================================
// JsonTypeContext
// ============================================================================

/**
 * Per-run interning table for JsonType.
 *
 * Returned pointers stay valid for the lifetime of the context.
 */
class JsonTypeContext
{
public:
  JsonTypeContext() = default;

  JsonTypeContext(const JsonTypeContext &) = delete;
  JsonTypeContext & operator=(const JsonTypeContext &) = delete;

  const JsonType * primitive(JsonPrimitive p, bool nullable = false);
  const JsonType * array(const JsonType * element, bool nullable = false);

  /// Object shape. A repeated key keeps its first position and last value.
  const JsonType * object(std::vector<JsonField> fields, bool nullable = false);

  /**
   * Union of two shapes. Nested unions are flattened and members that differ
   * only in nullability collapse into one, where every position is nullable
   * if it was in any copy. A union left with a single member is that member.
   * Null inputs are ignored.
   */
  const JsonType * unite(const JsonType * a, const JsonType * b);

  /// Fold unite() over `types`; nullptr for an empty list.
  const JsonType * unite(gsl::span<const JsonType * const> types);

  /// Same shape with a different top-level nullability.
  const JsonType * with_nullable(const JsonType * t, bool nullable);

  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  /// Merge two shapes with equal shape keys, OR-ing nullability position by position.
  const JsonType * merge(const JsonType * a, const JsonType * b);
  const JsonType * make_union(std::vector<const JsonType *> members, bool nullable);
  const JsonType * intern(JsonType t);

  std::pmr::monotonic_buffer_resource arena_{4096};
  // Interned shapes are referenced by pointer; deque keeps addresses stable.
  std::pmr::deque<JsonType> types_{&arena_};
  std::unordered_map<std::string, const JsonType *> by_key_;
};

// ============================================================================
// Utilities
// ============================================================================

[[nodiscard]] uint64_t fnv1a_64(std::string_view data) noexcept;

/**
 * Render a shape as a TypeScript-style type: `number`, `string[]`,
 * `{ a: number, b: string | null }`, `{ a: number } | { b: number }`.
 *
 * Members of a union do not print their own `| null`; the union adds a
 * single trailing one when any member is nullable.
 */
[[nodiscard]] std::string render_json_type(const JsonType * t, bool include_nulls = true);

}  // namespace pg_sema
