// pg_sema/sema/scope.hpp - Lexical scopes of a query
//
// A Scope maps the names a FROM clause exposes to their relation bindings.
// Nested query constructs (CTEs, sub-selects) run in a fork: a child scope
// with its own empty bindings that shares the type-name cache of the root
// and can see CTEs registered by its ancestors.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "pg_sema/catalog/identifier.hpp"
#include "pg_sema/sema/field.hpp"
#include "pg_sema/sema/metadata.hpp"

namespace pg_sema
{

/**
 * Unqualified column lookup table for one SELECT level.
 *
 * A name exposed by more than one relation is ambiguous and absent from
 * `unique`; it has to be qualified with a relation name.
 */
struct FieldIndex
{
  std::unordered_map<std::string_view, const Field *> unique;
  std::unordered_set<std::string_view> ambiguous;

  [[nodiscard]] const Field * find(std::string_view name) const
  {
    auto it = unique.find(name);
    return it != unique.end() ? it->second : nullptr;
  }

  [[nodiscard]] bool is_ambiguous(std::string_view name) const
  {
    return ambiguous.count(name) > 0;
  }
};

class Scope
{
public:
  struct Reference
  {
    std::string name;
    RelationBinding binding;
  };

  explicit Scope(MetadataResolver & metadata);

  Scope(const Scope &) = delete;
  Scope & operator=(const Scope &) = delete;
  Scope(Scope &&) = default;
  Scope & operator=(Scope &&) = delete;

  /// Child scope: empty bindings, shared type-name cache, parent CTEs visible.
  [[nodiscard]] Scope fork() const;

  // ===========================================================================
  // Bindings
  // ===========================================================================

  /// Bind `name`; an existing binding of the same name is replaced.
  void bind(std::string name, RelationBinding binding);

  [[nodiscard]] const RelationBinding * find(std::string_view name) const;
  [[nodiscard]] RelationBinding * find(std::string_view name);

  /// Bindings in the order they were first bound.
  [[nodiscard]] const std::vector<Reference> & references() const noexcept { return references_; }
  [[nodiscard]] std::vector<Reference> & references() noexcept { return references_; }

  /**
   * A column merged by `JOIN ... USING` or `NATURAL JOIN` over references
   * [first, last). Those references expose the name once, through the
   * merged field; a reference outside the range still makes it ambiguous.
   * A merge of the same name over an enclosing range replaces this one.
   */
  void add_merged_field(Field field, size_t first, size_t last);

  /// Field of name `name` merged by a join within references [first, last).
  [[nodiscard]] const Field * find_merged(std::string_view name, size_t first, size_t last) const;

  /// Mark references [first, last) and the columns merged among them nullable.
  void mark_nullable(size_t first, size_t last);

  [[nodiscard]] FieldIndex unique_fields() const;

  // ===========================================================================
  // CTEs
  // ===========================================================================

  void register_cte(std::string name, RelationBinding binding);

  /// CTE `name` registered here or by an ancestor scope.
  [[nodiscard]] const RelationBinding * find_cte(std::string_view name) const;

  // ===========================================================================
  // Cached metadata
  // ===========================================================================

  [[nodiscard]] MetadataResolver & metadata() const noexcept { return *metadata_; }

  std::optional<TypeInfo> get_type_name(uint32_t type_oid);
  std::optional<uint32_t> get_type_oid(const Identifier & id, bool array);

  /// `get_type_oid` for a built-in type name.
  std::optional<uint32_t> get_builtin_oid(std::string_view name, bool array = false)
  {
    return get_type_oid(Identifier(k_system_schema, name), array);
  }

private:
  struct TypeNameCache
  {
    std::unordered_map<uint32_t, std::optional<TypeInfo>> names;
    std::map<std::pair<Identifier, bool>, std::optional<uint32_t>> oids;
  };

  Scope(MetadataResolver & metadata, const Scope * parent, TypeNameCache * cache);

  MetadataResolver * metadata_;
  const Scope * parent_ = nullptr;
  std::unique_ptr<TypeNameCache> owned_cache_;
  TypeNameCache * cache_ = nullptr;

  struct MergedField
  {
    Field field;
    size_t first;  ///< first covered reference
    size_t last;   ///< one past the last covered reference

    [[nodiscard]] bool covers(size_t i) const noexcept { return i >= first && i < last; }
  };

  [[nodiscard]] bool is_merged(std::string_view name, size_t reference) const;

  std::vector<Reference> references_;
  std::vector<Reference> ctes_;
  std::vector<MergedField> merged_;
};

}  // namespace pg_sema
