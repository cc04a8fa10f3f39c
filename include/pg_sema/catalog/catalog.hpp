// pg_sema/catalog/catalog.hpp - Name -> schema object lookup table
#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/catalog/identifier.hpp"
#include "pg_sema/catalog/schema_object.hpp"

namespace pg_sema
{

/**
 * Owns every schema object of an analysis run.
 *
 * Objects keep their insertion order (source order across files); lookups
 * go through one index per ObjectNamespace.
 */
class Catalog
{
public:
  Catalog() = default;

  Catalog(const Catalog &) = delete;
  Catalog & operator=(const Catalog &) = delete;
  Catalog(Catalog &&) = default;
  Catalog & operator=(Catalog &&) = default;

  /**
   * Take ownership of `obj`.
   *
   * A second object with the same (namespace, identifier) is rejected with
   * E0101; the earlier declaration is kept and labelled.
   *
   * @return the stored object, or nullptr if it was a duplicate
   */
  SchemaObject * add(std::unique_ptr<SchemaObject> obj, DiagnosticBag & diags);

  /// Type or relation (table, view, composite, enum) named `id`.
  [[nodiscard]] SchemaObject * resolve_type(const Identifier & id) const;

  [[nodiscard]] RoutineObject * resolve_routine(const Identifier & id) const;

  /// Look `id` up in namespace `ns`.
  [[nodiscard]] SchemaObject * resolve(const Identifier & id, ObjectNamespace ns) const;

  /// Objects in insertion order.
  [[nodiscard]] const std::vector<std::unique_ptr<SchemaObject>> & objects() const noexcept
  {
    return objects_;
  }

  [[nodiscard]] size_t size() const noexcept { return objects_.size(); }
  [[nodiscard]] bool empty() const noexcept { return objects_.empty(); }

  /// Position of `obj` in insertion order; size() if not owned here.
  [[nodiscard]] size_t index_of(const SchemaObject * obj) const;

  // ===========================================================================
  // Extensions
  // ===========================================================================

  void add_extension(std::string name) { extensions_.insert(std::move(name)); }
  [[nodiscard]] bool has_extension(std::string_view name) const
  {
    return extensions_.find(std::string(name)) != extensions_.end();
  }
  [[nodiscard]] const std::set<std::string> & extensions() const noexcept { return extensions_; }

private:
  using Key = std::pair<ObjectNamespace, Identifier>;

  std::vector<std::unique_ptr<SchemaObject>> objects_;
  std::map<Key, SchemaObject *> index_;
  std::set<std::string> extensions_;
};

}  // namespace pg_sema
