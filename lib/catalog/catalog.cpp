// pg_sema/catalog/catalog.cpp - Catalog storage and duplicate detection
#include "pg_sema/catalog/catalog.hpp"

#include <algorithm>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/diagnostic_codes.hpp"

namespace pg_sema
{

SchemaObject * Catalog::add(std::unique_ptr<SchemaObject> obj, DiagnosticBag & diags)
{
  if (!obj) return nullptr;

  Key key{namespace_of(obj->get_kind()), obj->id()};
  if (auto it = index_.find(key); it != index_.end()) {
    const SchemaObject * prev = it->second;
    diags
      .report_error(
        obj->range(),
        std::string(to_string(obj->get_kind())) + " '" + obj->qualified_name() +
          "' is already defined",
        "duplicate definition")
      .with_code(diag_code::k_duplicate_object)
      .with_object(obj->qualified_name())
      .with_secondary_label(prev->range(), "first defined here");
    return nullptr;
  }

  SchemaObject * raw = obj.get();
  index_.emplace(std::move(key), raw);
  objects_.push_back(std::move(obj));
  return raw;
}

SchemaObject * Catalog::resolve(const Identifier & id, ObjectNamespace ns) const
{
  auto it = index_.find(Key{ns, id});
  return it != index_.end() ? it->second : nullptr;
}

SchemaObject * Catalog::resolve_type(const Identifier & id) const
{
  return resolve(id, ObjectNamespace::Relation);
}

RoutineObject * Catalog::resolve_routine(const Identifier & id) const
{
  return dyn_cast<RoutineObject>(resolve(id, ObjectNamespace::Routine));
}

size_t Catalog::index_of(const SchemaObject * obj) const
{
  auto it = std::find_if(
    objects_.begin(), objects_.end(), [&](const auto & p) { return p.get() == obj; });
  return static_cast<size_t>(it - objects_.begin());
}

}  // namespace pg_sema
