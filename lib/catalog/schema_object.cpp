// pg_sema/catalog/schema_object.cpp - Dependency edge bookkeeping
#include "pg_sema/catalog/schema_object.hpp"

#include <algorithm>

namespace pg_sema
{

bool SchemaObject::add_dependency(SchemaObject * dep)
{
  if (dep == nullptr || dep == this || depends_on(dep)) {
    return false;
  }
  dependencies_.push_back(dep);
  dep->dependents_.push_back(this);
  return true;
}

bool SchemaObject::depends_on(const SchemaObject * other) const noexcept
{
  return std::find(dependencies_.begin(), dependencies_.end(), other) != dependencies_.end();
}

void SchemaObject::clear_links() noexcept
{
  dependencies_.clear();
  dependents_.clear();
}

const ColumnDesc * TableObject::find_column(std::string_view name) const noexcept
{
  for (const auto & c : columns) {
    if (c.name == name) return &c;
  }
  return nullptr;
}

}  // namespace pg_sema
