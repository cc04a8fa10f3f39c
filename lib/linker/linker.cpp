// pg_sema/linker/linker.cpp - Reference linking and cycle reporting
#include "pg_sema/linker/linker.hpp"

#include <algorithm>
#include <string>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/linker/execution_queue.hpp"

namespace pg_sema
{

bool LinkResult::in_cycle(const SchemaObject * obj) const
{
  return std::any_of(cycles.begin(), cycles.end(), [&](const auto & cycle) {
    return std::find(cycle.begin(), cycle.end(), obj) != cycle.end();
  });
}

std::vector<SchemaObject *> Linker::sorted_objects() const
{
  std::vector<SchemaObject *> sorted;
  sorted.reserve(catalog_.size());
  for (const auto & obj : catalog_.objects()) {
    sorted.push_back(obj.get());
  }
  std::stable_sort(sorted.begin(), sorted.end(), [](const SchemaObject * a, const SchemaObject * b) {
    if (a->id() != b->id()) return a->id() < b->id();
    return namespace_of(a->get_kind()) < namespace_of(b->get_kind());
  });
  return sorted;
}

LinkResult Linker::link()
{
  for (const auto & obj : catalog_.objects()) {
    obj->clear_links();
  }
  self_cycles_.clear();

  const std::vector<SchemaObject *> sorted = sorted_objects();
  for (SchemaObject * obj : sorted) {
    link_object(obj);
  }

  ExecutionQueue<SchemaObject *> queue(
    [](SchemaObject * const & obj) -> const std::vector<SchemaObject *> & {
      return obj->dependencies();
    });
  for (SchemaObject * obj : sorted) {
    queue.add(obj);
  }

  auto traversal = queue.traverse();
  LinkResult result;
  result.order = std::move(traversal.order);
  result.cycles = std::move(traversal.cycles);

  // The dependency graph has no self-edges, so these never show up as
  // back-edges in the traversal.
  for (SchemaObject * obj : self_cycles_) {
    auto & order = result.order;
    order.erase(std::remove(order.begin(), order.end(), obj), order.end());
    result.cycles.push_back({obj});
  }

  for (const auto & cycle : result.cycles) {
    report_cycle(cycle);
  }
  return result;
}

SchemaObject * Linker::link_type(SchemaObject * obj, const Identifier & id)
{
  if (id.is_system()) return nullptr;
  SchemaObject * dep = catalog_.resolve_type(id);
  if (dep) obj->add_dependency(dep);
  return dep;
}

void Linker::link_object(SchemaObject * obj)
{
  const auto link_columns = [&](const std::vector<ColumnDesc> & columns) {
    for (const auto & col : columns) {
      // A row type containing itself has no finite size. A foreign key to
      // its own table is fine.
      const bool contains_itself = link_type(obj, col.type.id) == obj;
      if (contains_itself &&
          std::find(self_cycles_.begin(), self_cycles_.end(), obj) == self_cycles_.end()) {
        self_cycles_.push_back(obj);
      }
      for (const auto & ref : col.refs) {
        link_type(obj, ref);
      }
    }
  };

  switch (obj->get_kind()) {
    case ObjectKind::Table:
      link_columns(cast<TableObject>(obj)->columns);
      break;
    case ObjectKind::CompositeType:
      link_columns(cast<CompositeTypeObject>(obj)->columns);
      break;
    case ObjectKind::EnumType:
      break;
    case ObjectKind::Routine: {
      const auto * routine = cast<RoutineObject>(obj);
      for (const auto & p : routine->params) {
        link_type(obj, p.type.id);
      }
      if (routine->returns_columns()) {
        link_columns(routine->return_columns);
      } else if (routine->return_type) {
        link_type(obj, routine->return_type->id);
      }
      break;
    }
    case ObjectKind::View: {
      const auto * view = cast<ViewObject>(obj);
      for (const auto & ref : view->refs) {
        link_type(obj, ref);
      }
      for (const auto & ref : view->routine_refs) {
        if (ref.is_system()) continue;
        if (SchemaObject * dep = catalog_.resolve_routine(ref)) {
          obj->add_dependency(dep);
        }
      }
      break;
    }
  }
}

void Linker::report_cycle(const std::vector<SchemaObject *> & cycle)
{
  if (cycle.empty()) return;

  std::string path;
  for (const SchemaObject * member : cycle) {
    path += member->qualified_name();
    path += " -> ";
  }
  path += cycle.front()->qualified_name();

  auto builder = diags_.report_error(
    cycle.front()->range(), "dependency cycle: " + path, "part of a dependency cycle");
  builder.with_code(diag_code::k_dependency_cycle).with_object(cycle.front()->qualified_name());
  for (size_t i = 1; i < cycle.size(); ++i) {
    builder.with_secondary_label(
      cycle[i]->range(), std::string(to_string(cycle[i]->get_kind())) + " '" +
                           cycle[i]->qualified_name() + "' is part of the cycle");
  }
  builder.with_help("break the cycle by removing one of the references");
}

}  // namespace pg_sema
