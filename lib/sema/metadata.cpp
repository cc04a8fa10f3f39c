// pg_sema/sema/metadata.cpp - Catalog-backed metadata
#include "pg_sema/sema/metadata.hpp"

#include <utility>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/sema/query_inferrer.hpp"

namespace pg_sema
{

CatalogMetadata::CatalogMetadata(const Catalog & catalog, JsonTypeContext & json)
: catalog_(catalog), json_(json)
{
  assign_type_oids();
}

// ============================================================================
// Type OIDs
// ============================================================================

void CatalogMetadata::add_user_type(const Identifier & id, const SchemaObject * obj)
{
  const uint32_t next = oid::k_first_user + static_cast<uint32_t>(user_types_by_oid_.size());
  const TypeOids oids{next, next + 1};
  user_types_.emplace(id, oids);
  user_types_by_oid_.emplace(oids.oid, TypeInfo{id, false});
  user_types_by_oid_.emplace(oids.array_oid, TypeInfo{id, true});
  if (obj) object_oids_.emplace(obj, oids);
}

void CatalogMetadata::assign_type_oids()
{
  for (const auto & obj : catalog_.objects()) {
    if (namespace_of(obj->get_kind()) == ObjectNamespace::Relation) {
      add_user_type(obj->id(), obj.get());
    }
  }
  for (const auto & ext : catalog_.extensions()) {
    for (std::string_view type_name : extension_types(ext)) {
      const Identifier id(k_default_schema, type_name);
      if (user_types_.count(id) == 0) add_user_type(id, nullptr);
    }
  }
}

uint32_t CatalogMetadata::type_oid_of(const SchemaObject * obj) const
{
  auto it = object_oids_.find(obj);
  return it != object_oids_.end() ? it->second.oid : 0;
}

std::optional<uint32_t> CatalogMetadata::builtin_oid(std::string_view name, bool array)
{
  const BuiltinType * t = find_builtin_type(name);
  if (!t) return std::nullopt;
  const uint32_t result = array ? t->array_oid : t->oid;
  if (result == oid::k_invalid) return std::nullopt;
  return result;
}

std::optional<uint32_t> CatalogMetadata::get_type_oid(const Identifier & id, bool array)
{
  if (id.schema == k_system_schema) {
    return builtin_oid(id.name, array);
  }
  auto it = user_types_.find(id);
  if (it == user_types_.end()) return std::nullopt;
  if (const SchemaObject * obj = catalog_.resolve_type(id); obj && is_failed(obj)) {
    return std::nullopt;
  }
  return array ? it->second.array_oid : it->second.oid;
}

std::optional<TypeInfo> CatalogMetadata::get_type_name(uint32_t type_oid)
{
  if (const BuiltinType * t = find_builtin_type(type_oid)) {
    return TypeInfo{Identifier(k_system_schema, t->name), t->array_oid == type_oid};
  }
  auto it = user_types_by_oid_.find(type_oid);
  if (it == user_types_by_oid_.end()) return std::nullopt;
  return it->second;
}

// ============================================================================
// Relations
// ============================================================================

Field CatalogMetadata::column_field(const ColumnDesc & column)
{
  Field f;
  f.name = column.name;
  f.nullable = column.nullable;
  f.dims = column.type.dims;
  f.type_oid = get_type_oid(column.type.id, column.type.dims > 0).value_or(oid::k_invalid);
  return f;
}

const RelationBinding * CatalogMetadata::resolve_relation(const Identifier & id)
{
  const SchemaObject * obj = catalog_.resolve_type(id);
  if (!obj || is_failed(obj)) return nullptr;

  if (auto it = relations_.find(obj); it != relations_.end()) {
    return &it->second;
  }
  return bind_relation(obj);
}

const RelationBinding * CatalogMetadata::bind_relation(const SchemaObject * obj)
{
  RelationBinding binding;
  binding.row_type_oid = type_oid_of(obj);

  if (const auto * table = dyn_cast<TableObject>(obj)) {
    binding.kind = RelationKind::Table;
    for (const auto & col : table->columns) binding.fields.push_back(column_field(col));
  } else if (const auto * type = dyn_cast<CompositeTypeObject>(obj)) {
    binding.kind = RelationKind::CompositeType;
    for (const auto & col : type->columns) binding.fields.push_back(column_field(col));
  } else if (const auto * view = dyn_cast<ViewObject>(obj)) {
    binding.kind = RelationKind::View;
    if (const auto * fields = committed_fields(view)) {
      binding.fields = *fields;
    } else {
      // Not analysed yet: infer on demand. A view reached again while its own
      // inference is running is part of a cycle and does not resolve.
      if (in_progress_.count(view) > 0) return nullptr;
      in_progress_.insert(view);
      DiagnosticBag scratch;
      QueryInferrer inferrer(*this, json_, scratch);
      auto inferred = inferrer.infer_view(view);
      in_progress_.erase(view);
      if (!inferred) return nullptr;
      binding.fields = std::move(*inferred);
    }
  } else {
    return nullptr;
  }

  auto [it, inserted] = relations_.emplace(obj, std::move(binding));
  return &it->second;
}

// ============================================================================
// Analysis results
// ============================================================================

void CatalogMetadata::commit_fields(const SchemaObject * obj, std::vector<Field> fields)
{
  failed_.erase(obj);
  relations_.erase(obj);
  committed_[obj] = std::move(fields);
}

void CatalogMetadata::mark_failed(const SchemaObject * obj)
{
  failed_.insert(obj);
  relations_.erase(obj);
  committed_.erase(obj);
}

const std::vector<Field> * CatalogMetadata::committed_fields(const SchemaObject * obj) const
{
  auto it = committed_.find(obj);
  return it != committed_.end() ? &it->second : nullptr;
}

// ============================================================================
// Functions
// ============================================================================

std::optional<FunctionResult> CatalogMetadata::get_function_result(
  std::string_view schema, std::string_view name, gsl::span<const Field> args)
{
  if (schema != k_system_schema) {
    if (const RoutineObject * routine = catalog_.resolve_routine(Identifier(schema, name))) {
      if (is_failed(routine)) return std::nullopt;
      return routine_result(routine);
    }
  }
  if (schema.empty() || schema == k_system_schema) {
    if (const BuiltinFunction * fn = find_builtin_function(name)) {
      return builtin_result(*fn, args);
    }
  }
  return std::nullopt;
}

std::optional<FunctionResult> CatalogMetadata::routine_result(const RoutineObject * routine)
{
  FunctionResult result;
  result.returns_set = routine->return_set;

  const std::vector<Field> * committed = committed_fields(routine);
  const bool returns_record =
    routine->returns_columns() ||
    (routine->return_type && routine->return_type->id == Identifier(k_system_schema, "record"));

  if (returns_record) {
    result.type_oid = oid::k_record;
    if (committed) {
      result.columns = *committed;
    } else {
      for (const auto & col : routine->return_columns) result.columns.push_back(column_field(col));
    }
    return result;
  }

  if (committed && !committed->empty()) {
    const Field & f = committed->front();
    result.type_oid = f.type_oid;
    result.dims = f.dims;
    result.json_type = f.json_type;
    result.null_rule = f.nullable ? NullRule::Always : NullRule::Strict;
    return result;
  }

  if (!routine->return_type) return std::nullopt;
  auto type_oid = get_type_oid(routine->return_type->id, routine->return_type->dims > 0);
  if (!type_oid) return std::nullopt;
  result.type_oid = *type_oid;
  result.dims = routine->return_type->dims;
  return result;
}

std::optional<FunctionResult> CatalogMetadata::builtin_result(
  const BuiltinFunction & fn, gsl::span<const Field> args)
{
  FunctionResult result;
  result.null_rule = fn.null_rule;
  result.aggregate = fn.aggregate;

  const auto arg_type = [&](size_t i) -> std::optional<TypeInfo> {
    if (i >= args.size()) return std::nullopt;
    return get_type_name(args[i].type_oid);
  };

  switch (fn.rule) {
    case ResultRule::Fixed: {
      auto type_oid = builtin_oid(fn.result_type, fn.result_dims > 0);
      if (!type_oid) return std::nullopt;
      result.type_oid = *type_oid;
      result.dims = fn.result_dims;
      return result;
    }

    case ResultRule::FirstArg:
    case ResultRule::SecondArg: {
      const size_t i = fn.rule == ResultRule::FirstArg ? 0 : 1;
      if (i >= args.size()) return std::nullopt;
      result.type_oid = args[i].type_oid;
      result.dims = args[i].dims;
      result.json_type = args[i].json_type;
      return result;
    }

    case ResultRule::FirstArgArray: {
      if (args.empty()) return std::nullopt;
      if (args[0].dims > 0) {
        result.type_oid = args[0].type_oid;
      } else {
        auto info = arg_type(0);
        if (!info) return std::nullopt;
        auto array_oid = get_type_oid(info->id, true);
        if (!array_oid) return std::nullopt;
        result.type_oid = *array_oid;
      }
      result.dims = args[0].dims + 1;
      return result;
    }

    case ResultRule::FirstArgElement: {
      if (args.empty() || args[0].dims == 0) return std::nullopt;
      if (args[0].dims > 1) {
        result.type_oid = args[0].type_oid;
      } else {
        auto info = arg_type(0);
        if (!info) return std::nullopt;
        auto element_oid = get_type_oid(info->id, false);
        if (!element_oid) return std::nullopt;
        result.type_oid = *element_oid;
      }
      result.dims = args[0].dims - 1;
      return result;
    }

    case ResultRule::Sum:
    case ResultRule::Avg: {
      auto info = arg_type(0);
      if (!info) return std::nullopt;
      std::string_view out_type = info->id.name;
      const std::string_view in = info->id.name;
      if (fn.rule == ResultRule::Sum) {
        if (in == "int2" || in == "int4") {
          out_type = "int8";
        } else if (in == "int8") {
          out_type = "numeric";
        }
      } else if (in == "float4" || in == "float8") {
        out_type = "float8";
      } else if (in != "interval") {
        out_type = "numeric";
      }
      if (info->id.schema != k_system_schema) {
        result.type_oid = args[0].type_oid;
        return result;
      }
      auto type_oid = builtin_oid(out_type, false);
      if (!type_oid) return std::nullopt;
      result.type_oid = *type_oid;
      return result;
    }
  }
  return std::nullopt;
}

}  // namespace pg_sema
