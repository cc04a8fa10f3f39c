// pg_sema/sema/object_inferrer.cpp - Result fields of schema objects
#include <string>
#include <utility>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/sema/classification.hpp"
#include "pg_sema/sema/query_inferrer.hpp"

namespace pg_sema
{

std::string describe_type(const TypeRef & t)
{
  std::string out = t.id.schema == k_system_schema ? t.id.name : t.id.qualified();
  for (int32_t d = 0; d < t.dims; ++d) out += "[]";
  return out;
}

std::optional<Field> QueryInferrer::declared_field(
  std::string name, const TypeRef & type, SourceRange range, std::string_view what)
{
  auto type_oid = metadata_.get_type_oid(type.id, type.dims > 0);
  if (!type_oid) {
    report(
      diag_code::k_unknown_type, range,
      "type `" + describe_type(type) + "` of " + std::string(what) + " `" + name +
        "` does not exist",
      "unknown type");
    return std::nullopt;
  }
  Field f;
  f.name = std::move(name);
  f.type_oid = *type_oid;
  f.dims = type.dims;
  f.nullable = true;
  return f;
}

// ============================================================================
// Tables and composite types
// ============================================================================

bool QueryInferrer::check_columns(const SchemaObject * obj, const std::vector<ColumnDesc> & columns)
{
  const size_t errors_before = error_count_;
  for (const auto & col : columns) {
    if (!metadata_.get_type_oid(col.type.id, col.type.dims > 0)) {
      report(
        diag_code::k_unknown_type, col.range,
        "type `" + describe_type(col.type) + "` of column `" + col.name + "` does not exist",
        "unknown type");
    }
    for (const auto & target : col.refs) {
      if (target == obj->id()) continue;
      if (!metadata_.resolve_relation(target)) {
        report(
          diag_code::k_relation_not_found, col.range,
          "relation `" + target.qualified() + "` referenced by `" + col.name +
            "` does not exist",
          "foreign key target not found");
      }
    }
  }
  return error_count_ == errors_before;
}

// ============================================================================
// Views
// ============================================================================

std::optional<std::vector<Field>> QueryInferrer::infer_view(const ViewObject * view)
{
  Scope scope(metadata_);
  auto fields = infer_select(view->query, scope);
  if (!fields) return std::nullopt;

  std::vector<std::string_view> aliases(view->aliases.begin(), view->aliases.end());
  if (!apply_column_aliases(*fields, aliases, view->range(), view->qualified_name())) {
    return std::nullopt;
  }
  return fields;
}

// ============================================================================
// Routines
// ============================================================================

std::optional<std::vector<Field>> QueryInferrer::infer_routine(const RoutineObject * routine)
{
  std::vector<Field> params;
  for (size_t i = 0; i < routine->params.size(); ++i) {
    const auto & p = routine->params[i];
    std::string name = p.name.empty() ? "$" + std::to_string(i + 1) : p.name;
    auto f = declared_field(std::move(name), p.type, p.range, "parameter");
    if (!f) return std::nullopt;
    params.push_back(std::move(*f));
  }

  // Body of a `LANGUAGE sql` routine: the last statement decides the result.
  std::optional<std::vector<Field>> body;
  const auto * last = routine->body_stmts.empty()
                        ? nullptr
                        : dyn_cast<SelectStmt>(routine->body_stmts[routine->body_stmts.size() - 1]);
  if (routine->language == "sql" && last) {
    routine_params_ = std::move(params);
    in_routine_ = true;
    Scope scope(metadata_);
    body = infer_select(last, scope);
    in_routine_ = false;
    routine_params_.clear();
    if (!body) return std::nullopt;
  }

  const std::string routine_name = routine->id().name;

  if (routine->returns_columns()) {
    std::vector<Field> fields;
    for (size_t i = 0; i < routine->return_columns.size(); ++i) {
      const auto & col = routine->return_columns[i];
      auto f = declared_field(col.name, col.type, col.range, "column");
      if (!f) return std::nullopt;
      if (body && i < body->size() && col.type.dims == 0 && is_json_type_name(col.type.id.name)) {
        f->json_type = (*body)[i].json_type;
      }
      fields.push_back(std::move(*f));
    }
    return fields;
  }

  if (!routine->return_type) return std::vector<Field>{};
  const TypeRef & ret = *routine->return_type;
  const bool system_type = ret.id.schema == k_system_schema;

  if (system_type && ret.id.name == "void") return std::vector<Field>{};

  if (system_type && ret.id.name == "record" && ret.dims == 0) {
    if (!body) {
      report(
        diag_code::k_unsupported_construct, routine->range(),
        "cannot infer the columns of `" + routine->qualified_name() + "` returning record",
        "untyped record", "declare OUT parameters or use RETURNS TABLE (...)");
      return std::nullopt;
    }
    return body;
  }

  auto f = declared_field(routine_name, ret, routine->range(), "result");
  if (!f) return std::nullopt;
  if (system_type && ret.dims == 0 && is_json_type_name(ret.id.name) && body && !body->empty()) {
    f->json_type = body->front().json_type;
    f->nullable = body->front().nullable;
  }
  std::vector<Field> fields;
  fields.push_back(std::move(*f));
  return fields;
}

}  // namespace pg_sema
