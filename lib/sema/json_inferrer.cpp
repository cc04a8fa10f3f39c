// pg_sema/sema/json_inferrer.cpp - JSON shapes of expressions
#include <string>
#include <utility>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/catalog/identifier.hpp"
#include "pg_sema/sema/classification.hpp"
#include "pg_sema/sema/query_inferrer.hpp"

namespace pg_sema
{

const JsonType * QueryInferrer::infer_json(
  const Expr * expr, const FieldIndex & index, Scope & scope)
{
  if (const RelationBinding * relation = whole_row_relation(expr, index, scope)) {
    return json_of_relation(*relation, scope);
  }
  auto field = infer_value(expr, index, scope);
  if (!field) return nullptr;
  return json_of_field(*field, scope);
}

const JsonType * QueryInferrer::json_of_field(const Field & field, Scope & scope)
{
  if (field.json_type) return field.json_type;

  JsonPrimitive primitive = JsonPrimitive::Json;
  if (auto info = scope.get_type_name(field.type_oid); info && info->id.schema == k_system_schema) {
    primitive = classify_type(info->id.name);
  }

  // Array elements are not tracked separately; only the outermost level
  // carries the field's nullability.
  const JsonType * shape = json_.primitive(primitive, field.dims > 0 ? false : field.nullable);
  for (int32_t d = 0; d < field.dims; ++d) {
    const bool outermost = d == field.dims - 1;
    shape = json_.array(shape, outermost && field.nullable);
  }
  return shape;
}

const JsonType * QueryInferrer::json_of_relation(const RelationBinding & relation, Scope & scope)
{
  std::vector<JsonField> fields;
  fields.reserve(relation.fields.size());
  for (const auto & f : relation.fields) {
    const JsonType * t = json_of_field(f, scope);
    if (!t) return nullptr;
    fields.push_back(JsonField{f.name, t});
  }
  return json_.object(std::move(fields));
}

// ============================================================================
// Constructors
// ============================================================================

const JsonType * QueryInferrer::json_argument_shape(
  const Expr * arg, const Field & field, const FieldIndex & index, Scope & scope)
{
  if (const RelationBinding * relation = whole_row_relation(arg, index, scope)) {
    return json_of_relation(*relation, scope);
  }
  return json_of_field(field, scope);
}

const JsonType * QueryInferrer::json_call_shape(
  const FuncCall * call, gsl::span<const Field> args, const FieldIndex & index, Scope & scope)
{
  if (!call->schema().empty() && call->schema() != k_system_schema) return nullptr;
  if (args.size() != call->args.size()) return nullptr;

  const std::string_view name = call->name();
  if (name == "json_build_object" || name == "jsonb_build_object") {
    return json_object_shape(call, args, index, scope);
  }

  if (name == "json_build_array" || name == "jsonb_build_array") {
    const JsonType * element = nullptr;
    for (size_t i = 0; i < args.size(); ++i) {
      const JsonType * t = json_argument_shape(call->args[i], args[i], index, scope);
      if (!t) return nullptr;
      element = json_.unite(element, t);
    }
    if (!element) element = json_.primitive(JsonPrimitive::Json);
    return json_.array(element);
  }

  if (args.empty()) return nullptr;

  if (name == "json_agg" || name == "jsonb_agg") {
    const JsonType * element = json_argument_shape(call->args[0], args[0], index, scope);
    if (!element) return nullptr;
    // No input rows aggregate to NULL.
    return json_.array(element, true);
  }

  if (name == "to_json" || name == "to_jsonb" || name == "row_to_json" ||
      name == "array_to_json") {
    return json_argument_shape(call->args[0], args[0], index, scope);
  }

  return nullptr;
}

const JsonType * QueryInferrer::json_object_shape(
  const FuncCall * call, gsl::span<const Field> args, const FieldIndex & index, Scope & scope)
{
  const JsonType * opaque = json_.primitive(JsonPrimitive::Json);
  if (args.size() % 2 != 0) return opaque;

  std::vector<JsonField> fields;
  for (size_t i = 0; i + 1 < args.size(); i += 2) {
    // Keys computed at run time leave the shape unknown.
    const auto * key = dyn_cast<ConstExpr>(call->args[i]);
    if (!key || key->const_kind != ConstKind::String) return opaque;

    const JsonType * value = json_argument_shape(call->args[i + 1], args[i + 1], index, scope);
    if (!value) return nullptr;
    fields.push_back(JsonField{std::string(key->value), value});
  }
  return json_.object(std::move(fields));
}

}  // namespace pg_sema
