// pg_sema/sema/expr_inferrer.cpp - Types of target-list expressions
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/catalog/object_builder.hpp"
#include "pg_sema/sema/query_inferrer.hpp"

namespace pg_sema
{

namespace
{

bool is_comparison_op(std::string_view op)
{
  if (op == "=" || op == "<>" || op == "!=" || op == "<" || op == ">" || op == "<=" ||
      op == ">=") {
    return true;
  }
  if (op == "like" || op == "not like" || op == "ilike" || op == "not ilike" ||
      op == "similar to" || op == "not similar to") {
    return true;
  }
  // Pattern, containment and key-existence operators.
  if (op == "~" || op == "~*" || op == "!~" || op == "!~*" || op == "~~" || op == "~~*" ||
      op == "@>" || op == "<@" || op == "&&" || op == "?" || op == "?|" || op == "?&" ||
      op == "@@" || op == "@?") {
    return true;
  }
  // `x = ANY (array)`, `x > ALL (array)`
  const auto ends_with = [&](std::string_view suffix) {
    return op.size() > suffix.size() && op.substr(op.size() - suffix.size()) == suffix;
  };
  return ends_with(" any") || ends_with(" all");
}

bool is_json_oid(uint32_t type_oid) { return type_oid == oid::k_json || type_oid == oid::k_jsonb; }

bool is_null_literal(const Expr * e)
{
  const auto * c = dyn_cast<ConstExpr>(e);
  return c && c->const_kind == ConstKind::Null;
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

std::optional<std::vector<Field>> QueryInferrer::infer_expr(
  const Expr * expr, const FieldIndex & index, Scope & scope)
{
  if (!expr) return std::vector<Field>{};

  std::optional<Field> single;
  switch (expr->get_kind()) {
    case NodeKind::ColumnRef:
      return infer_column_ref(cast<ColumnRef>(expr), index, scope);
    case NodeKind::ParamRef:
      single = infer_param(cast<ParamRef>(expr));
      break;
    case NodeKind::ConstExpr:
      single = infer_const(cast<ConstExpr>(expr), scope);
      break;
    case NodeKind::TypeCast:
      single = infer_type_cast(cast<TypeCast>(expr), index, scope);
      break;
    case NodeKind::FuncCall:
      single = infer_func_call(cast<FuncCall>(expr), index, scope);
      break;
    case NodeKind::OpExpr:
      single = infer_op(cast<OpExpr>(expr), index, scope);
      break;
    case NodeKind::BoolExpr: {
      const auto * b = cast<BoolExpr>(expr);
      const std::vector<const Expr *> operands(b->args.begin(), b->args.end());
      single = bool_field(std::string(k_unnamed_column), operands, index, scope);
      break;
    }
    case NodeKind::NullTest: {
      const Expr * operands[] = {cast<NullTest>(expr)->arg};
      single = bool_field(std::string(k_unnamed_column), operands, index, scope);
      if (single) single->nullable = false;
      break;
    }
    case NodeKind::BooleanTest: {
      const Expr * operands[] = {cast<BooleanTest>(expr)->arg};
      single = bool_field(std::string(k_unnamed_column), operands, index, scope);
      if (single) single->nullable = false;
      break;
    }
    case NodeKind::InListExpr: {
      const auto * in = cast<InListExpr>(expr);
      std::vector<const Expr *> operands{in->lhs};
      operands.insert(operands.end(), in->items.begin(), in->items.end());
      single = bool_field(std::string(k_unnamed_column), operands, index, scope);
      break;
    }
    case NodeKind::BetweenExpr: {
      const auto * b = cast<BetweenExpr>(expr);
      const Expr * operands[] = {b->arg, b->lower, b->upper};
      single = bool_field(std::string(k_unnamed_column), operands, index, scope);
      break;
    }
    case NodeKind::CaseExpr:
      single = infer_case(cast<CaseExpr>(expr), index, scope);
      break;
    case NodeKind::ArrayExpr:
      single = infer_array(cast<ArrayExpr>(expr), index, scope);
      break;
    case NodeKind::SubLink:
      single = infer_sublink(cast<SubLink>(expr), index, scope);
      break;
    case NodeKind::IndirectionExpr:
      single = infer_indirection(cast<IndirectionExpr>(expr), index, scope);
      break;
    default:
      // Unmodeled kinds yield no fields; the caller names the construct.
      return std::vector<Field>{};
  }

  if (!single) return std::nullopt;
  std::vector<Field> fields;
  fields.push_back(std::move(*single));
  return fields;
}

std::optional<Field> QueryInferrer::infer_value(
  const Expr * expr, const FieldIndex & index, Scope & scope)
{
  auto fields = infer_expr(expr, index, scope);
  if (!fields) return std::nullopt;
  if (fields->empty()) {
    report(
      diag_code::k_unsupported_construct, expr ? expr->get_range() : SourceRange{},
      "cannot infer the type of a `" +
        std::string(expr ? to_string(expr->get_kind()) : std::string_view("null")) +
        "` expression",
      "unsupported expression");
    return std::nullopt;
  }
  return std::move(fields->front());
}

std::optional<Field> QueryInferrer::infer_argument(
  const Expr * expr, const FieldIndex & index, Scope & scope)
{
  // A bare relation name passed to a function is its row value.
  if (const RelationBinding * relation = whole_row_relation(expr, index, scope)) {
    Field f;
    const auto * ref = cast<ColumnRef>(expr);
    f.name = ref->fields.empty() ? std::string(k_unnamed_column) : std::string(ref->fields.back());
    f.type_oid = relation->row_type_oid != 0 ? relation->row_type_oid : oid::k_record;
    f.nullable = false;
    return f;
  }
  return infer_value(expr, index, scope);
}

// ============================================================================
// Column references
// ============================================================================

const RelationBinding * QueryInferrer::whole_row_relation(
  const Expr * expr, const FieldIndex & index, const Scope & scope) const
{
  const auto * ref = dyn_cast<ColumnRef>(expr);
  if (!ref || ref->fields.empty()) return nullptr;

  if (ref->star) return scope.find(ref->fields.back());

  if (ref->fields.size() != 1) return nullptr;
  const std::string_view name = ref->fields[0];
  if (index.find(name) || index.is_ambiguous(name)) return nullptr;
  for (const auto & param : routine_params_) {
    if (param.name == name) return nullptr;
  }
  return scope.find(name);
}

std::optional<std::vector<Field>> QueryInferrer::infer_column_ref(
  const ColumnRef * ref, const FieldIndex & index, Scope & scope)
{
  std::vector<Field> fields;

  if (ref->star) {
    if (ref->fields.empty()) {
      for (const auto & r : scope.references()) {
        fields.insert(fields.end(), r.binding.fields.begin(), r.binding.fields.end());
      }
      return fields;
    }
    const std::string_view relation = ref->fields.back();
    const RelationBinding * binding = scope.find(relation);
    if (!binding) {
      report(
        diag_code::k_relation_not_found, ref->get_range(),
        "missing FROM-clause entry for `" + std::string(relation) + "`", "not in FROM");
      return std::nullopt;
    }
    return binding->fields;
  }

  if (ref->fields.size() == 1) {
    const std::string_view name = ref->fields[0];
    if (const Field * f = index.find(name)) {
      fields.push_back(*f);
      return fields;
    }
    if (index.is_ambiguous(name)) {
      report(
        diag_code::k_unknown_column, ref->get_range(),
        "column reference `" + std::string(name) + "` is ambiguous", "ambiguous",
        "qualify the column with a relation name or alias");
      return std::nullopt;
    }
    for (const auto & param : routine_params_) {
      if (param.name == name) {
        fields.push_back(param);
        return fields;
      }
    }
    if (const RelationBinding * binding = scope.find(name)) {
      return binding->fields;
    }
    report(
      diag_code::k_unknown_column, ref->get_range(),
      "column `" + std::string(name) + "` does not exist", "unknown column");
    return std::nullopt;
  }

  // [schema.]relation.column
  const std::string_view relation = ref->fields[ref->fields.size() - 2];
  const std::string_view column = ref->fields.back();
  const RelationBinding * binding = scope.find(relation);
  if (!binding) {
    report(
      diag_code::k_relation_not_found, ref->get_range(),
      "missing FROM-clause entry for `" + std::string(relation) + "`", "not in FROM");
    return std::nullopt;
  }
  const Field * f = binding->find_field(column);
  if (!f) {
    report(
      diag_code::k_unknown_column, ref->get_range(),
      "column `" + std::string(relation) + "." + std::string(column) + "` does not exist",
      "unknown column");
    return std::nullopt;
  }
  fields.push_back(*f);
  return fields;
}

std::optional<Field> QueryInferrer::infer_param(const ParamRef * param)
{
  if (in_routine_ && param->number >= 1 &&
      static_cast<size_t>(param->number) <= routine_params_.size()) {
    return routine_params_[static_cast<size_t>(param->number) - 1];
  }
  if (in_routine_) {
    report(
      diag_code::k_unknown_column, param->get_range(),
      "there is no parameter $" + std::to_string(param->number), "unknown parameter");
    return std::nullopt;
  }

  // Ad-hoc queries: a placeholder of unknown type.
  Field f;
  f.name = std::string(k_unnamed_column);
  f.type_oid = oid::k_unknown;
  f.nullable = true;
  return f;
}

// ============================================================================
// Literals and casts
// ============================================================================

std::optional<Field> QueryInferrer::builtin_field(
  std::string name, std::string_view type, bool nullable, Scope & scope, SourceRange range)
{
  auto type_oid = scope.get_builtin_oid(type);
  if (!type_oid) {
    report(
      diag_code::k_unknown_type, range, "type `" + std::string(type) + "` does not exist",
      "unknown type");
    return std::nullopt;
  }
  Field f;
  f.name = std::move(name);
  f.type_oid = *type_oid;
  f.nullable = nullable;
  return f;
}

std::optional<Field> QueryInferrer::infer_const(const ConstExpr * c, Scope & scope)
{
  std::string name(k_unnamed_column);
  switch (c->const_kind) {
    case ConstKind::Integer: {
      const std::string text(c->value);
      errno = 0;
      const long long v = std::strtoll(text.c_str(), nullptr, 10);
      if (errno == ERANGE) {
        return builtin_field(std::move(name), "numeric", false, scope, c->get_range());
      }
      const bool fits_int4 =
        v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
      return builtin_field(
        std::move(name), fits_int4 ? "int4" : "int8", false, scope, c->get_range());
    }
    case ConstKind::Float:
      return builtin_field(std::move(name), "float8", false, scope, c->get_range());
    case ConstKind::String:
      return builtin_field(std::move(name), "text", false, scope, c->get_range());
    case ConstKind::Bool:
      return builtin_field(std::move(name), "bool", false, scope, c->get_range());
    case ConstKind::Null:
      return builtin_field(std::move(name), "unknown", true, scope, c->get_range());
  }
  return std::nullopt;
}

std::optional<Field> QueryInferrer::infer_type_cast(
  const TypeCast * cast_expr, const FieldIndex & index, Scope & scope)
{
  std::optional<Field> arg;
  const auto * array = dyn_cast<ArrayExpr>(cast_expr->arg);
  if (array && array->elements.empty()) {
    // `ARRAY[]::text[]` takes its type from the cast alone.
    arg = Field{std::string(k_unnamed_column), oid::k_unknown, false};
  } else {
    arg = infer_argument(cast_expr->arg, index, scope);
  }
  if (!arg) return std::nullopt;

  const TypeName * tn = cast_expr->type_name;
  const Identifier id = type_identifier(tn);
  const auto dims = static_cast<int32_t>(tn->array_bounds.size());
  auto type_oid = scope.get_type_oid(id, dims > 0);
  if (!type_oid) {
    report(
      diag_code::k_unknown_type, tn->get_range(),
      "type `" + describe_type(TypeRef{id, dims}) + "` does not exist", "unknown type");
    return std::nullopt;
  }

  Field f;
  const bool named_arg =
    isa<ColumnRef>(cast_expr->arg) || isa<FuncCall>(cast_expr->arg) || isa<TypeCast>(cast_expr->arg);
  f.name = named_arg && arg->name != k_unnamed_column ? arg->name : std::string(tn->name());
  f.type_oid = *type_oid;
  f.dims = dims;
  f.nullable = arg->nullable;
  // json <-> jsonb keeps the known shape.
  if (is_json_oid(*type_oid) && dims == 0 && arg->dims == 0) f.json_type = arg->json_type;
  return f;
}

// ============================================================================
// Function calls and operators
// ============================================================================

std::optional<Field> QueryInferrer::infer_func_call(
  const FuncCall * call, const FieldIndex & index, Scope & scope)
{
  std::vector<Field> args;
  args.reserve(call->args.size());
  for (const Expr * arg : call->args) {
    auto f = infer_argument(arg, index, scope);
    if (!f) return std::nullopt;
    args.push_back(std::move(*f));
  }

  const std::string_view name = call->name();
  auto result = metadata_.get_function_result(call->schema(), name, args);
  if (!result) {
    std::string qualified =
      call->schema().empty() ? std::string(name) : std::string(call->schema()) + "." + std::string(name);
    report(
      diag_code::k_unknown_function, call->get_range(),
      "function `" + qualified + "` does not exist", "unknown function");
    return std::nullopt;
  }

  Field f;
  f.name = std::string(name);
  f.type_oid = result->type_oid;
  f.dims = result->dims;

  switch (result->null_rule) {
    case NullRule::Never:
      f.nullable = false;
      break;
    case NullRule::Always:
      f.nullable = true;
      break;
    case NullRule::Strict:
      f.nullable = false;
      for (const auto & a : args) f.nullable = f.nullable || a.nullable;
      break;
    case NullRule::AllArgs:
      f.nullable = true;
      for (const auto & a : args) f.nullable = f.nullable && a.nullable;
      break;
  }

  if (is_json_oid(f.type_oid) && f.dims == 0) {
    const JsonType * shape = json_call_shape(call, args, index, scope);
    f.json_type = shape ? shape : result->json_type;
    if (f.json_type && !f.nullable) f.json_type = json_.with_nullable(f.json_type, false);
  }
  return f;
}

std::optional<Field> QueryInferrer::infer_op(
  const OpExpr * op, const FieldIndex & index, Scope & scope)
{
  std::optional<Field> lhs;
  if (op->lhs) {
    lhs = infer_value(op->lhs, index, scope);
    if (!lhs) return std::nullopt;
  }
  auto rhs = infer_value(op->rhs, index, scope);
  if (!rhs) return std::nullopt;

  const std::string_view name = op->op;
  const bool nullable = (lhs && lhs->nullable) || rhs->nullable;
  const std::string unnamed(k_unnamed_column);

  if (!lhs) {
    Field f = *rhs;
    f.name = unnamed;
    f.json_type = nullptr;
    return f;
  }

  if (name == "is distinct from" || name == "is not distinct from") {
    return builtin_field(unnamed, "bool", false, scope, op->get_range());
  }
  if (is_comparison_op(name)) {
    return builtin_field(unnamed, "bool", nullable, scope, op->get_range());
  }

  if (name == "->>" || name == "#>>") {
    return builtin_field(unnamed, "text", true, scope, op->get_range());
  }
  if (name == "->" || name == "#>") {
    Field f = *lhs;
    f.name = unnamed;
    f.nullable = true;
    f.json_type = nullptr;
    // Known object shape with a literal key: the member's shape.
    const auto * key = dyn_cast<ConstExpr>(op->rhs);
    if (name == "->" && lhs->json_type && key && key->const_kind == ConstKind::String) {
      if (const JsonType * member = lhs->json_type->find_field(key->value)) {
        f.json_type = json_.with_nullable(member, true);
      }
    }
    return f;
  }

  if (name == "||") {
    if (lhs->dims > 0 || rhs->dims > 0) {
      Field f = lhs->dims >= rhs->dims ? *lhs : *rhs;
      f.name = unnamed;
      f.nullable = lhs->nullable && rhs->nullable;
      return f;
    }
    if (lhs->type_oid == oid::k_jsonb && rhs->type_oid == oid::k_jsonb) {
      return builtin_field(unnamed, "jsonb", nullable, scope, op->get_range());
    }
    return builtin_field(unnamed, "text", nullable, scope, op->get_range());
  }

  // Arithmetic keeps the type of the operand that is not a literal.
  const bool lhs_literal = isa<ConstExpr>(op->lhs);
  Field f = lhs_literal && !isa<ConstExpr>(op->rhs) ? *rhs : *lhs;
  f.name = unnamed;
  f.nullable = nullable;
  f.json_type = nullptr;
  return f;
}

std::optional<Field> QueryInferrer::bool_field(
  std::string name, gsl::span<const Expr * const> operands, const FieldIndex & index,
  Scope & scope)
{
  bool nullable = false;
  SourceRange range;
  for (const Expr * e : operands) {
    if (!e) continue;
    auto f = infer_value(e, index, scope);
    if (!f) return std::nullopt;
    nullable = nullable || f->nullable;
    range = e->get_range();
  }
  return builtin_field(std::move(name), "bool", nullable, scope, range);
}

// ============================================================================
// CASE, ARRAY, sub-links, subscripts
// ============================================================================

std::optional<Field> QueryInferrer::infer_case(
  const CaseExpr * expr, const FieldIndex & index, Scope & scope)
{
  if (expr->arg && !infer_value(expr->arg, index, scope)) return std::nullopt;

  std::vector<const Expr *> results;
  for (const CaseWhen * when : expr->whens) results.push_back(when->result);
  if (expr->default_result) results.push_back(expr->default_result);

  std::vector<Field> branches;
  for (const Expr * e : results) {
    auto f = infer_value(e, index, scope);
    if (!f) return std::nullopt;
    branches.push_back(std::move(*f));
  }

  Field f;
  f.name = "case";
  f.nullable = expr->default_result == nullptr;
  bool typed = false;
  for (size_t i = 0; i < branches.size(); ++i) {
    f.nullable = f.nullable || branches[i].nullable;
    // A NULL branch does not decide the type.
    if (!typed && !is_null_literal(results[i])) {
      f.type_oid = branches[i].type_oid;
      f.dims = branches[i].dims;
      typed = true;
    }
  }
  if (!typed) {
    auto unknown = scope.get_builtin_oid("unknown");
    f.type_oid = unknown.value_or(oid::k_unknown);
  }

  if (is_json_oid(f.type_oid) && f.dims == 0) {
    const JsonType * shape = nullptr;
    for (size_t i = 0; i < branches.size(); ++i) {
      if (is_null_literal(results[i])) continue;
      const JsonType * branch = json_of_field(branches[i], scope);
      if (!branch) return std::nullopt;
      shape = json_.unite(shape, branch);
    }
    if (shape && f.nullable) shape = json_.with_nullable(shape, true);
    f.json_type = shape;
  }
  return f;
}

std::optional<uint32_t> QueryInferrer::element_oid(const Field & field, Scope & scope)
{
  if (field.dims > 1) return field.type_oid;
  auto info = scope.get_type_name(field.type_oid);
  if (!info) return std::nullopt;
  return scope.get_type_oid(info->id, false);
}

std::optional<uint32_t> QueryInferrer::array_oid(const Field & element, Scope & scope)
{
  if (element.dims > 0) return element.type_oid;
  auto info = scope.get_type_name(element.type_oid);
  if (!info) return std::nullopt;
  return scope.get_type_oid(info->id, true);
}

std::optional<Field> QueryInferrer::infer_array(
  const ArrayExpr * expr, const FieldIndex & index, Scope & scope)
{
  std::optional<Field> element;
  for (const Expr * e : expr->elements) {
    auto f = infer_value(e, index, scope);
    if (!f) return std::nullopt;
    if (!element && !is_null_literal(e)) element = std::move(f);
  }
  if (!element) {
    report(
      diag_code::k_unsupported_construct, expr->get_range(),
      "cannot determine the type of an empty array", "untyped array",
      "cast the array to its type, e.g. `ARRAY[]::text[]`");
    return std::nullopt;
  }

  auto type_oid = array_oid(*element, scope);
  if (!type_oid) {
    report(
      diag_code::k_unknown_type, expr->get_range(), "could not find the array type of the elements",
      "no array type");
    return std::nullopt;
  }

  Field f;
  f.name = "array";
  f.type_oid = *type_oid;
  f.dims = element->dims + 1;
  f.nullable = false;
  return f;
}

std::optional<Field> QueryInferrer::infer_sublink(
  const SubLink * link, const FieldIndex & index, Scope & scope)
{
  if (link->testexpr && !infer_value(link->testexpr, index, scope)) return std::nullopt;

  Scope child = scope.fork();
  auto fields = infer_select(link->subselect, child);
  if (!fields) return std::nullopt;

  switch (link->link_type) {
    case SubLinkType::Exists:
      return builtin_field("exists", "bool", false, scope, link->get_range());
    case SubLinkType::Any:
    case SubLinkType::All:
      return builtin_field(std::string(k_unnamed_column), "bool", true, scope, link->get_range());
    case SubLinkType::Expr:
    case SubLinkType::Array:
      break;
  }

  if (fields->empty()) {
    report(
      diag_code::k_unsupported_construct, link->get_range(), "subquery returns no columns",
      "empty target list");
    return std::nullopt;
  }
  Field f = std::move(fields->front());

  if (link->link_type == SubLinkType::Array) {
    auto type_oid = array_oid(f, scope);
    if (!type_oid) {
      report(
        diag_code::k_unknown_type, link->get_range(),
        "could not find the array type of the subquery column", "no array type");
      return std::nullopt;
    }
    f.name = "array";
    f.type_oid = *type_oid;
    f.dims += 1;
    f.nullable = false;
    f.json_type = nullptr;
    return f;
  }

  // No row yields NULL.
  f.nullable = true;
  if (f.json_type) f.json_type = json_.with_nullable(f.json_type, true);
  return f;
}

std::optional<Field> QueryInferrer::infer_indirection(
  const IndirectionExpr * expr, const FieldIndex & index, Scope & scope)
{
  if (!expr->field.empty()) {
    report(
      diag_code::k_unsupported_construct, expr->get_range(),
      "field selection `." + std::string(expr->field) + "` is not supported", "indirection");
    return std::nullopt;
  }

  auto arg = infer_value(expr->arg, index, scope);
  if (!arg) return std::nullopt;
  if (expr->subscript && !infer_value(expr->subscript, index, scope)) return std::nullopt;
  if (expr->upper && !infer_value(expr->upper, index, scope)) return std::nullopt;

  if (arg->dims == 0) {
    if (is_json_oid(arg->type_oid)) {
      // jsonb subscripting
      Field f = *arg;
      f.nullable = true;
      f.json_type = nullptr;
      return f;
    }
    report(
      diag_code::k_unsupported_construct, expr->get_range(),
      "cannot subscript `" + arg->name + "` because it is not an array", "not an array");
    return std::nullopt;
  }

  Field f = *arg;
  f.nullable = true;
  if (expr->is_slice) return f;

  auto type_oid = element_oid(*arg, scope);
  if (!type_oid) {
    report(
      diag_code::k_unknown_type, expr->get_range(), "could not find the element type of `" +
        arg->name + "`", "no element type");
    return std::nullopt;
  }
  f.type_oid = *type_oid;
  f.dims = arg->dims - 1;
  return f;
}

}  // namespace pg_sema
