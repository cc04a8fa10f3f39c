// pg_sema/sema/select_inferrer.cpp - WITH, FROM and target-list inference
#include <string>
#include <utility>

#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/catalog/object_builder.hpp"
#include "pg_sema/sema/query_inferrer.hpp"

namespace pg_sema
{

void QueryInferrer::report(
  std::string_view code, SourceRange range, std::string message, std::string label,
  std::string help)
{
  auto builder = diags_.report_error(range, std::move(message), std::move(label));
  builder.with_code(code);
  if (!help.empty()) builder.with_help(std::move(help));
  ++error_count_;
}

// ============================================================================
// SELECT
// ============================================================================

std::optional<std::vector<Field>> QueryInferrer::infer_select(
  const SelectStmt * stmt, Scope & scope)
{
  if (!stmt) return std::vector<Field>{};

  if (stmt->with_clause && !resolve_ctes(stmt->with_clause, scope)) {
    return std::nullopt;
  }

  if (stmt->op != SetOperation::None) return infer_set_operation(stmt, scope);

  for (const FromItem * item : stmt->from_clause) {
    if (!resolve_from(item, scope)) return std::nullopt;
  }

  const FieldIndex index = scope.unique_fields();

  std::vector<Field> fields;
  for (const ResTarget * target : stmt->target_list) {
    const Expr * val = target->val;
    if (!val) continue;

    if (const auto * ind = dyn_cast<IndirectionExpr>(val); ind && !ind->field.empty()) {
      report(
        diag_code::k_unsupported_construct, val->get_range(),
        "field selection in a target list is not supported", "indirection",
        "select the composite value and unpack it in the client");
      return std::nullopt;
    }

    auto expr_fields = infer_expr(val, index, scope);
    if (!expr_fields) return std::nullopt;
    if (expr_fields->empty()) {
      report(
        diag_code::k_unsupported_construct, val->get_range(),
        "cannot infer the type of a `" + std::string(to_string(val->get_kind())) + "` expression",
        "unsupported expression");
      return std::nullopt;
    }

    if (!target->name.empty()) {
      Field f = std::move(expr_fields->front());
      f.name = std::string(target->name);
      fields.push_back(std::move(f));
    } else {
      for (auto & f : *expr_fields) fields.push_back(std::move(f));
    }
  }
  return fields;
}

// Names come from the left arm. A column is nullable if a row holding NULL
// can survive the operation, and its type is that of the first arm not
// selecting a bare NULL.
std::optional<std::vector<Field>> QueryInferrer::infer_set_operation(
  const SelectStmt * stmt, Scope & scope)
{
  Scope left_scope = scope.fork();
  auto left = infer_select(stmt->larg, left_scope);
  Scope right_scope = scope.fork();
  auto right = infer_select(stmt->rarg, right_scope);
  if (!left || !right) return std::nullopt;

  if (left->size() != right->size()) {
    report(
      diag_code::k_unsupported_construct, stmt->get_range(),
      "each " + std::string(to_string(stmt->op)) + " query must have the same number of columns",
      std::to_string(left->size()) + " columns on the left, " + std::to_string(right->size()) +
        " on the right");
    return std::nullopt;
  }

  std::vector<Field> fields = std::move(*left);
  for (size_t i = 0; i < fields.size(); ++i) {
    Field & f = fields[i];
    const Field & r = (*right)[i];
    switch (stmt->op) {
      case SetOperation::Union:
        f.nullable = f.nullable || r.nullable;
        break;
      case SetOperation::Intersect:
        f.nullable = f.nullable && r.nullable;
        break;
      case SetOperation::Except:
      case SetOperation::None:
        break;
    }
    if (f.type_oid == oid::k_unknown && r.type_oid != oid::k_unknown) {
      f.type_oid = r.type_oid;
      f.dims = r.dims;
      f.json_type = r.json_type;
    } else if (
      stmt->op == SetOperation::Union && f.type_oid == r.type_oid &&
      (f.json_type || r.json_type)) {
      f.json_type = json_.unite(json_of_field(f, scope), json_of_field(r, scope));
    }
    if (f.json_type && f.nullable) f.json_type = json_.with_nullable(f.json_type, true);
  }
  return fields;
}

bool QueryInferrer::resolve_ctes(const WithClause * with, Scope & scope)
{
  for (const CommonTableExpr * cte : with->ctes) {
    const auto * query = dyn_cast<SelectStmt>(cte->query);
    if (!query) {
      report(
        diag_code::k_unsupported_construct, cte->get_range(),
        "WITH query `" + std::string(cte->ctename) + "` is not a SELECT",
        "data-modifying statement in WITH",
        "only SELECT bodies are supported in WITH queries");
      return false;
    }

    // Each CTE sees only the CTEs registered before it.
    Scope child = scope.fork();
    auto fields = infer_select(query, child);
    if (!fields) return false;
    if (!apply_column_aliases(*fields, cte->aliascolnames, cte->get_range(), cte->ctename)) {
      return false;
    }

    RelationBinding binding;
    binding.kind = RelationKind::Cte;
    binding.fields = std::move(*fields);
    scope.register_cte(std::string(cte->ctename), std::move(binding));
  }
  return true;
}

bool QueryInferrer::apply_column_aliases(
  std::vector<Field> & fields, gsl::span<std::string_view> aliases, SourceRange range,
  std::string_view relation)
{
  if (aliases.size() > fields.size()) {
    report(
      diag_code::k_unknown_column, range,
      "`" + std::string(relation) + "` has " + std::to_string(fields.size()) +
        " columns available but " + std::to_string(aliases.size()) + " columns specified",
      "too many column aliases");
    return false;
  }
  for (size_t i = 0; i < aliases.size(); ++i) {
    fields[i].name = std::string(aliases[i]);
  }
  return true;
}

// ============================================================================
// FROM
// ============================================================================

bool QueryInferrer::resolve_from(const FromItem * item, Scope & scope)
{
  if (const auto * rv = dyn_cast<RangeVar>(item)) return bind_range_var(rv, scope);
  if (const auto * join = dyn_cast<JoinExpr>(item)) return bind_join(join, scope);
  if (const auto * sub = dyn_cast<RangeSubselect>(item)) return bind_subselect(sub, scope);
  if (const auto * fn = dyn_cast<RangeFunction>(item)) {
    report(
      diag_code::k_unsupported_construct, fn->get_range(),
      "function `" + std::string(fn->call->name()) + "` in FROM is not supported",
      "range function");
    return false;
  }

  if (!item) return false;
  report(
    diag_code::k_unsupported_construct, item->get_range(),
    "unsupported FROM item `" + std::string(to_string(item->get_kind())) + "`");
  return false;
}

bool QueryInferrer::bind_range_var(const RangeVar * rv, Scope & scope)
{
  RelationBinding binding;
  const RelationBinding * cte = rv->schemaname.empty() ? scope.find_cte(rv->relname) : nullptr;
  if (cte) {
    binding = *cte;
  } else {
    const Identifier id = to_identifier(rv);
    const RelationBinding * relation = metadata_.resolve_relation(id);
    if (!relation) {
      report(
        diag_code::k_relation_not_found, rv->get_range(),
        "relation `" + id.qualified() + "` does not exist", "not found");
      return false;
    }
    binding = *relation;
  }

  std::string name(rv->relname);
  if (rv->alias) {
    name = std::string(rv->alias->aliasname);
    if (!apply_column_aliases(binding.fields, rv->alias->colnames, rv->alias->get_range(), name)) {
      return false;
    }
  }
  scope.bind(std::move(name), std::move(binding));
  return true;
}

bool QueryInferrer::bind_join(const JoinExpr * join, Scope & scope)
{
  const size_t before = scope.references().size();
  if (!resolve_from(join->larg, scope)) return false;
  const size_t middle = scope.references().size();
  if (!resolve_from(join->rarg, scope)) return false;
  const size_t after = scope.references().size();

  // Columns merged by USING / NATURAL stay unqualified-addressable.
  std::vector<std::string> merged(join->using_clause.begin(), join->using_clause.end());
  if (join->natural) {
    for (size_t l = before; l < middle; ++l) {
      for (const auto & lf : scope.references()[l].binding.fields) {
        for (size_t r = middle; r < after; ++r) {
          if (scope.references()[r].binding.find_field(lf.name)) merged.push_back(lf.name);
        }
      }
    }
  }
  for (const auto & name : merged) {
    const size_t first = join->jointype == JoinType::Right ? middle : before;
    const size_t last = join->jointype == JoinType::Right ? after : middle;
    const Field * source = scope.find_merged(name, first, last);
    for (size_t i = first; i < last && !source; ++i) {
      source = scope.references()[i].binding.find_field(name);
    }
    if (!source) {
      report(
        diag_code::k_unknown_column, join->get_range(),
        "column `" + name + "` specified in USING clause does not exist", "join");
      return false;
    }
    Field f = *source;
    f.nullable = f.nullable || join->jointype == JoinType::Full;
    scope.add_merged_field(std::move(f), before, after);
  }

  // The non-preserved side of an outer join may produce NULL rows.
  switch (join->jointype) {
    case JoinType::Left:
      scope.mark_nullable(middle, after);
      break;
    case JoinType::Right:
      scope.mark_nullable(before, middle);
      break;
    case JoinType::Full:
      scope.mark_nullable(before, after);
      break;
    case JoinType::Inner:
    case JoinType::Cross:
      break;
  }
  return true;
}

bool QueryInferrer::bind_subselect(const RangeSubselect * sub, Scope & scope)
{
  if (!sub->alias) {
    report(
      diag_code::k_unsupported_construct, sub->get_range(), "subquery in FROM must have an alias",
      "missing alias", "add `AS name` after the subquery");
    return false;
  }

  Scope child = scope.fork();
  auto fields = infer_select(sub->subquery, child);
  if (!fields) return false;

  const std::string name(sub->alias->aliasname);
  if (!apply_column_aliases(*fields, sub->alias->colnames, sub->alias->get_range(), name)) {
    return false;
  }

  RelationBinding binding;
  binding.kind = RelationKind::Subquery;
  binding.fields = std::move(*fields);
  scope.bind(name, std::move(binding));
  return true;
}

}  // namespace pg_sema
