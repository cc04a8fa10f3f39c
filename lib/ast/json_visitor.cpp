// pg_sema/ast/json_visitor.cpp - JSON serialization implementation
//
#include "pg_sema/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "pg_sema/ast/ast.hpp"
#include "pg_sema/ast/ast_enums.hpp"
#include "pg_sema/ast/visitor.hpp"
#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/source_manager.hpp"

namespace pg_sema
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

template <typename T>
json j_names(gsl::span<T> names)
{
  json out = json::array();
  for (const auto & n : names) out.push_back(std::string(n));
  return out;
}

json j_node(const AstNode * n);

template <typename T>
json j_list(gsl::span<T *> nodes)
{
  json out = json::array();
  for (const auto * n : nodes) out.push_back(j_node(n));
  return out;
}

std::string_view to_string(ConstKind k)
{
  switch (k) {
    case ConstKind::Integer:
      return "integer";
    case ConstKind::Float:
      return "float";
    case ConstKind::String:
      return "string";
    case ConstKind::Bool:
      return "bool";
    case ConstKind::Null:
      return "null";
  }
  return "";
}

std::string_view to_string(BoolOp op)
{
  switch (op) {
    case BoolOp::And:
      return "and";
    case BoolOp::Or:
      return "or";
    case BoolOp::Not:
      return "not";
  }
  return "";
}

std::string_view to_string(SetOperation op)
{
  switch (op) {
    case SetOperation::None:
      return "none";
    case SetOperation::Union:
      return "union";
    case SetOperation::Intersect:
      return "intersect";
    case SetOperation::Except:
      return "except";
  }
  return "";
}

std::string_view to_string(ConstrType t)
{
  switch (t) {
    case ConstrType::Null:
      return "null";
    case ConstrType::NotNull:
      return "not_null";
    case ConstrType::Default:
      return "default";
    case ConstrType::Check:
      return "check";
    case ConstrType::PrimaryKey:
      return "primary_key";
    case ConstrType::Unique:
      return "unique";
    case ConstrType::ForeignKey:
      return "foreign_key";
    case ConstrType::Generated:
      return "generated";
  }
  return "";
}

// ============================================================================
// Node serialization
// ============================================================================

/// One visit method per node kind; the result is completed with "type" and
/// "range" by j_node().
class JsonBuilder : public ConstAstVisitor<JsonBuilder, json>
{
public:
  json visit_column_ref(const ColumnRef * n)
  {
    return json{{"fields", j_names(n->fields)}, {"star", n->star}};
  }

  json visit_param_ref(const ParamRef * n) { return json{{"number", n->number}}; }

  json visit_const_expr(const ConstExpr * n)
  {
    json j{{"kind", std::string(to_string(n->const_kind))}};
    if (n->const_kind == ConstKind::Bool) {
      j["value"] = n->bool_value;
    } else if (n->const_kind != ConstKind::Null) {
      j["value"] = std::string(n->value);
    }
    return j;
  }

  json visit_type_cast(const TypeCast * n)
  {
    return json{{"arg", j_node(n->arg)}, {"typeName", j_node(n->type_name)}};
  }

  json visit_func_call(const FuncCall * n)
  {
    json j{{"funcname", j_names(n->funcname)}, {"args", j_list(n->args)}};
    if (n->agg_star) j["aggStar"] = true;
    if (n->agg_distinct) j["aggDistinct"] = true;
    if (n->has_over) j["over"] = true;
    if (n->agg_filter) j["aggFilter"] = j_node(n->agg_filter);
    return j;
  }

  json visit_op_expr(const OpExpr * n)
  {
    return json{{"op", std::string(n->op)}, {"lhs", j_node(n->lhs)}, {"rhs", j_node(n->rhs)}};
  }

  json visit_bool_expr(const BoolExpr * n)
  {
    return json{{"op", std::string(to_string(n->op))}, {"args", j_list(n->args)}};
  }

  json visit_null_test(const NullTest * n)
  {
    return json{{"arg", j_node(n->arg)}, {"isNull", n->test == NullTestType::IsNull}};
  }

  json visit_boolean_test(const BooleanTest * n)
  {
    return json{{"arg", j_node(n->arg)}, {"test", static_cast<int>(n->test)}};
  }

  json visit_in_list_expr(const InListExpr * n)
  {
    return json{{"lhs", j_node(n->lhs)}, {"items", j_list(n->items)}, {"negated", n->negated}};
  }

  json visit_between_expr(const BetweenExpr * n)
  {
    return json{
      {"arg", j_node(n->arg)},
      {"lower", j_node(n->lower)},
      {"upper", j_node(n->upper)},
      {"negated", n->negated}};
  }

  json visit_case_expr(const CaseExpr * n)
  {
    return json{
      {"arg", j_node(n->arg)},
      {"whens", j_list(n->whens)},
      {"defaultResult", j_node(n->default_result)}};
  }

  json visit_array_expr(const ArrayExpr * n) { return json{{"elements", j_list(n->elements)}}; }

  json visit_sub_link(const SubLink * n)
  {
    json j{
      {"linkType", std::string(to_string(n->link_type))}, {"subselect", j_node(n->subselect)}};
    if (n->testexpr) {
      j["testexpr"] = j_node(n->testexpr);
      j["op"] = std::string(n->op);
    }
    return j;
  }

  json visit_indirection_expr(const IndirectionExpr * n)
  {
    json j{{"arg", j_node(n->arg)}};
    if (!n->field.empty()) {
      j["field"] = std::string(n->field);
    } else {
      j["subscript"] = j_node(n->subscript);
      if (n->is_slice) j["upper"] = j_node(n->upper);
    }
    return j;
  }

  json visit_type_name(const TypeName * n)
  {
    json bounds = json::array();
    for (const int32_t b : n->array_bounds) bounds.push_back(b);
    json j{{"names", j_names(n->names)}, {"arrayBounds", bounds}};
    if (!n->typmods.empty()) j["typmods"] = j_list(n->typmods);
    if (n->setof) j["setof"] = true;
    if (n->pct_type) j["pctType"] = true;
    return j;
  }

  json visit_range_var(const RangeVar * n)
  {
    json j{{"relname", std::string(n->relname)}};
    if (!n->schemaname.empty()) j["schemaname"] = std::string(n->schemaname);
    if (n->alias) j["alias"] = j_node(n->alias);
    return j;
  }

  json visit_join_expr(const JoinExpr * n)
  {
    json j{
      {"jointype", std::string(to_string(n->jointype))},
      {"natural", n->natural},
      {"larg", j_node(n->larg)},
      {"rarg", j_node(n->rarg)},
      {"quals", j_node(n->quals)}};
    if (!n->using_clause.empty()) j["using"] = j_names(n->using_clause);
    if (n->alias) j["alias"] = j_node(n->alias);
    return j;
  }

  json visit_range_subselect(const RangeSubselect * n)
  {
    return json{
      {"lateral", n->lateral}, {"subquery", j_node(n->subquery)}, {"alias", j_node(n->alias)}};
  }

  json visit_range_function(const RangeFunction * n)
  {
    return json{{"lateral", n->lateral}, {"call", j_node(n->call)}, {"alias", j_node(n->alias)}};
  }

  json visit_select_stmt(const SelectStmt * n)
  {
    json j;
    if (n->with_clause) j["withClause"] = j_node(n->with_clause);
    if (n->op != SetOperation::None) {
      j["op"] = std::string(to_string(n->op));
      j["all"] = n->all;
      j["larg"] = j_node(n->larg);
      j["rarg"] = j_node(n->rarg);
    } else {
      j["distinct"] = n->distinct;
      j["targetList"] = j_list(n->target_list);
      j["fromClause"] = j_list(n->from_clause);
      j["whereClause"] = j_node(n->where_clause);
      if (!n->group_clause.empty()) j["groupClause"] = j_list(n->group_clause);
      if (n->having_clause) j["havingClause"] = j_node(n->having_clause);
    }
    if (!n->sort_clause.empty()) j["sortClause"] = j_list(n->sort_clause);
    if (n->limit_count) j["limitCount"] = j_node(n->limit_count);
    if (n->limit_offset) j["limitOffset"] = j_node(n->limit_offset);
    return j;
  }

  json visit_create_table_stmt(const CreateTableStmt * n)
  {
    return json{
      {"relation", j_node(n->relation)},
      {"columns", j_list(n->columns)},
      {"constraints", j_list(n->constraints)},
      {"ifNotExists", n->if_not_exists}};
  }

  json visit_composite_type_stmt(const CompositeTypeStmt * n)
  {
    return json{{"typevar", j_node(n->typevar)}, {"coldeflist", j_list(n->coldeflist)}};
  }

  json visit_create_enum_stmt(const CreateEnumStmt * n)
  {
    return json{{"typevar", j_node(n->typevar)}, {"vals", j_names(n->vals)}};
  }

  json visit_view_stmt(const ViewStmt * n)
  {
    json j{
      {"view", j_node(n->view)},
      {"query", j_node(n->query)},
      {"replace", n->replace},
      {"materialized", n->materialized}};
    if (!n->aliases.empty()) j["aliases"] = j_names(n->aliases);
    return j;
  }

  json visit_create_function_stmt(const CreateFunctionStmt * n)
  {
    json j{
      {"funcname", j_names(n->funcname)},
      {"parameters", j_list(n->parameters)},
      {"returnType", j_node(n->return_type)},
      {"isProcedure", n->is_procedure},
      {"replace", n->replace},
      {"language", std::string(n->language)}};
    if (!n->body_stmts.empty()) {
      j["body"] = j_list(n->body_stmts);
    } else if (!n->body.empty()) {
      j["body"] = std::string(n->body);
    }
    return j;
  }

  json visit_create_extension_stmt(const CreateExtensionStmt * n)
  {
    json j{{"extname", std::string(n->extname)}, {"ifNotExists", n->if_not_exists}};
    if (!n->schema.empty()) j["schema"] = std::string(n->schema);
    return j;
  }

  json visit_opaque_stmt(const OpaqueStmt * n)
  {
    return json{{"keyword", std::string(n->keyword)}};
  }

  json visit_res_target(const ResTarget * n)
  {
    json j{{"val", j_node(n->val)}};
    if (!n->name.empty()) j["name"] = std::string(n->name);
    return j;
  }

  json visit_alias(const Alias * n)
  {
    json j{{"aliasname", std::string(n->aliasname)}};
    if (!n->colnames.empty()) j["colnames"] = j_names(n->colnames);
    return j;
  }

  json visit_with_clause(const WithClause * n)
  {
    return json{{"recursive", n->recursive}, {"ctes", j_list(n->ctes)}};
  }

  json visit_common_table_expr(const CommonTableExpr * n)
  {
    json j{{"ctename", std::string(n->ctename)}, {"query", j_node(n->query)}};
    if (!n->aliascolnames.empty()) j["aliascolnames"] = j_names(n->aliascolnames);
    return j;
  }

  json visit_case_when(const CaseWhen * n)
  {
    return json{{"condition", j_node(n->condition)}, {"result", j_node(n->result)}};
  }

  json visit_column_def(const ColumnDef * n)
  {
    return json{
      {"colname", std::string(n->colname)},
      {"typeName", j_node(n->type_name)},
      {"constraints", j_list(n->constraints)}};
  }

  json visit_constraint(const Constraint * n)
  {
    json j{{"contype", std::string(to_string(n->contype))}};
    if (!n->conname.empty()) j["conname"] = std::string(n->conname);
    if (!n->keys.empty()) j["keys"] = j_names(n->keys);
    if (n->pktable) {
      j["pktable"] = j_node(n->pktable);
      j["pkAttrs"] = j_names(n->pk_attrs);
    }
    if (n->raw_expr) j["rawExpr"] = j_node(n->raw_expr);
    return j;
  }

  json visit_function_parameter(const FunctionParameter * n)
  {
    json j{{"mode", std::string(to_string(n->mode))}, {"argType", j_node(n->arg_type)}};
    if (!n->name.empty()) j["name"] = std::string(n->name);
    if (n->defexpr) j["defexpr"] = j_node(n->defexpr);
    return j;
  }

  json visit_script(const Script * n) { return json{{"statements", j_list(n->statements)}}; }
};

json j_node(const AstNode * n)
{
  if (!n) return nullptr;

  JsonBuilder builder;
  json body = builder.visit(n);
  json j{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
  j.update(body);
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};
  return j_node(node);
}

nlohmann::json to_json(const Script * script)
{
  if (!script)
    return nlohmann::json{
      {"type", "Script"}, {"range", j_range({})}, {"statements", nlohmann::json::array()}};
  return j_node(script);
}

}  // namespace pg_sema
