// pg_sema/sema/query_inferrer.hpp - Result types of queries and expressions
//
// QueryInferrer computes the output Fields of SELECT statements, target-list
// expressions, views and routines. Failures are reported into a
// DiagnosticBag and surface as std::nullopt (or nullptr for shapes); the
// inferrer never throws.
//
// Implementation is split by concern:
//   select_inferrer.cpp  - WITH, FROM and target lists
//   expr_inferrer.cpp    - expression types
//   json_inferrer.cpp    - JSON shapes
//   object_inferrer.cpp  - tables, views and routines
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pg_sema/ast/ast.hpp"
#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/catalog/schema_object.hpp"
#include "pg_sema/sema/field.hpp"
#include "pg_sema/sema/json_type.hpp"
#include "pg_sema/sema/metadata.hpp"
#include "pg_sema/sema/scope.hpp"

namespace pg_sema
{

class QueryInferrer
{
public:
  QueryInferrer(MetadataResolver & metadata, JsonTypeContext & json, DiagnosticBag & diags)
  : metadata_(metadata), json_(json), diags_(diags)
  {
  }

  // ===========================================================================
  // Queries
  // ===========================================================================

  /// Output fields of `stmt`, with its FROM clause bound into `scope`.
  std::optional<std::vector<Field>> infer_select(const SelectStmt * stmt, Scope & scope);

  /// Bind one FROM-clause entry into `scope`.
  bool resolve_from(const FromItem * item, Scope & scope);

  // ===========================================================================
  // Expressions
  // ===========================================================================

  /**
   * Fields produced by `expr`. Usually one; whole-row references expand to
   * every field of the relation.
   */
  std::optional<std::vector<Field>> infer_expr(
    const Expr * expr, const FieldIndex & index, Scope & scope);

  /// First field of infer_expr(), for operands and arguments.
  std::optional<Field> infer_value(const Expr * expr, const FieldIndex & index, Scope & scope);

  /// Structural JSON type of `expr`; nullptr on failure.
  const JsonType * infer_json(const Expr * expr, const FieldIndex & index, Scope & scope);

  /// Shape of a field's value: its known shape, else from its type.
  const JsonType * json_of_field(const Field & field, Scope & scope);

  /// Object shape of a relation's row.
  const JsonType * json_of_relation(const RelationBinding & relation, Scope & scope);

  // ===========================================================================
  // Schema objects
  // ===========================================================================

  /// Check that every column type resolves (tables and composite types).
  bool check_columns(const SchemaObject * obj, const std::vector<ColumnDesc> & columns);

  std::optional<std::vector<Field>> infer_view(const ViewObject * view);
  std::optional<std::vector<Field>> infer_routine(const RoutineObject * routine);

  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  // select_inferrer.cpp
  std::optional<std::vector<Field>> infer_set_operation(const SelectStmt * stmt, Scope & scope);
  bool resolve_ctes(const WithClause * with, Scope & scope);
  bool bind_range_var(const RangeVar * rv, Scope & scope);
  bool bind_join(const JoinExpr * join, Scope & scope);
  bool bind_subselect(const RangeSubselect * sub, Scope & scope);
  bool apply_column_aliases(
    std::vector<Field> & fields, gsl::span<std::string_view> aliases, SourceRange range,
    std::string_view relation);

  // expr_inferrer.cpp
  std::optional<std::vector<Field>> infer_column_ref(
    const ColumnRef * ref, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_const(const ConstExpr * c, Scope & scope);
  std::optional<Field> infer_type_cast(
    const TypeCast * cast_expr, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_func_call(
    const FuncCall * call, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_op(const OpExpr * op, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_case(const CaseExpr * expr, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_array(
    const ArrayExpr * expr, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_sublink(const SubLink * link, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_indirection(
    const IndirectionExpr * expr, const FieldIndex & index, Scope & scope);
  std::optional<Field> infer_param(const ParamRef * param);
  std::optional<Field> infer_argument(const Expr * expr, const FieldIndex & index, Scope & scope);
  std::optional<Field> bool_field(
    std::string name, gsl::span<const Expr * const> operands, const FieldIndex & index,
    Scope & scope);
  std::optional<Field> builtin_field(std::string name, std::string_view type, bool nullable,
    Scope & scope, SourceRange range);
  [[nodiscard]] const RelationBinding * whole_row_relation(
    const Expr * expr, const FieldIndex & index, const Scope & scope) const;
  std::optional<uint32_t> element_oid(const Field & field, Scope & scope);
  std::optional<uint32_t> array_oid(const Field & element, Scope & scope);

  // json_inferrer.cpp
  /// Shape built by a JSON constructor call; nullptr for other functions.
  const JsonType * json_call_shape(
    const FuncCall * call, gsl::span<const Field> args, const FieldIndex & index, Scope & scope);
  const JsonType * json_object_shape(
    const FuncCall * call, gsl::span<const Field> args, const FieldIndex & index, Scope & scope);
  const JsonType * json_argument_shape(
    const Expr * arg, const Field & field, const FieldIndex & index, Scope & scope);

  // object_inferrer.cpp
  std::optional<Field> declared_field(
    std::string name, const TypeRef & type, SourceRange range, std::string_view what);

  // Diagnostics
  void report(
    std::string_view code, SourceRange range, std::string message, std::string label = "",
    std::string help = "");

  MetadataResolver & metadata_;
  JsonTypeContext & json_;
  DiagnosticBag & diags_;
  size_t error_count_ = 0;

  /// Parameters of the routine whose body is being inferred.
  std::vector<Field> routine_params_;
  bool in_routine_ = false;
};

/// Type name of `t` as written (`schema.name[]`), for messages.
[[nodiscard]] std::string describe_type(const TypeRef & t);

}  // namespace pg_sema
