// pg_sema/ast/ast.hpp - SQL AST node class definitions
//
// Node classes follow the LLVM/Clang style with classof() for RTTI support.
// Nodes live in an AstContext arena and are trivially destructible: text is
// held as interned std::string_view, child lists as gsl::span.
//
// Node shapes mirror the PostgreSQL raw parse tree closely enough that the
// names (RangeVar, ResTarget, SubLink, ...) carry over.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "pg_sema/ast/ast_enums.hpp"
#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/source_manager.hpp"

namespace pg_sema
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind (for classof) and a SourceRange. Nodes are
 * non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * An entry of a FROM clause: relation, join, sub-select or function.
 */
class FromItem : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_from_kind(node->kind); }

protected:
  explicit FromItem(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class SelectStmt;
class Alias;
class TypeName;
class RangeVar;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Column reference: `a`, `t.a`, `s.t.a`, `t.*`, `*`.
class ColumnRef : public NodeBase<ColumnRef, Expr, NodeKind::ColumnRef>
{
public:
  gsl::span<std::string_view> fields;  ///< name parts, excluding a trailing `*`
  bool star = false;                   ///< ends in `*`

  ColumnRef(gsl::span<std::string_view> f, bool s, SourceRange r = {})
  : NodeBase(r), fields(f), star(s)
  {
  }
};

/// Positional parameter `$n`.
class ParamRef : public NodeBase<ParamRef, Expr, NodeKind::ParamRef>
{
public:
  int32_t number;

  explicit ParamRef(int32_t n, SourceRange r = {}) : NodeBase(r), number(n) {}
};

/// Literal constant. Numbers keep their source spelling in `value`.
class ConstExpr : public NodeBase<ConstExpr, Expr, NodeKind::ConstExpr>
{
public:
  ConstKind const_kind;
  std::string_view value;
  bool bool_value = false;

  ConstExpr(ConstKind k, std::string_view v, SourceRange r = {})
  : NodeBase(r), const_kind(k), value(v)
  {
  }
};

/// `arg::type`, `CAST(arg AS type)` or `type 'literal'`.
class TypeCast : public NodeBase<TypeCast, Expr, NodeKind::TypeCast>
{
public:
  Expr * arg;
  TypeName * type_name;

  TypeCast(Expr * a, TypeName * t, SourceRange r = {}) : NodeBase(r), arg(a), type_name(t) {}
};

/// Function call, including aggregates and window calls.
class FuncCall : public NodeBase<FuncCall, Expr, NodeKind::FuncCall>
{
public:
  gsl::span<std::string_view> funcname;  ///< [schema,] name
  gsl::span<Expr *> args;
  bool agg_star = false;      ///< count(*)
  bool agg_distinct = false;  ///< count(DISTINCT x)
  bool has_over = false;      ///< window call; the window clause is not kept
  Expr * agg_filter = nullptr;

  FuncCall(gsl::span<std::string_view> name, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), funcname(name), args(a)
  {
  }

  [[nodiscard]] std::string_view name() const noexcept
  {
    return funcname.empty() ? std::string_view{} : funcname[funcname.size() - 1];
  }
  [[nodiscard]] std::string_view schema() const noexcept
  {
    return funcname.size() > 1 ? funcname[funcname.size() - 2] : std::string_view{};
  }
};

/// Binary or prefix operator. `op` is the operator spelling ("=", "||",
/// "->>", "like", ...). `lhs` is null for prefix operators.
class OpExpr : public NodeBase<OpExpr, Expr, NodeKind::OpExpr>
{
public:
  std::string_view op;
  Expr * lhs;
  Expr * rhs;

  OpExpr(std::string_view o, Expr * l, Expr * r, SourceRange range = {})
  : NodeBase(range), op(o), lhs(l), rhs(r)
  {
  }
};

/// AND / OR / NOT.
class BoolExpr : public NodeBase<BoolExpr, Expr, NodeKind::BoolExpr>
{
public:
  BoolOp op;
  gsl::span<Expr *> args;

  BoolExpr(BoolOp o, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), op(o), args(a) {}
};

/// `arg IS [NOT] NULL`.
class NullTest : public NodeBase<NullTest, Expr, NodeKind::NullTest>
{
public:
  Expr * arg;
  NullTestType test;

  NullTest(Expr * a, NullTestType t, SourceRange r = {}) : NodeBase(r), arg(a), test(t) {}
};

/// `arg IS [NOT] TRUE|FALSE|UNKNOWN`.
class BooleanTest : public NodeBase<BooleanTest, Expr, NodeKind::BooleanTest>
{
public:
  Expr * arg;
  BoolTestType test;

  BooleanTest(Expr * a, BoolTestType t, SourceRange r = {}) : NodeBase(r), arg(a), test(t) {}
};

/// `lhs [NOT] IN (a, b, ...)`.
class InListExpr : public NodeBase<InListExpr, Expr, NodeKind::InListExpr>
{
public:
  Expr * lhs;
  gsl::span<Expr *> items;
  bool negated = false;

  InListExpr(Expr * l, gsl::span<Expr *> i, bool neg, SourceRange r = {})
  : NodeBase(r), lhs(l), items(i), negated(neg)
  {
  }
};

/// `arg [NOT] BETWEEN lower AND upper`.
class BetweenExpr : public NodeBase<BetweenExpr, Expr, NodeKind::BetweenExpr>
{
public:
  Expr * arg;
  Expr * lower;
  Expr * upper;
  bool negated = false;

  BetweenExpr(Expr * a, Expr * lo, Expr * hi, bool neg, SourceRange r = {})
  : NodeBase(r), arg(a), lower(lo), upper(hi), negated(neg)
  {
  }
};

/// `WHEN condition THEN result`.
class CaseWhen : public NodeBase<CaseWhen, AstNode, NodeKind::CaseWhen>
{
public:
  Expr * condition;
  Expr * result;

  CaseWhen(Expr * c, Expr * res, SourceRange r = {}) : NodeBase(r), condition(c), result(res) {}
};

/// `CASE [arg] WHEN ... THEN ... [ELSE default] END`.
class CaseExpr : public NodeBase<CaseExpr, Expr, NodeKind::CaseExpr>
{
public:
  Expr * arg;  ///< simple-CASE operand, or nullptr
  gsl::span<CaseWhen *> whens;
  Expr * default_result;  ///< ELSE branch, or nullptr

  CaseExpr(Expr * a, gsl::span<CaseWhen *> w, Expr * def, SourceRange r = {})
  : NodeBase(r), arg(a), whens(w), default_result(def)
  {
  }
};

/// `ARRAY[a, b, ...]`.
class ArrayExpr : public NodeBase<ArrayExpr, Expr, NodeKind::ArrayExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

/// Sub-select used as an expression.
class SubLink : public NodeBase<SubLink, Expr, NodeKind::SubLink>
{
public:
  SubLinkType link_type;
  Expr * testexpr = nullptr;  ///< left operand of ANY/ALL
  std::string_view op;        ///< operator of ANY/ALL ("=" for IN)
  SelectStmt * subselect;

  SubLink(SubLinkType t, SelectStmt * s, SourceRange r = {})
  : NodeBase(r), link_type(t), subselect(s)
  {
  }
};

/// Field selection or subscript applied to an expression: `(e).f`, `e[1]`,
/// `e[1:2]`.
class IndirectionExpr : public NodeBase<IndirectionExpr, Expr, NodeKind::IndirectionExpr>
{
public:
  Expr * arg;
  std::string_view field;      ///< selected field; empty for subscripts
  Expr * subscript = nullptr;  ///< lower bound / index
  Expr * upper = nullptr;      ///< slice upper bound
  bool is_slice = false;

  IndirectionExpr(Expr * a, std::string_view f, SourceRange r = {}) : NodeBase(r), arg(a), field(f)
  {
  }
};

// ============================================================================
// Type Nodes
// ============================================================================

/// Type name as written: `[schema.]name [(typmods)] {[] | [N]}`.
class TypeName : public NodeBase<TypeName, AstNode, NodeKind::TypeName>
{
public:
  gsl::span<std::string_view> names;   ///< [schema,] name (normalized spelling)
  gsl::span<int32_t> array_bounds;     ///< one entry per dimension; -1 if unsized
  gsl::span<Expr *> typmods;
  bool setof = false;
  bool pct_type = false;  ///< `tbl.col%TYPE`

  explicit TypeName(gsl::span<std::string_view> n, SourceRange r = {}) : NodeBase(r), names(n) {}

  [[nodiscard]] std::string_view name() const noexcept
  {
    return names.empty() ? std::string_view{} : names[names.size() - 1];
  }
  [[nodiscard]] std::string_view schema() const noexcept
  {
    return names.size() > 1 ? names[names.size() - 2] : std::string_view{};
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// `AS alias [(col, ...)]`.
class Alias : public NodeBase<Alias, AstNode, NodeKind::Alias>
{
public:
  std::string_view aliasname;
  gsl::span<std::string_view> colnames;

  Alias(std::string_view n, gsl::span<std::string_view> cols, SourceRange r = {})
  : NodeBase(r), aliasname(n), colnames(cols)
  {
  }
};

/// Target list entry: `val [AS name]`.
class ResTarget : public NodeBase<ResTarget, AstNode, NodeKind::ResTarget>
{
public:
  std::string_view name;  ///< explicit alias; empty if none
  Expr * val;

  ResTarget(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), val(v) {}
};

/// `name [(cols)] AS [[NOT] MATERIALIZED] (query)`.
class CommonTableExpr : public NodeBase<CommonTableExpr, AstNode, NodeKind::CommonTableExpr>
{
public:
  std::string_view ctename;
  gsl::span<std::string_view> aliascolnames;
  Stmt * query;  ///< SelectStmt, or OpaqueStmt for data-modifying bodies
  CteMaterialize materialized = CteMaterialize::Default;

  CommonTableExpr(
    std::string_view n, gsl::span<std::string_view> cols, Stmt * q, SourceRange r = {})
  : NodeBase(r), ctename(n), aliascolnames(cols), query(q)
  {
  }
};

class WithClause : public NodeBase<WithClause, AstNode, NodeKind::WithClause>
{
public:
  gsl::span<CommonTableExpr *> ctes;
  bool recursive = false;

  explicit WithClause(gsl::span<CommonTableExpr *> c, SourceRange r = {}) : NodeBase(r), ctes(c) {}
};

/// Column or table constraint.
class Constraint : public NodeBase<Constraint, AstNode, NodeKind::Constraint>
{
public:
  ConstrType contype;
  std::string_view conname;               ///< CONSTRAINT name; may be empty
  gsl::span<std::string_view> keys;       ///< constrained columns (table constraints)
  RangeVar * pktable = nullptr;           ///< REFERENCES target
  gsl::span<std::string_view> pk_attrs;   ///< referenced columns
  Expr * raw_expr = nullptr;              ///< DEFAULT / CHECK / GENERATED expression

  explicit Constraint(ConstrType t, SourceRange r = {}) : NodeBase(r), contype(t) {}
};

class ColumnDef : public NodeBase<ColumnDef, AstNode, NodeKind::ColumnDef>
{
public:
  std::string_view colname;
  TypeName * type_name;
  gsl::span<Constraint *> constraints;

  ColumnDef(std::string_view n, TypeName * t, SourceRange r = {})
  : NodeBase(r), colname(n), type_name(t)
  {
  }
};

class FunctionParameter : public NodeBase<FunctionParameter, AstNode, NodeKind::FunctionParameter>
{
public:
  std::string_view name;  ///< may be empty
  TypeName * arg_type;
  ParamMode mode = ParamMode::In;
  Expr * defexpr = nullptr;

  FunctionParameter(std::string_view n, TypeName * t, ParamMode m, SourceRange r = {})
  : NodeBase(r), name(n), arg_type(t), mode(m)
  {
  }
};

// ============================================================================
// FROM-clause Items
// ============================================================================

/// `[schema.]name [[AS] alias [(cols)]]`. Also used to name DDL targets.
class RangeVar : public NodeBase<RangeVar, FromItem, NodeKind::RangeVar>
{
public:
  std::string_view schemaname;  ///< empty if unqualified
  std::string_view relname;
  Alias * alias = nullptr;

  RangeVar(std::string_view s, std::string_view n, SourceRange r = {})
  : NodeBase(r), schemaname(s), relname(n)
  {
  }
};

class JoinExpr : public NodeBase<JoinExpr, FromItem, NodeKind::JoinExpr>
{
public:
  JoinType jointype;
  bool natural = false;
  FromItem * larg;
  FromItem * rarg;
  Expr * quals = nullptr;
  gsl::span<std::string_view> using_clause;
  Alias * alias = nullptr;

  JoinExpr(JoinType t, FromItem * l, FromItem * rr, SourceRange r = {})
  : NodeBase(r), jointype(t), larg(l), rarg(rr)
  {
  }
};

/// `[LATERAL] (SELECT ...) [AS] alias [(cols)]`.
class RangeSubselect : public NodeBase<RangeSubselect, FromItem, NodeKind::RangeSubselect>
{
public:
  bool lateral = false;
  SelectStmt * subquery;
  Alias * alias = nullptr;

  explicit RangeSubselect(SelectStmt * q, SourceRange r = {}) : NodeBase(r), subquery(q) {}
};

/// Set-returning function in FROM: `generate_series(1, 3) AS g(i)`.
class RangeFunction : public NodeBase<RangeFunction, FromItem, NodeKind::RangeFunction>
{
public:
  bool lateral = false;
  FuncCall * call;
  Alias * alias = nullptr;

  explicit RangeFunction(FuncCall * c, SourceRange r = {}) : NodeBase(r), call(c) {}
};

// ============================================================================
// Statements
// ============================================================================

/**
 * SELECT statement. Set operations are represented with `op != None` and
 * the operands in larg/rarg; a WITH clause attaches to the outermost node.
 */
class SelectStmt : public NodeBase<SelectStmt, Stmt, NodeKind::SelectStmt>
{
public:
  WithClause * with_clause = nullptr;
  bool distinct = false;
  gsl::span<ResTarget *> target_list;
  gsl::span<FromItem *> from_clause;
  Expr * where_clause = nullptr;
  gsl::span<Expr *> group_clause;
  Expr * having_clause = nullptr;
  gsl::span<Expr *> sort_clause;
  Expr * limit_count = nullptr;
  Expr * limit_offset = nullptr;

  SetOperation op = SetOperation::None;
  bool all = false;
  SelectStmt * larg = nullptr;
  SelectStmt * rarg = nullptr;

  explicit SelectStmt(SourceRange r = {}) : NodeBase(r) {}
};

class CreateTableStmt : public NodeBase<CreateTableStmt, Stmt, NodeKind::CreateTableStmt>
{
public:
  RangeVar * relation;
  gsl::span<ColumnDef *> columns;
  gsl::span<Constraint *> constraints;  ///< table constraints
  bool if_not_exists = false;

  explicit CreateTableStmt(RangeVar * rel, SourceRange r = {}) : NodeBase(r), relation(rel) {}
};

/// `CREATE TYPE name AS (col type, ...)`.
class CompositeTypeStmt : public NodeBase<CompositeTypeStmt, Stmt, NodeKind::CompositeTypeStmt>
{
public:
  RangeVar * typevar;
  gsl::span<ColumnDef *> coldeflist;

  explicit CompositeTypeStmt(RangeVar * tv, SourceRange r = {}) : NodeBase(r), typevar(tv) {}
};

/// `CREATE TYPE name AS ENUM ('a', ...)`.
class CreateEnumStmt : public NodeBase<CreateEnumStmt, Stmt, NodeKind::CreateEnumStmt>
{
public:
  RangeVar * typevar;
  gsl::span<std::string_view> vals;

  CreateEnumStmt(RangeVar * tv, gsl::span<std::string_view> v, SourceRange r = {})
  : NodeBase(r), typevar(tv), vals(v)
  {
  }
};

class ViewStmt : public NodeBase<ViewStmt, Stmt, NodeKind::ViewStmt>
{
public:
  RangeVar * view;
  gsl::span<std::string_view> aliases;
  SelectStmt * query;
  bool replace = false;
  bool materialized = false;

  ViewStmt(RangeVar * v, SelectStmt * q, SourceRange r = {}) : NodeBase(r), view(v), query(q) {}
};

/**
 * CREATE FUNCTION / CREATE PROCEDURE. For `LANGUAGE sql` routines the body
 * is parsed into `body_stmts`; other languages keep only the raw text.
 */
class CreateFunctionStmt : public NodeBase<CreateFunctionStmt, Stmt, NodeKind::CreateFunctionStmt>
{
public:
  gsl::span<std::string_view> funcname;
  gsl::span<FunctionParameter *> parameters;
  TypeName * return_type = nullptr;  ///< nullptr for procedures and RETURNS TABLE
  bool is_procedure = false;
  bool replace = false;
  std::string_view language;
  std::string_view body;
  SourceRange body_range;
  gsl::span<Stmt *> body_stmts;

  explicit CreateFunctionStmt(gsl::span<std::string_view> name, SourceRange r = {})
  : NodeBase(r), funcname(name)
  {
  }

  [[nodiscard]] std::string_view name() const noexcept
  {
    return funcname.empty() ? std::string_view{} : funcname[funcname.size() - 1];
  }
  [[nodiscard]] std::string_view schema() const noexcept
  {
    return funcname.size() > 1 ? funcname[funcname.size() - 2] : std::string_view{};
  }
};

class CreateExtensionStmt
: public NodeBase<CreateExtensionStmt, Stmt, NodeKind::CreateExtensionStmt>
{
public:
  std::string_view extname;
  std::string_view schema;  ///< WITH SCHEMA; may be empty
  bool if_not_exists = false;

  explicit CreateExtensionStmt(std::string_view n, SourceRange r = {}) : NodeBase(r), extname(n) {}
};

/**
 * Statement the analyzer does not model (INSERT, CREATE INDEX, ALTER, ...).
 * Only its leading keywords are kept.
 */
class OpaqueStmt : public NodeBase<OpaqueStmt, Stmt, NodeKind::OpaqueStmt>
{
public:
  std::string_view keyword;  ///< e.g. "insert", "create index"

  explicit OpaqueStmt(std::string_view kw, SourceRange r = {}) : NodeBase(r), keyword(kw) {}
};

// ============================================================================
// Top-level
// ============================================================================

/// Statements of one source file, in source order.
class Script : public NodeBase<Script, AstNode, NodeKind::Script>
{
public:
  gsl::span<Stmt *> statements;

  explicit Script(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace pg_sema
