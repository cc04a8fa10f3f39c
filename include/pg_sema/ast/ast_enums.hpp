// pg_sema/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds (generated from ast_nodes.def) and the small enums carried by
// SQL AST nodes.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace pg_sema
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Grouped by category; category checks compare against the first/last kind.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "pg_sema/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "pg_sema/ast/ast_nodes.def"

// === FROM-clause items ===
#define AST_NODE_FROM(Class, Kind, Snake) Kind,
#include "pg_sema/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "pg_sema/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "pg_sema/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "pg_sema/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_expr_kind(NodeKind k) noexcept
{
  return k >= NodeKind::ColumnRef && k <= NodeKind::IndirectionExpr;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind k) noexcept { return k == NodeKind::TypeName; }

[[nodiscard]] constexpr bool is_from_kind(NodeKind k) noexcept
{
  return k >= NodeKind::RangeVar && k <= NodeKind::RangeFunction;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind k) noexcept
{
  return k >= NodeKind::SelectStmt && k <= NodeKind::OpaqueStmt;
}

/// Node kind name, e.g. "FuncCall". Used in diagnostics and AST dumps.
[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_TYPE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_FROM(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "pg_sema/ast/ast_nodes.def"
  }
  return "<unknown>";
}

// ============================================================================
// Literals
// ============================================================================

enum class ConstKind : uint8_t {
  Integer,
  Float,
  String,
  Bool,
  Null,
};

// ============================================================================
// Operators and tests
// ============================================================================

enum class BoolOp : uint8_t {
  And,
  Or,
  Not,
};

enum class NullTestType : uint8_t {
  IsNull,
  IsNotNull,
};

enum class BoolTestType : uint8_t {
  IsTrue,
  IsNotTrue,
  IsFalse,
  IsNotFalse,
  IsUnknown,
  IsNotUnknown,
};

/**
 * Kind of sub-select embedded in an expression.
 */
enum class SubLinkType : uint8_t {
  Expr,    ///< (SELECT ...)
  Array,   ///< ARRAY(SELECT ...)
  Exists,  ///< EXISTS (SELECT ...)
  Any,     ///< x IN (SELECT ...), x = ANY (SELECT ...)
  All,     ///< x > ALL (SELECT ...)
};

// ============================================================================
// Query structure
// ============================================================================

enum class JoinType : uint8_t {
  Inner,
  Left,
  Right,
  Full,
  Cross,
};

enum class SetOperation : uint8_t {
  None,
  Union,
  Intersect,
  Except,
};

enum class CteMaterialize : uint8_t {
  Default,
  Always,
  Never,
};

// ============================================================================
// DDL
// ============================================================================

enum class ConstrType : uint8_t {
  Null,
  NotNull,
  Default,
  Check,
  PrimaryKey,
  Unique,
  ForeignKey,
  Generated,
};

/**
 * Routine parameter mode.
 */
enum class ParamMode : uint8_t {
  In,
  Out,
  InOut,
  Variadic,
  Table,  ///< column of RETURNS TABLE (...)
};

[[nodiscard]] constexpr std::string_view to_string(JoinType t) noexcept
{
  switch (t) {
    case JoinType::Inner:
      return "inner";
    case JoinType::Left:
      return "left";
    case JoinType::Right:
      return "right";
    case JoinType::Full:
      return "full";
    case JoinType::Cross:
      return "cross";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(SetOperation op) noexcept
{
  switch (op) {
    case SetOperation::None:
      return "";
    case SetOperation::Union:
      return "UNION";
    case SetOperation::Intersect:
      return "INTERSECT";
    case SetOperation::Except:
      return "EXCEPT";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(SubLinkType t) noexcept
{
  switch (t) {
    case SubLinkType::Expr:
      return "expr";
    case SubLinkType::Array:
      return "array";
    case SubLinkType::Exists:
      return "exists";
    case SubLinkType::Any:
      return "any";
    case SubLinkType::All:
      return "all";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ParamMode m) noexcept
{
  switch (m) {
    case ParamMode::In:
      return "in";
    case ParamMode::Out:
      return "out";
    case ParamMode::InOut:
      return "inout";
    case ParamMode::Variadic:
      return "variadic";
    case ParamMode::Table:
      return "table";
  }
  return "";
}

}  // namespace pg_sema
