// pg_sema/ast/visitor.hpp - CRTP visitor for AST traversal
//
// AstVisitor dispatches on NodeKind to `visit_<snake_name>` methods generated
// from ast_nodes.def. Unimplemented methods fall back to the category method
// (visit_expr, visit_from_item, visit_stmt) and finally to visit_node.
//
#pragma once

#include <functional>
#include <type_traits>

#include "pg_sema/ast/ast.hpp"
#include "pg_sema/ast/ast_enums.hpp"
#include "pg_sema/basic/casting.hpp"

namespace pg_sema
{

namespace detail
{

/// Propagate const-ness of NodePtrT onto a derived node pointer type
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor
// ============================================================================

/**
 * CRTP-based visitor.
 *
 * @code
 *   class RelationCollector : public ConstAstVisitor<RelationCollector> {
 *   public:
 *     void visit_range_var(const RangeVar * rv) { names.push_back(rv->relname); }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType Return type of visit methods
 * @tparam NodePtrT AstNode * or const AstNode *
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define PG_SEMA_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                         \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR PG_SEMA_VISIT_CASE
#define AST_NODE_TYPE PG_SEMA_VISIT_CASE
#define AST_NODE_FROM PG_SEMA_VISIT_CASE
#define AST_NODE_STMT PG_SEMA_VISIT_CASE
#define AST_NODE_SUPPORT PG_SEMA_VISIT_CASE
#define AST_NODE_TOP PG_SEMA_VISIT_CASE
#include "pg_sema/ast/ast_nodes.def"
#undef PG_SEMA_VISIT_CASE
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_FROM(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_from_item(node);                             \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_SUPPORT AST_NODE_TYPE
#define AST_NODE_TOP AST_NODE_TYPE
#include "pg_sema/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_from_item(detail::propagate_const_t<NodePtrT, FromItem> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// Child enumeration
// ============================================================================

/**
 * Call `fn` for each direct, non-null child of `node`, in source order.
 */
void for_each_child(const AstNode * node, const std::function<void(const AstNode *)> & fn);

/**
 * Visitor that walks the whole subtree below the visited node.
 *
 * Derived classes override `visit_<snake_name>` methods; the overrides are
 * called in pre-order and the walk continues into children afterwards.
 */
template <typename Derived>
class RecursiveAstVisitor : public ConstAstVisitor<Derived>
{
public:
  void traverse(const AstNode * node)
  {
    if (!node) return;
    this->visit(node);
    for_each_child(node, [this](const AstNode * child) { traverse(child); });
  }
};

}  // namespace pg_sema
