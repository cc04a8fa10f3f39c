// pg_sema/ast/visitor.cpp - Direct-children enumeration for AST nodes
#include "pg_sema/ast/visitor.hpp"

namespace pg_sema
{

namespace
{

template <typename T>
void each(gsl::span<T *> nodes, const std::function<void(const AstNode *)> & fn)
{
  for (const T * n : nodes) {
    if (n) fn(n);
  }
}

void one(const AstNode * node, const std::function<void(const AstNode *)> & fn)
{
  if (node) fn(node);
}

}  // namespace

void for_each_child(const AstNode * node, const std::function<void(const AstNode *)> & fn)
{
  if (!node) return;

  switch (node->get_kind()) {
    // Expressions
    case NodeKind::ColumnRef:
    case NodeKind::ParamRef:
    case NodeKind::ConstExpr:
      return;
    case NodeKind::TypeCast: {
      const auto * n = cast<TypeCast>(node);
      one(n->arg, fn);
      one(n->type_name, fn);
      return;
    }
    case NodeKind::FuncCall: {
      const auto * n = cast<FuncCall>(node);
      each(n->args, fn);
      one(n->agg_filter, fn);
      return;
    }
    case NodeKind::OpExpr: {
      const auto * n = cast<OpExpr>(node);
      one(n->lhs, fn);
      one(n->rhs, fn);
      return;
    }
    case NodeKind::BoolExpr:
      each(cast<BoolExpr>(node)->args, fn);
      return;
    case NodeKind::NullTest:
      one(cast<NullTest>(node)->arg, fn);
      return;
    case NodeKind::BooleanTest:
      one(cast<BooleanTest>(node)->arg, fn);
      return;
    case NodeKind::InListExpr: {
      const auto * n = cast<InListExpr>(node);
      one(n->lhs, fn);
      each(n->items, fn);
      return;
    }
    case NodeKind::BetweenExpr: {
      const auto * n = cast<BetweenExpr>(node);
      one(n->arg, fn);
      one(n->lower, fn);
      one(n->upper, fn);
      return;
    }
    case NodeKind::CaseExpr: {
      const auto * n = cast<CaseExpr>(node);
      one(n->arg, fn);
      each(n->whens, fn);
      one(n->default_result, fn);
      return;
    }
    case NodeKind::ArrayExpr:
      each(cast<ArrayExpr>(node)->elements, fn);
      return;
    case NodeKind::SubLink: {
      const auto * n = cast<SubLink>(node);
      one(n->testexpr, fn);
      one(n->subselect, fn);
      return;
    }
    case NodeKind::IndirectionExpr: {
      const auto * n = cast<IndirectionExpr>(node);
      one(n->arg, fn);
      one(n->subscript, fn);
      one(n->upper, fn);
      return;
    }

    // Types
    case NodeKind::TypeName:
      each(cast<TypeName>(node)->typmods, fn);
      return;

    // FROM items
    case NodeKind::RangeVar:
      one(cast<RangeVar>(node)->alias, fn);
      return;
    case NodeKind::JoinExpr: {
      const auto * n = cast<JoinExpr>(node);
      one(n->larg, fn);
      one(n->rarg, fn);
      one(n->quals, fn);
      one(n->alias, fn);
      return;
    }
    case NodeKind::RangeSubselect: {
      const auto * n = cast<RangeSubselect>(node);
      one(n->subquery, fn);
      one(n->alias, fn);
      return;
    }
    case NodeKind::RangeFunction: {
      const auto * n = cast<RangeFunction>(node);
      one(n->call, fn);
      one(n->alias, fn);
      return;
    }

    // Statements
    case NodeKind::SelectStmt: {
      const auto * n = cast<SelectStmt>(node);
      one(n->with_clause, fn);
      if (n->op != SetOperation::None) {
        one(n->larg, fn);
        one(n->rarg, fn);
      }
      each(n->target_list, fn);
      each(n->from_clause, fn);
      one(n->where_clause, fn);
      each(n->group_clause, fn);
      one(n->having_clause, fn);
      each(n->sort_clause, fn);
      one(n->limit_count, fn);
      one(n->limit_offset, fn);
      return;
    }
    case NodeKind::CreateTableStmt: {
      const auto * n = cast<CreateTableStmt>(node);
      one(n->relation, fn);
      each(n->columns, fn);
      each(n->constraints, fn);
      return;
    }
    case NodeKind::CompositeTypeStmt: {
      const auto * n = cast<CompositeTypeStmt>(node);
      one(n->typevar, fn);
      each(n->coldeflist, fn);
      return;
    }
    case NodeKind::CreateEnumStmt:
      one(cast<CreateEnumStmt>(node)->typevar, fn);
      return;
    case NodeKind::ViewStmt: {
      const auto * n = cast<ViewStmt>(node);
      one(n->view, fn);
      one(n->query, fn);
      return;
    }
    case NodeKind::CreateFunctionStmt: {
      const auto * n = cast<CreateFunctionStmt>(node);
      each(n->parameters, fn);
      one(n->return_type, fn);
      each(n->body_stmts, fn);
      return;
    }
    case NodeKind::CreateExtensionStmt:
    case NodeKind::OpaqueStmt:
      return;

    // Supporting nodes
    case NodeKind::ResTarget:
      one(cast<ResTarget>(node)->val, fn);
      return;
    case NodeKind::Alias:
      return;
    case NodeKind::WithClause:
      each(cast<WithClause>(node)->ctes, fn);
      return;
    case NodeKind::CommonTableExpr:
      one(cast<CommonTableExpr>(node)->query, fn);
      return;
    case NodeKind::CaseWhen: {
      const auto * n = cast<CaseWhen>(node);
      one(n->condition, fn);
      one(n->result, fn);
      return;
    }
    case NodeKind::ColumnDef: {
      const auto * n = cast<ColumnDef>(node);
      one(n->type_name, fn);
      each(n->constraints, fn);
      return;
    }
    case NodeKind::Constraint: {
      const auto * n = cast<Constraint>(node);
      one(n->pktable, fn);
      one(n->raw_expr, fn);
      return;
    }
    case NodeKind::FunctionParameter: {
      const auto * n = cast<FunctionParameter>(node);
      one(n->arg_type, fn);
      one(n->defexpr, fn);
      return;
    }

    // Top-level
    case NodeKind::Script:
      each(cast<Script>(node)->statements, fn);
      return;
  }
}

}  // namespace pg_sema
