// pg_sema/catalog/object_builder.cpp - Schema object construction
#include "pg_sema/catalog/object_builder.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "pg_sema/ast/visitor.hpp"
#include "pg_sema/basic/casting.hpp"
#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/builtin_types.hpp"

namespace pg_sema
{

// ============================================================================
// Helpers
// ============================================================================

Identifier to_identifier(const RangeVar * rv)
{
  return Identifier(rv->schemaname, rv->relname);
}

Identifier type_identifier(const TypeName * type)
{
  if (type->schema().empty() && find_builtin_type(type->name()) != nullptr) {
    return Identifier(k_system_schema, type->name());
  }
  return Identifier(type->schema(), type->name());
}

namespace
{

void push_unique(std::vector<Identifier> & out, Identifier id)
{
  if (std::find(out.begin(), out.end(), id) == out.end()) {
    out.push_back(std::move(id));
  }
}

/**
 * Collects the relations, routines and cast target types a view's query
 * names. CTE names are local to the query and are not references.
 */
class ViewRefCollector : public RecursiveAstVisitor<ViewRefCollector>
{
public:
  explicit ViewRefCollector(ViewObject & view) : view_(view) {}

  void collect(const SelectStmt * query)
  {
    CteNameCollector ctes(cte_names_);
    ctes.traverse(query);
    traverse(query);
  }

  void visit_range_var(const RangeVar * rv)
  {
    if (rv->schemaname.empty() && cte_names_.count(rv->relname) > 0) return;
    add_ref(view_.refs, to_identifier(rv));
  }

  void visit_func_call(const FuncCall * call)
  {
    add_ref(view_.routine_refs, Identifier(call->schema(), call->name()));
  }

  void visit_type_cast(const TypeCast * cast_expr)
  {
    if (cast_expr->type_name && !cast_expr->type_name->pct_type) {
      add_ref(view_.refs, type_identifier(cast_expr->type_name));
    }
  }

private:
  class CteNameCollector : public RecursiveAstVisitor<CteNameCollector>
  {
  public:
    explicit CteNameCollector(std::set<std::string_view> & names) : names_(names) {}
    void visit_common_table_expr(const CommonTableExpr * cte) { names_.insert(cte->ctename); }

  private:
    std::set<std::string_view> & names_;
  };

  static void add_ref(std::vector<Identifier> & out, Identifier id)
  {
    if (id.is_system()) return;
    push_unique(out, std::move(id));
  }

  ViewObject & view_;
  std::set<std::string_view> cte_names_;
};

[[nodiscard]] bool has_constraint(const ColumnDef * def, ConstrType type)
{
  return std::any_of(def->constraints.begin(), def->constraints.end(), [&](const Constraint * c) {
    return c->contype == type;
  });
}

[[nodiscard]] ColumnDesc * find_column(std::vector<ColumnDesc> & columns, std::string_view name)
{
  for (auto & c : columns) {
    if (c.name == name) return &c;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// ObjectBuilder
// ============================================================================

bool ObjectBuilder::build(const Script * script)
{
  if (!script) return true;
  const size_t errors_before = error_count_;
  for (const Stmt * stmt : script->statements) {
    (void)build_statement(stmt);
  }
  return error_count_ == errors_before;
}

SchemaObject * ObjectBuilder::build_statement(const Stmt * stmt)
{
  if (const auto * s = dyn_cast<CreateTableStmt>(stmt)) return build_table(s);
  if (const auto * s = dyn_cast<CompositeTypeStmt>(stmt)) return build_composite(s);
  if (const auto * s = dyn_cast<CreateEnumStmt>(stmt)) return build_enum(s);
  if (const auto * s = dyn_cast<ViewStmt>(stmt)) return build_view(s);
  if (const auto * s = dyn_cast<CreateFunctionStmt>(stmt)) return build_routine(s);
  if (const auto * s = dyn_cast<CreateExtensionStmt>(stmt)) {
    build_extension(s);
  }
  return nullptr;
}

std::optional<TypeRef> ObjectBuilder::resolve_type_name(const TypeName * type)
{
  if (!type) return std::nullopt;
  const auto dims = static_cast<int32_t>(type->array_bounds.size());

  if (!type->pct_type) {
    return TypeRef{type_identifier(type), dims};
  }

  // [schema.]relation.column%TYPE
  const auto & names = type->names;
  if (names.size() >= 2) {
    const std::string_view column = names[names.size() - 1];
    const std::string_view relation = names[names.size() - 2];
    const std::string_view schema = names.size() >= 3 ? names[names.size() - 3] : "";
    const SchemaObject * rel = catalog_.resolve_type(Identifier(schema, relation));

    const std::vector<ColumnDesc> * columns = nullptr;
    if (const auto * t = dyn_cast<TableObject>(rel)) {
      columns = &t->columns;
    } else if (const auto * c = dyn_cast<CompositeTypeObject>(rel)) {
      columns = &c->columns;
    }
    if (columns) {
      for (const auto & col : *columns) {
        if (col.name == column) {
          TypeRef ref = col.type;
          ref.dims += dims;
          return ref;
        }
      }
    }
  }

  std::string written;
  for (const auto & n : names) {
    if (!written.empty()) written += '.';
    written += n;
  }
  diags_.report_error(type->get_range(), "could not resolve `" + written + "%TYPE`", "unknown column")
    .with_code(diag_code::k_unknown_type)
    .with_help("%TYPE must name a column of a table or type declared earlier");
  ++error_count_;
  return std::nullopt;
}

std::optional<ColumnDesc> ObjectBuilder::build_column(const ColumnDef * def)
{
  auto type = resolve_type_name(def->type_name);
  if (!type) return std::nullopt;

  ColumnDesc col;
  col.name = std::string(def->colname);
  col.type = std::move(*type);
  col.range = def->get_range();
  col.nullable =
    !has_constraint(def, ConstrType::NotNull) && !has_constraint(def, ConstrType::PrimaryKey);
  for (const Constraint * c : def->constraints) {
    if (c->contype == ConstrType::ForeignKey && c->pktable) {
      push_unique(col.refs, to_identifier(c->pktable));
    }
  }
  return col;
}

SchemaObject * ObjectBuilder::commit(std::unique_ptr<SchemaObject> obj)
{
  SchemaObject * stored = catalog_.add(std::move(obj), diags_);
  if (!stored) ++error_count_;
  return stored;
}

SchemaObject * ObjectBuilder::build_table(const CreateTableStmt * stmt)
{
  auto table = std::make_unique<TableObject>(
    to_identifier(stmt->relation), stmt->get_range(), stmt);

  bool ok = true;
  for (const ColumnDef * def : stmt->columns) {
    auto col = build_column(def);
    if (!col) {
      ok = false;
      continue;
    }
    if (has_constraint(def, ConstrType::PrimaryKey)) {
      table->primary_key.push_back(col->name);
    }
    table->columns.push_back(std::move(*col));
  }

  for (const Constraint * c : stmt->constraints) {
    if (c->contype == ConstrType::PrimaryKey) {
      for (std::string_view key : c->keys) {
        table->primary_key.emplace_back(key);
        if (ColumnDesc * col = find_column(table->columns, key)) col->nullable = false;
      }
    } else if (c->contype == ConstrType::ForeignKey && c->pktable) {
      for (std::string_view key : c->keys) {
        if (ColumnDesc * col = find_column(table->columns, key)) {
          push_unique(col->refs, to_identifier(c->pktable));
        }
      }
    }
  }

  if (!ok) return nullptr;
  return commit(std::move(table));
}

SchemaObject * ObjectBuilder::build_composite(const CompositeTypeStmt * stmt)
{
  auto type = std::make_unique<CompositeTypeObject>(
    to_identifier(stmt->typevar), stmt->get_range(), stmt);

  bool ok = true;
  for (const ColumnDef * def : stmt->coldeflist) {
    auto col = build_column(def);
    if (!col) {
      ok = false;
      continue;
    }
    col->nullable = true;
    type->columns.push_back(std::move(*col));
  }

  if (!ok) return nullptr;
  return commit(std::move(type));
}

SchemaObject * ObjectBuilder::build_enum(const CreateEnumStmt * stmt)
{
  auto type =
    std::make_unique<EnumTypeObject>(to_identifier(stmt->typevar), stmt->get_range(), stmt);
  for (std::string_view label : stmt->vals) {
    type->labels.emplace_back(label);
  }
  return commit(std::move(type));
}

SchemaObject * ObjectBuilder::build_view(const ViewStmt * stmt)
{
  auto view = std::make_unique<ViewObject>(to_identifier(stmt->view), stmt->get_range(), stmt);
  view->query = stmt->query;
  view->materialized = stmt->materialized;
  for (std::string_view alias : stmt->aliases) {
    view->aliases.emplace_back(alias);
  }

  ViewRefCollector collector(*view);
  collector.collect(stmt->query);

  return commit(std::move(view));
}

SchemaObject * ObjectBuilder::build_routine(const CreateFunctionStmt * stmt)
{
  auto routine = std::make_unique<RoutineObject>(
    Identifier(stmt->schema(), stmt->name()), stmt->get_range(), stmt);
  routine->is_procedure = stmt->is_procedure;
  routine->language = std::string(stmt->language);
  routine->body_stmts = stmt->body_stmts;

  bool ok = true;
  for (const FunctionParameter * p : stmt->parameters) {
    auto type = resolve_type_name(p->arg_type);
    if (!type) {
      ok = false;
      continue;
    }

    if (p->mode == ParamMode::In || p->mode == ParamMode::InOut ||
        p->mode == ParamMode::Variadic) {
      routine->params.push_back(RoutineParam{std::string(p->name), *type, p->mode, p->get_range()});
    }
    if (p->mode == ParamMode::Out || p->mode == ParamMode::InOut ||
        p->mode == ParamMode::Table) {
      ColumnDesc col;
      col.name = std::string(p->name);
      col.type = *type;
      col.range = p->get_range();
      routine->return_columns.push_back(std::move(col));
      if (p->mode == ParamMode::Table) routine->return_set = true;
    }
  }

  if (stmt->return_type) {
    auto type = resolve_type_name(stmt->return_type);
    if (!type) {
      ok = false;
    } else if (routine->return_columns.empty()) {
      routine->return_type = std::move(*type);
    }
    routine->return_set = routine->return_set || stmt->return_type->setof;
  } else if (routine->return_columns.empty()) {
    routine->return_type = TypeRef{Identifier(k_system_schema, "void"), 0};
  }

  if (!ok) return nullptr;
  return commit(std::move(routine));
}

void ObjectBuilder::build_extension(const CreateExtensionStmt * stmt)
{
  catalog_.add_extension(std::string(stmt->extname));
}

}  // namespace pg_sema
