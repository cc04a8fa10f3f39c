// pg_sema/syntax/parse_query.cpp - SELECT, FROM and WITH grammar
#include <string>

#include "pg_sema/syntax/parser.hpp"

namespace pg_sema::syntax
{

bool Parser::at_select_start(size_t lookahead) const
{
  const Token & t = cur(lookahead);
  if (is_kw("select", t) || is_kw("with", t) || is_kw("values", t)) {
    return true;
  }
  if (t.kind == TokenKind::LParen) {
    return at_select_start(lookahead + 1);
  }
  return false;
}

// ============================================================================
// SELECT
// ============================================================================

SelectStmt * Parser::parse_select_stmt()
{
  const Token & start = cur();

  WithClause * with = nullptr;
  if (at_kw("with")) {
    with = parse_with_clause();
    if (!with) return nullptr;
  }

  SelectStmt * stmt = parse_union_level();
  if (!stmt) return nullptr;

  if (at_kw("order") && at_kw("by", 1)) {
    advance();
    advance();
    auto sort = parse_sort_list();
    if (!sort) return nullptr;
    stmt->sort_clause = *sort;
  }

  while (true) {
    if (match_kw("limit")) {
      if (!match_kw("all")) {
        stmt->limit_count = parse_expr();
        if (!stmt->limit_count) return nullptr;
      }
      continue;
    }
    if (match_kw("offset")) {
      stmt->limit_offset = parse_expr();
      if (!stmt->limit_offset) return nullptr;
      if (!match_kw("row")) match_kw("rows");
      continue;
    }
    if (match_kw("fetch")) {
      // FETCH {FIRST|NEXT} [n] {ROW|ROWS} {ONLY|WITH TIES}
      advance();
      if (!at_kw("row") && !at_kw("rows")) {
        stmt->limit_count = parse_other_op();
        if (!stmt->limit_count) return nullptr;
      }
      advance();
      if (match_kw("with")) {
        if (!expect_kw("ties")) return nullptr;
      } else if (!expect_kw("only")) {
        return nullptr;
      }
      continue;
    }
    if (at_kw("for") && (at_kw("update", 1) || at_kw("share", 1) || at_kw("no", 1) ||
                         at_kw("key", 1))) {
      // Row locking clauses do not affect the result shape.
      while (!at_eof() && !at(TokenKind::Semicolon) && !at(TokenKind::RParen)) {
        advance();
      }
      continue;
    }
    break;
  }

  if (with) {
    if (stmt->with_clause) {
      std::vector<CommonTableExpr *> merged(with->ctes.begin(), with->ctes.end());
      merged.insert(merged.end(), stmt->with_clause->ctes.begin(), stmt->with_clause->ctes.end());
      with->ctes = ast_.copy_to_arena(merged);
      with->recursive = with->recursive || stmt->with_clause->recursive;
    }
    stmt->with_clause = with;
  }

  stmt->range_ = range_from(start);
  return stmt;
}

SelectStmt * Parser::parse_union_level()
{
  const Token & start = cur();
  SelectStmt * left = parse_intersect_level();
  if (!left) return nullptr;

  while (at_kw("union") || at_kw("except")) {
    const SetOperation op = at_kw("union") ? SetOperation::Union : SetOperation::Except;
    advance();
    const bool all = match_kw("all");
    if (!all) match_kw("distinct");

    SelectStmt * right = parse_intersect_level();
    if (!right) return nullptr;

    auto * node = ast_.create<SelectStmt>(range_from(start));
    node->op = op;
    node->all = all;
    node->larg = left;
    node->rarg = right;
    left = node;
  }
  return left;
}

SelectStmt * Parser::parse_intersect_level()
{
  const Token & start = cur();
  SelectStmt * left = parse_select_primary();
  if (!left) return nullptr;

  while (match_kw("intersect")) {
    const bool all = match_kw("all");
    if (!all) match_kw("distinct");

    SelectStmt * right = parse_select_primary();
    if (!right) return nullptr;

    auto * node = ast_.create<SelectStmt>(range_from(start));
    node->op = SetOperation::Intersect;
    node->all = all;
    node->larg = left;
    node->rarg = right;
    left = node;
  }
  return left;
}

SelectStmt * Parser::parse_select_primary()
{
  if (match(TokenKind::LParen)) {
    SelectStmt * inner = parse_select_stmt();
    if (!inner) return nullptr;
    if (!expect(TokenKind::RParen, "`)` after sub-select")) return nullptr;
    return inner;
  }
  if (at_kw("values")) {
    return parse_values();
  }
  if (at_kw("select")) {
    return parse_simple_select();
  }
  if (at_kw("table")) {
    // TABLE name is SELECT * FROM name
    const Token & start = advance();
    const Token & name_tok = cur();
    auto names = parse_qualified_name("table name");
    if (!names) return nullptr;
    auto * stmt = ast_.create<SelectStmt>();
    std::vector<ResTarget *> targets{ast_.create<ResTarget>(
      "", ast_.create<ColumnRef>(gsl::span<std::string_view>{}, true, start.range), start.range)};
    std::vector<FromItem *> from{make_range_var(*names, range_from(name_tok))};
    stmt->target_list = ast_.copy_to_arena(targets);
    stmt->from_clause = ast_.copy_to_arena(from);
    stmt->range_ = range_from(start);
    return stmt;
  }
  error_at(cur(), "expected SELECT");
  return nullptr;
}

bool Parser::at_target_list_end() const
{
  if (at_eof() || at(TokenKind::Semicolon) || at(TokenKind::RParen)) {
    return true;
  }
  static constexpr std::string_view k_clause_words[] = {
    "from",   "where", "group", "having", "window", "union", "intersect",
    "except", "order", "limit", "offset", "fetch",  "for",   "into",
  };
  for (const std::string_view kw : k_clause_words) {
    if (at_kw(kw)) return true;
  }
  return false;
}

SelectStmt * Parser::parse_simple_select()
{
  const Token & start = advance();  // SELECT
  auto * stmt = ast_.create<SelectStmt>();

  if (!match_kw("all") && match_kw("distinct")) {
    stmt->distinct = true;
    if (match_kw("on")) {
      if (!expect(TokenKind::LParen, "`(` after DISTINCT ON")) return nullptr;
      auto on = parse_expr_list();
      if (!on) return nullptr;
      if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    }
  }

  std::vector<ResTarget *> targets;
  if (!at_target_list_end()) {
    do {
      ResTarget * target = parse_target();
      if (!target) return nullptr;
      targets.push_back(target);
    } while (match(TokenKind::Comma));
  }
  stmt->target_list = ast_.copy_to_arena(targets);

  if (at_kw("into")) {
    error_at(cur(), "SELECT INTO is not supported; use CREATE TABLE AS");
    return nullptr;
  }

  if (match_kw("from")) {
    std::vector<FromItem *> items;
    do {
      FromItem * item = parse_from_item();
      if (!item) return nullptr;
      items.push_back(item);
    } while (match(TokenKind::Comma));
    stmt->from_clause = ast_.copy_to_arena(items);
  }

  if (match_kw("where")) {
    stmt->where_clause = parse_expr();
    if (!stmt->where_clause) return nullptr;
  }

  if (at_kw("group") && at_kw("by", 1)) {
    advance();
    advance();
    if (!match_kw("all")) match_kw("distinct");
    std::vector<Expr *> groups;
    do {
      if (at_kw("rollup") || at_kw("cube") || at_kw("grouping")) {
        // Grouping sets only affect which rows are produced.
        advance();
        match_kw("sets");
        skip_balanced_parens();
        continue;
      }
      if (at(TokenKind::LParen) && cur(1).kind == TokenKind::RParen) {
        advance();
        advance();
        continue;
      }
      Expr * e = parse_expr();
      if (!e) return nullptr;
      groups.push_back(e);
    } while (match(TokenKind::Comma));
    stmt->group_clause = ast_.copy_to_arena(groups);
  }

  if (match_kw("having")) {
    stmt->having_clause = parse_expr();
    if (!stmt->having_clause) return nullptr;
  }

  if (match_kw("window")) {
    // WINDOW name AS (spec) {, name AS (spec)}
    do {
      auto name = parse_identifier("window name");
      if (!name) return nullptr;
      if (!expect_kw("as")) return nullptr;
      if (!at(TokenKind::LParen)) {
        error_at(cur(), "expected window specification");
        return nullptr;
      }
      skip_balanced_parens();
    } while (match(TokenKind::Comma));
  }

  stmt->range_ = range_from(start);
  return stmt;
}

SelectStmt * Parser::parse_values()
{
  const Token & start = advance();  // VALUES
  auto * stmt = ast_.create<SelectStmt>();

  // Output columns are named column1..N after the first row.
  bool first_row = true;
  do {
    if (!expect(TokenKind::LParen, "`(` to start VALUES row")) return nullptr;
    auto row = parse_expr_list();
    if (!row) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;

    if (first_row) {
      std::vector<ResTarget *> targets;
      for (size_t i = 0; i < row->size(); ++i) {
        Expr * e = (*row)[i];
        const std::string_view name = ast_.intern("column" + std::to_string(i + 1));
        targets.push_back(ast_.create<ResTarget>(name, e, e->get_range()));
      }
      stmt->target_list = ast_.copy_to_arena(targets);
      first_row = false;
    }
  } while (match(TokenKind::Comma));

  stmt->range_ = range_from(start);
  return stmt;
}

ResTarget * Parser::parse_target()
{
  const Token & start = cur();

  if (at(TokenKind::Star)) {
    advance();
    auto * ref = ast_.create<ColumnRef>(gsl::span<std::string_view>{}, true, start.range);
    return ast_.create<ResTarget>("", ref, start.range);
  }

  Expr * value = parse_expr();
  if (!value) return nullptr;

  std::string_view name;
  if (match_kw("as")) {
    auto alias = parse_identifier("column alias");
    if (!alias) return nullptr;
    name = *alias;
  } else if (at(TokenKind::QuotedIdentifier) || (at(TokenKind::Identifier) && !is_reserved(cur()))) {
    name = ident_text(advance());
  }

  return ast_.create<ResTarget>(name, value, range_from(start));
}

std::optional<gsl::span<Expr *>> Parser::parse_sort_list()
{
  std::vector<Expr *> items;
  do {
    Expr * e = parse_expr();
    if (!e) return std::nullopt;
    items.push_back(e);

    if (!match_kw("asc") && !match_kw("desc") && match_kw("using")) {
      advance();  // operator
    }
    if (match_kw("nulls")) {
      if (!match_kw("first") && !expect_kw("last")) return std::nullopt;
    }
  } while (match(TokenKind::Comma));
  return ast_.copy_to_arena(items);
}

// ============================================================================
// FROM
// ============================================================================

FromItem * Parser::parse_from_item()
{
  const Token & start = cur();
  FromItem * left = parse_table_ref();
  if (!left) return nullptr;

  while (true) {
    const bool natural = match_kw("natural");

    JoinType type = JoinType::Inner;
    if (match_kw("cross")) {
      type = JoinType::Cross;
      if (!expect_kw("join")) return nullptr;
    } else if (match_kw("join")) {
      type = JoinType::Inner;
    } else if (match_kw("inner")) {
      if (!expect_kw("join")) return nullptr;
    } else if (at_kw("left") || at_kw("right") || at_kw("full")) {
      type = at_kw("left") ? JoinType::Left : (at_kw("right") ? JoinType::Right : JoinType::Full);
      advance();
      match_kw("outer");
      if (!expect_kw("join")) return nullptr;
    } else {
      if (natural) {
        error_at(cur(), "expected JOIN after NATURAL");
        return nullptr;
      }
      break;
    }

    FromItem * right = parse_table_ref();
    if (!right) return nullptr;

    auto * join = ast_.create<JoinExpr>(type, left, right);
    join->natural = natural;

    if (type != JoinType::Cross && !natural) {
      if (match_kw("on")) {
        join->quals = parse_expr();
        if (!join->quals) return nullptr;
      } else if (match_kw("using")) {
        auto cols = parse_name_list();
        if (!cols) return nullptr;
        join->using_clause = *cols;
        if (at_kw("as")) {
          join->alias = parse_alias_opt();
        }
      } else {
        error_at(cur(), "expected ON or USING after JOIN");
        return nullptr;
      }
    }

    join->range_ = range_from(start);
    left = join;
  }

  return left;
}

FromItem * Parser::parse_table_ref()
{
  const Token & start = cur();
  const bool lateral = match_kw("lateral");

  if (at(TokenKind::LParen)) {
    if (at_select_start(1)) {
      advance();
      SelectStmt * query = parse_select_stmt();
      if (!query) return nullptr;
      if (!expect(TokenKind::RParen, "`)` after sub-select")) return nullptr;

      auto * sub = ast_.create<RangeSubselect>(query);
      sub->lateral = lateral;
      sub->alias = parse_alias_opt();
      sub->range_ = range_from(start);
      return sub;
    }

    // Parenthesized join tree
    advance();
    FromItem * inner = parse_from_item();
    if (!inner) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    if (auto * join = dyn_cast<JoinExpr>(inner)) {
      join->alias = parse_alias_opt();
    }
    return inner;
  }

  match_kw("only");

  if (!at_ident() || (at(TokenKind::Identifier) && is_reserved(cur()))) {
    error_at(cur(), "expected table name or sub-select");
    return nullptr;
  }

  auto names = parse_qualified_name("table name");
  if (!names) return nullptr;

  if (at(TokenKind::LParen)) {
    Expr * call = parse_func_call(ast_.copy_to_arena(*names), start);
    if (!call) return nullptr;
    if (at_kw("with") && at_kw("ordinality", 1)) {
      advance();
      advance();
    }
    auto * fn = ast_.create<RangeFunction>(cast<FuncCall>(call));
    fn->lateral = lateral;
    fn->alias = parse_alias_opt();
    fn->range_ = range_from(start);
    return fn;
  }

  match(TokenKind::Star);  // inheritance marker: t *

  auto * rv = make_range_var(*names, range_from(start));
  rv->alias = parse_alias_opt();
  rv->range_ = range_from(start);
  return rv;
}

Alias * Parser::parse_alias_opt()
{
  const Token & start = cur();

  std::string_view name;
  if (match_kw("as")) {
    auto alias = parse_identifier("alias");
    if (!alias) return nullptr;
    name = *alias;
  } else if (at(TokenKind::QuotedIdentifier) || (at(TokenKind::Identifier) && !is_reserved(cur()))) {
    name = ident_text(advance());
  } else {
    return nullptr;
  }

  std::vector<std::string_view> cols;
  if (match(TokenKind::LParen)) {
    do {
      auto col = parse_identifier("column alias");
      if (!col) return nullptr;
      cols.push_back(*col);
      // Column definition lists of record functions: AS t(a int, b text)
      while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RParen)) {
        if (at(TokenKind::LParen)) {
          skip_balanced_parens();
        } else {
          advance();
        }
      }
    } while (match(TokenKind::Comma));
    if (!expect(TokenKind::RParen, "`)` after column aliases")) return nullptr;
  }

  return ast_.create<Alias>(name, ast_.copy_to_arena(cols), range_from(start));
}

// ============================================================================
// WITH
// ============================================================================

WithClause * Parser::parse_with_clause()
{
  const Token & start = advance();  // WITH
  const bool recursive = match_kw("recursive");

  std::vector<CommonTableExpr *> ctes;
  do {
    CommonTableExpr * cte = parse_cte();
    if (!cte) return nullptr;
    ctes.push_back(cte);
  } while (match(TokenKind::Comma));

  auto * with = ast_.create<WithClause>(ast_.copy_to_arena(ctes), range_from(start));
  with->recursive = recursive;
  return with;
}

CommonTableExpr * Parser::parse_cte()
{
  const Token & start = cur();
  auto name = parse_identifier("CTE name");
  if (!name) return nullptr;

  gsl::span<std::string_view> cols;
  if (at(TokenKind::LParen)) {
    auto names = parse_name_list();
    if (!names) return nullptr;
    cols = *names;
  }

  if (!expect_kw("as")) return nullptr;

  CteMaterialize materialized = CteMaterialize::Default;
  if (match_kw("materialized")) {
    materialized = CteMaterialize::Always;
  } else if (at_kw("not") && at_kw("materialized", 1)) {
    advance();
    advance();
    materialized = CteMaterialize::Never;
  }

  if (!expect(TokenKind::LParen, "`(` before CTE body")) return nullptr;

  Stmt * query = nullptr;
  if (at_select_start()) {
    query = parse_select_stmt();
    if (!query) return nullptr;
  } else {
    // INSERT / UPDATE / DELETE ... RETURNING: kept opaque.
    const Token & body_start = cur();
    if (body_start.kind != TokenKind::Identifier) {
      error_at(body_start, "expected CTE body");
      return nullptr;
    }
    const std::string_view keyword = ast_.intern_folded(body_start.text);
    int depth = 0;
    while (!at_eof()) {
      if (at(TokenKind::LParen)) {
        ++depth;
      } else if (at(TokenKind::RParen)) {
        if (depth == 0) break;
        --depth;
      }
      advance();
    }
    query = ast_.create<OpaqueStmt>(keyword, range_from(body_start));
  }

  if (!expect(TokenKind::RParen, "`)` after CTE body")) return nullptr;

  auto * cte = ast_.create<CommonTableExpr>(*name, cols, query, range_from(start));
  cte->materialized = materialized;
  return cte;
}

}  // namespace pg_sema::syntax
