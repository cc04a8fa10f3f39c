#include "pg_sema/syntax/parser.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/syntax/lexer.hpp"

namespace pg_sema::syntax
{
namespace
{

// Words that end an expression or a FROM item when they appear where an
// implicit alias could go.
constexpr std::string_view k_reserved[] = {
  "all",       "and",      "any",       "array",     "as",        "asc",        "between",
  "both",      "case",     "cast",      "check",     "collate",   "constraint", "create",
  "cross",     "default",  "desc",      "distinct",  "do",        "else",       "end",
  "except",    "exists",   "false",     "fetch",     "filter",    "for",        "foreign",
  "from",      "full",     "grant",     "group",     "having",    "ilike",      "in",
  "inner",     "intersect", "into",     "is",        "isnull",    "join",       "lateral",
  "leading",   "left",     "like",      "limit",     "natural",   "not",        "notnull",
  "null",      "offset",   "on",        "only",      "or",        "order",      "outer",
  "over",      "primary",  "references", "returning", "right",    "select",     "similar",
  "some",      "table",    "then",      "to",        "trailing",  "true",       "union",
  "unique",    "using",    "values",    "when",      "where",     "window",     "with",
};

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const { return is_kw(kw, cur(lookahead)); }

bool Parser::at_ident() const { return is_ident_token(cur()); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), std::string("expected ") + std::string(what));
  return false;
}

bool Parser::expect_kw(std::string_view kw)
{
  if (match_kw(kw)) {
    return true;
  }
  std::string upper(kw);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  error_at(cur(), "expected `" + upper + "`");
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  std::string label;
  if (t.kind == TokenKind::Eof) {
    label = "unexpected end of input";
  } else if (t.kind == TokenKind::Unknown) {
    label = "unrecognized token";
  } else {
    label = "unexpected `" + std::string(t.text) + "`";
  }
  diags_.report_error(t.range, std::string(msg), label).with_code(diag_code::k_syntax_error);
  ++error_count_;
}

void Parser::synchronize_to_stmt()
{
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LParen)) {
      ++depth;
    } else if (at(TokenKind::RParen) && depth > 0) {
      --depth;
    } else if (at(TokenKind::Semicolon) && depth == 0) {
      advance();
      return;
    }
    advance();
  }
}

void Parser::skip_balanced_parens()
{
  if (!at(TokenKind::LParen)) return;
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LParen)) {
      ++depth;
    } else if (at(TokenKind::RParen)) {
      --depth;
      if (depth == 0) {
        advance();
        return;
      }
    }
    advance();
  }
}

SourceRange Parser::range_from(const Token & start) const
{
  const Token & last = idx_ > 0 ? tokens_[idx_ - 1] : start;
  return join_ranges(start.range, last.range);
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  if (t.kind != TokenKind::Identifier || t.text.size() != kw.size()) {
    return false;
  }
  for (size_t i = 0; i < kw.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(t.text[i])) != kw[i]) {
      return false;
    }
  }
  return true;
}

bool Parser::is_reserved(const Token & t)
{
  return std::any_of(std::begin(k_reserved), std::end(k_reserved), [&](std::string_view k) {
    return is_kw(k, t);
  });
}

bool Parser::is_ident_token(const Token & t)
{
  return t.kind == TokenKind::Identifier || t.kind == TokenKind::QuotedIdentifier;
}

std::string_view Parser::ident_text(const Token & t)
{
  if (t.kind == TokenKind::QuotedIdentifier) {
    if (t.text.find("\"\"") == std::string_view::npos) {
      return ast_.intern(t.text);
    }
    std::string unescaped;
    for (size_t i = 0; i < t.text.size(); ++i) {
      unescaped.push_back(t.text[i]);
      if (t.text[i] == '"' && i + 1 < t.text.size() && t.text[i + 1] == '"') {
        ++i;
      }
    }
    return ast_.intern(unescaped);
  }
  return ast_.intern_folded(t.text);
}

std::optional<std::string_view> Parser::parse_identifier(std::string_view what)
{
  if (!at_ident()) {
    error_at(cur(), std::string("expected ") + std::string(what));
    return std::nullopt;
  }
  return ident_text(advance());
}

std::optional<std::vector<std::string_view>> Parser::parse_qualified_name(std::string_view what)
{
  std::vector<std::string_view> names;
  auto first = parse_identifier(what);
  if (!first) return std::nullopt;
  names.push_back(*first);

  while (at(TokenKind::Dot) && is_ident_token(cur(1))) {
    advance();
    names.push_back(ident_text(advance()));
  }
  return names;
}

std::optional<gsl::span<std::string_view>> Parser::parse_name_list()
{
  if (!expect(TokenKind::LParen, "`(`")) return std::nullopt;
  std::vector<std::string_view> names;
  do {
    auto name = parse_identifier("column name");
    if (!name) return std::nullopt;
    names.push_back(*name);
  } while (match(TokenKind::Comma));
  if (!expect(TokenKind::RParen, "`)`")) return std::nullopt;
  return ast_.copy_to_arena(names);
}

std::string_view Parser::string_value(const Token & t)
{
  const bool plain = t.kind == TokenKind::DollarString ||
                     (t.text.find('\'') == std::string_view::npos &&
                      (!t.escape || t.text.find('\\') == std::string_view::npos));
  if (plain) {
    return ast_.intern(t.text);
  }

  std::string out;
  out.reserve(t.text.size());
  for (size_t i = 0; i < t.text.size(); ++i) {
    const char c = t.text[i];
    if (c == '\'' && i + 1 < t.text.size() && t.text[i + 1] == '\'') {
      out.push_back('\'');
      ++i;
      continue;
    }
    if (t.escape && c == '\\' && i + 1 < t.text.size()) {
      const char e = t.text[++i];
      switch (e) {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case 'b':
          out.push_back('\b');
          break;
        case 'f':
          out.push_back('\f');
          break;
        default:
          out.push_back(e);
          break;
      }
      continue;
    }
    out.push_back(c);
  }
  return ast_.intern(out);
}

RangeVar * Parser::make_range_var(const std::vector<std::string_view> & names, SourceRange r)
{
  const std::string_view relname = names.back();
  const std::string_view schema = names.size() >= 2 ? names[names.size() - 2] : std::string_view{};
  return ast_.create<RangeVar>(schema, relname, r);
}

// ============================================================================
// Script
// ============================================================================

Script * Parser::parse_script()
{
  const Token & start = cur();
  auto * script = ast_.create<Script>();
  script->statements = parse_statement_list();
  script->range_ = join_ranges(start.range, cur().range);
  return script;
}

gsl::span<Stmt *> Parser::parse_statement_list()
{
  std::vector<Stmt *> stmts;

  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }

    const size_t errors_before = error_count_;
    Stmt * stmt = parse_statement();

    if (!stmt || error_count_ > errors_before) {
      synchronize_to_stmt();
      continue;
    }

    stmts.push_back(stmt);

    if (!at_eof() && !match(TokenKind::Semicolon)) {
      error_at(cur(), "expected `;` after statement");
      synchronize_to_stmt();
    }
  }

  return ast_.copy_to_arena(stmts);
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_statement()
{
  if (at_select_start()) {
    return parse_select_stmt();
  }
  if (at_kw("create")) {
    return parse_create();
  }
  if (cur().kind != TokenKind::Identifier) {
    error_at(cur(), "expected statement");
    return nullptr;
  }
  return parse_opaque(cur(), 1);
}

Stmt * Parser::parse_create()
{
  const Token & start = advance();  // CREATE

  bool replace = false;
  if (at_kw("or") && at_kw("replace", 1)) {
    advance();
    advance();
    replace = true;
  }

  // Persistence modifiers do not change the modelled shape.
  while (at_kw("temp") || at_kw("temporary") || at_kw("unlogged") || at_kw("global") ||
         at_kw("local")) {
    advance();
  }

  if (at_kw("table")) {
    return parse_create_table(start);
  }
  if (at_kw("type")) {
    return parse_create_type(start);
  }
  if (at_kw("view")) {
    return parse_create_view(start, replace, false);
  }
  if (at_kw("recursive") && at_kw("view", 1)) {
    advance();
    return parse_create_view(start, replace, false);
  }
  if (at_kw("materialized") && at_kw("view", 1)) {
    advance();
    return parse_create_view(start, replace, true);
  }
  if (at_kw("function") || at_kw("procedure")) {
    const bool procedure = at_kw("procedure");
    return parse_create_function(start, replace, procedure);
  }
  if (at_kw("extension")) {
    return parse_create_extension(start);
  }

  // CREATE INDEX, CREATE TRIGGER, CREATE SCHEMA, ...
  return parse_opaque(start, 2);
}

Stmt * Parser::parse_create_table(const Token & start)
{
  advance();  // TABLE

  bool if_not_exists = false;
  if (at_kw("if") && at_kw("not", 1) && at_kw("exists", 2)) {
    advance();
    advance();
    advance();
    if_not_exists = true;
  }

  const Token & name_tok = cur();
  auto names = parse_qualified_name("table name");
  if (!names) return nullptr;
  auto * relation = make_range_var(*names, range_from(name_tok));

  // CREATE TABLE ... AS / PARTITION OF / OF type are not modelled.
  if (!at(TokenKind::LParen)) {
    return parse_opaque(start, 2);
  }
  advance();

  std::vector<ColumnDef *> columns;
  std::vector<Constraint *> constraints;

  if (!at(TokenKind::RParen)) {
    do {
      if (at_kw("like")) {
        // LIKE other_table [options]: copies columns we cannot see here.
        while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RParen)) {
          advance();
        }
        continue;
      }
      if (
        at_kw("constraint") || at_kw("primary") || at_kw("unique") || at_kw("check") ||
        at_kw("foreign") || at_kw("exclude")) {
        Constraint * c = parse_table_constraint();
        if (!c) return nullptr;
        constraints.push_back(c);
        continue;
      }
      ColumnDef * col = parse_column_def(/*allow_constraints=*/true);
      if (!col) return nullptr;
      columns.push_back(col);
    } while (match(TokenKind::Comma));
  }

  if (!expect(TokenKind::RParen, "`)` after column definitions")) return nullptr;

  // INHERITS (...), PARTITION BY ..., WITH (...), TABLESPACE x, ...
  while (!at_eof() && !at(TokenKind::Semicolon)) {
    if (at(TokenKind::LParen)) {
      skip_balanced_parens();
    } else {
      advance();
    }
  }

  auto * stmt = ast_.create<CreateTableStmt>(relation, range_from(start));
  stmt->columns = ast_.copy_to_arena(columns);
  stmt->constraints = ast_.copy_to_arena(constraints);
  stmt->if_not_exists = if_not_exists;
  return stmt;
}

ColumnDef * Parser::parse_column_def(bool allow_constraints)
{
  const Token & start = cur();
  auto name = parse_identifier("column name");
  if (!name) return nullptr;

  const bool serial = at_kw("serial") || at_kw("bigserial") || at_kw("smallserial") ||
                      at_kw("serial4") || at_kw("serial8") || at_kw("serial2");

  TypeName * type = parse_type_name();
  if (!type) return nullptr;

  std::vector<Constraint *> constraints;
  if (serial) {
    // serial expands to an integer column with NOT NULL and a sequence default.
    constraints.push_back(ast_.create<Constraint>(ConstrType::NotNull, type->get_range()));
  }

  while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RParen) &&
         !at(TokenKind::Semicolon)) {
    if (match_kw("collate")) {
      auto collation = parse_qualified_name("collation name");
      if (!collation) return nullptr;
      continue;
    }
    if (!allow_constraints) {
      error_at(cur(), "expected `,` or `)`");
      return nullptr;
    }
    // Constraint timing: [NOT] DEFERRABLE, INITIALLY DEFERRED|IMMEDIATE
    if (at_kw("deferrable") || (at_kw("not") && at_kw("deferrable", 1))) {
      match_kw("not");
      advance();
      continue;
    }
    if (match_kw("initially")) {
      advance();
      continue;
    }
    Constraint * c = parse_column_constraint();
    if (!c) return nullptr;
    constraints.push_back(c);
  }

  auto * col = ast_.create<ColumnDef>(*name, type, range_from(start));
  col->constraints = ast_.copy_to_arena(constraints);
  return col;
}

Constraint * Parser::parse_column_constraint()
{
  const Token & start = cur();

  std::string_view conname;
  if (match_kw("constraint")) {
    auto name = parse_identifier("constraint name");
    if (!name) return nullptr;
    conname = *name;
  }

  Constraint * c = nullptr;

  if (at_kw("not") && at_kw("null", 1)) {
    advance();
    advance();
    c = ast_.create<Constraint>(ConstrType::NotNull);
  } else if (match_kw("null")) {
    c = ast_.create<Constraint>(ConstrType::Null);
  } else if (at_kw("primary") && at_kw("key", 1)) {
    advance();
    advance();
    c = ast_.create<Constraint>(ConstrType::PrimaryKey);
  } else if (match_kw("unique")) {
    if (at_kw("nulls")) {
      advance();
      match_kw("not");
      expect_kw("distinct");
    }
    c = ast_.create<Constraint>(ConstrType::Unique);
  } else if (match_kw("default")) {
    c = ast_.create<Constraint>(ConstrType::Default);
    c->raw_expr = parse_other_op();
    if (!c->raw_expr) return nullptr;
  } else if (match_kw("check")) {
    c = ast_.create<Constraint>(ConstrType::Check);
    if (!expect(TokenKind::LParen, "`(` after CHECK")) return nullptr;
    c->raw_expr = parse_expr();
    if (!c->raw_expr) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    if (at_kw("no") && at_kw("inherit", 1)) {
      advance();
      advance();
    }
  } else if (at_kw("references")) {
    c = ast_.create<Constraint>(ConstrType::ForeignKey);
    if (!parse_references(c)) return nullptr;
  } else if (match_kw("generated")) {
    c = ast_.create<Constraint>(ConstrType::Generated);
    if (!match_kw("always")) {
      if (!expect_kw("by") || !expect_kw("default")) return nullptr;
    }
    if (!expect_kw("as")) return nullptr;
    if (match_kw("identity")) {
      skip_balanced_parens();
    } else {
      if (!expect(TokenKind::LParen, "`(`")) return nullptr;
      c->raw_expr = parse_expr();
      if (!c->raw_expr) return nullptr;
      if (!expect(TokenKind::RParen, "`)`")) return nullptr;
      match_kw("stored");
    }
  } else {
    error_at(cur(), "expected column constraint");
    return nullptr;
  }

  c->conname = conname;
  c->range_ = range_from(start);
  return c;
}

bool Parser::parse_references(Constraint * c)
{
  if (!expect_kw("references")) return false;

  const Token & name_tok = cur();
  auto names = parse_qualified_name("referenced table name");
  if (!names) return false;
  c->pktable = make_range_var(*names, range_from(name_tok));

  if (at(TokenKind::LParen)) {
    auto cols = parse_name_list();
    if (!cols) return false;
    c->pk_attrs = *cols;
  }

  // MATCH FULL|PARTIAL|SIMPLE, ON DELETE/UPDATE action, deferrability
  while (true) {
    if (match_kw("match")) {
      advance();
      continue;
    }
    if (at_kw("on") && (at_kw("delete", 1) || at_kw("update", 1))) {
      advance();
      advance();
      if (match_kw("no")) {
        if (!expect_kw("action")) return false;
      } else if (match_kw("set")) {
        advance();  // NULL | DEFAULT
        if (at(TokenKind::LParen)) {
          auto cols = parse_name_list();
          if (!cols) return false;
        }
      } else if (!match_kw("cascade") && !match_kw("restrict")) {
        error_at(cur(), "expected referential action");
        return false;
      }
      continue;
    }
    break;
  }
  return true;
}

Constraint * Parser::parse_table_constraint()
{
  const Token & start = cur();

  std::string_view conname;
  if (match_kw("constraint")) {
    auto name = parse_identifier("constraint name");
    if (!name) return nullptr;
    conname = *name;
  }

  Constraint * c = nullptr;

  if (at_kw("primary") && at_kw("key", 1)) {
    advance();
    advance();
    c = ast_.create<Constraint>(ConstrType::PrimaryKey);
    auto keys = parse_name_list();
    if (!keys) return nullptr;
    c->keys = *keys;
  } else if (match_kw("unique")) {
    c = ast_.create<Constraint>(ConstrType::Unique);
    if (at_kw("nulls")) {
      advance();
      match_kw("not");
      if (!expect_kw("distinct")) return nullptr;
    }
    auto keys = parse_name_list();
    if (!keys) return nullptr;
    c->keys = *keys;
  } else if (match_kw("check")) {
    c = ast_.create<Constraint>(ConstrType::Check);
    if (!expect(TokenKind::LParen, "`(` after CHECK")) return nullptr;
    c->raw_expr = parse_expr();
    if (!c->raw_expr) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
  } else if (at_kw("foreign") && at_kw("key", 1)) {
    advance();
    advance();
    c = ast_.create<Constraint>(ConstrType::ForeignKey);
    auto keys = parse_name_list();
    if (!keys) return nullptr;
    c->keys = *keys;
    if (!parse_references(c)) return nullptr;
  } else if (match_kw("exclude")) {
    // EXCLUDE [USING method] (elements) [WHERE (predicate)]
    c = ast_.create<Constraint>(ConstrType::Check);
    while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RParen)) {
      if (at(TokenKind::LParen)) {
        skip_balanced_parens();
      } else {
        advance();
      }
    }
  } else {
    error_at(cur(), "expected table constraint");
    return nullptr;
  }

  // INCLUDE (...), USING INDEX TABLESPACE x, DEFERRABLE, NOT VALID, ...
  while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::RParen)) {
    if (at(TokenKind::LParen)) {
      skip_balanced_parens();
    } else {
      advance();
    }
  }

  c->conname = conname;
  c->range_ = range_from(start);
  return c;
}

Stmt * Parser::parse_create_type(const Token & start)
{
  advance();  // TYPE

  const Token & name_tok = cur();
  auto names = parse_qualified_name("type name");
  if (!names) return nullptr;
  auto * typevar = make_range_var(*names, range_from(name_tok));

  if (!at_kw("as")) {
    // Base types and shell types.
    return parse_opaque(start, 2);
  }
  advance();

  if (match_kw("enum")) {
    if (!expect(TokenKind::LParen, "`(` after ENUM")) return nullptr;
    std::vector<std::string_view> labels;
    if (!at(TokenKind::RParen)) {
      do {
        if (!at(TokenKind::StringLiteral)) {
          error_at(cur(), "expected enum label string");
          return nullptr;
        }
        labels.push_back(string_value(advance()));
      } while (match(TokenKind::Comma));
    }
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    return ast_.create<CreateEnumStmt>(typevar, ast_.copy_to_arena(labels), range_from(start));
  }

  if (!at(TokenKind::LParen)) {
    // AS RANGE (...) and friends.
    return parse_opaque(start, 2);
  }
  advance();

  std::vector<ColumnDef *> columns;
  if (!at(TokenKind::RParen)) {
    do {
      ColumnDef * col = parse_column_def(/*allow_constraints=*/false);
      if (!col) return nullptr;
      columns.push_back(col);
    } while (match(TokenKind::Comma));
  }
  if (!expect(TokenKind::RParen, "`)` after attribute list")) return nullptr;

  auto * stmt = ast_.create<CompositeTypeStmt>(typevar, range_from(start));
  stmt->coldeflist = ast_.copy_to_arena(columns);
  return stmt;
}

Stmt * Parser::parse_create_view(const Token & start, bool replace, bool materialized)
{
  advance();  // VIEW

  if (at_kw("if") && at_kw("not", 1) && at_kw("exists", 2)) {
    advance();
    advance();
    advance();
  }

  const Token & name_tok = cur();
  auto names = parse_qualified_name("view name");
  if (!names) return nullptr;
  auto * view = make_range_var(*names, range_from(name_tok));

  gsl::span<std::string_view> aliases;
  if (at(TokenKind::LParen)) {
    auto cols = parse_name_list();
    if (!cols) return nullptr;
    aliases = *cols;
  }

  // USING method, WITH (options), TABLESPACE name
  while (!at_eof() && !at_kw("as")) {
    if (at(TokenKind::LParen)) {
      skip_balanced_parens();
    } else if (at(TokenKind::Semicolon)) {
      break;
    } else {
      advance();
    }
  }
  if (!expect_kw("as")) return nullptr;

  if (!at_select_start()) {
    error_at(cur(), "expected query after AS");
    return nullptr;
  }
  SelectStmt * query = parse_select_stmt();
  if (!query) return nullptr;

  // WITH [CASCADED|LOCAL] CHECK OPTION, WITH [NO] DATA
  if (match_kw("with")) {
    while (!at_eof() && !at(TokenKind::Semicolon)) {
      advance();
    }
  }

  auto * stmt = ast_.create<ViewStmt>(view, query, range_from(start));
  stmt->aliases = aliases;
  stmt->replace = replace;
  stmt->materialized = materialized;
  return stmt;
}

FunctionParameter * Parser::parse_function_parameter()
{
  const Token & start = cur();

  ParamMode mode = ParamMode::In;
  if (match_kw("in")) {
    mode = match_kw("out") ? ParamMode::InOut : ParamMode::In;
  } else if (match_kw("out")) {
    mode = ParamMode::Out;
  } else if (match_kw("inout")) {
    mode = ParamMode::InOut;
  } else if (match_kw("variadic")) {
    mode = ParamMode::Variadic;
  }

  // `name type` or just `type`. Multi-word type spellings start with a word
  // that is also a valid parameter name, so look at the token after it.
  std::string_view name;
  const Token & next = cur(1);
  const bool next_continues_type =
    next.kind == TokenKind::Dot || next.kind == TokenKind::LParen ||
    next.kind == TokenKind::LBracket || next.kind == TokenKind::Comma ||
    next.kind == TokenKind::RParen || next.kind == TokenKind::Eq ||
    next.kind == TokenKind::Percent || is_kw("default", next) ||
    (at_kw("double") && is_kw("precision", next)) ||
    ((at_kw("character") || at_kw("char") || at_kw("bit")) && is_kw("varying", next)) ||
    ((at_kw("timestamp") || at_kw("time")) && (is_kw("with", next) || is_kw("without", next)));
  if (at_ident() && !next_continues_type && is_ident_token(next)) {
    name = ident_text(advance());
  }

  TypeName * type = parse_type_name();
  if (!type) return nullptr;

  auto * param = ast_.create<FunctionParameter>(name, type, mode);
  if (match_kw("default") || match(TokenKind::Eq)) {
    param->defexpr = parse_expr();
    if (!param->defexpr) return nullptr;
  }
  param->range_ = range_from(start);
  return param;
}

Stmt * Parser::parse_create_function(const Token & start, bool replace, bool procedure)
{
  advance();  // FUNCTION | PROCEDURE

  auto names = parse_qualified_name(procedure ? "procedure name" : "function name");
  if (!names) return nullptr;

  auto * fn = ast_.create<CreateFunctionStmt>(ast_.copy_to_arena(*names));
  fn->is_procedure = procedure;
  fn->replace = replace;

  if (!expect(TokenKind::LParen, "`(` after routine name")) return nullptr;
  std::vector<FunctionParameter *> params;
  if (!at(TokenKind::RParen)) {
    do {
      FunctionParameter * p = parse_function_parameter();
      if (!p) return nullptr;
      params.push_back(p);
    } while (match(TokenKind::Comma));
  }
  if (!expect(TokenKind::RParen, "`)` after parameter list")) return nullptr;

  if (match_kw("returns")) {
    if (match_kw("table")) {
      if (!expect(TokenKind::LParen, "`(` after RETURNS TABLE")) return nullptr;
      do {
        const Token & col_start = cur();
        auto col_name = parse_identifier("column name");
        if (!col_name) return nullptr;
        TypeName * col_type = parse_type_name();
        if (!col_type) return nullptr;
        params.push_back(
          ast_.create<FunctionParameter>(*col_name, col_type, ParamMode::Table, range_from(col_start)));
      } while (match(TokenKind::Comma));
      if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    } else {
      const bool setof = match_kw("setof");
      fn->return_type = parse_type_name();
      if (!fn->return_type) return nullptr;
      fn->return_type->setof = setof;
    }
  }
  fn->parameters = ast_.copy_to_arena(params);

  // Routine options, in any order.
  const Token * body_tok = nullptr;
  while (!at_eof() && !at(TokenKind::Semicolon)) {
    if (match_kw("language")) {
      if (at(TokenKind::StringLiteral)) {
        fn->language = ast_.intern_folded(string_value(advance()));
      } else {
        auto lang = parse_identifier("language name");
        if (!lang) return nullptr;
        fn->language = *lang;
      }
      continue;
    }
    if (match_kw("as")) {
      if (!at(TokenKind::StringLiteral) && !at(TokenKind::DollarString)) {
        error_at(cur(), "expected routine body string");
        return nullptr;
      }
      body_tok = &advance();
      if (match(TokenKind::Comma)) {
        advance();  // link symbol of C functions
      }
      continue;
    }
    if (at_kw("return")) {
      // SQL-standard body: RETURN expr
      const Token & ret_start = advance();
      Expr * value = parse_expr();
      if (!value) return nullptr;
      auto * select = ast_.create<SelectStmt>(range_from(ret_start));
      std::vector<ResTarget *> targets{ast_.create<ResTarget>("", value, value->get_range())};
      select->target_list = ast_.copy_to_arena(targets);
      std::vector<Stmt *> body{select};
      fn->body_stmts = ast_.copy_to_arena(body);
      fn->body_range = select->get_range();
      continue;
    }
    if (at_kw("begin") && at_kw("atomic", 1)) {
      const Token & body_start = advance();
      advance();
      std::vector<Stmt *> body;
      while (!at_eof() && !at_kw("end")) {
        if (match(TokenKind::Semicolon)) continue;
        Stmt * s = parse_statement();
        if (!s) return nullptr;
        body.push_back(s);
      }
      if (!expect_kw("end")) return nullptr;
      fn->body_stmts = ast_.copy_to_arena(body);
      fn->body_range = range_from(body_start);
      continue;
    }
    if (at(TokenKind::LParen)) {
      skip_balanced_parens();
      continue;
    }
    advance();
  }

  if (body_tok) {
    parse_routine_body(fn, *body_tok);
  }

  fn->range_ = range_from(start);
  return fn;
}

void Parser::parse_routine_body(CreateFunctionStmt * fn, const Token & body)
{
  fn->body = string_value(body);

  if (fn->language != "sql") {
    // Procedural bodies are kept as text only.
    fn->body_range = body.range;
    return;
  }

  // Lex the body where it sits in the file when the text is unchanged by
  // unescaping, so diagnostics point into the routine definition.
  const std::string_view content = source_.content();
  const bool in_place = fn->body == body.text && body.text.data() >= content.data() &&
                        body.text.data() + body.text.size() <= content.data() + content.size();

  std::vector<Token> tokens;
  if (in_place) {
    const auto begin = static_cast<size_t>(body.text.data() - content.data());
    fn->body_range = SourceRange(
      file_id_, static_cast<uint32_t>(begin), static_cast<uint32_t>(begin + body.text.size()));
    tokens = Lexer(file_id_, content, begin, begin + body.text.size()).lex_all();
  } else {
    // Unescaped copy ('' inside a quoted body): offsets no longer map to the file.
    fn->body_range = body.range;
    tokens = Lexer(FileId::invalid(), fn->body).lex_all();
  }

  Parser body_parser(ast_, file_id_, source_, diags_, std::move(tokens));
  fn->body_stmts = body_parser.parse_statement_list();
  error_count_ += body_parser.error_count();
}

Stmt * Parser::parse_create_extension(const Token & start)
{
  advance();  // EXTENSION

  bool if_not_exists = false;
  if (at_kw("if") && at_kw("not", 1) && at_kw("exists", 2)) {
    advance();
    advance();
    advance();
    if_not_exists = true;
  }

  auto name = parse_identifier("extension name");
  if (!name) return nullptr;

  auto * stmt = ast_.create<CreateExtensionStmt>(*name);
  stmt->if_not_exists = if_not_exists;

  match_kw("with");
  while (!at_eof() && !at(TokenKind::Semicolon)) {
    if (match_kw("schema")) {
      auto schema = parse_identifier("schema name");
      if (!schema) return nullptr;
      stmt->schema = *schema;
      continue;
    }
    advance();  // VERSION x, CASCADE
  }

  stmt->range_ = range_from(start);
  return stmt;
}

Stmt * Parser::parse_opaque(const Token & start, size_t keyword_tokens)
{
  // Keyword: leading words, e.g. "create index", "alter table", "insert".
  const size_t first = static_cast<size_t>(&start - tokens_.data());
  std::string keyword;
  for (size_t i = first; i < tokens_.size() && i < first + keyword_tokens; ++i) {
    const Token & t = tokens_[i];
    if (t.kind != TokenKind::Identifier) break;
    if (is_kw("or", t) || is_kw("replace", t) || is_kw("unique", t)) {
      ++keyword_tokens;
      continue;
    }
    if (!keyword.empty()) keyword += ' ';
    std::string word(t.text);
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    keyword += word;
  }

  // Skip to the end of the statement.
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LParen)) {
      ++depth;
    } else if (at(TokenKind::RParen) && depth > 0) {
      --depth;
    } else if (at(TokenKind::Semicolon) && depth == 0) {
      break;
    }
    advance();
  }

  const SourceRange range = range_from(start);
  diags_.report_warning(range, "unhandled statement `" + keyword + "`", "skipped by the analyzer")
    .with_code(diag_code::k_unhandled_statement);
  return ast_.create<OpaqueStmt>(ast_.intern(keyword), range);
}

}  // namespace pg_sema::syntax
