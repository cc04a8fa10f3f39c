// pg_sema/syntax/parse_expr.cpp - Expression and type-name grammar
#include <charconv>
#include <string>

#include "pg_sema/syntax/parser.hpp"

namespace pg_sema::syntax
{
namespace
{

/// Catalog spelling of single-word SQL type names.
std::string_view normalize_type_word(std::string_view word)
{
  struct Alias
  {
    std::string_view sql;
    std::string_view catalog;
  };
  static constexpr Alias k_aliases[] = {
    {"integer", "int4"},     {"int", "int4"},         {"bigint", "int8"},
    {"smallint", "int2"},    {"real", "float4"},      {"float", "float8"},
    {"boolean", "bool"},     {"decimal", "numeric"},  {"dec", "numeric"},
    {"serial", "int4"},      {"serial4", "int4"},     {"bigserial", "int8"},
    {"serial8", "int8"},     {"smallserial", "int2"}, {"serial2", "int2"},
    {"character", "bpchar"}, {"char", "bpchar"},
  };
  for (const auto & a : k_aliases) {
    if (a.sql == word) return a.catalog;
  }
  return word;
}

bool is_comparison(TokenKind k)
{
  return k == TokenKind::Eq || k == TokenKind::Ne || k == TokenKind::Lt || k == TokenKind::Le ||
         k == TokenKind::Gt || k == TokenKind::Ge;
}

bool is_other_operator(TokenKind k)
{
  return k == TokenKind::Concat || k == TokenKind::Arrow || k == TokenKind::ArrowText ||
         k == TokenKind::HashArrow || k == TokenKind::HashArrowText || k == TokenKind::Operator;
}

}  // namespace

// ============================================================================
// Boolean layers
// ============================================================================

Expr * Parser::parse_expr() { return parse_or(); }

Expr * Parser::parse_or()
{
  const Token & start = cur();
  Expr * first = parse_and();
  if (!first) return nullptr;
  if (!at_kw("or")) return first;

  std::vector<Expr *> args{first};
  while (match_kw("or")) {
    Expr * e = parse_and();
    if (!e) return nullptr;
    args.push_back(e);
  }
  return ast_.create<BoolExpr>(BoolOp::Or, ast_.copy_to_arena(args), range_from(start));
}

Expr * Parser::parse_and()
{
  const Token & start = cur();
  Expr * first = parse_not();
  if (!first) return nullptr;
  if (!at_kw("and")) return first;

  std::vector<Expr *> args{first};
  while (match_kw("and")) {
    Expr * e = parse_not();
    if (!e) return nullptr;
    args.push_back(e);
  }
  return ast_.create<BoolExpr>(BoolOp::And, ast_.copy_to_arena(args), range_from(start));
}

Expr * Parser::parse_not()
{
  if (at_kw("not")) {
    const Token & start = advance();
    Expr * operand = parse_not();
    if (!operand) return nullptr;
    std::vector<Expr *> args{operand};
    return ast_.create<BoolExpr>(BoolOp::Not, ast_.copy_to_arena(args), range_from(start));
  }
  return parse_is();
}

Expr * Parser::parse_is()
{
  const Token & start = cur();
  Expr * lhs = parse_comparison();
  if (!lhs) return nullptr;

  while (true) {
    if (match_kw("isnull")) {
      lhs = ast_.create<NullTest>(lhs, NullTestType::IsNull, range_from(start));
      continue;
    }
    if (match_kw("notnull")) {
      lhs = ast_.create<NullTest>(lhs, NullTestType::IsNotNull, range_from(start));
      continue;
    }
    if (!match_kw("is")) break;

    const bool negated = match_kw("not");
    if (match_kw("null")) {
      lhs = ast_.create<NullTest>(
        lhs, negated ? NullTestType::IsNotNull : NullTestType::IsNull, range_from(start));
    } else if (match_kw("true")) {
      lhs = ast_.create<BooleanTest>(
        lhs, negated ? BoolTestType::IsNotTrue : BoolTestType::IsTrue, range_from(start));
    } else if (match_kw("false")) {
      lhs = ast_.create<BooleanTest>(
        lhs, negated ? BoolTestType::IsNotFalse : BoolTestType::IsFalse, range_from(start));
    } else if (match_kw("unknown")) {
      lhs = ast_.create<BooleanTest>(
        lhs, negated ? BoolTestType::IsNotUnknown : BoolTestType::IsUnknown, range_from(start));
    } else if (match_kw("distinct")) {
      if (!expect_kw("from")) return nullptr;
      Expr * rhs = parse_comparison();
      if (!rhs) return nullptr;
      lhs = ast_.create<OpExpr>(
        negated ? "is not distinct from" : "is distinct from", lhs, rhs, range_from(start));
    } else {
      error_at(cur(), "expected NULL, TRUE, FALSE, UNKNOWN or DISTINCT FROM after IS");
      return nullptr;
    }
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  const Token & start = cur();
  Expr * lhs = parse_pattern();
  if (!lhs) return nullptr;

  if (!is_comparison(cur().kind)) {
    return lhs;
  }

  const Token & op_tok = advance();
  const std::string_view op = op_tok.kind == TokenKind::Ne ? "<>" : to_string(op_tok.kind);

  // x = ANY (...), x > ALL (...)
  if ((at_kw("any") || at_kw("some") || at_kw("all")) && cur(1).kind == TokenKind::LParen) {
    const bool all = at_kw("all");
    advance();
    if (at_select_start(1)) {
      SubLink * link = parse_sublink_body(all ? SubLinkType::All : SubLinkType::Any, start);
      if (!link) return nullptr;
      link->testexpr = lhs;
      link->op = op;
      return link;
    }
    advance();  // (
    Expr * array = parse_expr();
    if (!array) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    const std::string spelled = std::string(op) + (all ? " all" : " any");
    return ast_.create<OpExpr>(ast_.intern(spelled), lhs, array, range_from(start));
  }

  Expr * rhs = parse_pattern();
  if (!rhs) return nullptr;
  return ast_.create<OpExpr>(op, lhs, rhs, range_from(start));
}

Expr * Parser::parse_pattern()
{
  const Token & start = cur();
  Expr * lhs = parse_other_op();
  if (!lhs) return nullptr;

  bool negated = false;
  if (
    at_kw("not") && (at_kw("in", 1) || at_kw("between", 1) || at_kw("like", 1) ||
                     at_kw("ilike", 1) || at_kw("similar", 1))) {
    advance();
    negated = true;
  }

  if (match_kw("in")) {
    if (at_select_start(1)) {
      SubLink * link = parse_sublink_body(SubLinkType::Any, start);
      if (!link) return nullptr;
      link->testexpr = lhs;
      link->op = "=";
      if (!negated) return link;
      std::vector<Expr *> args{link};
      return ast_.create<BoolExpr>(BoolOp::Not, ast_.copy_to_arena(args), range_from(start));
    }
    if (!expect(TokenKind::LParen, "`(` after IN")) return nullptr;
    auto items = parse_expr_list();
    if (!items) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    return ast_.create<InListExpr>(lhs, *items, negated, range_from(start));
  }

  if (match_kw("between")) {
    match_kw("symmetric");
    Expr * lower = parse_other_op();
    if (!lower) return nullptr;
    if (!expect_kw("and")) return nullptr;
    Expr * upper = parse_other_op();
    if (!upper) return nullptr;
    return ast_.create<BetweenExpr>(lhs, lower, upper, negated, range_from(start));
  }

  if (at_kw("like") || at_kw("ilike") || at_kw("similar")) {
    std::string_view op;
    if (match_kw("like")) {
      op = negated ? "not like" : "like";
    } else if (match_kw("ilike")) {
      op = negated ? "not ilike" : "ilike";
    } else {
      advance();
      if (!expect_kw("to")) return nullptr;
      op = negated ? "not similar to" : "similar to";
    }
    Expr * pattern = parse_other_op();
    if (!pattern) return nullptr;
    if (match_kw("escape")) {
      Expr * escape = parse_other_op();
      if (!escape) return nullptr;
    }
    return ast_.create<OpExpr>(op, lhs, pattern, range_from(start));
  }

  return lhs;
}

// ============================================================================
// Arithmetic layers
// ============================================================================

Expr * Parser::parse_other_op()
{
  const Token & start = cur();
  Expr * lhs = parse_add();
  if (!lhs) return nullptr;

  while (is_other_operator(cur().kind)) {
    const Token & op_tok = advance();
    Expr * rhs = parse_add();
    if (!rhs) return nullptr;
    lhs = ast_.create<OpExpr>(ast_.intern(op_tok.text), lhs, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  const Token & start = cur();
  Expr * lhs = parse_mul();
  if (!lhs) return nullptr;

  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const std::string_view op = to_string(advance().kind);
    Expr * rhs = parse_mul();
    if (!rhs) return nullptr;
    lhs = ast_.create<OpExpr>(op, lhs, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  const Token & start = cur();
  Expr * lhs = parse_pow();
  if (!lhs) return nullptr;

  while (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent)) {
    const std::string_view op = to_string(advance().kind);
    Expr * rhs = parse_pow();
    if (!rhs) return nullptr;
    lhs = ast_.create<OpExpr>(op, lhs, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_pow()
{
  const Token & start = cur();
  Expr * lhs = parse_unary();
  if (!lhs) return nullptr;

  while (match(TokenKind::Caret)) {
    Expr * rhs = parse_unary();
    if (!rhs) return nullptr;
    lhs = ast_.create<OpExpr>("^", lhs, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  if (at(TokenKind::Minus)) {
    const Token & start = advance();
    Expr * operand = parse_unary();
    if (!operand) return nullptr;

    // Fold the sign into numeric literals so `-1` stays a constant.
    if (auto * lit = dyn_cast<ConstExpr>(operand)) {
      if (
        (lit->const_kind == ConstKind::Integer || lit->const_kind == ConstKind::Float) &&
        !lit->value.empty() && lit->value.front() != '-') {
        const std::string negated = "-" + std::string(lit->value);
        return ast_.create<ConstExpr>(lit->const_kind, ast_.intern(negated), range_from(start));
      }
    }
    return ast_.create<OpExpr>("-", nullptr, operand, range_from(start));
  }
  if (match(TokenKind::Plus)) {
    return parse_unary();
  }
  if (at(TokenKind::Operator)) {
    // Prefix operators: @ x, |/ x, ~ x
    const Token & start = advance();
    Expr * operand = parse_unary();
    if (!operand) return nullptr;
    return ast_.create<OpExpr>(ast_.intern(start.text), nullptr, operand, range_from(start));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  const Token & start = cur();
  Expr * e = parse_primary();
  if (!e) return nullptr;

  while (true) {
    if (match(TokenKind::ColonColon)) {
      TypeName * type = parse_type_name();
      if (!type) return nullptr;
      e = ast_.create<TypeCast>(e, type, range_from(start));
      continue;
    }

    if (match(TokenKind::LBracket)) {
      auto * ind = ast_.create<IndirectionExpr>(e, std::string_view{});
      if (!at(TokenKind::Colon)) {
        ind->subscript = parse_expr();
        if (!ind->subscript) return nullptr;
      }
      if (match(TokenKind::Colon)) {
        ind->is_slice = true;
        if (!at(TokenKind::RBracket)) {
          ind->upper = parse_expr();
          if (!ind->upper) return nullptr;
        }
      }
      if (!expect(TokenKind::RBracket, "`]`")) return nullptr;
      ind->range_ = range_from(start);
      e = ind;
      continue;
    }

    // Field selection on a parenthesized or subscripted expression: (e).f
    if (at(TokenKind::Dot) && (is_ident_token(cur(1)) || cur(1).kind == TokenKind::Star)) {
      advance();
      const std::string_view field =
        at(TokenKind::Star) ? (advance(), std::string_view{"*"}) : ident_text(advance());
      e = ast_.create<IndirectionExpr>(e, field, range_from(start));
      continue;
    }

    if (match_kw("collate")) {
      auto collation = parse_qualified_name("collation name");
      if (!collation) return nullptr;
      continue;
    }

    if (at_kw("at") && at_kw("time", 1) && at_kw("zone", 2)) {
      advance();
      advance();
      advance();
      Expr * zone = parse_postfix();
      if (!zone) return nullptr;
      e = make_func("timezone", {zone, e}, range_from(start));
      continue;
    }

    break;
  }
  return e;
}

// ============================================================================
// Primary expressions
// ============================================================================

Expr * Parser::parse_primary()
{
  const Token & start = cur();

  switch (start.kind) {
    case TokenKind::IntLiteral:
      advance();
      return ast_.create<ConstExpr>(ConstKind::Integer, ast_.intern(start.text), start.range);
    case TokenKind::FloatLiteral:
      advance();
      return ast_.create<ConstExpr>(ConstKind::Float, ast_.intern(start.text), start.range);
    case TokenKind::StringLiteral:
    case TokenKind::DollarString:
      advance();
      return ast_.create<ConstExpr>(ConstKind::String, string_value(start), start.range);
    case TokenKind::Param: {
      advance();
      int32_t number = 0;
      const auto [ptr, ec] =
        std::from_chars(start.text.data(), start.text.data() + start.text.size(), number);
      (void)ptr;
      if (ec != std::errc()) {
        error_at(start, "parameter number out of range");
        return nullptr;
      }
      return ast_.create<ParamRef>(number, start.range);
    }
    case TokenKind::LParen: {
      if (at_select_start(1)) {
        return parse_sublink_body(SubLinkType::Expr, start);
      }
      advance();
      Expr * inner = parse_expr();
      if (!inner) return nullptr;
      if (at(TokenKind::Comma)) {
        // Row constructor: (a, b, ...)
        std::vector<Expr *> fields{inner};
        while (match(TokenKind::Comma)) {
          Expr * f = parse_expr();
          if (!f) return nullptr;
          fields.push_back(f);
        }
        if (!expect(TokenKind::RParen, "`)`")) return nullptr;
        return make_func("row", fields, range_from(start));
      }
      if (!expect(TokenKind::RParen, "`)`")) return nullptr;
      return inner;
    }
    case TokenKind::Identifier:
    case TokenKind::QuotedIdentifier:
      break;
    default:
      error_at(start, "expected expression");
      return nullptr;
  }

  if (start.kind == TokenKind::Identifier) {
    if (at_kw("true") || at_kw("false")) {
      advance();
      auto * lit = ast_.create<ConstExpr>(ConstKind::Bool, ast_.intern_folded(start.text), start.range);
      lit->bool_value = is_kw("true", start);
      return lit;
    }
    if (match_kw("null")) {
      return ast_.create<ConstExpr>(ConstKind::Null, "null", start.range);
    }
    if (at_kw("case")) {
      return parse_case();
    }
    if (at_kw("cast")) {
      advance();
      if (!expect(TokenKind::LParen, "`(` after CAST")) return nullptr;
      Expr * arg = parse_expr();
      if (!arg) return nullptr;
      if (!expect_kw("as")) return nullptr;
      TypeName * type = parse_type_name();
      if (!type) return nullptr;
      if (!expect(TokenKind::RParen, "`)`")) return nullptr;
      return ast_.create<TypeCast>(arg, type, range_from(start));
    }
    if (at_kw("array")) {
      return parse_array_ctor(start);
    }
    if (at_kw("exists")) {
      advance();
      return parse_sublink_body(SubLinkType::Exists, start);
    }
    if (at_kw("row") && cur(1).kind == TokenKind::LParen) {
      advance();
      advance();
      std::vector<Expr *> fields;
      if (!at(TokenKind::RParen)) {
        auto list = parse_expr_list();
        if (!list) return nullptr;
        fields.assign(list->begin(), list->end());
      }
      if (!expect(TokenKind::RParen, "`)`")) return nullptr;
      return make_func("row", fields, range_from(start));
    }
    if (at_kw("not")) {
      advance();
      Expr * operand = parse_postfix();
      if (!operand) return nullptr;
      std::vector<Expr *> args{operand};
      return ast_.create<BoolExpr>(BoolOp::Not, ast_.copy_to_arena(args), range_from(start));
    }

    const size_t before_special = idx_;
    if (Expr * special = parse_special_func(start)) {
      return special;
    }
    if (idx_ != before_special) {
      return nullptr;  // special form reported an error
    }

    if (at_type_literal()) {
      TypeName * type = parse_type_name();
      if (!type) return nullptr;
      const Token & lit_tok = advance();
      auto * lit = ast_.create<ConstExpr>(ConstKind::String, string_value(lit_tok), lit_tok.range);
      return ast_.create<TypeCast>(lit, type, range_from(start));
    }

    // left(...) and right(...) are functions despite being join keywords.
    const bool call_keyword = (at_kw("left") || at_kw("right")) && cur(1).kind == TokenKind::LParen;
    if (is_reserved(start) && !call_keyword) {
      error_at(start, "expected expression");
      return nullptr;
    }
  }

  // Column reference or function call: a, t.a, s.t.a, t.*, f(...), s.f(...)
  std::vector<std::string_view> names{ident_text(advance())};
  bool star = false;
  while (at(TokenKind::Dot)) {
    if (is_ident_token(cur(1))) {
      advance();
      names.push_back(ident_text(advance()));
    } else if (cur(1).kind == TokenKind::Star) {
      advance();
      advance();
      star = true;
      break;
    } else {
      break;
    }
  }

  if (!star && at(TokenKind::LParen)) {
    return parse_func_call(ast_.copy_to_arena(names), start);
  }
  return ast_.create<ColumnRef>(ast_.copy_to_arena(names), star, range_from(start));
}

Expr * Parser::parse_case()
{
  const Token & start = advance();  // CASE

  Expr * arg = nullptr;
  if (!at_kw("when")) {
    arg = parse_expr();
    if (!arg) return nullptr;
  }

  std::vector<CaseWhen *> whens;
  while (at_kw("when")) {
    const Token & when_start = advance();
    Expr * condition = parse_expr();
    if (!condition) return nullptr;
    if (!expect_kw("then")) return nullptr;
    Expr * result = parse_expr();
    if (!result) return nullptr;
    whens.push_back(ast_.create<CaseWhen>(condition, result, range_from(when_start)));
  }
  if (whens.empty()) {
    error_at(cur(), "expected WHEN in CASE expression");
    return nullptr;
  }

  Expr * default_result = nullptr;
  if (match_kw("else")) {
    default_result = parse_expr();
    if (!default_result) return nullptr;
  }
  if (!expect_kw("end")) return nullptr;

  return ast_.create<CaseExpr>(arg, ast_.copy_to_arena(whens), default_result, range_from(start));
}

Expr * Parser::parse_array_ctor(const Token & start)
{
  // ARRAY[...], ARRAY(SELECT ...), or a nested `[...]` inside ARRAY[...]
  if (match_kw("array") && at(TokenKind::LParen)) {
    return parse_sublink_body(SubLinkType::Array, start);
  }
  if (!expect(TokenKind::LBracket, "`[` after ARRAY")) return nullptr;

  std::vector<Expr *> elements;
  if (!at(TokenKind::RBracket)) {
    do {
      Expr * e = at(TokenKind::LBracket) ? parse_array_ctor(cur()) : parse_expr();
      if (!e) return nullptr;
      elements.push_back(e);
    } while (match(TokenKind::Comma));
  }
  if (!expect(TokenKind::RBracket, "`]`")) return nullptr;

  return ast_.create<ArrayExpr>(ast_.copy_to_arena(elements), range_from(start));
}

SubLink * Parser::parse_sublink_body(SubLinkType type, const Token & start)
{
  if (!expect(TokenKind::LParen, "`(`")) return nullptr;
  if (!at_select_start()) {
    error_at(cur(), "expected sub-select");
    return nullptr;
  }
  SelectStmt * query = parse_select_stmt();
  if (!query) return nullptr;
  if (!expect(TokenKind::RParen, "`)` after sub-select")) return nullptr;
  return ast_.create<SubLink>(type, query, range_from(start));
}

std::optional<gsl::span<Expr *>> Parser::parse_expr_list()
{
  std::vector<Expr *> items;
  do {
    Expr * e = parse_expr();
    if (!e) return std::nullopt;
    items.push_back(e);
  } while (match(TokenKind::Comma));
  return ast_.copy_to_arena(items);
}

FuncCall * Parser::make_func(std::string_view name, const std::vector<Expr *> & args, SourceRange r)
{
  std::vector<std::string_view> names{name};
  return ast_.create<FuncCall>(ast_.copy_to_arena(names), ast_.copy_to_arena(args), r);
}

Expr * Parser::parse_func_call(gsl::span<std::string_view> names, const Token & start)
{
  if (!expect(TokenKind::LParen, "`(`")) return nullptr;

  auto * call = ast_.create<FuncCall>(names, gsl::span<Expr *>{});
  std::vector<Expr *> args;

  if (match(TokenKind::Star)) {
    call->agg_star = true;
  } else if (!at(TokenKind::RParen)) {
    if (match_kw("distinct")) {
      call->agg_distinct = true;
    } else {
      match_kw("all");
    }

    do {
      match_kw("variadic");
      // Named notation: name => value, name := value
      if (at_ident() && cur(1).kind == TokenKind::Operator && cur(1).text == "=>") {
        advance();
        advance();
      } else if (
        at_ident() && cur(1).kind == TokenKind::Colon && cur(2).kind == TokenKind::Eq) {
        advance();
        advance();
        advance();
      }
      Expr * arg = parse_expr();
      if (!arg) return nullptr;
      args.push_back(arg);
    } while (match(TokenKind::Comma));

    if (at_kw("order") && at_kw("by", 1)) {
      advance();
      advance();
      auto order = parse_sort_list();
      if (!order) return nullptr;
    }
  }
  if (!expect(TokenKind::RParen, "`)` after function arguments")) return nullptr;

  if (at_kw("within") && at_kw("group", 1)) {
    advance();
    advance();
    if (!expect(TokenKind::LParen, "`(`")) return nullptr;
    if (!expect_kw("order") || !expect_kw("by")) return nullptr;
    auto order = parse_sort_list();
    if (!order) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
  }

  if (match_kw("filter")) {
    if (!expect(TokenKind::LParen, "`(` after FILTER")) return nullptr;
    if (!expect_kw("where")) return nullptr;
    call->agg_filter = parse_expr();
    if (!call->agg_filter) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
  }

  if (match_kw("over")) {
    // The window definition does not affect the result type.
    call->has_over = true;
    if (at(TokenKind::LParen)) {
      skip_balanced_parens();
    } else {
      auto window = parse_identifier("window name");
      if (!window) return nullptr;
    }
  }

  call->args = ast_.copy_to_arena(args);
  call->range_ = range_from(start);
  return call;
}

/**
 * SQL-standard functions with keyword syntax. Returns nullptr without
 * consuming anything when `start` does not begin one.
 */
Expr * Parser::parse_special_func(const Token & start)
{
  // Niladic value functions: CURRENT_DATE, CURRENT_TIMESTAMP, ...
  static constexpr std::string_view k_niladic[] = {
    "current_date", "current_time", "current_timestamp", "localtime",      "localtimestamp",
    "current_user", "session_user", "current_role",      "current_schema", "current_catalog",
    "user",
  };
  for (const std::string_view name : k_niladic) {
    if (!at_kw(name)) continue;
    advance();
    if (
      (name == "current_time" || name == "current_timestamp" || name == "localtime" ||
       name == "localtimestamp") &&
      at(TokenKind::LParen)) {
      skip_balanced_parens();  // precision
    }
    return make_func(name, {}, range_from(start));
  }

  if (cur(1).kind != TokenKind::LParen) {
    return nullptr;
  }

  if (at_kw("extract")) {
    advance();
    advance();
    std::string_view field;
    if (at(TokenKind::StringLiteral)) {
      field = string_value(advance());
    } else {
      auto name = parse_identifier("date field");
      if (!name) return nullptr;
      field = *name;
    }
    if (!expect_kw("from")) return nullptr;
    Expr * source = parse_expr();
    if (!source) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    auto * field_lit = ast_.create<ConstExpr>(ConstKind::String, field, start.range);
    return make_func("extract", {field_lit, source}, range_from(start));
  }

  if (at_kw("position")) {
    advance();
    advance();
    Expr * needle = parse_other_op();
    if (!needle) return nullptr;
    if (!expect_kw("in")) return nullptr;
    Expr * haystack = parse_other_op();
    if (!haystack) return nullptr;
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    return make_func("position", {haystack, needle}, range_from(start));
  }

  if (at_kw("substring") || at_kw("overlay")) {
    const std::string_view name = at_kw("substring") ? "substring" : "overlay";
    advance();
    advance();
    std::vector<Expr *> args;
    Expr * subject = parse_expr();
    if (!subject) return nullptr;
    args.push_back(subject);
    while (match(TokenKind::Comma) || match_kw("from") || match_kw("for") || match_kw("placing") ||
           match_kw("similar") || match_kw("escape")) {
      Expr * e = parse_expr();
      if (!e) return nullptr;
      args.push_back(e);
    }
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    return make_func(name, args, range_from(start));
  }

  if (at_kw("trim")) {
    advance();
    advance();
    std::string_view name = "btrim";
    if (match_kw("leading")) {
      name = "ltrim";
    } else if (match_kw("trailing")) {
      name = "rtrim";
    } else {
      match_kw("both");
    }

    std::vector<Expr *> args;
    if (match_kw("from")) {
      auto list = parse_expr_list();
      if (!list) return nullptr;
      args.assign(list->begin(), list->end());
    } else {
      Expr * first = parse_expr();
      if (!first) return nullptr;
      if (match_kw("from")) {
        Expr * subject = parse_expr();
        if (!subject) return nullptr;
        args = {subject, first};
      } else {
        args.push_back(first);
        while (match(TokenKind::Comma)) {
          Expr * e = parse_expr();
          if (!e) return nullptr;
          args.push_back(e);
        }
      }
    }
    if (!expect(TokenKind::RParen, "`)`")) return nullptr;
    return make_func(name, args, range_from(start));
  }

  return nullptr;
}

// ============================================================================
// Type names
// ============================================================================

bool Parser::at_type_literal() const
{
  // type 'literal': date '2020-01-01', interval '1 day', jsonb '{}'
  if (cur().kind != TokenKind::Identifier || is_reserved(cur())) {
    return false;
  }
  if (cur(1).kind == TokenKind::StringLiteral) {
    return true;
  }
  if (at_kw("double") && at_kw("precision", 1)) {
    return cur(2).kind == TokenKind::StringLiteral;
  }
  if ((at_kw("timestamp") || at_kw("time")) && (at_kw("with", 1) || at_kw("without", 1))) {
    return at_kw("time", 2) && at_kw("zone", 3) && cur(4).kind == TokenKind::StringLiteral;
  }
  return false;
}

TypeName * Parser::parse_type_name()
{
  const Token & start = cur();
  if (!at_ident()) {
    error_at(cur(), "expected type name");
    return nullptr;
  }

  std::vector<std::string_view> names;
  std::vector<Expr *> typmods;

  auto parse_typmods = [&]() -> bool {
    if (!match(TokenKind::LParen)) return true;
    auto list = parse_expr_list();
    if (!list) return false;
    typmods.assign(list->begin(), list->end());
    return expect(TokenKind::RParen, "`)` after type modifiers");
  };

  if (at_kw("double") && at_kw("precision", 1)) {
    advance();
    advance();
    names.push_back("float8");
  } else if (at_kw("character") || at_kw("char") || at_kw("varchar")) {
    const bool varchar = at_kw("varchar");
    advance();
    names.push_back((varchar || match_kw("varying")) ? "varchar" : "bpchar");
  } else if (at_kw("bit")) {
    advance();
    names.push_back(match_kw("varying") ? "varbit" : "bit");
  } else if (at_kw("timestamp") || at_kw("time")) {
    const bool timestamp = at_kw("timestamp");
    advance();
    if (!parse_typmods()) return nullptr;
    bool with_zone = false;
    if (match_kw("with")) {
      with_zone = true;
      if (!expect_kw("time") || !expect_kw("zone")) return nullptr;
    } else if (match_kw("without")) {
      if (!expect_kw("time") || !expect_kw("zone")) return nullptr;
    }
    if (timestamp) {
      names.push_back(with_zone ? "timestamptz" : "timestamp");
    } else {
      names.push_back(with_zone ? "timetz" : "time");
    }
  } else if (at_kw("interval")) {
    advance();
    names.push_back("interval");
    // Field restriction: YEAR TO MONTH, DAY TO SECOND(3), ...
    static constexpr std::string_view k_fields[] = {"year",   "month",  "day", "hour",
                                                    "minute", "second", "to"};
    bool more = true;
    while (more) {
      more = false;
      for (const std::string_view f : k_fields) {
        if (match_kw(f)) {
          more = true;
          break;
        }
      }
    }
  } else {
    const bool quoted = at(TokenKind::QuotedIdentifier);
    auto qualified = parse_qualified_name("type name");
    if (!qualified) return nullptr;
    names = std::move(*qualified);
    if (!quoted && (names.size() == 1 || (names.size() == 2 && names[0] == "pg_catalog"))) {
      names.back() = normalize_type_word(names.back());
    }
  }

  if (!parse_typmods()) return nullptr;

  auto * type = ast_.create<TypeName>(ast_.copy_to_arena(names));

  if (at(TokenKind::Percent) && at_kw("type", 1)) {
    advance();
    advance();
    type->pct_type = true;
  }

  std::vector<int32_t> bounds;
  while (true) {
    if (match(TokenKind::LBracket)) {
      int32_t bound = -1;
      if (at(TokenKind::IntLiteral)) {
        const Token & n = advance();
        const auto [ptr, ec] = std::from_chars(n.text.data(), n.text.data() + n.text.size(), bound);
        (void)ptr;
        if (ec != std::errc()) bound = -1;
      }
      if (!expect(TokenKind::RBracket, "`]`")) return nullptr;
      bounds.push_back(bound);
      continue;
    }
    if (at_kw("array") && cur(1).kind != TokenKind::LParen) {
      advance();
      int32_t bound = -1;
      if (match(TokenKind::LBracket)) {
        if (at(TokenKind::IntLiteral)) {
          const Token & n = advance();
          const auto [ptr, ec] =
            std::from_chars(n.text.data(), n.text.data() + n.text.size(), bound);
          (void)ptr;
          if (ec != std::errc()) bound = -1;
        }
        if (!expect(TokenKind::RBracket, "`]`")) return nullptr;
      }
      bounds.push_back(bound);
      continue;
    }
    break;
  }

  type->array_bounds = ast_.copy_to_arena(bounds);
  type->typmods = ast_.copy_to_arena(typmods);
  type->range_ = range_from(start);
  return type;
}

}  // namespace pg_sema::syntax
