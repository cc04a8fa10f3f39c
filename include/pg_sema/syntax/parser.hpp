// pg_sema/syntax/parser.hpp - Recursive-descent parser for schema SQL
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pg_sema/ast/ast.hpp"
#include "pg_sema/ast/ast_context.hpp"
#include "pg_sema/basic/diagnostic.hpp"
#include "pg_sema/basic/source_manager.hpp"
#include "pg_sema/syntax/token.hpp"

namespace pg_sema::syntax
{

/**
 * Parses a token stream into a Script.
 *
 * Errors are reported to the DiagnosticBag (E0001); the parser then skips to
 * the next top-level `;` and continues, so one run reports every malformed
 * statement. Statements outside the modelled subset become OpaqueStmt with a
 * W0401 warning.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
    std::vector<Token> tokens)
  : ast_(ast), file_id_(file_id), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Script * parse_script();

  /// Parse `stmt {; stmt}` up to EOF. Used for routine bodies.
  [[nodiscard]] gsl::span<Stmt *> parse_statement_list();

  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;
  [[nodiscard]] bool at_ident() const;

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  bool expect(TokenKind k, std::string_view what);
  bool expect_kw(std::string_view kw);

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_stmt();
  void skip_balanced_parens();
  [[nodiscard]] SourceRange range_from(const Token & start) const;

  // Small scanners
  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] static bool is_reserved(const Token & t);
  [[nodiscard]] static bool is_ident_token(const Token & t);
  [[nodiscard]] std::string_view ident_text(const Token & t);
  [[nodiscard]] std::optional<std::string_view> parse_identifier(std::string_view what);
  [[nodiscard]] std::optional<std::vector<std::string_view>> parse_qualified_name(
    std::string_view what);
  [[nodiscard]] std::optional<gsl::span<std::string_view>> parse_name_list();
  [[nodiscard]] std::string_view string_value(const Token & t);

  // Statements (parser.cpp)
  [[nodiscard]] Stmt * parse_statement();
  [[nodiscard]] Stmt * parse_create();
  [[nodiscard]] Stmt * parse_create_table(const Token & start);
  [[nodiscard]] Stmt * parse_create_type(const Token & start);
  [[nodiscard]] Stmt * parse_create_view(const Token & start, bool replace, bool materialized);
  [[nodiscard]] Stmt * parse_create_function(const Token & start, bool replace, bool procedure);
  [[nodiscard]] Stmt * parse_create_extension(const Token & start);
  [[nodiscard]] Stmt * parse_opaque(const Token & start, size_t keyword_tokens);

  [[nodiscard]] ColumnDef * parse_column_def(bool allow_constraints);
  [[nodiscard]] Constraint * parse_column_constraint();
  [[nodiscard]] Constraint * parse_table_constraint();
  [[nodiscard]] bool parse_references(Constraint * c);
  [[nodiscard]] FunctionParameter * parse_function_parameter();
  void parse_routine_body(CreateFunctionStmt * fn, const Token & body);
  [[nodiscard]] RangeVar * make_range_var(
    const std::vector<std::string_view> & names, SourceRange r);

  // Queries (parse_query.cpp)
  [[nodiscard]] bool at_select_start(size_t lookahead = 0) const;
  [[nodiscard]] SelectStmt * parse_select_stmt();
  [[nodiscard]] SelectStmt * parse_union_level();
  [[nodiscard]] SelectStmt * parse_intersect_level();
  [[nodiscard]] SelectStmt * parse_select_primary();
  [[nodiscard]] SelectStmt * parse_simple_select();
  [[nodiscard]] SelectStmt * parse_values();
  [[nodiscard]] WithClause * parse_with_clause();
  [[nodiscard]] CommonTableExpr * parse_cte();
  [[nodiscard]] ResTarget * parse_target();
  [[nodiscard]] bool at_target_list_end() const;
  [[nodiscard]] std::optional<gsl::span<Expr *>> parse_sort_list();
  [[nodiscard]] FromItem * parse_from_item();
  [[nodiscard]] FromItem * parse_table_ref();
  [[nodiscard]] Alias * parse_alias_opt();

  // Expressions (parse_expr.cpp)
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_not();
  [[nodiscard]] Expr * parse_is();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_pattern();
  [[nodiscard]] Expr * parse_other_op();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_pow();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_case();
  [[nodiscard]] Expr * parse_array_ctor(const Token & start);
  [[nodiscard]] Expr * parse_func_call(gsl::span<std::string_view> names, const Token & start);
  [[nodiscard]] Expr * parse_special_func(const Token & start);
  [[nodiscard]] SubLink * parse_sublink_body(SubLinkType type, const Token & start);
  [[nodiscard]] std::optional<gsl::span<Expr *>> parse_expr_list();
  [[nodiscard]] FuncCall * make_func(
    std::string_view name, const std::vector<Expr *> & args, SourceRange r);

  // Types (parse_expr.cpp)
  [[nodiscard]] TypeName * parse_type_name();
  [[nodiscard]] bool at_type_literal() const;

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  size_t error_count_ = 0;
};

}  // namespace pg_sema::syntax
