// pg_sema/syntax/token.hpp - SQL token kinds
#pragma once

#include <cstdint>
#include <string_view>

#include "pg_sema/basic/source_manager.hpp"

namespace pg_sema::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,        // unquoted word; keywords are identifiers to the lexer
  QuotedIdentifier,  // "Name"; text is the interior with "" unescaped lazily
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // '...', E'...'; text is the interior (escapes not processed)
  DollarString,   // $$...$$ or $tag$...$tag$; text is the body
  Param,          // $1; text is the digits

  // Punctuation
  LParen,
  RParen,
  LBracket,
  RBracket,
  Comma,
  Semicolon,
  Dot,
  Colon,
  ColonColon,

  // Operators
  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Caret,
  Concat,  // ||
  Eq,
  Ne,  // <> or !=
  Lt,
  Le,
  Gt,
  Ge,
  Arrow,        // ->
  ArrowText,    // ->>
  HashArrow,    // #>
  HashArrowText,  // #>>
  Operator,     // any other operator spelling (@>, ?|, ~~, ...)
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes)
  std::string_view text;  // slice view (for quoted forms: interior)
  bool escape = false;    // StringLiteral written as E'...'

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::QuotedIdentifier:
      return "quoted identifier";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::FloatLiteral:
      return "number";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::DollarString:
      return "dollar-quoted string";
    case TokenKind::Param:
      return "parameter";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Concat:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::Ne:
      return "<>";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::ArrowText:
      return "->>";
    case TokenKind::HashArrow:
      return "#>";
    case TokenKind::HashArrowText:
      return "#>>";
    case TokenKind::Operator:
      return "operator";
  }
  return "<unknown>";
}

}  // namespace pg_sema::syntax
