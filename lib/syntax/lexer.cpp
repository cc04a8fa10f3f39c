#include "pg_sema/syntax/lexer.hpp"

#include <cctype>

namespace pg_sema::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_ident_continue(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '_' || c == '$' || c >= 0x80;
}

bool is_operator_char(char c)
{
  switch (c) {
    case '+':
    case '-':
    case '*':
    case '/':
    case '<':
    case '>':
    case '=':
    case '~':
    case '!':
    case '@':
    case '#':
    case '%':
    case '^':
    case '&':
    case '|':
    case '`':
    case '?':
      return true;
    default:
      return false;
  }
}

// Characters that allow a multi-character operator to end in '+' or '-'.
bool is_special_operator_char(char c)
{
  switch (c) {
    case '~':
    case '!':
    case '@':
    case '#':
    case '%':
    case '^':
    case '&':
    case '|':
    case '`':
    case '?':
      return true;
    default:
      return false;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_trivia()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (std::isspace(c) != 0) {
      advance(1);
      continue;
    }

    if (starts_with("--")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }

    if (starts_with("/*")) {
      // Block comments nest in PostgreSQL.
      advance(2);
      int depth = 1;
      while (!eof() && depth > 0) {
        if (starts_with("/*")) {
          ++depth;
          advance(2);
        } else if (starts_with("*/")) {
          --depth;
          advance(2);
        } else {
          advance(1);
        }
      }
      if (depth > 0) {
        return false;
      }
      continue;
    }

    break;
  }
  return true;
}

Token Lexer::lex_identifier()
{
  const size_t start = pos_;
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make(TokenKind::Identifier, start);
}

Token Lexer::lex_quoted_identifier()
{
  const size_t start = pos_;
  advance(1);

  while (!eof()) {
    if (peek() == '"') {
      if (peek(1) == '"') {
        advance(2);
        continue;
      }
      break;
    }
    advance(1);
  }

  if (eof()) {
    return make(TokenKind::Unknown, start);
  }

  const size_t payload_end = pos_;
  advance(1);  // closing quote

  Token t;
  t.kind = TokenKind::QuotedIdentifier;
  t.range = make_range(start, pos_);
  t.text = src_.substr(start + 1, payload_end - start - 1);
  if (t.text.empty()) {
    t.kind = TokenKind::Unknown;  // zero-length delimited identifier
  }
  return t;
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance(1);
  }

  bool is_float = false;

  // Fractional part; `1..2` is not a number followed by a fraction.
  if (!eof() && peek() == '.' && peek(1) != '.') {
    is_float = true;
    advance(1);
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      advance(1);
    }
  }

  // Exponent
  if (!eof() && (peek() == 'e' || peek() == 'E')) {
    const char sign = peek(1);
    const size_t digit_at = (sign == '+' || sign == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek(digit_at))) != 0) {
      is_float = true;
      advance(digit_at);
      while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        advance(1);
      }
    }
  }

  // Trailing identifier characters (`123abc`) make the literal invalid.
  if (!eof() && is_ident_start(static_cast<unsigned char>(peek()))) {
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    return make(TokenKind::Unknown, start);
  }

  return make(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::lex_string(bool escape)
{
  const size_t start = pos_;
  if (escape) {
    advance(1);  // E prefix
  }
  advance(1);  // opening quote
  const size_t payload_start = pos_;

  while (!eof()) {
    const char c = peek();
    if (escape && c == '\\') {
      advance(2);
      continue;
    }
    if (c == '\'') {
      if (peek(1) == '\'') {
        advance(2);
        continue;
      }
      break;
    }
    advance(1);
  }

  if (eof()) {
    return make(TokenKind::Unknown, start);
  }

  const size_t payload_end = pos_;
  advance(1);  // closing quote

  Token t;
  t.kind = TokenKind::StringLiteral;
  t.range = make_range(start, pos_);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  t.escape = escape;
  return t;
}

Token Lexer::lex_dollar()
{
  const size_t start = pos_;

  // Positional parameter: $1
  if (std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    advance(1);
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      advance(1);
    }
    Token t = make(TokenKind::Param, start);
    t.text = src_.substr(start + 1, pos_ - start - 1);
    return t;
  }

  // Dollar-quoted string: $tag$ ... $tag$
  size_t tag_end = pos_ + 1;
  while (tag_end < src_.size() && src_[tag_end] != '$') {
    const auto c = static_cast<unsigned char>(src_[tag_end]);
    const bool ok = (tag_end == pos_ + 1) ? is_ident_start(c) : is_ident_continue(c) && c != '$';
    if (!ok) {
      advance(1);
      return make(TokenKind::Unknown, start);
    }
    ++tag_end;
  }
  if (tag_end >= src_.size()) {
    advance(1);
    return make(TokenKind::Unknown, start);
  }

  const std::string_view delim = src_.substr(pos_, tag_end - pos_ + 1);
  const size_t body_start = tag_end + 1;
  const size_t close = src_.find(delim, body_start);
  if (close == std::string_view::npos) {
    pos_ = src_.size();
    return make(TokenKind::Unknown, start);
  }

  pos_ = close + delim.size();
  Token t;
  t.kind = TokenKind::DollarString;
  t.range = make_range(start, pos_);
  t.text = src_.substr(body_start, close - body_start);
  return t;
}

Token Lexer::lex_operator()
{
  const size_t start = pos_;

  size_t end = pos_;
  while (end < src_.size() && is_operator_char(src_[end])) {
    // A comment start terminates the operator.
    if (end > pos_ && src_[end] == '-' && end + 1 < src_.size() && src_[end + 1] == '-') break;
    if (end > pos_ && src_[end] == '/' && end + 1 < src_.size() && src_[end + 1] == '*') break;
    ++end;
  }

  std::string_view op = src_.substr(pos_, end - pos_);

  // `=-1` is `=` followed by `-1`: a multi-character operator can only end in
  // + or - if it also contains one of ~ ! @ # % ^ & | ` ?
  if (op.size() > 1 && (op.back() == '+' || op.back() == '-')) {
    bool special = false;
    for (const char c : op) {
      special = special || is_special_operator_char(c);
    }
    if (!special) {
      while (op.size() > 1 && (op.back() == '+' || op.back() == '-')) {
        op.remove_suffix(1);
      }
    }
  }

  advance(op.size());

  TokenKind kind = TokenKind::Operator;
  if (op == "+") {
    kind = TokenKind::Plus;
  } else if (op == "-") {
    kind = TokenKind::Minus;
  } else if (op == "*") {
    kind = TokenKind::Star;
  } else if (op == "/") {
    kind = TokenKind::Slash;
  } else if (op == "%") {
    kind = TokenKind::Percent;
  } else if (op == "^") {
    kind = TokenKind::Caret;
  } else if (op == "||") {
    kind = TokenKind::Concat;
  } else if (op == "=") {
    kind = TokenKind::Eq;
  } else if (op == "<>" || op == "!=") {
    kind = TokenKind::Ne;
  } else if (op == "<") {
    kind = TokenKind::Lt;
  } else if (op == "<=") {
    kind = TokenKind::Le;
  } else if (op == ">") {
    kind = TokenKind::Gt;
  } else if (op == ">=") {
    kind = TokenKind::Ge;
  } else if (op == "->") {
    kind = TokenKind::Arrow;
  } else if (op == "->>") {
    kind = TokenKind::ArrowText;
  } else if (op == "#>") {
    kind = TokenKind::HashArrow;
  } else if (op == "#>>") {
    kind = TokenKind::HashArrowText;
  }

  return make(kind, start);
}

Token Lexer::next_token()
{
  const size_t trivia_start = pos_;
  if (!skip_trivia()) {
    // Unterminated block comment: report it as a single unknown token; the
    // next call sees EOF.
    Token t;
    t.kind = TokenKind::Unknown;
    t.range = make_range(trivia_start, src_.size());
    t.text = "/*";
    return t;
  }

  if (eof()) {
    Token t;
    t.kind = TokenKind::Eof;
    t.range = make_range(src_.size(), src_.size());
    t.text = {};
    return t;
  }

  const auto c = static_cast<unsigned char>(peek());

  if ((c == 'e' || c == 'E') && peek(1) == '\'') {
    return lex_string(/*escape=*/true);
  }
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0 ||
      (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
    return lex_number();
  }
  if (c == '\'') {
    return lex_string(/*escape=*/false);
  }
  if (c == '"') {
    return lex_quoted_identifier();
  }
  if (c == '$') {
    return lex_dollar();
  }

  const size_t start = pos_;

  if (starts_with("::")) {
    advance(2);
    return make(TokenKind::ColonColon, start);
  }

  switch (c) {
    case '(':
      advance(1);
      return make(TokenKind::LParen, start);
    case ')':
      advance(1);
      return make(TokenKind::RParen, start);
    case '[':
      advance(1);
      return make(TokenKind::LBracket, start);
    case ']':
      advance(1);
      return make(TokenKind::RBracket, start);
    case ',':
      advance(1);
      return make(TokenKind::Comma, start);
    case ';':
      advance(1);
      return make(TokenKind::Semicolon, start);
    case '.':
      advance(1);
      return make(TokenKind::Dot, start);
    case ':':
      advance(1);
      return make(TokenKind::Colon, start);
    default:
      break;
  }

  if (is_operator_char(static_cast<char>(c))) {
    return lex_operator();
  }

  advance(1);
  return make(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace pg_sema::syntax
