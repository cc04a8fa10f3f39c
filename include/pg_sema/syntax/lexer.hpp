// pg_sema/syntax/lexer.hpp - SQL tokenizer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "pg_sema/syntax/token.hpp"

namespace pg_sema::syntax
{

/**
 * Tokenizes PostgreSQL-flavoured SQL.
 *
 * Comments and whitespace are skipped. Offsets are absolute within the
 * registered file: a lexer constructed over a sub-range (e.g. a routine
 * body) reports ranges relative to the file start, not the sub-range.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : Lexer(file_id, src, 0, src.size()) {}

  /// Lex only `src[begin, end)`.
  Lexer(FileId file_id, std::string_view src, size_t begin, size_t end)
  : file_id_(file_id), src_(src.substr(0, end)), pos_(begin)
  {
  }

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skip whitespace and comments. Returns false on an unterminated comment.
  bool skip_trivia();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_quoted_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(bool escape);
  [[nodiscard]] Token lex_dollar();
  [[nodiscard]] Token lex_operator();

  [[nodiscard]] SourceRange make_range(size_t start, size_t end) const noexcept
  {
    return {file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
  }
  [[nodiscard]] Token make(TokenKind k, size_t start) const noexcept
  {
    return {k, make_range(start, pos_), src_.substr(start, pos_ - start)};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace pg_sema::syntax
