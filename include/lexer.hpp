#pragma once

#include "error.hpp"
#include "token.hpp"

#include <llvm/Support/Error.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace impscan {

class Lexer {
public:
  explicit Lexer(std::string_view source);

  // Produce the next token; returns std::nullopt once the input is
  // exhausted. Fails with NumericOverflowError when an integer literal does
  // not fit in 32 bits; the lexer stays usable after that.
  llvm::Expected<std::optional<Token>> next_token();

  // Reset the lexer with new source content.
  void reset(std::string_view source);

  // Convenience: tokenize entire input, stopping at the first error.
  llvm::Expected<std::vector<Token>> tokenize_all();

  bool at_end() const;

  std::size_t offset() const { return index_; }
  std::size_t line() const { return line_; }
  std::size_t column() const { return column_; }

private:
  llvm::Expected<Token> lex_integer();
  Token lex_name_or_keyword();
  Token lex_symbol();

  Token make_token(TokenKind kind, std::size_t start_index,
                   std::size_t start_line, std::size_t start_column) const;

  void consume_utf8_tail(char lead);
  void skip_whitespace();
  char peek() const;
  bool match(char expected);
  char advance();

  std::string source_{};
  std::size_t index_{0};
  std::size_t line_{1};
  std::size_t column_{1};
};

} // namespace impscan
