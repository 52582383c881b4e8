#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace impscan {

enum class TokenKind {
  Invalid,

  // Values
  Boolean,
  Integer,
  Name,

  // Keywords
  And,
  Array,
  If,
  Let,
  Not,
  Or,
  Print,
  While,

  // Symbols
  Asterisk,
  BraceLeft,
  BraceRight,
  BracketLeft,
  BracketRight,
  Colon,
  Dot,
  EqualSign,
  Minus,
  ParenLeft,
  ParenRight,
  Plus,
  Semicolon,
  Slash,

  // Operators
  Assign,
  Eq,
  Ge,
  Gt,
  Le,
  Lt,
  Ne,
};

struct Token {
  TokenKind kind{TokenKind::Invalid};
  std::string lexeme{};     // Exact source slice; the text of a Name.
  std::int32_t int_value{0}; // Only meaningful for Integer.
  bool bool_value{false};    // Only meaningful for Boolean.

  std::size_t offset{0};     // 0-based byte offset of the first character.
  std::size_t line{1};       // 1-based line number.
  std::size_t column{1};     // 1-based column number (start of token).
  std::size_t end_column{1}; // 1-based column number (end of token, exclusive).

  // Position-free tokens, used when comparing against expected values.
  static Token of(TokenKind kind);
  static Token integer(std::int32_t value);
  static Token boolean(bool value);
  static Token name(std::string text);

  // Kind and payload only; position does not take part.
  bool operator==(const Token &other) const;
  bool operator!=(const Token &other) const { return !(*this == other); }
};

const char *to_string(TokenKind kind);

} // namespace impscan
