#include "lexer.hpp"
#include "keywords.hpp"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ConvertUTF.h>

#include <cstdint>
#include <utility>

namespace impscan {
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_letter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_name_part(char c) { return is_letter(c) || is_digit(c) || c == '_'; }

bool is_utf8_continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool is_whitespace(char c) {
  switch (c) {
  case ' ': // space
  case '\t':
  case '\n':
    return true;
  default:
    return false;
  }
}

} // namespace

Lexer::Lexer(std::string_view source) { reset(source); }

void Lexer::reset(std::string_view source) {
  source_ = std::string(source);
  index_ = 0;
  line_ = 1;
  column_ = 1;
}

llvm::Expected<std::optional<Token>> Lexer::next_token() {
  skip_whitespace();

  if (at_end()) {
    return std::nullopt;
  }

  char c = peek();
  if (is_digit(c)) {
    auto number = lex_integer();
    if (!number) {
      return number.takeError();
    }
    return std::move(*number);
  }
  if (is_letter(c)) {
    return lex_name_or_keyword();
  }
  return lex_symbol();
}

llvm::Expected<std::vector<Token>> Lexer::tokenize_all() {
  std::vector<Token> tokens;
  for (;;) {
    auto tok = next_token();
    if (!tok) {
      return tok.takeError();
    }
    if (!*tok) {
      break;
    }
    tokens.push_back(std::move(**tok));
  }
  return std::move(tokens);
}

llvm::Expected<Token> Lexer::lex_integer() {
  std::size_t start_index = index_;
  std::size_t start_line = line_;
  std::size_t start_column = column_;

  while (!at_end() && is_digit(peek())) {
    advance();
  }

  llvm::StringRef digits =
      llvm::StringRef(source_).slice(start_index, index_);
  std::int32_t value = 0;
  // getAsInteger returns true when the text does not fit the target type.
  if (digits.getAsInteger(10, value)) {
    return llvm::make_error<NumericOverflowError>(
        digits.str(), start_index, start_line, start_column, column_);
  }

  Token tok = make_token(TokenKind::Integer, start_index, start_line,
                         start_column);
  tok.int_value = value;
  return std::move(tok);
}

Token Lexer::lex_name_or_keyword() {
  std::size_t start_index = index_;
  std::size_t start_line = line_;
  std::size_t start_column = column_;

  advance(); // first character already validated
  while (!at_end() && is_name_part(peek())) {
    advance();
  }

  std::string_view view =
      std::string_view(source_).substr(start_index, index_ - start_index);
  TokenKind kind = lookup_keyword(view).value_or(TokenKind::Name);
  return make_token(kind, start_index, start_line, start_column);
}

Token Lexer::lex_symbol() {
  std::size_t start_index = index_;
  std::size_t start_line = line_;
  std::size_t start_column = column_;

  TokenKind kind = TokenKind::Invalid;
  char c = advance();
  switch (c) {
  case '*':
    kind = TokenKind::Asterisk;
    break;
  case '{':
    kind = TokenKind::BraceLeft;
    break;
  case '}':
    kind = TokenKind::BraceRight;
    break;
  case '[':
    kind = TokenKind::BracketLeft;
    break;
  case ']':
    kind = TokenKind::BracketRight;
    break;
  case ':':
    kind = match('=') ? TokenKind::Assign : TokenKind::Colon;
    break;
  case '.':
    kind = TokenKind::Dot;
    break;
  case '=':
    kind = match('=') ? TokenKind::Eq : TokenKind::EqualSign;
    break;
  case '-':
    kind = TokenKind::Minus;
    break;
  case '(':
    kind = TokenKind::ParenLeft;
    break;
  case ')':
    kind = TokenKind::ParenRight;
    break;
  case '+':
    kind = TokenKind::Plus;
    break;
  case ';':
    kind = TokenKind::Semicolon;
    break;
  case '/':
    kind = TokenKind::Slash;
    break;
  case '>':
    kind = match('=') ? TokenKind::Ge : TokenKind::Gt;
    break;
  case '<':
    if (match('=')) {
      kind = TokenKind::Le;
    } else if (match('>')) {
      kind = TokenKind::Ne;
    } else {
      kind = TokenKind::Lt;
    }
    break;
  default:
    // Unknown character: it stays consumed so the next call makes progress.
    // A well-formed UTF-8 sequence is one character; a stray or truncated
    // one is reported byte by byte.
    if (static_cast<unsigned char>(c) >= 0x80) {
      consume_utf8_tail(c);
    }
    break;
  }

  return make_token(kind, start_index, start_line, start_column);
}

Token Lexer::make_token(TokenKind kind, std::size_t start_index,
                        std::size_t start_line,
                        std::size_t start_column) const {
  Token tok;
  tok.kind = kind;
  tok.lexeme = source_.substr(start_index, index_ - start_index);
  tok.offset = start_index;
  tok.line = start_line;
  tok.column = start_column;
  tok.end_column = column_;
  return tok;
}

void Lexer::consume_utf8_tail(char lead) {
  unsigned length = llvm::getNumBytesForUTF8(static_cast<llvm::UTF8>(lead));
  if (length < 2 || index_ + (length - 1) > source_.size()) {
    return;
  }
  for (unsigned i = 0; i + 1 < length; ++i) {
    if (!is_utf8_continuation(source_[index_ + i])) {
      return;
    }
  }
  for (unsigned i = 0; i + 1 < length; ++i) {
    advance();
  }
}

void Lexer::skip_whitespace() {
  while (!at_end() && is_whitespace(peek())) {
    advance();
  }
}

bool Lexer::at_end() const { return index_ >= source_.size(); }

char Lexer::peek() const { return source_[index_]; }

bool Lexer::match(char expected) {
  if (at_end() || peek() != expected) {
    return false;
  }
  advance();
  return true;
}

char Lexer::advance() {
  char c = source_[index_++];
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

} // namespace impscan
