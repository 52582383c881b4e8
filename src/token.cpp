#include "token.hpp"

#include <utility>

namespace impscan {

Token Token::of(TokenKind kind) {
  Token tok;
  tok.kind = kind;
  return tok;
}

Token Token::integer(std::int32_t value) {
  Token tok;
  tok.kind = TokenKind::Integer;
  tok.int_value = value;
  tok.lexeme = std::to_string(value);
  return tok;
}

Token Token::boolean(bool value) {
  Token tok;
  tok.kind = TokenKind::Boolean;
  tok.bool_value = value;
  return tok;
}

Token Token::name(std::string text) {
  Token tok;
  tok.kind = TokenKind::Name;
  tok.lexeme = std::move(text);
  return tok;
}

bool Token::operator==(const Token &other) const {
  if (kind != other.kind) {
    return false;
  }
  switch (kind) {
  case TokenKind::Integer:
    return int_value == other.int_value;
  case TokenKind::Boolean:
    return bool_value == other.bool_value;
  case TokenKind::Name:
    return lexeme == other.lexeme;
  default:
    return true;
  }
}

const char *to_string(TokenKind kind) {
  switch (kind) {
  case TokenKind::Invalid:
    return "Invalid";
  case TokenKind::Boolean:
    return "Boolean";
  case TokenKind::Integer:
    return "Integer";
  case TokenKind::Name:
    return "Name";
  case TokenKind::And:
    return "And";
  case TokenKind::Array:
    return "Array";
  case TokenKind::If:
    return "If";
  case TokenKind::Let:
    return "Let";
  case TokenKind::Not:
    return "Not";
  case TokenKind::Or:
    return "Or";
  case TokenKind::Print:
    return "Print";
  case TokenKind::While:
    return "While";
  case TokenKind::Asterisk:
    return "Asterisk";
  case TokenKind::BraceLeft:
    return "BraceLeft";
  case TokenKind::BraceRight:
    return "BraceRight";
  case TokenKind::BracketLeft:
    return "BracketLeft";
  case TokenKind::BracketRight:
    return "BracketRight";
  case TokenKind::Colon:
    return "Colon";
  case TokenKind::Dot:
    return "Dot";
  case TokenKind::EqualSign:
    return "EqualSign";
  case TokenKind::Minus:
    return "Minus";
  case TokenKind::ParenLeft:
    return "ParenLeft";
  case TokenKind::ParenRight:
    return "ParenRight";
  case TokenKind::Plus:
    return "Plus";
  case TokenKind::Semicolon:
    return "Semicolon";
  case TokenKind::Slash:
    return "Slash";
  case TokenKind::Assign:
    return "Assign";
  case TokenKind::Eq:
    return "Eq";
  case TokenKind::Ge:
    return "Ge";
  case TokenKind::Gt:
    return "Gt";
  case TokenKind::Le:
    return "Le";
  case TokenKind::Lt:
    return "Lt";
  case TokenKind::Ne:
    return "Ne";
  }
  return "Unknown";
}

} // namespace impscan
