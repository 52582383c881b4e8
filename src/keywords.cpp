#include "keywords.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace impscan {
namespace {

constexpr std::array<std::pair<std::string_view, TokenKind>, 8> kKeywords = {{
    {"and", TokenKind::And},
    {"array", TokenKind::Array},
    {"if", TokenKind::If},
    {"let", TokenKind::Let},
    {"not", TokenKind::Not},
    {"or", TokenKind::Or},
    {"print", TokenKind::Print},
    {"while", TokenKind::While},
}};

} // namespace

std::optional<TokenKind> lookup_keyword(std::string_view spelling) {
  auto it = std::find_if(
      kKeywords.begin(), kKeywords.end(),
      [spelling](const auto &entry) { return entry.first == spelling; });
  if (it == kKeywords.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string_view keyword_spelling(TokenKind kind) {
  for (const auto &[spelling, keyword] : kKeywords) {
    if (keyword == kind) {
      return spelling;
    }
  }
  return {};
}

} // namespace impscan
