#pragma once

#include "token.hpp"

#include <optional>
#include <string_view>

namespace impscan {

// Exact-case lookup of a reserved word; std::nullopt for ordinary names.
std::optional<TokenKind> lookup_keyword(std::string_view spelling);

// Reserved spelling of a keyword kind, or an empty view for any other kind.
std::string_view keyword_spelling(TokenKind kind);

} // namespace impscan
