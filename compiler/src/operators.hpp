#ifndef SILVER_OPERATORS_HPP
#define SILVER_OPERATORS_HPP

#include "token.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace silver {

/* Fixed table of operator and punctuation spellings. Pure lookups, no state. */

/* Longest spelling in the table. */
constexpr size_t kMaxOperatorLength = 3;

struct OperatorMatch {
  TokenKind kind = TokenKind::Unknown;
  size_t length = 0;
};

/* Exact lookup of a one to three character spelling. */
std::optional<TokenKind> lookup_operator(std::string_view spelling);

/* Longest table entry that is a prefix of `text` (maximal munch). */
std::optional<OperatorMatch> match_operator(std::string_view text);

/* Spelling of an operator/punctuation kind, nullptr for any other kind. */
const char* operator_spelling(TokenKind kind);

}  // namespace silver

#endif
