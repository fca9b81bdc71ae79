#ifndef SILVER_RULES_HPP
#define SILVER_RULES_HPP

#include "cursor.hpp"
#include "token.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace silver {

struct RuleMatch {
  TokenKind kind = TokenKind::Unknown;
  std::string text;
};

/* A token rule consulted before the built-in dispatch. scan() is called with
 * the cursor positioned at `first` (not yet consumed). Returning a match
 * commits the consumed characters as one token; returning nullopt declines,
 * and the lexer restores the cursor to where it was before the call. */
class LexerRule {
 public:
  virtual ~LexerRule() = default;
  virtual std::optional<RuleMatch> scan(Cursor& cursor, char32_t first) = 0;
};

using LexerRulePtr = std::shared_ptr<LexerRule>;

/* Double-quoted single-line string with \n \t \" \\ escapes. Declines when
 * the closing quote is missing. */
class StringLiteralRule : public LexerRule {
 public:
  std::optional<RuleMatch> scan(Cursor& cursor, char32_t first) override;
};

/* Rules registered when none are given explicitly. Currently empty. */
std::vector<LexerRulePtr> default_rules();

}  // namespace silver

#endif
