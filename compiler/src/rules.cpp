#include "rules.hpp"

namespace silver {

std::optional<RuleMatch> StringLiteralRule::scan(Cursor& cursor, char32_t first) {
  if (first != U'"') return std::nullopt;
  cursor.bump();
  std::string value;
  while (auto c = cursor.peek()) {
    if (*c == U'\n') return std::nullopt;
    cursor.bump();
    if (*c == U'"') return RuleMatch{TokenKind::StringLiteral, std::move(value)};
    if (*c == U'\\') {
      auto escaped = cursor.bump();
      if (!escaped || *escaped == U'\n') return std::nullopt;
      if (*escaped == U'n') value += '\n';
      else if (*escaped == U't') value += '\t';
      else value += encode_utf8(*escaped);
      continue;
    }
    value += encode_utf8(*c);
  }
  return std::nullopt;
}

std::vector<LexerRulePtr> default_rules() {
  return {};
}

}  // namespace silver
