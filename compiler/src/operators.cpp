#include "operators.hpp"

namespace silver {

namespace {

struct OperatorEntry {
  std::string_view spelling;
  TokenKind kind;
};

constexpr OperatorEntry kOperators[] = {
    {"(", TokenKind::LParen},
    {")", TokenKind::RParen},
    {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},
    {"}", TokenKind::RBrace},
    {":", TokenKind::Colon},
    {";", TokenKind::Semi},
    {".", TokenKind::Dot},
    {",", TokenKind::Comma},
    {"~", TokenKind::Tilde},
    {"@", TokenKind::At},

    {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},
    {"*", TokenKind::Star},
    {"/", TokenKind::Slash},
    {"%", TokenKind::Percent},
    {"^", TokenKind::Caret},
    {"&", TokenKind::Amper},
    {"|", TokenKind::Pipe},
    {"=", TokenKind::Equals},
    {"<", TokenKind::Less},
    {">", TokenKind::Greater},
    {"!", TokenKind::Not},

    {"->", TokenKind::RArrow},
    {"==", TokenKind::EqualsEquals},
    {"!=", TokenKind::NotEquals},
    {"<=", TokenKind::LessEquals},
    {">=", TokenKind::GreaterEquals},
    {"<<", TokenKind::LShift},
    {">>", TokenKind::RShift},
    {"**", TokenKind::StarStar},

    {"+=", TokenKind::PlusEquals},
    {"-=", TokenKind::MinusEquals},
    {"*=", TokenKind::StarEquals},
    {"/=", TokenKind::SlashEquals},
    {"%=", TokenKind::PercentEquals},
    {"&=", TokenKind::AmperEquals},
    {"|=", TokenKind::PipeEquals},
    {"^=", TokenKind::CaretEquals},
    {"<<=", TokenKind::LShiftEquals},
    {">>=", TokenKind::RShiftEquals},
    {"**=", TokenKind::StarStarEquals},
};

}  // namespace

std::optional<TokenKind> lookup_operator(std::string_view spelling) {
  for (const auto& entry : kOperators) {
    if (entry.spelling == spelling) return entry.kind;
  }
  return std::nullopt;
}

std::optional<OperatorMatch> match_operator(std::string_view text) {
  size_t max_len = text.size() < kMaxOperatorLength ? text.size() : kMaxOperatorLength;
  for (size_t len = max_len; len > 0; --len) {
    if (auto kind = lookup_operator(text.substr(0, len))) return OperatorMatch{*kind, len};
  }
  return std::nullopt;
}

const char* operator_spelling(TokenKind kind) {
  for (const auto& entry : kOperators) {
    if (entry.kind == kind) return entry.spelling.data();
  }
  return nullptr;
}

}  // namespace silver
