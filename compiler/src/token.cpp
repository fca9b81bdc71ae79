#include "token.hpp"
#include <ostream>

namespace silver {

const char* token_kind_name(TokenKind kind) {
  switch (kind) {
    case TokenKind::Comment: return "Comment";
    case TokenKind::Identifier: return "Identifier";
    case TokenKind::IntegerLiteral: return "IntegerLiteral";
    case TokenKind::StringLiteral: return "StringLiteral";
    case TokenKind::NewLine: return "NewLine";
    case TokenKind::Indent: return "Indent";
    case TokenKind::Dedent: return "Dedent";
    case TokenKind::LParen: return "LParen";
    case TokenKind::RParen: return "RParen";
    case TokenKind::LBracket: return "LBracket";
    case TokenKind::RBracket: return "RBracket";
    case TokenKind::LBrace: return "LBrace";
    case TokenKind::RBrace: return "RBrace";
    case TokenKind::Colon: return "Colon";
    case TokenKind::Semi: return "Semi";
    case TokenKind::Dot: return "Dot";
    case TokenKind::Comma: return "Comma";
    case TokenKind::Plus: return "Plus";
    case TokenKind::Minus: return "Minus";
    case TokenKind::Star: return "Star";
    case TokenKind::Slash: return "Slash";
    case TokenKind::Percent: return "Percent";
    case TokenKind::Caret: return "Caret";
    case TokenKind::Amper: return "Amper";
    case TokenKind::Pipe: return "Pipe";
    case TokenKind::Tilde: return "Tilde";
    case TokenKind::Equals: return "Equals";
    case TokenKind::Less: return "Less";
    case TokenKind::Greater: return "Greater";
    case TokenKind::Not: return "Not";
    case TokenKind::At: return "At";
    case TokenKind::RArrow: return "RArrow";
    case TokenKind::EqualsEquals: return "EqualsEquals";
    case TokenKind::NotEquals: return "NotEquals";
    case TokenKind::LessEquals: return "LessEquals";
    case TokenKind::GreaterEquals: return "GreaterEquals";
    case TokenKind::LShift: return "LShift";
    case TokenKind::RShift: return "RShift";
    case TokenKind::StarStar: return "StarStar";
    case TokenKind::PlusEquals: return "PlusEquals";
    case TokenKind::MinusEquals: return "MinusEquals";
    case TokenKind::StarEquals: return "StarEquals";
    case TokenKind::SlashEquals: return "SlashEquals";
    case TokenKind::PercentEquals: return "PercentEquals";
    case TokenKind::AmperEquals: return "AmperEquals";
    case TokenKind::PipeEquals: return "PipeEquals";
    case TokenKind::CaretEquals: return "CaretEquals";
    case TokenKind::LShiftEquals: return "LShiftEquals";
    case TokenKind::RShiftEquals: return "RShiftEquals";
    case TokenKind::StarStarEquals: return "StarStarEquals";
    case TokenKind::Unknown: return "Unknown";
  }
  return "Unknown";
}

bool token_kind_has_text(TokenKind kind) {
  return kind == TokenKind::Identifier || kind == TokenKind::IntegerLiteral ||
         kind == TokenKind::StringLiteral;
}

std::string to_string(const Token& token) {
  std::string out = token_kind_name(token.kind);
  if (token_kind_has_text(token.kind)) {
    out += "(\"";
    out += token.text;
    out += "\")";
  }
  out += " ";
  out += std::to_string(token.span.start);
  out += "..";
  out += std::to_string(token.span.end);
  return out;
}

std::ostream& operator<<(std::ostream& os, TokenKind kind) {
  return os << token_kind_name(kind);
}

}  // namespace silver
