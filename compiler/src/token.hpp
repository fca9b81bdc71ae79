#ifndef SILVER_TOKEN_HPP
#define SILVER_TOKEN_HPP

#include "span.hpp"
#include <iosfwd>
#include <string>

namespace silver {

enum class TokenKind {
  Comment,  // # ...
  Identifier,
  IntegerLiteral,
  StringLiteral,
  NewLine,
  Indent,
  Dedent,

  LParen,    // (
  RParen,    // )
  LBracket,  // [
  RBracket,  // ]
  LBrace,    // {
  RBrace,    // }
  Colon,
  Semi,
  Dot,
  Comma,

  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Caret,
  Amper,
  Pipe,
  Tilde,
  Equals,   // =
  Less,
  Greater,
  Not,      // !
  At,

  RArrow,         // ->
  EqualsEquals,   // ==
  NotEquals,      // !=
  LessEquals,     // <=
  GreaterEquals,  // >=
  LShift,         // <<
  RShift,         // >>
  StarStar,       // **

  PlusEquals,
  MinusEquals,
  StarEquals,
  SlashEquals,
  PercentEquals,
  AmperEquals,
  PipeEquals,
  CaretEquals,
  LShiftEquals,    // <<=
  RShiftEquals,    // >>=
  StarStarEquals,  // **=

  Unknown,
};

struct Token {
  TokenKind kind = TokenKind::Unknown;
  std::string text;  // Identifier, IntegerLiteral, StringLiteral only
  Span span;
};

const char* token_kind_name(TokenKind kind);

/* True for the kinds that carry text in Token::text. */
bool token_kind_has_text(TokenKind kind);

/* One-line rendering used by the driver, e.g. `Identifier("one") 0..3`. */
std::string to_string(const Token& token);

std::ostream& operator<<(std::ostream& os, TokenKind kind);

}  // namespace silver

#endif
