#include "lexer.hpp"
#include "operators.hpp"
#include <algorithm>
#include <utility>

namespace silver {

static bool is_ascii_alpha(char32_t c) {
  return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

static bool is_digit(char32_t c) {
  return c >= U'0' && c <= U'9';
}

static bool is_ident_start(char32_t c) {
  return c == U'_' || is_ascii_alpha(c);
}

static bool is_ident_body(char32_t c) {
  return c == U'_' || is_ascii_alpha(c) || is_digit(c);
}

static bool is_not_newline(char32_t c) {
  return c != U'\n';
}

Lexer::Lexer(std::string_view source, LexOptions options)
    : cursor_(source), options_(std::move(options)) {}

Token Lexer::make_token(TokenKind kind, size_t start, size_t end, std::string text) const {
  Token t;
  t.kind = kind;
  t.text = std::move(text);
  t.span = make_span(options_.base_offset + start, options_.base_offset + end);
  return t;
}

std::optional<NextResult> Lexer::resolve_indentation() {
  is_line_start_ = false;
  size_t width = cursor_.skip_whitespace();

  // Blank lines never open or close a block.
  auto next = cursor_.peek();
  if (!next || *next == U'\n') return std::nullopt;

  size_t top = indent_stack_.back();
  if (width == top) return std::nullopt;

  if (width > top) {
    indent_stack_.push_back(width);
    NextResult r;
    r.token = make_token(TokenKind::Indent, line_start_, line_start_);
    return r;
  }

  if (std::find(indent_stack_.begin(), indent_stack_.end(), width) == indent_stack_.end()) {
    LexError err;
    err.kind = LexErrorKind::InconsistentIndentation;
    err.width = width;
    err.offset = options_.base_offset + line_start_;
    err.message = "inconsistent dedent: indentation of " + std::to_string(width) +
                  " does not match any enclosing block (line at offset " +
                  std::to_string(err.offset) + ")";
    NextResult r;
    r.error = std::move(err);
    return r;
  }

  while (indent_stack_.back() > width) {
    indent_stack_.pop_back();
    pending_.push_back(make_token(TokenKind::Dedent, line_start_, line_start_));
  }
  NextResult r;
  r.token = std::move(pending_.front());
  pending_.pop_front();
  return r;
}

std::optional<Token> Lexer::scan_with_rules(size_t start, char32_t first) {
  for (const auto& rule : options_.rules) {
    if (!rule) continue;
    Cursor saved = cursor_;
    auto match = rule->scan(cursor_, first);
    if (match && cursor_.offset() > start)
      return make_token(match->kind, start, cursor_.offset(), std::move(match->text));
    cursor_ = saved;
  }
  return std::nullopt;
}

TokenKind Lexer::scan_operator(char32_t first) {
  // `first` is already consumed; look ahead on a copy for the rest of the
  // longest candidate spelling.
  std::string text(1, static_cast<char>(first));
  Cursor ahead = cursor_;
  while (text.size() < kMaxOperatorLength) {
    auto next = ahead.bump();
    if (!next || *next >= 0x80) break;
    text += static_cast<char>(*next);
  }
  auto match = match_operator(text);
  if (!match) return TokenKind::Unknown;
  for (size_t i = 1; i < match->length; ++i) cursor_.bump();
  return match->kind;
}

Token Lexer::scan_token() {
  size_t start = cursor_.offset();
  char32_t first = *cursor_.peek();

  if (auto ruled = scan_with_rules(start, first)) return std::move(*ruled);

  cursor_.bump();
  if (first == U'#') {
    cursor_.take_while(is_not_newline);
    return make_token(TokenKind::Comment, start, cursor_.offset());
  }
  if (is_ident_start(first)) {
    std::string text(1, static_cast<char>(first));
    text += cursor_.take_while(is_ident_body);
    return make_token(TokenKind::Identifier, start, cursor_.offset(), std::move(text));
  }
  if (is_digit(first)) {
    std::string text(1, static_cast<char>(first));
    text += cursor_.take_while(is_digit);
    return make_token(TokenKind::IntegerLiteral, start, cursor_.offset(), std::move(text));
  }
  if (first == U'\n') {
    is_line_start_ = true;
    line_start_ = cursor_.offset();
    return make_token(TokenKind::NewLine, start, cursor_.offset());
  }
  if (first < 0x80) return make_token(scan_operator(first), start, cursor_.offset());
  return make_token(TokenKind::Unknown, start, cursor_.offset());
}

void Lexer::close_stream() {
  if (closed_) return;
  closed_ = true;
  size_t end = cursor_.offset();
  if (emitted_content_ && last_content_ != TokenKind::NewLine)
    pending_.push_back(make_token(TokenKind::NewLine, end, end));
  for (size_t i = 1; i < indent_stack_.size(); ++i)
    pending_.push_back(make_token(TokenKind::Dedent, end, end));
  indent_stack_.resize(1);
}

NextResult Lexer::next() {
  NextResult r;
  if (!pending_.empty()) {
    r.token = std::move(pending_.front());
    pending_.pop_front();
    return r;
  }

  if (is_line_start_) {
    if (auto resolved = resolve_indentation()) return std::move(*resolved);
  }

  cursor_.skip_whitespace();
  if (cursor_.at_end()) {
    close_stream();
    if (!pending_.empty()) {
      r.token = std::move(pending_.front());
      pending_.pop_front();
    }
    return r;
  }

  Token t = scan_token();
  emitted_content_ = true;
  last_content_ = t.kind;
  r.token = std::move(t);
  return r;
}

LexResult lex(std::string_view source, const LexOptions& options) {
  LexResult result;
  Lexer lexer(source, options);
  while (true) {
    NextResult r = lexer.next();
    if (!r.ok()) {
      result.error = std::move(r.error);
      break;
    }
    if (!r.token) break;
    result.tokens.push_back(std::move(*r.token));
  }
  return result;
}

}  // namespace silver
