#ifndef SILVER_LEXER_HPP
#define SILVER_LEXER_HPP

#include "cursor.hpp"
#include "rules.hpp"
#include "token.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace silver {

enum class LexErrorKind {
  InconsistentIndentation,
};

struct LexError {
  LexErrorKind kind = LexErrorKind::InconsistentIndentation;
  std::string message;
  size_t width = 0;   // offending indentation width
  size_t offset = 0;  // start of the offending line
};

/* Result of one pull. Neither token nor error means the stream is finished. */
struct NextResult {
  std::optional<Token> token;
  std::optional<LexError> error;
  bool ok() const { return !error.has_value(); }
  bool done() const { return ok() && !token.has_value(); }
};

struct LexOptions {
  /* Added to every emitted span and error offset. */
  size_t base_offset = 0;
  /* Consulted in order before the built-in dispatch. */
  std::vector<LexerRulePtr> rules = default_rules();
};

/* Pull-based tokenizer for one source unit. Each next() call first drains the
 * pending queue, then resolves indentation if a logical line is starting, then
 * scans one content token. At end of input the stream is closed with a NewLine
 * (unless the last token was one) and one Dedent per open indentation level.
 * The source text must outlive the lexer. */
class Lexer {
 public:
  explicit Lexer(std::string_view source, LexOptions options = {});

  NextResult next();

  /* True once end of input was reached and every queued token delivered. */
  bool exhausted() const { return closed_ && pending_.empty(); }

  /* Open indentation widths, bottom first. Always starts with 0. */
  const std::vector<size_t>& indent_levels() const { return indent_stack_; }

 private:
  std::optional<NextResult> resolve_indentation();
  Token scan_token();
  std::optional<Token> scan_with_rules(size_t start, char32_t first);
  TokenKind scan_operator(char32_t first);
  void close_stream();
  Token make_token(TokenKind kind, size_t start, size_t end, std::string text = {}) const;

  Cursor cursor_;
  LexOptions options_;
  std::deque<Token> pending_;
  std::vector<size_t> indent_stack_{0};
  bool is_line_start_ = true;
  size_t line_start_ = 0;
  bool closed_ = false;
  bool emitted_content_ = false;
  TokenKind last_content_ = TokenKind::NewLine;
};

struct LexResult {
  std::vector<Token> tokens;
  std::optional<LexError> error;
  bool ok() const { return !error.has_value(); }
};

/* Lexes a whole unit eagerly. Stops at the first error; tokens produced
 * before it are kept. */
LexResult lex(std::string_view source, const LexOptions& options = {});

}  // namespace silver

#endif
