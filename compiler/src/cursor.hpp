#ifndef SILVER_CURSOR_HPP
#define SILVER_CURSOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace silver {

/* Single-pass reader over the characters of a UTF-8 source unit with one
 * character of lookahead. Offsets count characters (code points), not bytes.
 * The text must outlive the cursor. Copying a cursor snapshots its position. */
class Cursor {
 public:
  explicit Cursor(std::string_view text);

  std::optional<char32_t> peek() const;
  std::optional<char32_t> bump();

  /* Consumes the longest run of characters satisfying `pred` and returns
   * them as UTF-8. Stops before the first failing character. */
  std::string take_while(bool (*pred)(char32_t));

  /* Consumes a run of spaces (not tabs) and returns how many. */
  size_t skip_whitespace();

  bool at_end() const { return byte_pos_ >= text_.size(); }
  size_t offset() const { return offset_; }
  size_t byte_offset() const { return byte_pos_; }

 private:
  void decode_next() const;

  std::string_view text_;
  size_t byte_pos_ = 0;
  size_t offset_ = 0;

  // Decoded lookahead, valid while peeked_width_ != 0.
  mutable char32_t peeked_ = 0;
  mutable size_t peeked_width_ = 0;
};

/* Number of characters a Cursor consumes over `text`. */
size_t char_count(std::string_view text);

struct LineCol {
  size_t line = 1;    // 1-based
  size_t column = 1;  // 1-based, in characters
};

/* Line and column of a character offset into `text`. */
LineCol line_col_at(std::string_view text, size_t offset);

/* Encodes one code point as UTF-8 (U+FFFD for invalid code points). */
std::string encode_utf8(char32_t c);

}  // namespace silver

#endif
