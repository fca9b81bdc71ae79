#include "cursor.hpp"
#include <llvm/Support/ConvertUTF.h>

namespace silver {

static constexpr char32_t kReplacementChar = 0xFFFD;

Cursor::Cursor(std::string_view text) : text_(text) {}

void Cursor::decode_next() const {
  unsigned char lead = static_cast<unsigned char>(text_[byte_pos_]);
  if (lead < 0x80) {
    peeked_ = lead;
    peeked_width_ = 1;
    return;
  }
  const auto* src = reinterpret_cast<const llvm::UTF8*>(text_.data() + byte_pos_);
  const auto* end = reinterpret_cast<const llvm::UTF8*>(text_.data() + text_.size());
  const llvm::UTF8* next = src;
  llvm::UTF32 code_point = 0;
  if (llvm::convertUTF8Sequence(&next, end, &code_point, llvm::strictConversion) ==
          llvm::conversionOK &&
      next > src) {
    peeked_ = code_point;
    peeked_width_ = static_cast<size_t>(next - src);
  } else {
    // Malformed sequence: one byte, one character.
    peeked_ = kReplacementChar;
    peeked_width_ = 1;
  }
}

std::optional<char32_t> Cursor::peek() const {
  if (at_end()) return std::nullopt;
  if (peeked_width_ == 0) decode_next();
  return peeked_;
}

std::optional<char32_t> Cursor::bump() {
  if (at_end()) return std::nullopt;
  if (peeked_width_ == 0) decode_next();
  char32_t c = peeked_;
  byte_pos_ += peeked_width_;
  offset_++;
  peeked_width_ = 0;
  return c;
}

std::string Cursor::take_while(bool (*pred)(char32_t)) {
  size_t start = byte_pos_;
  while (auto c = peek()) {
    if (!pred(*c)) break;
    bump();
  }
  return std::string(text_.substr(start, byte_pos_ - start));
}

size_t Cursor::skip_whitespace() {
  size_t count = 0;
  while (peek() == U' ') {
    bump();
    count++;
  }
  return count;
}

size_t char_count(std::string_view text) {
  Cursor cursor(text);
  while (cursor.bump()) {
  }
  return cursor.offset();
}

LineCol line_col_at(std::string_view text, size_t offset) {
  LineCol lc;
  Cursor cursor(text);
  while (cursor.offset() < offset) {
    auto c = cursor.bump();
    if (!c) break;
    if (*c == U'\n') {
      lc.line++;
      lc.column = 1;
    } else {
      lc.column++;
    }
  }
  return lc;
}

std::string encode_utf8(char32_t c) {
  char buf[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
  char* out = buf;
  if (!llvm::ConvertCodePointToUTF8(static_cast<unsigned>(c), out)) {
    out = buf;
    llvm::ConvertCodePointToUTF8(static_cast<unsigned>(kReplacementChar), out);
  }
  return std::string(buf, static_cast<size_t>(out - buf));
}

}  // namespace silver
