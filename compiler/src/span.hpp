#ifndef SILVER_SPAN_HPP
#define SILVER_SPAN_HPP

#include <cstddef>

namespace silver {

/* Half-open character range [start, end) in a source unit (or, with a base
 * offset, in the whole project). */
struct Span {
  size_t start = 0;
  size_t end = 0;
  size_t len = 0;

  bool operator==(const Span& other) const {
    return start == other.start && end == other.end;
  }
  bool operator!=(const Span& other) const { return !(*this == other); }
};

inline Span make_span(size_t start, size_t end) {
  if (end < start) end = start;
  return Span{start, end, end - start};
}

inline Span empty_span(size_t at) {
  return Span{at, at, 0};
}

}  // namespace silver

#endif
