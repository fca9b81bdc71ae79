#ifndef SILVER_DRIVER_HPP
#define SILVER_DRIVER_HPP

#include "lexer.hpp"
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace silver {

/* Replaces the two-character escape `\n` with a newline. Any other
 * backslash, including a trailing one, is kept as is. */
std::string unescape_newlines(std::string_view line);

/* `silver: <where>:<line>:<col>: <message>`. `base` is the offset the text
 * was lexed at, so err.offset - base indexes into `text`. */
std::string format_lex_error(const std::string& where, std::string_view text, size_t base,
                             const LexError& err);

/* Interactive loop: banner, then one prompt per line of `in`, each line lexed
 * with a fresh lexer. Lexical errors go to `err` and the loop goes on.
 * Returns the exit status (0 at end of input). */
int run_repl(std::istream& in, std::ostream& out, std::ostream& err, const LexOptions& options);

/* Lexes one file and prints its tokens. 1 on an unreadable file or a
 * lexical error. */
int run_file(const std::string& path, std::ostream& out, std::ostream& err,
             const LexOptions& options);

int run_tree(const std::string& root, std::ostream& out, std::ostream& err);

/* Opens a source map over `root` and prints the tokens of one module with
 * project-wide offsets. */
int run_module(const std::string& root, const std::string& module, std::ostream& out,
               std::ostream& err, const LexOptions& options);

}  // namespace silver

#endif
