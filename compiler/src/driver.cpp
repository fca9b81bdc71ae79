#include "driver.hpp"
#include "cursor.hpp"
#include "module_path.hpp"
#include "module_tree.hpp"
#include "source_map.hpp"
#include "token.hpp"
#include <cstdlib>
#include <istream>
#include <ostream>
#include <vector>

namespace silver {

static void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
  for (const auto& t : tokens) out << to_string(t) << "\n";
}

std::string unescape_newlines(std::string_view line) {
  std::string out;
  for (size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size() && line[i + 1] == 'n') {
      out += '\n';
      ++i;
    } else {
      out += line[i];
    }
  }
  return out;
}

std::string format_lex_error(const std::string& where, std::string_view text, size_t base,
                             const LexError& err) {
  size_t rel = err.offset >= base ? err.offset - base : 0;
  LineCol lc = line_col_at(text, rel);
  return "silver: " + where + ":" + std::to_string(lc.line) + ":" + std::to_string(lc.column) +
         ": " + err.message;
}

int run_repl(std::istream& in, std::ostream& out, std::ostream& err, const LexOptions& options) {
  out << "Silver lexer output\n";
  std::string line;
  while (true) {
    out << "> " << std::flush;
    if (!std::getline(in, line)) break;
    std::string source = unescape_newlines(line);
    if (getenv("SILVER_DEBUG")) err << "silver: lexing " << source.size() << " bytes\n";

    Lexer lexer(source, options);
    while (true) {
      NextResult r = lexer.next();
      if (!r.ok()) {
        err << format_lex_error("<stdin>", source, 0, *r.error) << "\n";
        continue;
      }
      if (!r.token) break;
      out << to_string(*r.token) << "\n";
    }
  }
  out << "\n";
  return 0;
}

int run_file(const std::string& path, std::ostream& out, std::ostream& err,
             const LexOptions& options) {
  std::string source;
  std::string read_err = read_file(path, source);
  if (!read_err.empty()) {
    err << "silver: " << read_err << "\n";
    return 1;
  }
  if (getenv("SILVER_DEBUG")) {
    err << "silver: lexing " << path << " (first line: ";
    err << source.substr(0, source.find('\n')) << ")\n";
  }

  auto result = lex(source, options);
  print_tokens(result.tokens, out);
  if (!result.ok()) {
    err << format_lex_error(path, source, 0, *result.error) << "\n";
    return 1;
  }
  return 0;
}

int run_tree(const std::string& root, std::ostream& out, std::ostream& err) {
  auto tree = load_module_tree(root);
  if (!tree.ok()) {
    err << "silver: " << tree.error << "\n";
    return 1;
  }
  out << display_tree(*tree.root);
  return 0;
}

int run_module(const std::string& root, const std::string& module, std::ostream& out,
               std::ostream& err, const LexOptions& options) {
  auto opened = open_source_map(root);
  if (!opened.ok()) {
    err << "silver: " << opened.error << "\n";
    return 1;
  }
  std::string load_err;
  const SourceFile* file = opened.map->get_module(ModulePath::parse(module), load_err);
  if (!file) {
    err << "silver: " << load_err << "\n";
    return 1;
  }
  if (!file->source_code) {
    err << "silver: '" << module << "' is a directory\n";
    return 1;
  }
  auto result = lex_source_file(*file, options);
  print_tokens(result.tokens, out);
  if (!result.ok()) {
    err << format_lex_error(module, file->source_code->content, file->source_code->start,
                            *result.error)
        << "\n";
    return 1;
  }
  return 0;
}

}  // namespace silver
