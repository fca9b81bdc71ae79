#ifndef SILVER_TEST_UTILS_H
#define SILVER_TEST_UTILS_H

#include "lexer.hpp"
#include "token.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace silver {
namespace test {

/** Kinds of a full token stream; fails the current test on a lexical error. */
std::vector<TokenKind> lex_kinds(std::string_view source, const LexOptions& options = {});

/** Fresh directory under the system temp dir, removed with its contents on destruction. */
class TempDir {
 public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string name() const { return path_.filename().string(); }

  /** Creates `rel` (and missing parent directories) with `content`. */
  void write(const std::string& rel, const std::string& content) const;
  void mkdir(const std::string& rel) const;

 private:
  std::filesystem::path path_;
};

}  // namespace test
}  // namespace silver

#endif
