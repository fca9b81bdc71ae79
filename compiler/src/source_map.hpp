#ifndef SILVER_SOURCE_MAP_HPP
#define SILVER_SOURCE_MAP_HPP

#include "lexer.hpp"
#include "module_path.hpp"
#include "module_tree.hpp"
#include "span.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace silver {

/* Loaded file content placed in the project-wide offset space: characters
 * [start, end) belong to this file. */
struct SourceCode {
  size_t start = 0;
  size_t end = 0;
  std::string content;

  bool contains(size_t pos) const { return pos >= start && pos <= end; }

  /* Copies the text covered by an absolute span into `out`. Returns an error
   * message, or an empty string on success. */
  std::string slice(const Span& span, std::string& out) const;
};

struct SourceFile {
  SourceFileId id;
  ModulePath module_path;
  std::optional<SourceCode> source_code;  // none for directories

  std::optional<size_t> offset() const {
    if (!source_code) return std::nullopt;
    return source_code->start;
  }
  bool contains(size_t pos) const { return source_code && source_code->contains(pos); }
};

/* Project registry: the module tree is listed up front, file contents are
 * read the first time a module is requested. */
class SourceMap {
 public:
  explicit SourceMap(std::unique_ptr<ModuleNode> tree) : tree_(std::move(tree)) {}

  const ModuleNode& tree() const { return *tree_; }

  /* Loads (once) and returns the module at `path`, or nullptr with `error`
   * set when the path is unknown or the file cannot be read. */
  const SourceFile* get_module(const ModulePath& path, std::string& error);

  /* Loaded file whose range contains the absolute position. */
  const SourceFile* file_at(size_t pos) const;

  size_t loaded_count() const { return files_.size(); }

 private:
  size_t next_offset() const;

  std::unique_ptr<ModuleNode> tree_;
  std::unordered_map<uint64_t, SourceFile> files_;
  std::vector<uint64_t> load_order_;
};

struct SourceMapResult {
  std::unique_ptr<SourceMap> map;
  std::string error;
  bool ok() const { return map != nullptr; }
};

SourceMapResult open_source_map(const std::string& root_path);

/* Reads a whole file. Returns an error message, or empty on success. */
std::string read_file(const std::string& path, std::string& out);

/* Lexes a loaded file with its project-wide start offset as the base. */
LexResult lex_source_file(const SourceFile& file, LexOptions options = {});

}  // namespace silver

#endif
