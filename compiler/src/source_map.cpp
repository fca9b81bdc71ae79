#include "source_map.hpp"
#include "cursor.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace silver {

std::string SourceCode::slice(const Span& span, std::string& out) const {
  if (span.start < start || span.start > end)
    return std::to_string(span.start) + " is not within the bounds of this file";
  if (span.end < span.start || span.end > end)
    return std::to_string(span.end) + " is not within the bounds of this file";

  Cursor cursor(content);
  size_t rel_start = span.start - start;
  size_t rel_end = span.end - start;
  while (cursor.offset() < rel_start && cursor.bump()) {
  }
  size_t byte_start = cursor.byte_offset();
  while (cursor.offset() < rel_end && cursor.bump()) {
  }
  out = content.substr(byte_start, cursor.byte_offset() - byte_start);
  return "";
}

std::string read_file(const std::string& path, std::string& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return "cannot open '" + path + "'";
  std::stringstream buf;
  buf << f.rdbuf();
  if (f.bad()) return "cannot read '" + path + "'";
  out = buf.str();
  return "";
}

size_t SourceMap::next_offset() const {
  // One past the end of the last file with content, so a file's end-of-input
  // tokens never share a position with the next file's first character.
  for (auto it = load_order_.rbegin(); it != load_order_.rend(); ++it) {
    const SourceFile& f = files_.at(*it);
    if (f.source_code) return f.source_code->end + 1;
  }
  return 0;
}

const SourceFile* SourceMap::get_module(const ModulePath& path, std::string& error) {
  SourceFileId id = source_file_id(path);
  auto cached = files_.find(id.value);
  if (cached != files_.end() && cached->second.module_path == path) return &cached->second;

  const ModuleNode* node = find_module(*tree_, path);
  if (!node) {
    error = "no module '" + path.to_string() + "' in the project";
    return nullptr;
  }
  if (cached != files_.end()) {
    error = "module id collision between '" + path.to_string() + "' and '" +
            cached->second.module_path.to_string() + "'";
    return nullptr;
  }

  SourceFile file;
  file.id = id;
  file.module_path = path;
  if (!node->is_dir) {
    SourceCode code;
    std::string err = read_file(node->fs_path.string(), code.content);
    if (!err.empty()) {
      error = err;
      return nullptr;
    }
    code.start = next_offset();
    code.end = code.start + char_count(code.content);
    if (getenv("SILVER_DEBUG")) {
      std::cerr << "silver: loaded " << path.to_string() << " at offset " << code.start
                << " (" << (code.end - code.start) << " chars)\n";
    }
    file.source_code = std::move(code);
  }

  load_order_.push_back(id.value);
  auto inserted = files_.emplace(id.value, std::move(file));
  return &inserted.first->second;
}

const SourceFile* SourceMap::file_at(size_t pos) const {
  for (uint64_t id : load_order_) {
    const SourceFile& f = files_.at(id);
    if (f.contains(pos)) return &f;
  }
  return nullptr;
}

SourceMapResult open_source_map(const std::string& root_path) {
  SourceMapResult result;
  ModuleTreeResult tree = load_module_tree(root_path);
  if (!tree.ok()) {
    result.error = tree.error;
    return result;
  }
  result.map = std::make_unique<SourceMap>(std::move(tree.root));
  return result;
}

LexResult lex_source_file(const SourceFile& file, LexOptions options) {
  if (!file.source_code) return LexResult{};
  options.base_offset = file.source_code->start;
  return lex(file.source_code->content, options);
}

}  // namespace silver
