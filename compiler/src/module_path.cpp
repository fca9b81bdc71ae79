#include "module_path.hpp"
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/xxhash.h>

namespace silver {

ModulePath ModulePath::parse(const std::string& text) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= text.size()) {
    size_t slash = text.find('/', start);
    if (slash == std::string::npos) slash = text.size();
    if (slash > start) segments.push_back(text.substr(start, slash - start));
    start = slash + 1;
  }
  return ModulePath(std::move(segments));
}

ModulePath ModulePath::child(const std::string& name) const {
  std::vector<std::string> segments = segments_;
  segments.push_back(name);
  return ModulePath(std::move(segments));
}

const std::string& ModulePath::name() const {
  static const std::string empty;
  return segments_.empty() ? empty : segments_.back();
}

std::string ModulePath::to_string() const {
  std::string out;
  for (size_t i = 0; i < segments_.size(); ++i) {
    if (i > 0) out += '/';
    out += segments_[i];
  }
  return out;
}

SourceFileId source_file_id(const ModulePath& path) {
  std::string text = path.to_string();
  return SourceFileId{llvm::xxHash64(llvm::StringRef(text))};
}

}  // namespace silver
