#ifndef SILVER_MODULE_PATH_HPP
#define SILVER_MODULE_PATH_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace silver {

/* Path of a module from the project root: the root directory's own name
 * first, then one segment per nested directory, then the file name. */
class ModulePath {
 public:
  ModulePath() = default;
  explicit ModulePath(std::vector<std::string> segments) : segments_(std::move(segments)) {}

  /* Splits on '/', ignoring empty segments. */
  static ModulePath parse(const std::string& text);

  ModulePath child(const std::string& name) const;

  const std::string& name() const;
  const std::vector<std::string>& segments() const { return segments_; }
  bool empty() const { return segments_.empty(); }
  size_t depth() const { return segments_.size(); }

  std::string to_string() const;

  bool operator==(const ModulePath& other) const { return segments_ == other.segments_; }
  bool operator!=(const ModulePath& other) const { return !(*this == other); }

 private:
  std::vector<std::string> segments_;
};

/* Identifier of a loaded source file: 64-bit xxHash of the module path. */
struct SourceFileId {
  uint64_t value = 0;

  bool operator==(const SourceFileId& other) const { return value == other.value; }
  bool operator!=(const SourceFileId& other) const { return value != other.value; }
};

SourceFileId source_file_id(const ModulePath& path);

}  // namespace silver

#endif
