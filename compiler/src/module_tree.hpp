#ifndef SILVER_MODULE_TREE_HPP
#define SILVER_MODULE_TREE_HPP

#include "module_path.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace silver {

/* A directory (branch) or a source file (leaf) of a project. Building the tree
 * only lists the directories; no file content is read. */
struct ModuleNode {
  ModulePath path;
  std::filesystem::path fs_path;
  bool is_dir = false;
  std::vector<ModuleNode> children;  // sorted by name; empty for files
};

struct ModuleTreeResult {
  std::unique_ptr<ModuleNode> root;
  std::string error;
  bool ok() const { return root != nullptr; }
};

ModuleTreeResult load_module_tree(const std::string& root_path);

/* Depth-first pre-order over every node, `root` first. */
std::vector<const ModuleNode*> walk(const ModuleNode& root);

const ModuleNode* find_module(const ModuleNode& root, const ModulePath& path);

/* Immediate children of `node` that are files. */
std::vector<const ModuleNode*> leaves(const ModuleNode& node);

/* One line per node, four spaces per level: `|-<module path>`. */
std::string display_tree(const ModuleNode& root);

}  // namespace silver

#endif
