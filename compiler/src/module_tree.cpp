#include "module_tree.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace silver {

static std::string build_node(const fs::path& dir, ModuleNode& node) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return "cannot read directory '" + dir.string() + "': " + ec.message();

  std::vector<fs::path> entries;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) return "cannot read directory '" + dir.string() + "': " + ec.message();
    entries.push_back(it->path());
  }
  std::sort(entries.begin(), entries.end(),
            [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });

  for (const fs::path& entry : entries) {
    ModuleNode child;
    child.path = node.path.child(entry.filename().string());
    child.fs_path = entry;
    child.is_dir = fs::is_directory(entry, ec);
    if (child.is_dir) {
      std::string err = build_node(entry, child);
      if (!err.empty()) return err;
    }
    node.children.push_back(std::move(child));
  }
  return "";
}

ModuleTreeResult load_module_tree(const std::string& root_path) {
  ModuleTreeResult result;
  std::error_code ec;
  fs::path root = fs::absolute(fs::path(root_path), ec).lexically_normal();
  if (ec || !fs::exists(root, ec)) {
    result.error = "root path '" + root_path + "' does not exist";
    return result;
  }
  if (!fs::is_directory(root, ec)) {
    result.error = "root path '" + root_path + "' should be a directory";
    return result;
  }
  if (!root.has_filename()) root = root.parent_path();

  auto node = std::make_unique<ModuleNode>();
  node->path = ModulePath(std::vector<std::string>{root.filename().string()});
  node->fs_path = root;
  node->is_dir = true;
  std::string err = build_node(root, *node);
  if (!err.empty()) {
    result.error = err;
    return result;
  }
  result.root = std::move(node);
  return result;
}

std::vector<const ModuleNode*> walk(const ModuleNode& root) {
  std::vector<const ModuleNode*> order;
  std::vector<const ModuleNode*> stack{&root};
  while (!stack.empty()) {
    const ModuleNode* node = stack.back();
    stack.pop_back();
    order.push_back(node);
    for (auto it = node->children.rbegin(); it != node->children.rend(); ++it)
      stack.push_back(&*it);
  }
  return order;
}

const ModuleNode* find_module(const ModuleNode& root, const ModulePath& path) {
  for (const ModuleNode* node : walk(root))
    if (node->path == path) return node;
  return nullptr;
}

std::vector<const ModuleNode*> leaves(const ModuleNode& node) {
  std::vector<const ModuleNode*> out;
  for (const auto& child : node.children)
    if (!child.is_dir) out.push_back(&child);
  return out;
}

static void display_node(const ModuleNode& node, size_t level, std::string& out) {
  for (size_t i = 0; i < level; ++i) out += "    ";
  out += "|-";
  out += node.path.to_string();
  out += '\n';
  for (const auto& child : node.children) display_node(child, level + 1, out);
}

std::string display_tree(const ModuleNode& root) {
  std::string out;
  display_node(root, 0, out);
  return out;
}

}  // namespace silver
