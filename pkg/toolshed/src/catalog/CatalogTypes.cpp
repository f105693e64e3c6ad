// Repository: Toolshed
// Component: Catalog
// Purpose: CatalogSnapshot lookups and arena construction.
// Copyright (c) 2025 Toolshed

#include "toolshed/catalog/CatalogTypes.hpp"

#include <unordered_map>
#include <utility>

namespace toolshed::catalog {

CommandKind KindOf(const CommandSpec& command) {
  if (std::holds_alternative<RawCommand>(command)) return CommandKind::kRaw;
  if (std::holds_alternative<LocalFileCommand>(command)) return CommandKind::kLocalFile;
  return CommandKind::kNone;
}

const char* CommandKindName(CommandKind kind) {
  switch (kind) {
    case CommandKind::kNone:
      return "directory";
    case CommandKind::kRaw:
      return "raw";
    case CommandKind::kLocalFile:
      return "script";
  }
  return "unknown";
}

// =============================================================================
// CatalogSnapshot
// =============================================================================

CatalogSnapshot::CatalogSnapshot(std::vector<Category> categories,
                                 std::vector<CatalogNode> nodes)
    : categories_(std::move(categories)), nodes_(std::move(nodes)) {}

const CatalogNode* CatalogSnapshot::FindNode(NodeId id) const {
  if (id >= nodes_.size()) return nullptr;
  return &nodes_[id];
}

const Category* CatalogSnapshot::FindCategory(const std::string& name) const {
  for (const auto& category : categories_) {
    if (category.name == name) return &category;
  }
  return nullptr;
}

const Category* CatalogSnapshot::CategoryOf(NodeId id) const {
  for (const auto& category : categories_) {
    std::vector<NodeId> stack{category.root};
    while (!stack.empty()) {
      NodeId current = stack.back();
      stack.pop_back();
      if (current == id) return &category;
      const CatalogNode* node = FindNode(current);
      if (node == nullptr) continue;
      stack.insert(stack.end(), node->children.begin(), node->children.end());
    }
  }
  return nullptr;
}

std::vector<std::string> CatalogSnapshot::CategoryNames() const {
  std::vector<std::string> names;
  names.reserve(categories_.size());
  for (const auto& category : categories_) {
    names.push_back(category.name);
  }
  return names;
}

size_t CatalogSnapshot::CountEntries(const Category& category) const {
  size_t count = 0;
  std::vector<NodeId> stack{category.root};
  while (!stack.empty()) {
    const CatalogNode* node = FindNode(stack.back());
    stack.pop_back();
    if (node == nullptr) continue;
    count += node->children.size();
    stack.insert(stack.end(), node->children.begin(), node->children.end());
  }
  return count;
}

// =============================================================================
// CatalogBuilder
// =============================================================================

NodeId CatalogBuilder::AddCategory(const std::string& name) {
  CatalogNode root;
  root.id = static_cast<NodeId>(nodes_.size());
  root.name = "root";
  root.command = NoCommand{};
  nodes_.push_back(std::move(root));
  categories_.push_back(Category{name, nodes_.back().id});
  return nodes_.back().id;
}

NodeId CatalogBuilder::AddNode(NodeId parent, CatalogNode node) {
  const NodeId id = static_cast<NodeId>(nodes_.size());
  node.id = id;
  node.children.clear();
  nodes_.push_back(std::move(node));
  if (parent < id) {
    nodes_[parent].children.push_back(id);
  }
  return id;
}

void CatalogBuilder::PruneEmptyGroups() {
  for (const auto& category : categories_) {
    PruneRecursive(category.root);
  }
}

// Returns true if the subtree under `id` contains an executable leaf.
bool CatalogBuilder::PruneRecursive(NodeId id) {
  CatalogNode& node = nodes_[id];
  if (IsExecutable(node.command)) {
    // Executable nodes keep their subtree untouched.
    for (NodeId child : node.children) PruneRecursive(child);
    return true;
  }
  std::vector<NodeId> kept;
  const std::vector<NodeId> children = node.children;
  for (NodeId child : children) {
    if (PruneRecursive(child)) kept.push_back(child);
  }
  nodes_[id].children = std::move(kept);
  return !nodes_[id].children.empty();
}

// Compacts the arena to the nodes reachable from category roots so that ids
// stay dense and equal to their index.
CatalogSnapshot CatalogBuilder::Build() {
  std::vector<CatalogNode> compact;
  std::unordered_map<NodeId, NodeId> remap;
  std::vector<Category> categories;
  categories.reserve(categories_.size());

  for (const auto& category : categories_) {
    std::vector<NodeId> order{category.root};
    for (size_t i = 0; i < order.size(); ++i) {
      const CatalogNode& node = nodes_[order[i]];
      remap[node.id] = static_cast<NodeId>(compact.size() + i);
      order.insert(order.end(), node.children.begin(), node.children.end());
    }
    for (NodeId old_id : order) {
      compact.push_back(nodes_[old_id]);
    }
    categories.push_back(Category{category.name, remap[category.root]});
  }

  for (auto& node : compact) {
    node.id = remap[node.id];
    for (auto& child : node.children) {
      child = remap[child];
    }
  }

  categories_.clear();
  nodes_.clear();
  return CatalogSnapshot(std::move(categories), std::move(compact));
}

}  // namespace toolshed::catalog
