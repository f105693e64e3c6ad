// Repository: Toolshed
// Component: Catalog
// Purpose: Data structures for the immutable catalog snapshot (node arena,
//          categories, command specifications).
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_CATALOG_TYPES_HPP_
#define TOOLSHED_CATALOG_TYPES_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace toolshed::catalog {

// Index into CatalogSnapshot::nodes. Unique within one loaded snapshot only;
// ids from a previous snapshot must not be used after a reload.
using NodeId = uint32_t;

// =============================================================================
// Command Specification
// =============================================================================

// Grouping node ("directory"). Never executable.
struct NoCommand {};

// Shell text passed to `sh -c` as a single command string.
struct RawCommand {
  std::string shell_text;
};

// Script on disk. Runs `executable args...` with the working directory set
// to the parent directory of source_path.
struct LocalFileCommand {
  std::string executable;
  std::vector<std::string> args;
  std::string source_path;
};

using CommandSpec = std::variant<NoCommand, RawCommand, LocalFileCommand>;

enum class CommandKind {
  kNone,
  kRaw,
  kLocalFile,
};

CommandKind KindOf(const CommandSpec& command);

// "directory", "raw" or "script"; used in logs and item views.
const char* CommandKindName(CommandKind kind);

inline bool IsExecutable(const CommandSpec& command) {
  return !std::holds_alternative<NoCommand>(command);
}

// =============================================================================
// Nodes and Categories
// =============================================================================

struct CatalogNode {
  NodeId id = 0;
  std::string name;
  std::string description;
  std::vector<std::string> tags;  // "task list"
  bool multi_select = false;
  std::vector<NodeId> children;   // Ordered; empty => leaf
  CommandSpec command;

  bool HasChildren() const { return !children.empty(); }
};

struct Category {
  std::string name;
  NodeId root = 0;  // Grouping node; never listed as an item
};

// =============================================================================
// CatalogSnapshot
// Immutable once produced. All categories share one node arena; each node's
// id equals its index in `nodes`.
// =============================================================================

class CatalogSnapshot {
 public:
  CatalogSnapshot() = default;
  CatalogSnapshot(std::vector<Category> categories, std::vector<CatalogNode> nodes);

  const std::vector<Category>& Categories() const { return categories_; }
  const std::vector<CatalogNode>& Nodes() const { return nodes_; }

  // nullptr when unknown.
  const CatalogNode* FindNode(NodeId id) const;
  const Category* FindCategory(const std::string& name) const;

  // Category whose tree contains `id`, or nullptr.
  const Category* CategoryOf(NodeId id) const;

  std::vector<std::string> CategoryNames() const;

  // Number of nodes reachable from the category root, root excluded.
  size_t CountEntries(const Category& category) const;

 private:
  std::vector<Category> categories_;
  std::vector<CatalogNode> nodes_;
};

// =============================================================================
// CatalogBuilder
// Appends nodes to an arena while keeping id == index. Used by providers and
// by tests to assemble snapshots.
// =============================================================================

class CatalogBuilder {
 public:
  // Adds a category with a fresh root grouping node; returns the root id.
  NodeId AddCategory(const std::string& name);

  // Appends `node` under `parent`; assigns and returns its id.
  NodeId AddNode(NodeId parent, CatalogNode node);

  // Removes grouping nodes that (recursively) contain no executable leaf.
  // Category roots are kept even when empty.
  void PruneEmptyGroups();

  CatalogSnapshot Build();

 private:
  bool PruneRecursive(NodeId id);

  std::vector<Category> categories_;
  std::vector<CatalogNode> nodes_;
};

// Thrown by providers when no snapshot can be produced at all.
class CatalogError : public std::runtime_error {
 public:
  explicit CatalogError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace toolshed::catalog

#endif  // TOOLSHED_CATALOG_TYPES_HPP_
