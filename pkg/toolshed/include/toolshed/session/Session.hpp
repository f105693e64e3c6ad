// Repository: Toolshed
// Component: Session
// Purpose: Interactive-layer facade over the catalog cache, navigation state,
//          selection set and execution coordinator.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_SESSION_SESSION_HPP_
#define TOOLSHED_SESSION_SESSION_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolshed/catalog/CatalogCache.hpp"
#include "toolshed/catalog/CatalogTypes.hpp"
#include "toolshed/execution/ExecutionCoordinator.hpp"
#include "toolshed/navigation/NavigationStack.hpp"
#include "toolshed/navigation/SelectionSet.hpp"

namespace toolshed::session {

using catalog::NodeId;

// =============================================================================
// Error Codes
// Synchronous rejections. Failures that happen after dispatch travel in
// ExecutionResult instead.
// =============================================================================

enum class SessionError {
  kNone = 0,

  // Unknown category name, or node id not present in the current snapshot.
  kNotFound,

  // Target is a grouping node.
  kNotExecutable,

  // The catalog provider failed; no snapshot is loaded.
  kCatalogUnavailable,
};

const char* SessionErrorToString(SessionError error);

struct SessionResult {
  bool success;
  SessionError error;
  std::string message;

  // Execute(): sequence assigned by the coordinator.
  uint64_t sequence;

  static SessionResult Success(uint64_t seq = 0) {
    return {true, SessionError::kNone, "", seq};
  }

  static SessionResult Failure(SessionError err, const std::string& message = "") {
    return {false, err, message, 0};
  }
};

// One row of the current listing.
struct ItemView {
  NodeId id = 0;
  std::string name;
  std::string description;
  std::vector<std::string> tags;
  bool has_children = false;
  bool is_multi_selected = false;
  bool is_executable = false;
  bool multi_select = false;
};

// Session
//
// Owns the NavigationStack, search text and SelectionSet; shares the
// CatalogCache and ExecutionCoordinator it was given. The snapshot is loaded
// lazily on first use. Navigation and selection are reset whenever the
// category switches or the snapshot is reloaded.
//
// Not thread-safe. A Session belongs to one interactive thread; the control
// service serializes its handlers with a mutex.
class Session {
 public:
  Session(std::shared_ptr<catalog::CatalogCache> cache,
          std::shared_ptr<execution::ExecutionCoordinator> coordinator,
          bool validate);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  // Loads the snapshot if none is held and opens the first category.
  // Fails with kCatalogUnavailable when the provider throws.
  SessionResult EnsureLoaded();

  // Queries below return empty values while no snapshot can be loaded.
  std::vector<std::string> ListCategories();
  std::vector<ItemView> CurrentItems();
  std::vector<std::string> Breadcrumb();
  std::string CurrentCategory() const;
  const std::string& SearchText() const { return search_text_; }
  [[nodiscard]] bool AtRoot() const;

  // Descends into a child of the current node. Entering a leaf is a
  // successful no-op. Clears the search text when the stack changes.
  SessionResult Enter(NodeId node);

  // Returns false at the root. Clears the search text otherwise.
  bool GoBack();

  SessionResult SwitchCategory(const std::string& name);

  void SetSearch(const std::string& text);

  // Unknown ids fail with kNotFound; nodes without multi_select are left
  // unchanged and reported as success.
  SessionResult ToggleSelection(NodeId node);
  bool IsSelected(NodeId node) const { return selection_.Contains(node); }
  size_t SelectionSize() const { return selection_.Size(); }

  // Asynchronous. kNotFound and kNotExecutable are returned before anything
  // is submitted.
  SessionResult Execute(NodeId node);

  // Submits every selected node in insertion order and clears the selection.
  // Returns the number of requests submitted.
  size_t ExecuteSelected();

  std::optional<execution::ExecutionResult> PollResult();

  SessionResult Preview(NodeId node, std::string* out);

  // Drops the cached snapshot and loads a fresh one. The current category is
  // kept if it still exists.
  SessionResult RefreshCatalog();

  // Selection cursor within the current (filtered) listing.
  bool Select(size_t index);
  std::optional<size_t> SelectedIndex() const;
  std::optional<NodeId> SelectedNode();

  [[nodiscard]] bool IsExecuting() const;

  // True while the front-end should keep ticking to pick up results.
  [[nodiscard]] bool WantsTick() const { return IsExecuting(); }

 private:
  void OpenCategory(const catalog::Category& category);
  std::vector<NodeId> VisibleChildren() const;
  void ClampCursor();
  const catalog::CatalogNode* Lookup(NodeId node) const;

  std::shared_ptr<catalog::CatalogCache> cache_;
  std::shared_ptr<execution::ExecutionCoordinator> coordinator_;
  bool validate_;

  std::shared_ptr<const catalog::CatalogSnapshot> snapshot_;
  std::optional<navigation::NavigationStack> nav_;
  std::string search_text_;
  navigation::SelectionSet selection_;
};

}  // namespace toolshed::session

#endif  // TOOLSHED_SESSION_SESSION_HPP_
