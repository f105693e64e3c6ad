// Repository: Toolshed
// Component: NavigationStack
// Purpose: Location inside one category's tree and the path taken to reach it.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_NAVIGATION_NAVIGATION_STACK_HPP_
#define TOOLSHED_NAVIGATION_NAVIGATION_STACK_HPP_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolshed/catalog/CatalogTypes.hpp"

namespace toolshed::navigation {

using catalog::NodeId;

// One level of navigation history: the node whose children are listed, and
// the selection index that was active in the parent listing when the frame
// was entered (restored by GoBack).
struct NavigationFrame {
  NodeId node = 0;
  std::optional<size_t> selected_index;
};

// NavigationStack: never empty; the bottom frame is the category root.
//
// Enter() only descends into nodes that have children. GoBack() at the root
// is a no-op. Both report whether the stack changed so the owner can clear
// its search text.
class NavigationStack {
 public:
  NavigationStack(std::shared_ptr<const catalog::CatalogSnapshot> snapshot,
                  const catalog::Category& category);

  // Pushes (node, current selection) and resets the selection to 0.
  // Returns false (stack unchanged) if the node is unknown or a leaf.
  bool Enter(NodeId node);

  // Pops the top frame and restores its stored selection.
  // Returns false at the root.
  bool GoBack();

  [[nodiscard]] bool AtRoot() const { return frames_.size() == 1; }
  [[nodiscard]] size_t Depth() const { return frames_.size(); }

  // Category name followed by the name of every frame above the root.
  std::vector<std::string> Breadcrumb() const;

  NodeId CurrentNode() const { return frames_.back().node; }
  const std::vector<NodeId>& CurrentChildren() const;

  const std::string& CategoryName() const { return category_name_; }
  const std::vector<NavigationFrame>& Frames() const { return frames_; }

  // Selection within the current (filtered) listing; nullopt when the
  // listing is empty.
  std::optional<size_t> SelectedIndex() const { return selected_index_; }
  void SetSelectedIndex(std::optional<size_t> index) { selected_index_ = index; }

 private:
  std::shared_ptr<const catalog::CatalogSnapshot> snapshot_;
  std::string category_name_;
  std::vector<NavigationFrame> frames_;
  std::optional<size_t> selected_index_;
};

}  // namespace toolshed::navigation

#endif  // TOOLSHED_NAVIGATION_NAVIGATION_STACK_HPP_
