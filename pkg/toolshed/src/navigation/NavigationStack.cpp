// Repository: Toolshed
// Component: NavigationStack Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/navigation/NavigationStack.hpp"

#include <stdexcept>
#include <utility>

namespace toolshed::navigation {

NavigationStack::NavigationStack(std::shared_ptr<const catalog::CatalogSnapshot> snapshot,
                                 const catalog::Category& category)
    : snapshot_(std::move(snapshot)), category_name_(category.name), selected_index_(0) {
  if (!snapshot_ || snapshot_->FindNode(category.root) == nullptr) {
    throw std::invalid_argument("NavigationStack: category root not in snapshot");
  }
  frames_.push_back(NavigationFrame{category.root, std::nullopt});
}

bool NavigationStack::Enter(NodeId node) {
  const catalog::CatalogNode* target = snapshot_->FindNode(node);
  if (target == nullptr || !target->HasChildren()) {
    return false;
  }
  frames_.push_back(NavigationFrame{node, selected_index_});
  selected_index_ = 0;
  return true;
}

bool NavigationStack::GoBack() {
  if (AtRoot()) {
    return false;
  }
  selected_index_ = frames_.back().selected_index;
  frames_.pop_back();
  return true;
}

std::vector<std::string> NavigationStack::Breadcrumb() const {
  std::vector<std::string> crumbs;
  crumbs.reserve(frames_.size());
  crumbs.push_back(category_name_);
  for (size_t i = 1; i < frames_.size(); ++i) {
    const catalog::CatalogNode* node = snapshot_->FindNode(frames_[i].node);
    crumbs.push_back(node != nullptr ? node->name : std::string());
  }
  return crumbs;
}

const std::vector<NodeId>& NavigationStack::CurrentChildren() const {
  // Every frame was validated on push; the snapshot is immutable.
  return snapshot_->FindNode(CurrentNode())->children;
}

}  // namespace toolshed::navigation
