// Repository: Toolshed
// Component: SelectionSet Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/navigation/SelectionSet.hpp"

#include <algorithm>

namespace toolshed::navigation {

bool SelectionSet::Toggle(const catalog::CatalogNode& node) {
  if (!node.multi_select) {
    return false;
  }
  auto it = std::find(members_.begin(), members_.end(), node.id);
  if (it != members_.end()) {
    members_.erase(it);
  } else {
    members_.push_back(node.id);
  }
  return true;
}

bool SelectionSet::Contains(catalog::NodeId id) const {
  return std::find(members_.begin(), members_.end(), id) != members_.end();
}

std::vector<catalog::NodeId> SelectionSet::Drain() {
  std::vector<catalog::NodeId> drained;
  drained.swap(members_);
  return drained;
}

}  // namespace toolshed::navigation
