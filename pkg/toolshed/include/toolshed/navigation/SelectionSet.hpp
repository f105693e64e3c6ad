// Repository: Toolshed
// Component: SelectionSet
// Purpose: Nodes explicitly marked for batched execution, keyed by identity.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_NAVIGATION_SELECTION_SET_HPP_
#define TOOLSHED_NAVIGATION_SELECTION_SET_HPP_

#include <cstddef>
#include <vector>

#include "toolshed/catalog/CatalogTypes.hpp"

namespace toolshed::navigation {

// Members are node ids, not list positions, so membership survives
// navigation. Only nodes with multi_select=true can be members. Iteration
// order is insertion order.
class SelectionSet {
 public:
  // Adds or removes `node`. Returns true if membership changed; always false
  // for nodes without multi_select.
  bool Toggle(const catalog::CatalogNode& node);

  bool Contains(catalog::NodeId id) const;
  bool Empty() const { return members_.empty(); }
  size_t Size() const { return members_.size(); }

  const std::vector<catalog::NodeId>& Members() const { return members_; }

  // Returns the members in insertion order and empties the set.
  std::vector<catalog::NodeId> Drain();

  void Clear() { members_.clear(); }

 private:
  std::vector<catalog::NodeId> members_;
};

}  // namespace toolshed::navigation

#endif  // TOOLSHED_NAVIGATION_SELECTION_SET_HPP_
