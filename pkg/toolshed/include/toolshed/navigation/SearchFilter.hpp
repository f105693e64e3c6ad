// Repository: Toolshed
// Component: SearchFilter
// Purpose: Derives the visible subset of a listing from a text query.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_NAVIGATION_SEARCH_FILTER_HPP_
#define TOOLSHED_NAVIGATION_SEARCH_FILTER_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "toolshed/catalog/CatalogTypes.hpp"

namespace toolshed::navigation {

// Substring test under full Unicode case folding of UTF-8 text, so "ÄPFEL"
// contains "äpfel" and "STRASSE" contains "straße". An empty needle always
// matches.
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

// Ordered sub-sequence of `children` whose name or description contains
// `query`. Empty query returns `children` unchanged. Recomputed from scratch
// on every call; there is no incremental state.
std::vector<catalog::NodeId> FilterChildren(const catalog::CatalogSnapshot& snapshot,
                                            const std::vector<catalog::NodeId>& children,
                                            const std::string& query);

// Keeps `index` if it addresses one of `count` items, otherwise 0;
// nullopt when the listing is empty.
std::optional<size_t> ClampSelection(std::optional<size_t> index, size_t count);

}  // namespace toolshed::navigation

#endif  // TOOLSHED_NAVIGATION_SEARCH_FILTER_HPP_
