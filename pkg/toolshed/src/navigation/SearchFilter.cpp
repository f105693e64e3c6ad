// Repository: Toolshed
// Component: SearchFilter Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/navigation/SearchFilter.hpp"

#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace toolshed::navigation {

namespace {

// Full Unicode case folding of UTF-8 text; malformed bytes become U+FFFD.
icu::UnicodeString FoldCase(const std::string& text) {
  icu::UnicodeString folded =
      icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
  folded.foldCase(U_FOLD_CASE_DEFAULT);
  return folded;
}

}  // namespace

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return true;
  if (haystack.empty()) return false;
  return FoldCase(haystack).indexOf(FoldCase(needle)) >= 0;
}

std::vector<catalog::NodeId> FilterChildren(const catalog::CatalogSnapshot& snapshot,
                                            const std::vector<catalog::NodeId>& children,
                                            const std::string& query) {
  if (query.empty()) return children;

  std::vector<catalog::NodeId> visible;
  for (catalog::NodeId id : children) {
    const catalog::CatalogNode* node = snapshot.FindNode(id);
    if (node == nullptr) continue;
    if (ContainsIgnoreCase(node->name, query) ||
        ContainsIgnoreCase(node->description, query)) {
      visible.push_back(id);
    }
  }
  return visible;
}

std::optional<size_t> ClampSelection(std::optional<size_t> index, size_t count) {
  if (count == 0) return std::nullopt;
  if (!index.has_value() || *index >= count) return 0;
  return index;
}

}  // namespace toolshed::navigation
