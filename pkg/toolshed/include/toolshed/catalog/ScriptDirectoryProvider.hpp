// Repository: Toolshed
// Component: ScriptDirectoryProvider
// Purpose: Catalog provider that builds a snapshot from a directory tree of
//          shell scripts and raw command files.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_CATALOG_SCRIPT_DIRECTORY_PROVIDER_HPP_
#define TOOLSHED_CATALOG_SCRIPT_DIRECTORY_PROVIDER_HPP_

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "toolshed/catalog/ICatalogProvider.hpp"

namespace toolshed::catalog {

// Metadata read from the leading "# Key: value" comment lines of a leaf file.
struct EntryHeader {
  std::string name;
  std::string description;
  std::vector<std::string> tags;
  std::vector<std::string> requires_executables;
  bool multi_select = false;
  // Remaining file content after the header block (raw command text).
  std::string body;
};

// Parses the header block. Parsing stops at the first line that is not a
// comment; a shebang line is skipped. Unknown keys are ignored.
EntryHeader ParseEntryHeader(const std::string& content);

// Catalog layout:
//
//   <root>/<Category>/                 one category per sub-directory
//   <root>/<Category>/<Group>/         grouping node
//   <root>/<Category>/.../name.sh      LocalFile{sh, [abs path], abs path}
//   <root>/<Category>/.../name.cmd     Raw(body)
//   <dir>/.description                 first line = grouping node description
//
// Categories are ordered by name; within a directory, grouping nodes come
// first, then leaves, each ordered by name. Grouping nodes left without any
// leaf are pruned.
//
// validate=true drops leaves whose "Requires" header names an executable
// that cannot be found on PATH.
class ScriptDirectoryProvider : public ICatalogProvider {
 public:
  using ExecutableLookupFn = std::function<bool(const std::string&)>;

  explicit ScriptDirectoryProvider(std::filesystem::path root);

  // Throws CatalogError when the root is missing or not a directory.
  std::shared_ptr<const CatalogSnapshot> GetCatalog(bool validate) override;

  const std::filesystem::path& Root() const { return root_; }

  // Test-only: replace the PATH lookup used by validation.
  void SetExecutableLookup(ExecutableLookupFn lookup);

  // True if `name` resolves to an executable file via PATH (or is a path to one).
  static bool ExecutableOnPath(const std::string& name);

 private:
  void ScanDirectory(CatalogBuilder& builder, NodeId parent,
                     const std::filesystem::path& dir, bool validate,
                     size_t* skipped) const;
  bool Compatible(const EntryHeader& header) const;

  std::filesystem::path root_;
  ExecutableLookupFn lookup_;
};

}  // namespace toolshed::catalog

#endif  // TOOLSHED_CATALOG_SCRIPT_DIRECTORY_PROVIDER_HPP_
