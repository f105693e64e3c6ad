// Repository: Toolshed
// Component: ScriptDirectoryProvider Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/catalog/ScriptDirectoryProvider.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <unistd.h>

#include "toolshed/util/Logger.hpp"

namespace toolshed::catalog {

namespace fs = std::filesystem;
using toolshed::util::Logger;

namespace {

constexpr char kScriptExtension[] = ".sh";
constexpr char kRawCommandExtension[] = ".cmd";
constexpr char kDescriptionFile[] = ".description";
constexpr char kScriptInterpreter[] = "sh";

std::string Trim(const std::string& s) {
  size_t begin = 0;
  while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> Split(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(s);
  while (std::getline(in, item, delim)) {
    item = Trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

bool ParseBool(const std::string& value) {
  const std::string v = ToLower(Trim(value));
  return v == "true" || v == "yes" || v == "1";
}

bool ReadFile(const fs::path& path, std::string* out) {
  std::ifstream file(path);
  if (!file.is_open()) return false;
  std::stringstream buffer;
  buffer << file.rdbuf();
  *out = buffer.str();
  return true;
}

std::string FirstLine(const std::string& content) {
  return Trim(content.substr(0, content.find('\n')));
}

bool IsExecutableFile(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return false;
  return access(path.c_str(), X_OK) == 0;
}

}  // namespace

// =============================================================================
// Header parsing
// =============================================================================

EntryHeader ParseEntryHeader(const std::string& content) {
  EntryHeader header;
  std::istringstream in(content);
  std::string line;
  std::ostringstream body;
  bool in_header = true;
  bool first_line = true;

  while (std::getline(in, line)) {
    if (in_header) {
      if (first_line && line.rfind("#!", 0) == 0) {
        first_line = false;
        continue;
      }
      first_line = false;
      const std::string trimmed = Trim(line);
      if (!trimmed.empty() && trimmed.front() == '#') {
        const std::string text = Trim(trimmed.substr(1));
        const size_t colon = text.find(':');
        if (colon != std::string::npos) {
          const std::string key = ToLower(Trim(text.substr(0, colon)));
          const std::string value = Trim(text.substr(colon + 1));
          if (key == "name") {
            header.name = value;
          } else if (key == "description") {
            header.description = value;
          } else if (key == "tags") {
            header.tags = Split(value, ',');
          } else if (key == "multiselect" || key == "multi-select") {
            header.multi_select = ParseBool(value);
          } else if (key == "requires") {
            header.requires_executables = Split(value, ' ');
          }
        }
        continue;
      }
      // Blank lines between the shebang and the comment block do not end it.
      if (trimmed.empty()) continue;
      in_header = false;
    }
    body << line << '\n';
  }

  header.body = Trim(body.str());
  return header;
}

// =============================================================================
// ScriptDirectoryProvider
// =============================================================================

ScriptDirectoryProvider::ScriptDirectoryProvider(fs::path root)
    : root_(std::move(root)), lookup_(&ScriptDirectoryProvider::ExecutableOnPath) {}

void ScriptDirectoryProvider::SetExecutableLookup(ExecutableLookupFn lookup) {
  lookup_ = std::move(lookup);
}

bool ScriptDirectoryProvider::ExecutableOnPath(const std::string& name) {
  if (name.empty()) return false;
  if (name.find('/') != std::string::npos) {
    return IsExecutableFile(fs::path(name));
  }
  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) return false;
  std::istringstream in(path_env);
  std::string dir;
  while (std::getline(in, dir, ':')) {
    if (dir.empty()) dir = ".";
    if (IsExecutableFile(fs::path(dir) / name)) return true;
  }
  return false;
}

bool ScriptDirectoryProvider::Compatible(const EntryHeader& header) const {
  for (const auto& executable : header.requires_executables) {
    if (!lookup_ || !lookup_(executable)) return false;
  }
  return true;
}

std::shared_ptr<const CatalogSnapshot> ScriptDirectoryProvider::GetCatalog(bool validate) {
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    throw CatalogError("catalog root is not a directory: " + root_.string());
  }

  std::vector<fs::path> category_dirs;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    const std::string filename = it->path().filename().string();
    if (it->is_directory(entry_ec) && !filename.empty() && filename.front() != '.') {
      category_dirs.push_back(it->path());
    }
  }
  if (ec) {
    throw CatalogError("cannot read catalog root " + root_.string() + ": " + ec.message());
  }
  std::sort(category_dirs.begin(), category_dirs.end());

  CatalogBuilder builder;
  size_t skipped = 0;
  for (const auto& dir : category_dirs) {
    const NodeId root = builder.AddCategory(dir.filename().string());
    ScanDirectory(builder, root, dir, validate, &skipped);
  }
  builder.PruneEmptyGroups();
  auto snapshot = std::make_shared<const CatalogSnapshot>(builder.Build());

  std::ostringstream oss;
  oss << "[ScriptDirectoryProvider] SCAN_COMPLETE root=" << root_.string()
      << " categories=" << snapshot->Categories().size()
      << " nodes=" << snapshot->Nodes().size()
      << " skipped_incompatible=" << skipped
      << " validate=" << (validate ? "Y" : "N");
  Logger::Info(oss.str());
  return snapshot;
}

void ScriptDirectoryProvider::ScanDirectory(CatalogBuilder& builder, NodeId parent,
                                            const fs::path& dir, bool validate,
                                            size_t* skipped) const {
  std::vector<fs::path> subdirs;
  std::vector<fs::path> leaves;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const fs::path& path = it->path();
    const std::string filename = path.filename().string();
    if (filename.empty() || filename.front() == '.') continue;
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      // Linked groups can point back at an ancestor; only real directories nest.
      if (it->is_symlink(entry_ec)) {
        std::ostringstream oss;
        oss << "[ScriptDirectoryProvider] SKIP_SYMLINK_DIR path=" << path.string();
        Logger::Debug(oss.str());
        continue;
      }
      subdirs.push_back(path);
    } else if (path.extension() == kScriptExtension ||
               path.extension() == kRawCommandExtension) {
      leaves.push_back(path);
    }
  }
  if (ec) {
    std::ostringstream oss;
    oss << "[ScriptDirectoryProvider] SCAN_WARN dir=" << dir.string()
        << " error=" << ec.message();
    Logger::Warn(oss.str());
  }
  std::sort(subdirs.begin(), subdirs.end());
  std::sort(leaves.begin(), leaves.end());

  for (const auto& subdir : subdirs) {
    CatalogNode group;
    group.name = subdir.filename().string();
    group.command = NoCommand{};
    std::string description;
    if (ReadFile(subdir / kDescriptionFile, &description)) {
      group.description = FirstLine(description);
    }
    const NodeId id = builder.AddNode(parent, std::move(group));
    ScanDirectory(builder, id, subdir, validate, skipped);
  }

  for (const auto& leaf : leaves) {
    std::string content;
    if (!ReadFile(leaf, &content)) {
      std::ostringstream oss;
      oss << "[ScriptDirectoryProvider] UNREADABLE_ENTRY path=" << leaf.string();
      Logger::Warn(oss.str());
      continue;
    }
    EntryHeader header = ParseEntryHeader(content);
    if (validate && !Compatible(header)) {
      ++*skipped;
      std::ostringstream oss;
      oss << "[ScriptDirectoryProvider] SKIP_INCOMPATIBLE path=" << leaf.string();
      Logger::Debug(oss.str());
      continue;
    }

    CatalogNode node;
    node.name = header.name.empty() ? leaf.stem().string() : header.name;
    node.description = header.description;
    node.tags = header.tags;
    node.multi_select = header.multi_select;

    if (leaf.extension() == kScriptExtension) {
      const std::string absolute = fs::absolute(leaf, ec).lexically_normal().string();
      const std::string source = ec ? leaf.string() : absolute;
      node.command = LocalFileCommand{kScriptInterpreter, {source}, source};
    } else {
      if (header.body.empty()) {
        std::ostringstream oss;
        oss << "[ScriptDirectoryProvider] EMPTY_COMMAND path=" << leaf.string();
        Logger::Warn(oss.str());
        continue;
      }
      node.command = RawCommand{header.body};
    }
    builder.AddNode(parent, std::move(node));
  }
}

}  // namespace toolshed::catalog
