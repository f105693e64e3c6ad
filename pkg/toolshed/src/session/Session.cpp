// Repository: Toolshed
// Component: Session Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/session/Session.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

#include "toolshed/navigation/SearchFilter.hpp"
#include "toolshed/util/Logger.hpp"

namespace toolshed::session {

using toolshed::util::Logger;

const char* SessionErrorToString(SessionError error) {
  switch (error) {
    case SessionError::kNone:
      return "NONE";
    case SessionError::kNotFound:
      return "NOT_FOUND";
    case SessionError::kNotExecutable:
      return "NOT_EXECUTABLE";
    case SessionError::kCatalogUnavailable:
      return "CATALOG_UNAVAILABLE";
  }
  return "UNKNOWN";
}

namespace {

std::string JoinArgs(const std::vector<std::string>& args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0) out += ' ';
    out += args[i];
  }
  return out;
}

}  // namespace

Session::Session(std::shared_ptr<catalog::CatalogCache> cache,
                 std::shared_ptr<execution::ExecutionCoordinator> coordinator,
                 bool validate)
    : cache_(std::move(cache)), coordinator_(std::move(coordinator)), validate_(validate) {
  if (!cache_ || !coordinator_) {
    throw std::invalid_argument("Session requires a catalog cache and a coordinator");
  }
}

SessionResult Session::EnsureLoaded() {
  if (snapshot_) return SessionResult::Success();

  try {
    snapshot_ = cache_->Load(validate_);
  } catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[Session] CATALOG_UNAVAILABLE reason=\"" << e.what() << "\"";
    Logger::Error(oss.str());
    return SessionResult::Failure(SessionError::kCatalogUnavailable, e.what());
  }

  nav_.reset();
  search_text_.clear();
  selection_.Clear();
  if (!snapshot_->Categories().empty()) {
    OpenCategory(snapshot_->Categories().front());
  }
  return SessionResult::Success();
}

void Session::OpenCategory(const catalog::Category& category) {
  nav_.emplace(snapshot_, category);
  search_text_.clear();
  selection_.Clear();
  ClampCursor();
}

const catalog::CatalogNode* Session::Lookup(NodeId node) const {
  if (!snapshot_) return nullptr;
  return snapshot_->FindNode(node);
}

std::vector<NodeId> Session::VisibleChildren() const {
  if (!snapshot_ || !nav_) return {};
  return navigation::FilterChildren(*snapshot_, nav_->CurrentChildren(), search_text_);
}

void Session::ClampCursor() {
  if (!nav_) return;
  nav_->SetSelectedIndex(
      navigation::ClampSelection(nav_->SelectedIndex(), VisibleChildren().size()));
}

// =============================================================================
// Queries
// =============================================================================

std::vector<std::string> Session::ListCategories() {
  if (!EnsureLoaded().success) return {};
  return snapshot_->CategoryNames();
}

std::vector<ItemView> Session::CurrentItems() {
  std::vector<ItemView> items;
  if (!EnsureLoaded().success || !nav_) return items;

  for (NodeId id : VisibleChildren()) {
    const catalog::CatalogNode* node = snapshot_->FindNode(id);
    if (node == nullptr) continue;
    ItemView item;
    item.id = node->id;
    item.name = node->name;
    item.description = node->description;
    item.tags = node->tags;
    item.has_children = node->HasChildren();
    item.is_multi_selected = selection_.Contains(node->id);
    item.is_executable = catalog::IsExecutable(node->command);
    item.multi_select = node->multi_select;
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<std::string> Session::Breadcrumb() {
  if (!EnsureLoaded().success || !nav_) return {};
  return nav_->Breadcrumb();
}

std::string Session::CurrentCategory() const {
  return nav_ ? nav_->CategoryName() : std::string();
}

bool Session::AtRoot() const {
  return !nav_ || nav_->AtRoot();
}

// =============================================================================
// Navigation
// =============================================================================

SessionResult Session::Enter(NodeId node) {
  SessionResult loaded = EnsureLoaded();
  if (!loaded.success) return loaded;
  if (!nav_) {
    return SessionResult::Failure(SessionError::kNotFound, "no category is open");
  }

  const auto& children = nav_->CurrentChildren();
  if (Lookup(node) == nullptr ||
      std::find(children.begin(), children.end(), node) == children.end()) {
    return SessionResult::Failure(SessionError::kNotFound,
                                  "node " + std::to_string(node) + " is not in the current listing");
  }

  if (nav_->Enter(node)) {
    search_text_.clear();
    ClampCursor();
  }
  return SessionResult::Success();
}

bool Session::GoBack() {
  if (!nav_ || !nav_->GoBack()) return false;
  search_text_.clear();
  ClampCursor();
  return true;
}

SessionResult Session::SwitchCategory(const std::string& name) {
  SessionResult loaded = EnsureLoaded();
  if (!loaded.success) return loaded;

  const catalog::Category* category = snapshot_->FindCategory(name);
  if (category == nullptr) {
    return SessionResult::Failure(SessionError::kNotFound, "unknown category: " + name);
  }
  OpenCategory(*category);
  return SessionResult::Success();
}

void Session::SetSearch(const std::string& text) {
  search_text_ = text;
  ClampCursor();
}

bool Session::Select(size_t index) {
  if (!nav_ || index >= VisibleChildren().size()) return false;
  nav_->SetSelectedIndex(index);
  return true;
}

std::optional<size_t> Session::SelectedIndex() const {
  if (!nav_) return std::nullopt;
  return nav_->SelectedIndex();
}

std::optional<NodeId> Session::SelectedNode() {
  if (!nav_ || !nav_->SelectedIndex()) return std::nullopt;
  std::vector<NodeId> visible = VisibleChildren();
  size_t index = *nav_->SelectedIndex();
  if (index >= visible.size()) return std::nullopt;
  return visible[index];
}

// =============================================================================
// Selection and Execution
// =============================================================================

SessionResult Session::ToggleSelection(NodeId node) {
  SessionResult loaded = EnsureLoaded();
  if (!loaded.success) return loaded;

  const catalog::CatalogNode* target = Lookup(node);
  if (target == nullptr) {
    return SessionResult::Failure(SessionError::kNotFound, "unknown node " + std::to_string(node));
  }
  if (!selection_.Toggle(*target)) {
    SessionResult result = SessionResult::Success();
    result.message = target->name + " does not support multi-select";
    return result;
  }
  return SessionResult::Success();
}

SessionResult Session::Execute(NodeId node) {
  SessionResult loaded = EnsureLoaded();
  if (!loaded.success) return loaded;

  const catalog::CatalogNode* target = Lookup(node);
  if (target == nullptr) {
    return SessionResult::Failure(SessionError::kNotFound, "unknown node " + std::to_string(node));
  }
  if (!catalog::IsExecutable(target->command)) {
    return SessionResult::Failure(SessionError::kNotExecutable,
                                  target->name + " is a directory");
  }

  const catalog::Category* category = snapshot_->CategoryOf(node);

  execution::ExecutionRequest request;
  request.category = category != nullptr ? category->name : CurrentCategory();
  request.node = node;
  request.node_name = target->name;
  request.command = target->command;
  uint64_t sequence = coordinator_->Submit(std::move(request));

  std::ostringstream oss;
  oss << "[Session] EXECUTE_SUBMITTED seq=" << sequence << " node=" << node
      << " name=\"" << target->name << "\"";
  Logger::Info(oss.str());
  return SessionResult::Success(sequence);
}

size_t Session::ExecuteSelected() {
  if (!EnsureLoaded().success) return 0;

  size_t submitted = 0;
  for (NodeId id : selection_.Drain()) {
    SessionResult result = Execute(id);
    if (!result.success) {
      std::ostringstream oss;
      oss << "[Session] EXECUTE_SELECTED_SKIPPED node=" << id
          << " error=" << SessionErrorToString(result.error)
          << " reason=\"" << result.message << "\"";
      Logger::Warn(oss.str());
      continue;
    }
    ++submitted;
  }
  return submitted;
}

std::optional<execution::ExecutionResult> Session::PollResult() {
  return coordinator_->Poll();
}

bool Session::IsExecuting() const {
  return coordinator_->IsExecuting();
}

// =============================================================================
// Preview
// =============================================================================

SessionResult Session::Preview(NodeId node, std::string* out) {
  SessionResult loaded = EnsureLoaded();
  if (!loaded.success) return loaded;

  const catalog::CatalogNode* target = Lookup(node);
  if (target == nullptr) {
    return SessionResult::Failure(SessionError::kNotFound, "unknown node " + std::to_string(node));
  }

  std::ostringstream oss;
  if (const auto* raw = std::get_if<catalog::RawCommand>(&target->command)) {
    oss << "Raw Command:\n" << raw->shell_text
        << "\n\nDescription:\n" << target->description;
  } else if (const auto* file = std::get_if<catalog::LocalFileCommand>(&target->command)) {
    std::string content;
    std::ifstream in(file->source_path, std::ios::binary);
    if (in) {
      std::ostringstream buffer;
      buffer << in.rdbuf();
      content = buffer.str();
    } else {
      content = "Could not read script file: " + file->source_path;
    }
    oss << "Script Preview:\n" << content
        << "\n\nExecution Info:\n"
        << "Executable: " << file->executable << "\n"
        << "Arguments: " << JoinArgs(file->args) << "\n"
        << "Script File: " << file->source_path
        << "\n\nDescription:\n" << target->description;
  } else {
    oss << "Directory: " << target->name
        << "\n\nDescription:\n" << target->description;
  }

  if (out != nullptr) *out = oss.str();
  return SessionResult::Success();
}

// =============================================================================
// Refresh
// =============================================================================

SessionResult Session::RefreshCatalog() {
  const std::string previous_category = CurrentCategory();

  cache_->Invalidate();
  snapshot_.reset();
  nav_.reset();
  search_text_.clear();
  selection_.Clear();

  SessionResult loaded = EnsureLoaded();
  if (!loaded.success) return loaded;

  if (!previous_category.empty()) {
    if (const catalog::Category* category = snapshot_->FindCategory(previous_category)) {
      OpenCategory(*category);
    }
  }

  std::ostringstream oss;
  oss << "[Session] CATALOG_REFRESHED categories=" << snapshot_->Categories().size()
      << " category=" << CurrentCategory()
      << " provider_calls=" << cache_->ProviderCalls();
  Logger::Info(oss.str());
  return SessionResult::Success();
}

}  // namespace toolshed::session
