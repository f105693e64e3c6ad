// Repository: Toolshed
// Component: CatalogControl gRPC Service Implementation
// Purpose: Implements the CatalogControl service over one Session.
// Copyright (c) 2025 Toolshed

#include "control/CatalogControlService.h"

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "toolshed/app/SystemInfo.hpp"
#include "toolshed/util/Logger.hpp"

namespace toolshed {
namespace control {

using toolshed::util::Logger;

namespace {

constexpr char kApiVersion[] = "1.0.0";

grpc::Status ToStatus(const session::SessionResult& result) {
  grpc::StatusCode code = grpc::StatusCode::INTERNAL;
  switch (result.error) {
    case session::SessionError::kNotFound:
      code = grpc::StatusCode::NOT_FOUND;
      break;
    case session::SessionError::kNotExecutable:
      code = grpc::StatusCode::FAILED_PRECONDITION;
      break;
    case session::SessionError::kCatalogUnavailable:
      code = grpc::StatusCode::UNAVAILABLE;
      break;
    case session::SessionError::kNone:
      return grpc::Status::OK;
  }
  return grpc::Status(code, result.message);
}

void FillItem(const session::ItemView& view, Item* item) {
  item->set_id(view.id);
  item->set_name(view.name);
  item->set_description(view.description);
  for (const auto& tag : view.tags) item->add_tags(tag);
  item->set_has_children(view.has_children);
  item->set_is_multi_selected(view.is_multi_selected);
  item->set_is_executable(view.is_executable);
  item->set_multi_select(view.multi_select);
}

ExecutionResult::ErrorKind ToProto(execution::ExecutionErrorKind kind) {
  switch (kind) {
    case execution::ExecutionErrorKind::kSpawnFailure:
      return ExecutionResult::SPAWN_FAILURE;
    case execution::ExecutionErrorKind::kNonZeroExit:
      return ExecutionResult::NON_ZERO_EXIT;
    case execution::ExecutionErrorKind::kNone:
      break;
  }
  return ExecutionResult::NONE;
}

}  // namespace

CatalogControlImpl::CatalogControlImpl(
    std::shared_ptr<catalog::CatalogCache> cache,
    std::shared_ptr<execution::ExecutionCoordinator> coordinator,
    bool validate)
    : cache_(cache), coordinator_(coordinator), session_(cache, coordinator, validate) {}

void CatalogControlImpl::FillItems(CurrentItemsResponse* response) {
  for (const auto& view : session_.CurrentItems()) FillItem(view, response->add_items());
  for (const auto& name : session_.Breadcrumb()) response->add_breadcrumb(name);
  response->set_search_text(session_.SearchText());
  std::optional<size_t> selected = session_.SelectedIndex();
  response->set_selected_index(selected ? static_cast<int32_t>(*selected) : -1);
}

void CatalogControlImpl::FillNavigation(bool changed, NavigationResponse* response) {
  std::vector<std::string> breadcrumb = session_.Breadcrumb();
  response->set_changed(changed);
  response->set_depth(static_cast<uint32_t>(breadcrumb.size()));
  for (const auto& name : breadcrumb) response->add_breadcrumb(name);
  for (const auto& view : session_.CurrentItems()) FillItem(view, response->add_items());
}

grpc::Status CatalogControlImpl::ListCategories(grpc::ServerContext* context,
                                                const ListCategoriesRequest* request,
                                                ListCategoriesResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult loaded = session_.EnsureLoaded();
  if (!loaded.success) return ToStatus(loaded);

  for (const auto& name : session_.ListCategories()) response->add_categories(name);
  response->set_current_category(session_.CurrentCategory());
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::CurrentItems(grpc::ServerContext* context,
                                              const CurrentItemsRequest* request,
                                              CurrentItemsResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult loaded = session_.EnsureLoaded();
  if (!loaded.success) return ToStatus(loaded);

  FillItems(response);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::Enter(grpc::ServerContext* context,
                                       const EnterRequest* request,
                                       NavigationResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  const size_t before = session_.Breadcrumb().size();
  session::SessionResult result = session_.Enter(request->node_id());
  if (!result.success) {
    std::ostringstream oss;
    oss << "[CatalogControl] ENTER_REJECTED node=" << request->node_id()
        << " error=" << session::SessionErrorToString(result.error);
    Logger::Info(oss.str());
    return ToStatus(result);
  }
  FillNavigation(session_.Breadcrumb().size() != before, response);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::GoBack(grpc::ServerContext* context,
                                        const GoBackRequest* request,
                                        NavigationResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult loaded = session_.EnsureLoaded();
  if (!loaded.success) return ToStatus(loaded);

  bool changed = session_.GoBack();
  FillNavigation(changed, response);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::SwitchCategory(grpc::ServerContext* context,
                                                const SwitchCategoryRequest* request,
                                                NavigationResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult result = session_.SwitchCategory(request->name());
  if (!result.success) return ToStatus(result);

  FillNavigation(true, response);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::SetSearch(grpc::ServerContext* context,
                                           const SetSearchRequest* request,
                                           CurrentItemsResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult loaded = session_.EnsureLoaded();
  if (!loaded.success) return ToStatus(loaded);

  session_.SetSearch(request->text());
  FillItems(response);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::ToggleSelection(grpc::ServerContext* context,
                                                 const ToggleSelectionRequest* request,
                                                 ToggleSelectionResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult result = session_.ToggleSelection(request->node_id());
  if (!result.success) return ToStatus(result);

  response->set_is_multi_selected(session_.IsSelected(request->node_id()));
  response->set_selection_size(static_cast<uint32_t>(session_.SelectionSize()));
  response->set_message(result.message);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::Execute(grpc::ServerContext* context,
                                         const ExecuteRequest* request,
                                         ExecuteResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult result = session_.Execute(request->node_id());
  if (!result.success) {
    std::ostringstream oss;
    oss << "[CatalogControl] EXECUTE_REJECTED node=" << request->node_id()
        << " error=" << session::SessionErrorToString(result.error)
        << " reason=\"" << result.message << "\"";
    Logger::Info(oss.str());
    return ToStatus(result);
  }
  response->set_sequence(result.sequence);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::ExecuteSelected(grpc::ServerContext* context,
                                                 const ExecuteSelectedRequest* request,
                                                 ExecuteSelectedResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult loaded = session_.EnsureLoaded();
  if (!loaded.success) return ToStatus(loaded);

  response->set_submitted(static_cast<uint32_t>(session_.ExecuteSelected()));
  return grpc::Status::OK;
}

// The coordinator is thread-safe; no session lock while waiting.
grpc::Status CatalogControlImpl::PollResult(grpc::ServerContext* context,
                                            const PollResultRequest* request,
                                            PollResultResponse* response) {
  std::optional<execution::ExecutionResult> result =
      request->wait_ms() > 0 ? coordinator_->WaitForResult(request->wait_ms())
                             : coordinator_->Poll();

  response->set_has_result(result.has_value());
  if (result) {
    ExecutionResult* out = response->mutable_result();
    out->set_sequence(result->sequence);
    out->set_category(result->category);
    out->set_node_id(result->node);
    out->set_node_name(result->node_name);
    out->set_success(result->success);
    out->set_output(result->output);
    if (result->error) out->set_error(*result->error);
    if (result->exit_code) out->set_exit_code(*result->exit_code);
    out->set_error_kind(ToProto(result->error_kind));
  }
  response->set_executing(coordinator_->IsExecuting());
  response->set_pending(static_cast<uint32_t>(coordinator_->PendingCount()));
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::Preview(grpc::ServerContext* context,
                                         const PreviewRequest* request,
                                         PreviewResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  std::string text;
  session::SessionResult result = session_.Preview(request->node_id(), &text);
  if (!result.success) return ToStatus(result);

  response->set_text(text);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::RefreshCatalog(grpc::ServerContext* context,
                                                const RefreshCatalogRequest* request,
                                                RefreshCatalogResponse* response) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  session::SessionResult result = session_.RefreshCatalog();
  if (!result.success) return ToStatus(result);

  for (const auto& name : session_.ListCategories()) response->add_categories(name);
  response->set_provider_calls(cache_->ProviderCalls());
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::GetSystemInfo(grpc::ServerContext* context,
                                               const SystemInfoRequest* request,
                                               SystemInfoResponse* response) {
  app::SystemInfo info = app::CollectSystemInfo();
  response->set_system(info.system);
  response->set_distribution(info.distribution);
  response->set_architecture(info.architecture);
  return grpc::Status::OK;
}

grpc::Status CatalogControlImpl::GetVersion(grpc::ServerContext* context,
                                            const ApiVersionRequest* request,
                                            ApiVersion* response) {
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

}  // namespace control
}  // namespace toolshed
