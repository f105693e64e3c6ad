// Repository: Toolshed
// Component: CatalogControl gRPC Service Implementation
// Purpose: Implements the CatalogControl service over one Session.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_CONTROL_CATALOG_CONTROL_SERVICE_H_
#define TOOLSHED_CONTROL_CATALOG_CONTROL_SERVICE_H_

#include <memory>
#include <mutex>

#include <grpcpp/grpcpp.h>

#include "toolshed_control.grpc.pb.h"
#include "toolshed_control.pb.h"
#include "toolshed/catalog/CatalogCache.hpp"
#include "toolshed/execution/ExecutionCoordinator.hpp"
#include "toolshed/session/Session.hpp"

namespace toolshed {
namespace control {

// CatalogControlImpl is a thin adapter that delegates to Session.
//
// gRPC handlers run on several threads; session_mutex_ serializes every call
// that touches the Session. PollResult with wait_ms > 0 waits on the
// coordinator without holding it.
class CatalogControlImpl final : public CatalogControl::Service {
 public:
  CatalogControlImpl(std::shared_ptr<catalog::CatalogCache> cache,
                     std::shared_ptr<execution::ExecutionCoordinator> coordinator,
                     bool validate);
  ~CatalogControlImpl() override = default;

  CatalogControlImpl(const CatalogControlImpl&) = delete;
  CatalogControlImpl& operator=(const CatalogControlImpl&) = delete;

  grpc::Status ListCategories(grpc::ServerContext* context,
                              const ListCategoriesRequest* request,
                              ListCategoriesResponse* response) override;

  grpc::Status CurrentItems(grpc::ServerContext* context,
                            const CurrentItemsRequest* request,
                            CurrentItemsResponse* response) override;

  grpc::Status Enter(grpc::ServerContext* context,
                     const EnterRequest* request,
                     NavigationResponse* response) override;

  grpc::Status GoBack(grpc::ServerContext* context,
                      const GoBackRequest* request,
                      NavigationResponse* response) override;

  grpc::Status SwitchCategory(grpc::ServerContext* context,
                              const SwitchCategoryRequest* request,
                              NavigationResponse* response) override;

  grpc::Status SetSearch(grpc::ServerContext* context,
                         const SetSearchRequest* request,
                         CurrentItemsResponse* response) override;

  grpc::Status ToggleSelection(grpc::ServerContext* context,
                               const ToggleSelectionRequest* request,
                               ToggleSelectionResponse* response) override;

  grpc::Status Execute(grpc::ServerContext* context,
                       const ExecuteRequest* request,
                       ExecuteResponse* response) override;

  grpc::Status ExecuteSelected(grpc::ServerContext* context,
                               const ExecuteSelectedRequest* request,
                               ExecuteSelectedResponse* response) override;

  grpc::Status PollResult(grpc::ServerContext* context,
                          const PollResultRequest* request,
                          PollResultResponse* response) override;

  grpc::Status Preview(grpc::ServerContext* context,
                       const PreviewRequest* request,
                       PreviewResponse* response) override;

  grpc::Status RefreshCatalog(grpc::ServerContext* context,
                              const RefreshCatalogRequest* request,
                              RefreshCatalogResponse* response) override;

  grpc::Status GetSystemInfo(grpc::ServerContext* context,
                             const SystemInfoRequest* request,
                             SystemInfoResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

 private:
  // Call with session_mutex_ held.
  void FillItems(CurrentItemsResponse* response);
  void FillNavigation(bool changed, NavigationResponse* response);

  std::shared_ptr<catalog::CatalogCache> cache_;
  std::shared_ptr<execution::ExecutionCoordinator> coordinator_;

  std::mutex session_mutex_;
  session::Session session_;  // Guarded by session_mutex_
};

}  // namespace control
}  // namespace toolshed

#endif  // TOOLSHED_CONTROL_CATALOG_CONTROL_SERVICE_H_
