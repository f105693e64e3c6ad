// Repository: Toolshed
// Component: CatalogCache Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/catalog/CatalogCache.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "toolshed/util/Logger.hpp"

namespace toolshed::catalog {

using toolshed::util::Logger;

CatalogCache::CatalogCache(std::shared_ptr<ICatalogProvider> provider)
    : provider_(std::move(provider)) {
  if (!provider_) {
    throw std::invalid_argument("CatalogCache requires a provider");
  }
}

std::shared_ptr<const CatalogSnapshot> CatalogCache::Load(bool validate) {
  std::unique_lock<std::mutex> lock(mutex_);
  // Only one provider call is in flight; later loaders wait for its result.
  load_cv_.wait(lock, [this] { return slot_ != nullptr || !loading_; });
  if (slot_) return slot_;
  loading_ = true;
  lock.unlock();

  std::shared_ptr<const CatalogSnapshot> snapshot;
  try {
    provider_calls_.fetch_add(1, std::memory_order_acq_rel);
    snapshot = provider_->GetCatalog(validate);
    if (!snapshot) {
      throw CatalogError("catalog provider returned no snapshot");
    }
  } catch (...) {
    // Hand the load to the next waiter, then report the failure to our caller.
    {
      std::lock_guard<std::mutex> guard(mutex_);
      loading_ = false;
    }
    load_cv_.notify_all();
    throw;
  }

  {
    std::ostringstream oss;
    oss << "[CatalogCache] LOADED categories=" << snapshot->Categories().size()
        << " nodes=" << snapshot->Nodes().size()
        << " validate=" << (validate ? "Y" : "N");
    Logger::Debug(oss.str());
  }

  lock.lock();
  slot_ = std::move(snapshot);
  loading_ = false;
  auto result = slot_;
  lock.unlock();
  load_cv_.notify_all();
  return result;
}

void CatalogCache::Invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  slot_.reset();
}

bool CatalogCache::HasSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slot_ != nullptr;
}

}  // namespace toolshed::catalog
