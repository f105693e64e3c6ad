// Repository: Toolshed
// Component: CatalogCache
// Purpose: Single-slot memoized holder of the most recently loaded snapshot.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_CATALOG_CATALOG_CACHE_HPP_
#define TOOLSHED_CATALOG_CATALOG_CACHE_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

#include "toolshed/catalog/ICatalogProvider.hpp"

namespace toolshed::catalog {

// CatalogCache: explicit cache object handed to each Session.
//
// Load() returns the cached snapshot if present, otherwise asks the provider
// for one, stores it and returns it. Invalidate() empties the slot; the next
// Load() performs exactly one provider call. There is no expiry and no
// partial invalidation: a snapshot is replaced as a whole.
//
// Loads are single-flight: while one caller runs the provider, concurrent
// Load() calls wait on load_cv_ and share its snapshot. If that call fails,
// one waiter takes over and calls the provider itself. The mutex is never
// held while the provider runs.
class CatalogCache {
 public:
  explicit CatalogCache(std::shared_ptr<ICatalogProvider> provider);

  CatalogCache(const CatalogCache&) = delete;
  CatalogCache& operator=(const CatalogCache&) = delete;

  // Throws whatever the provider throws; the slot stays empty in that case.
  std::shared_ptr<const CatalogSnapshot> Load(bool validate);

  void Invalidate();

  bool HasSnapshot() const;

  // Total number of provider calls made through this cache.
  uint64_t ProviderCalls() const { return provider_calls_.load(std::memory_order_acquire); }

 private:
  std::shared_ptr<ICatalogProvider> provider_;

  mutable std::mutex mutex_;
  std::condition_variable load_cv_;
  std::shared_ptr<const CatalogSnapshot> slot_;  // Guarded by mutex_
  bool loading_ = false;                         // Guarded by mutex_

  std::atomic<uint64_t> provider_calls_{0};
};

}  // namespace toolshed::catalog

#endif  // TOOLSHED_CATALOG_CATALOG_CACHE_HPP_
