// Repository: Toolshed
// Component: Catalog Provider Interface
// Purpose: Source of catalog snapshots consumed by CatalogCache.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_CATALOG_ICATALOG_PROVIDER_HPP_
#define TOOLSHED_CATALOG_ICATALOG_PROVIDER_HPP_

#include <memory>

#include "toolshed/catalog/CatalogTypes.hpp"

namespace toolshed::catalog {

// validate=false: return every node.
// validate=true: apply the provider's own compatibility filter.
// The caller never interprets `validate`; it only forwards it.
//
// Implementations may block on filesystem I/O and may throw CatalogError.
class ICatalogProvider {
 public:
  virtual ~ICatalogProvider() = default;
  virtual std::shared_ptr<const CatalogSnapshot> GetCatalog(bool validate) = 0;
};

}  // namespace toolshed::catalog

#endif  // TOOLSHED_CATALOG_ICATALOG_PROVIDER_HPP_
