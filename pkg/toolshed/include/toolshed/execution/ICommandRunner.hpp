// Repository: Toolshed
// Component: Command Runner Interface
// Purpose: Runs one resolved command to completion on the calling thread.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_EXECUTION_ICOMMAND_RUNNER_HPP_
#define TOOLSHED_EXECUTION_ICOMMAND_RUNNER_HPP_

#include "toolshed/catalog/CatalogTypes.hpp"
#include "toolshed/execution/ExecutionTypes.hpp"

namespace toolshed::execution {

// Called only from the ExecutionCoordinator worker thread. Must not throw:
// every failure is reported inside the returned result. Request identity
// fields of the result are filled in by the coordinator.
class ICommandRunner {
 public:
  virtual ~ICommandRunner() = default;
  virtual ExecutionResult Run(const catalog::CommandSpec& command) = 0;
};

}  // namespace toolshed::execution

#endif  // TOOLSHED_EXECUTION_ICOMMAND_RUNNER_HPP_
