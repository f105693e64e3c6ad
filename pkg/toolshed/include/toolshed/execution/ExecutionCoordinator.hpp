// Repository: Toolshed
// Component: ExecutionCoordinator
// Purpose: Persistent worker thread that runs submitted commands one at a
//          time in submission order and hands results back to the
//          interactive thread through a FIFO result queue.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_EXECUTION_EXECUTION_COORDINATOR_HPP_
#define TOOLSHED_EXECUTION_EXECUTION_COORDINATOR_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "toolshed/execution/ExecutionTypes.hpp"
#include "toolshed/execution/ICommandRunner.hpp"

namespace toolshed::execution {

// ExecutionCoordinator
//
// Submit() never blocks on a running command. The worker takes requests in
// FIFO order and runs each through the ICommandRunner; results are queued in
// completion order, which is also submission order.
//
// IsExecuting() is true from the first Submit() until every submitted
// request's result has been taken by Poll(). A second submission while one is
// running keeps it true.
//
// Destruction drops queued requests, waits for the in-flight command to
// finish, and joins the worker. There is no cancellation of a running child.
class ExecutionCoordinator {
 public:
  // Test-only: runs on the worker before each command.
  using DispatchHookFn = std::function<void(const ExecutionRequest&)>;

  explicit ExecutionCoordinator(std::shared_ptr<ICommandRunner> runner);
  ~ExecutionCoordinator();

  ExecutionCoordinator(const ExecutionCoordinator&) = delete;
  ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

  // Enqueue a request; wakes the worker. Returns the assigned sequence.
  uint64_t Submit(ExecutionRequest request);

  // Non-blocking. Takes the oldest finished result, if any.
  std::optional<ExecutionResult> Poll();

  // Blocks up to `timeout_ms` for a result. Used by tests and the control
  // server; the interactive loop uses Poll().
  std::optional<ExecutionResult> WaitForResult(int timeout_ms);

  [[nodiscard]] bool IsExecuting() const;

  // Submitted requests whose results have not been taken yet.
  size_t PendingCount() const;

  void SetDispatchHook(DispatchHookFn hook);

 private:
  void WorkerLoop();

  std::shared_ptr<ICommandRunner> runner_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable result_cv_;

  std::deque<ExecutionRequest> queue_;
  std::deque<ExecutionResult> results_;

  uint64_t next_sequence_ = 1;  // Guarded by mutex_
  size_t pending_ = 0;          // Guarded by mutex_

  std::thread worker_thread_;
  std::atomic<bool> shutdown_{false};

  DispatchHookFn dispatch_hook_;  // Test-only
};

}  // namespace toolshed::execution

#endif  // TOOLSHED_EXECUTION_EXECUTION_COORDINATOR_HPP_
