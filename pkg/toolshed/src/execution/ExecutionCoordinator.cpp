// Repository: Toolshed
// Component: ExecutionCoordinator Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/execution/ExecutionCoordinator.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "toolshed/util/Logger.hpp"

namespace toolshed::execution {

using toolshed::util::Logger;

ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<ICommandRunner> runner)
    : runner_(std::move(runner)) {
  if (!runner_) {
    throw std::invalid_argument("ExecutionCoordinator requires a command runner");
  }
  worker_thread_ = std::thread(&ExecutionCoordinator::WorkerLoop, this);
}

ExecutionCoordinator::~ExecutionCoordinator() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
    dropped = queue_.size();
    queue_.clear();
  }
  work_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
  if (dropped > 0) {
    std::ostringstream oss;
    oss << "[ExecutionCoordinator] SHUTDOWN dropped_requests=" << dropped;
    Logger::Warn(oss.str());
  }
}

uint64_t ExecutionCoordinator::Submit(ExecutionRequest request) {
  uint64_t sequence = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sequence = next_sequence_++;
    request.sequence = sequence;
    queue_.push_back(std::move(request));
    ++pending_;
  }
  work_cv_.notify_one();
  return sequence;
}

std::optional<ExecutionResult> ExecutionCoordinator::Poll() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (results_.empty()) return std::nullopt;
  ExecutionResult result = std::move(results_.front());
  results_.pop_front();
  --pending_;
  return result;
}

std::optional<ExecutionResult> ExecutionCoordinator::WaitForResult(int timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!result_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [this] { return !results_.empty(); })) {
    return std::nullopt;
  }
  ExecutionResult result = std::move(results_.front());
  results_.pop_front();
  --pending_;
  return result;
}

bool ExecutionCoordinator::IsExecuting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_ > 0;
}

size_t ExecutionCoordinator::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}

void ExecutionCoordinator::SetDispatchHook(DispatchHookFn hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  dispatch_hook_ = std::move(hook);
}

// =============================================================================
// WorkerLoop: persistent thread, one command at a time
// =============================================================================

void ExecutionCoordinator::WorkerLoop() {
  while (true) {
    ExecutionRequest req;
    DispatchHookFn hook;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });

      if (shutdown_.load(std::memory_order_acquire)) return;

      req = std::move(queue_.front());
      queue_.pop_front();
      hook = dispatch_hook_;
    }

    {
      std::ostringstream oss;
      oss << "[ExecutionCoordinator] DISPATCH seq=" << req.sequence
          << " category=" << req.category << " node=" << req.node
          << " name=\"" << req.node_name << "\""
          << " kind=" << catalog::CommandKindName(catalog::KindOf(req.command));
      Logger::Debug(oss.str());
    }

    if (hook) hook(req);

    ExecutionResult result = runner_->Run(req.command);
    result.sequence = req.sequence;
    result.category = req.category;
    result.node = req.node;
    result.node_name = req.node_name;

    {
      std::ostringstream oss;
      oss << "[ExecutionCoordinator] COMPLETE seq=" << result.sequence
          << " success=" << (result.success ? "true" : "false")
          << " error_kind=" << ExecutionErrorKindToString(result.error_kind);
      if (result.exit_code) oss << " exit_code=" << *result.exit_code;
      Logger::Debug(oss.str());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      results_.push_back(std::move(result));
    }
    result_cv_.notify_all();
  }
}

}  // namespace toolshed::execution
