// Repository: Toolshed
// Component: Execution
// Purpose: Request/result records exchanged with the execution worker.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_EXECUTION_TYPES_HPP_
#define TOOLSHED_EXECUTION_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "toolshed/catalog/CatalogTypes.hpp"

namespace toolshed::execution {

// =============================================================================
// Error Kinds
// Only failures that happen after dispatch appear here. NotFound and
// NotExecutable are rejected by the Session before a request exists.
// =============================================================================

enum class ExecutionErrorKind {
  kNone = 0,

  // Process could not be started (fork/pipe/exec/chdir failure).
  kSpawnFailure,

  // Process ran and exited non-zero or was killed by a signal.
  kNonZeroExit,
};

const char* ExecutionErrorKindToString(ExecutionErrorKind kind);

// Placeholders used when a successful command printed nothing.
inline constexpr char kRawSuccessPlaceholder[] = "Command executed successfully";
inline constexpr char kScriptSuccessPlaceholder[] = "Script executed successfully";

// =============================================================================
// Request
// The command is resolved by the caller before submission; the worker never
// looks anything up in the catalog (a reload may have replaced it meanwhile).
// =============================================================================

struct ExecutionRequest {
  uint64_t sequence = 0;  // Assigned by ExecutionCoordinator::Submit
  std::string category;
  catalog::NodeId node = 0;
  std::string node_name;
  catalog::CommandSpec command;
};

// =============================================================================
// Result
// =============================================================================

struct ExecutionResult {
  bool success = false;
  // stdout if non-empty, else stderr if non-empty, else a placeholder.
  std::string output;
  // stderr text; present on failure only.
  std::optional<std::string> error;
  // Exit status; absent when the process was signalled or never started.
  std::optional<int> exit_code;
  ExecutionErrorKind error_kind = ExecutionErrorKind::kNone;

  // Identity of the request this result answers.
  uint64_t sequence = 0;
  std::string category;
  catalog::NodeId node = 0;
  std::string node_name;

  static ExecutionResult SpawnFailure(const std::string& description) {
    ExecutionResult result;
    result.success = false;
    result.output = description;
    result.error = description;
    result.error_kind = ExecutionErrorKind::kSpawnFailure;
    return result;
  }
};

}  // namespace toolshed::execution

#endif  // TOOLSHED_EXECUTION_TYPES_HPP_
