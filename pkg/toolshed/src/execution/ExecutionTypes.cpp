// Repository: Toolshed
// Component: Execution
// Copyright (c) 2025 Toolshed

#include "toolshed/execution/ExecutionTypes.hpp"

namespace toolshed::execution {

const char* ExecutionErrorKindToString(ExecutionErrorKind kind) {
  switch (kind) {
    case ExecutionErrorKind::kNone:
      return "NONE";
    case ExecutionErrorKind::kSpawnFailure:
      return "SPAWN_FAILURE";
    case ExecutionErrorKind::kNonZeroExit:
      return "NON_ZERO_EXIT";
  }
  return "UNKNOWN";
}

}  // namespace toolshed::execution
