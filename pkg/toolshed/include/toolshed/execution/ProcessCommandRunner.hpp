// Repository: Toolshed
// Component: ProcessCommandRunner
// Purpose: POSIX fork/exec runner capturing stdout and stderr separately.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_EXECUTION_PROCESS_COMMAND_RUNNER_HPP_
#define TOOLSHED_EXECUTION_PROCESS_COMMAND_RUNNER_HPP_

#include <string>
#include <utility>
#include <vector>

#include "toolshed/execution/ICommandRunner.hpp"

namespace toolshed::execution {

// Environment overrides applied to every child so package tools never stop
// at an interactive prompt.
inline const std::vector<std::pair<std::string, std::string>>& NonInteractiveEnvironment() {
  static const std::vector<std::pair<std::string, std::string>> kEnv = {
      {"DEBIAN_FRONTEND", "noninteractive"},
      {"NEEDRESTART_MODE", "a"},
  };
  return kEnv;
}

// Raw(text)        → sh -c text
// LocalFile{e,a,p} → e a..., cwd = dirname(p), e resolved through PATH
// None             → spawn failure result (callers reject it earlier)
//
// stdin is /dev/null. The call blocks until the child exits and both pipes
// reach EOF. There is no timeout.
class ProcessCommandRunner : public ICommandRunner {
 public:
  ProcessCommandRunner() = default;

  ExecutionResult Run(const catalog::CommandSpec& command) override;

 private:
  struct SpawnSpec {
    std::string executable;
    std::vector<std::string> args;
    std::string working_directory;  // Empty: inherit
    const char* success_placeholder = kRawSuccessPlaceholder;
  };

  static ExecutionResult Spawn(const SpawnSpec& spec);
};

}  // namespace toolshed::execution

#endif  // TOOLSHED_EXECUTION_PROCESS_COMMAND_RUNNER_HPP_
