// Repository: Toolshed
// Component: ProcessCommandRunner Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/execution/ProcessCommandRunner.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <variant>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "toolshed/util/Logger.hpp"

extern char** environ;

namespace toolshed::execution {

using toolshed::util::Logger;

namespace {

constexpr char kShell[] = "sh";
constexpr int kExecFailedStatus = 127;

// Written by the child to the status pipe when it fails before exec
// completes. The pipe is close-on-exec, so a successful exec yields EOF.
struct ChildFailure {
  enum Stage : int { kStdio = 0, kChdir = 1, kExec = 2 };
  int stage;
  int error;
};

void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

// Builds the child's environment: the parent's, with the non-interactive
// overrides replacing any existing values.
std::vector<std::string> BuildEnvironment() {
  std::vector<std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string value(*entry);
    bool overridden = false;
    for (const auto& kv : NonInteractiveEnvironment()) {
      if (value.compare(0, kv.first.size() + 1, kv.first + "=") == 0) {
        overridden = true;
        break;
      }
    }
    if (!overridden) env.push_back(value);
  }
  for (const auto& kv : NonInteractiveEnvironment()) {
    env.push_back(kv.first + "=" + kv.second);
  }
  return env;
}

std::vector<char*> ToCStrings(std::vector<std::string>& strings) {
  std::vector<char*> out;
  out.reserve(strings.size() + 1);
  for (auto& s : strings) out.push_back(s.data());
  out.push_back(nullptr);
  return out;
}

// Drains both pipes until EOF on each.
void ReadOutputs(int* out_fd, int* err_fd, std::string* out, std::string* err) {
  char chunk[4096];
  while (*out_fd >= 0 || *err_fd >= 0) {
    pollfd fds[2];
    nfds_t count = 0;
    int* owners[2];
    std::string* sinks[2];
    if (*out_fd >= 0) {
      fds[count] = pollfd{*out_fd, POLLIN, 0};
      owners[count] = out_fd;
      sinks[count] = out;
      ++count;
    }
    if (*err_fd >= 0) {
      fds[count] = pollfd{*err_fd, POLLIN, 0};
      owners[count] = err_fd;
      sinks[count] = err;
      ++count;
    }

    int ready = poll(fds, count, -1);
    if (ready < 0) {
      if (errno == EINTR) continue;
      CloseFd(out_fd);
      CloseFd(err_fd);
      return;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
      ssize_t n = read(fds[i].fd, chunk, sizeof(chunk));
      if (n > 0) {
        sinks[i]->append(chunk, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        CloseFd(owners[i]);
      }
    }
  }
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  return status;
}

}  // namespace

ExecutionResult ProcessCommandRunner::Run(const catalog::CommandSpec& command) {
  if (const auto* raw = std::get_if<catalog::RawCommand>(&command)) {
    SpawnSpec spec;
    spec.executable = kShell;
    spec.args = {"-c", raw->shell_text};
    spec.success_placeholder = kRawSuccessPlaceholder;
    return Spawn(spec);
  }

  if (const auto* file = std::get_if<catalog::LocalFileCommand>(&command)) {
    const std::filesystem::path parent =
        std::filesystem::path(file->source_path).parent_path();
    if (parent.empty()) {
      return ExecutionResult::SpawnFailure(
          "Failed to execute script: could not determine script directory for " +
          file->source_path);
    }
    SpawnSpec spec;
    spec.executable = file->executable;
    spec.args = file->args;
    spec.working_directory = parent.string();
    spec.success_placeholder = kScriptSuccessPlaceholder;
    return Spawn(spec);
  }

  return ExecutionResult::SpawnFailure("Cannot execute directory");
}

ExecutionResult ProcessCommandRunner::Spawn(const SpawnSpec& spec) {
  const std::string failure_prefix =
      spec.success_placeholder == kScriptSuccessPlaceholder ? "Failed to execute script: "
                                                             : "Failed to execute command: ";

  // Everything the child needs is allocated before fork().
  std::vector<std::string> argv_strings;
  argv_strings.reserve(spec.args.size() + 1);
  argv_strings.push_back(spec.executable);
  argv_strings.insert(argv_strings.end(), spec.args.begin(), spec.args.end());
  std::vector<char*> argv = ToCStrings(argv_strings);
  std::vector<std::string> env_strings = BuildEnvironment();
  std::vector<char*> envp = ToCStrings(env_strings);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(status_pipe, O_CLOEXEC) < 0) {
    const int saved = errno;
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &status_pipe[0], &status_pipe[1]}) {
      CloseFd(fd);
    }
    return ExecutionResult::SpawnFailure(failure_prefix + "pipe() failed: " +
                                         std::strerror(saved));
  }

  pid_t pid = fork();
  if (pid < 0) {
    const int saved = errno;
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &status_pipe[0], &status_pipe[1]}) {
      CloseFd(fd);
    }
    return ExecutionResult::SpawnFailure(failure_prefix + "fork() failed: " +
                                         std::strerror(saved));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    ChildFailure failure{ChildFailure::kStdio, 0};
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0 ||
        dup2(out_pipe[1], STDOUT_FILENO) < 0 || dup2(err_pipe[1], STDERR_FILENO) < 0) {
      failure.error = errno;
      ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
      (void)ignored;
      _exit(kExecFailedStatus);
    }
    if (!spec.working_directory.empty() && chdir(spec.working_directory.c_str()) < 0) {
      failure.stage = ChildFailure::kChdir;
      failure.error = errno;
      ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
      (void)ignored;
      _exit(kExecFailedStatus);
    }
    execvpe(argv[0], argv.data(), envp.data());
    failure.stage = ChildFailure::kExec;
    failure.error = errno;
    ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
    (void)ignored;
    _exit(kExecFailedStatus);
  }

  // Parent
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&status_pipe[1]);

  ChildFailure failure{};
  ssize_t n;
  do {
    n = read(status_pipe[0], &failure, sizeof(failure));
  } while (n < 0 && errno == EINTR);
  CloseFd(&status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(failure))) {
    CloseFd(&out_pipe[0]);
    CloseFd(&err_pipe[0]);
    WaitForChild(pid);
    std::string reason;
    switch (failure.stage) {
      case ChildFailure::kChdir:
        reason = "cannot enter working directory " + spec.working_directory + ": ";
        break;
      case ChildFailure::kExec:
        reason = spec.executable + ": ";
        break;
      default:
        reason = "cannot set up standard streams: ";
        break;
    }
    reason += std::strerror(failure.error);

    std::ostringstream oss;
    oss << "[ProcessCommandRunner] SPAWN_FAILED executable=" << spec.executable
        << " reason=\"" << reason << "\"";
    Logger::Warn(oss.str());
    return ExecutionResult::SpawnFailure(failure_prefix + reason);
  }

  std::string stdout_text;
  std::string stderr_text;
  ReadOutputs(&out_pipe[0], &err_pipe[0], &stdout_text, &stderr_text);
  const int status = WaitForChild(pid);

  ExecutionResult result;
  if (status >= 0 && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    result.success = (result.exit_code == 0);
  } else {
    result.success = false;
  }

  if (!stdout_text.empty()) {
    result.output = stdout_text;
  } else if (!stderr_text.empty()) {
    result.output = stderr_text;
  } else {
    result.output = spec.success_placeholder;
  }

  if (!result.success) {
    result.error = stderr_text;
    result.error_kind = ExecutionErrorKind::kNonZeroExit;
  }

  std::ostringstream oss;
  oss << "[ProcessCommandRunner] EXITED pid=" << pid
      << " executable=" << spec.executable
      << " exit_code=" << (result.exit_code ? std::to_string(*result.exit_code) : "none")
      << " stdout_bytes=" << stdout_text.size()
      << " stderr_bytes=" << stderr_text.size();
  Logger::Debug(oss.str());
  return result;
}

}  // namespace toolshed::execution
