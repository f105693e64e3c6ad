// Repository: Toolshed
// Component: SystemInfo Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/app/SystemInfo.hpp"

#include <fstream>
#include <sstream>

#include <sys/utsname.h>
#include <unistd.h>

#include "toolshed/util/Logger.hpp"

namespace toolshed::app {

using toolshed::util::Logger;

namespace {

constexpr char kOsReleasePath[] = "/etc/os-release";
constexpr char kPrettyNameKey[] = "PRETTY_NAME=";

}  // namespace

std::string ParseOsReleasePrettyName(const std::string& content) {
  std::istringstream in(content);
  std::string line;
  const std::string key = kPrettyNameKey;
  while (std::getline(in, line)) {
    if (line.compare(0, key.size(), key) != 0) continue;
    std::string value = line.substr(key.size());
    if (!value.empty() && value.back() == '\r') value.pop_back();
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    return value;
  }
  return "";
}

SystemInfo CollectSystemInfo() {
  SystemInfo info;

  struct utsname uts {};
  if (uname(&uts) == 0) {
    std::ostringstream oss;
    oss << uts.sysname << " " << uts.nodename << " " << uts.release << " "
        << uts.version << " " << uts.machine;
    info.system = oss.str();
    info.architecture = uts.machine;
  } else {
    Logger::Warn("[SystemInfo] UNAME_FAILED");
  }

  std::ifstream in(kOsReleasePath);
  if (in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    info.distribution = ParseOsReleasePrettyName(buffer.str());
  }

  return info;
}

bool IsRunningAsRoot() {
  return geteuid() == 0;
}

bool WarnIfRoot(bool bypass_root) {
  if (bypass_root || !IsRunningAsRoot()) return false;
  Logger::Warn(
      "[SystemInfo] RUNNING_AS_ROOT commands will run with full privileges "
      "(pass --bypass-root to silence)");
  return true;
}

}  // namespace toolshed::app
