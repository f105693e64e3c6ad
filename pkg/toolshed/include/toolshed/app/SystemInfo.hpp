// Repository: Toolshed
// Component: SystemInfo
// Purpose: Host description (kernel, distribution, architecture) and the
//          privilege check performed at startup.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_APP_SYSTEM_INFO_HPP_
#define TOOLSHED_APP_SYSTEM_INFO_HPP_

#include <string>

namespace toolshed::app {

struct SystemInfo {
  std::string system;        // uname: sysname nodename release version machine
  std::string distribution;  // PRETTY_NAME from /etc/os-release
  std::string architecture;  // uname machine
};

// Fields that cannot be determined are left empty.
SystemInfo CollectSystemInfo();

// Value of PRETTY_NAME in os-release content, quotes stripped; empty if absent.
std::string ParseOsReleasePrettyName(const std::string& content);

bool IsRunningAsRoot();

// Warns once when running with root privileges unless bypassed.
// Returns true if the warning was emitted.
bool WarnIfRoot(bool bypass_root);

}  // namespace toolshed::app

#endif  // TOOLSHED_APP_SYSTEM_INFO_HPP_
