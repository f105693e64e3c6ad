// Repository: Toolshed
// Component: AppConfig
// Purpose: Command-line and environment configuration shared by the
//          interactive front-end and the control server.
// Copyright (c) 2025 Toolshed

#ifndef TOOLSHED_APP_APP_CONFIG_HPP_
#define TOOLSHED_APP_APP_CONFIG_HPP_

#include <ostream>
#include <string>

namespace toolshed::app {

inline constexpr char kDefaultListenAddress[] = "127.0.0.1:50071";
inline constexpr int kDefaultTickMs = 100;
inline constexpr char kCatalogEnvVar[] = "TOOLSHED_CATALOG";

struct AppConfig {
  std::string catalog_dir;
  bool skip_confirmation = false;
  bool override_validation = false;  // Show entries whose requirements are missing
  bool bypass_root = false;
  std::string listen_address = kDefaultListenAddress;
  int tick_ms = kDefaultTickMs;

  bool help = false;
  bool valid = false;
  std::string error;

  // Value handed to the catalog provider.
  bool Validate() const { return !override_validation; }
};

// $TOOLSHED_CATALOG if set and non-empty, otherwise "./catalog".
std::string DefaultCatalogDir();

// Never throws. On failure `valid` is false and `error` names the problem.
AppConfig ParseArgs(int argc, const char* const argv[]);

void PrintUsage(const char* program_name, std::ostream& os);

}  // namespace toolshed::app

#endif  // TOOLSHED_APP_APP_CONFIG_HPP_
