// Repository: Toolshed
// Component: AppConfig Implementation
// Copyright (c) 2025 Toolshed

#include "toolshed/app/AppConfig.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace toolshed::app {

std::string DefaultCatalogDir() {
  const char* env = std::getenv(kCatalogEnvVar);
  if (env != nullptr && env[0] != '\0') return env;
  return "./catalog";
}

void PrintUsage(const char* program_name, std::ostream& os) {
  os << "Usage: " << program_name << " [OPTIONS]\n"
     << "\n"
     << "Browse a catalog of system operations and run them.\n"
     << "\n"
     << "CATALOG:\n"
     << "  --catalog DIR             Catalog root (default: $" << kCatalogEnvVar
     << " or ./catalog)\n"
     << "  -u, --override-validation Show all entries, disregarding compatibility checks\n"
     << "\n"
     << "EXECUTION:\n"
     << "  -y, --skip-confirmation   Do not ask before running a command\n"
     << "  -r, --bypass-root         Do not warn when running as root\n"
     << "\n"
     << "FRONT-END:\n"
     << "  --tick-ms N               Result polling period in ms (default: "
     << kDefaultTickMs << ")\n"
     << "\n"
     << "CONTROL SERVER:\n"
     << "  --listen ADDR             gRPC listen address (default: "
     << kDefaultListenAddress << ")\n"
     << "\n"
     << "  -h, --help                Show this help message\n"
     << "\n"
     << "ENVIRONMENT:\n"
     << "  " << kCatalogEnvVar << "          Default catalog root\n"
     << "  TOOLSHED_DEBUG            Enable debug logging\n";
}

AppConfig ParseArgs(int argc, const char* const argv[]) {
  AppConfig config;
  config.catalog_dir = DefaultCatalogDir();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.help = true;
      config.valid = true;
      return config;
    } else if (arg == "--catalog" && i + 1 < argc) {
      config.catalog_dir = argv[++i];
    } else if (arg == "--skip-confirmation" || arg == "-y") {
      config.skip_confirmation = true;
    } else if (arg == "--override-validation" || arg == "-u") {
      config.override_validation = true;
    } else if (arg == "--bypass-root" || arg == "-r") {
      config.bypass_root = true;
    } else if (arg == "--listen" && i + 1 < argc) {
      config.listen_address = argv[++i];
    } else if (arg == "--tick-ms" && i + 1 < argc) {
      std::string value = argv[++i];
      try {
        size_t consumed = 0;
        config.tick_ms = std::stoi(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
      } catch (const std::exception&) {
        config.error = "--tick-ms expects an integer, got: " + value;
        return config;
      }
    } else {
      config.error = "Unknown or incomplete argument: " + arg;
      return config;
    }
  }

  if (config.catalog_dir.empty()) {
    config.error = "--catalog must not be empty";
    return config;
  }
  if (config.tick_ms <= 0) {
    config.error = "--tick-ms must be positive";
    return config;
  }
  if (config.listen_address.empty()) {
    config.error = "--listen must not be empty";
    return config;
  }

  config.valid = true;
  return config;
}

}  // namespace toolshed::app
