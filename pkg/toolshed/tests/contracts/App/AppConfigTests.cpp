// Repository: Toolshed
// Component: AppConfig Tests
// Purpose: Command-line parsing, environment defaults and host description.
// Copyright (c) 2025 Toolshed

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "toolshed/app/AppConfig.hpp"
#include "toolshed/app/SystemInfo.hpp"

namespace toolshed::app::testing {
namespace {

class AppConfigTests : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* saved = std::getenv(kCatalogEnvVar);
    had_env_ = saved != nullptr;
    if (had_env_) saved_env_ = saved;
    unsetenv(kCatalogEnvVar);
  }

  void TearDown() override {
    if (had_env_) {
      setenv(kCatalogEnvVar, saved_env_.c_str(), 1);
    } else {
      unsetenv(kCatalogEnvVar);
    }
  }

  AppConfig Parse(std::vector<const char*> args) {
    args.insert(args.begin(), "toolshed");
    return ParseArgs(static_cast<int>(args.size()), args.data());
  }

  bool had_env_ = false;
  std::string saved_env_;
};

TEST_F(AppConfigTests, DefaultsWithoutArguments) {
  AppConfig config = Parse({});

  EXPECT_TRUE(config.valid);
  EXPECT_FALSE(config.help);
  EXPECT_EQ(config.catalog_dir, "./catalog");
  EXPECT_FALSE(config.skip_confirmation);
  EXPECT_FALSE(config.override_validation);
  EXPECT_TRUE(config.Validate());
  EXPECT_FALSE(config.bypass_root);
  EXPECT_EQ(config.listen_address, kDefaultListenAddress);
  EXPECT_EQ(config.tick_ms, kDefaultTickMs);
}

TEST_F(AppConfigTests, ShortFlags) {
  AppConfig config = Parse({"-y", "-u", "-r"});

  ASSERT_TRUE(config.valid);
  EXPECT_TRUE(config.skip_confirmation);
  EXPECT_TRUE(config.override_validation);
  EXPECT_FALSE(config.Validate());
  EXPECT_TRUE(config.bypass_root);
}

TEST_F(AppConfigTests, LongFlagsWithValues) {
  AppConfig config = Parse({"--catalog", "/srv/catalog", "--skip-confirmation",
                            "--override-validation", "--bypass-root",
                            "--listen", "0.0.0.0:6000", "--tick-ms", "250"});

  ASSERT_TRUE(config.valid) << config.error;
  EXPECT_EQ(config.catalog_dir, "/srv/catalog");
  EXPECT_TRUE(config.skip_confirmation);
  EXPECT_TRUE(config.override_validation);
  EXPECT_TRUE(config.bypass_root);
  EXPECT_EQ(config.listen_address, "0.0.0.0:6000");
  EXPECT_EQ(config.tick_ms, 250);
}

TEST_F(AppConfigTests, HelpStopsParsing) {
  AppConfig config = Parse({"--help", "--bogus"});
  EXPECT_TRUE(config.help);
  EXPECT_TRUE(config.valid);

  EXPECT_TRUE(Parse({"-h"}).help);
}

TEST_F(AppConfigTests, UnknownArgumentIsRejected) {
  AppConfig config = Parse({"--frobnicate"});
  EXPECT_FALSE(config.valid);
  EXPECT_EQ(config.error, "Unknown or incomplete argument: --frobnicate");
}

TEST_F(AppConfigTests, FlagMissingItsValueIsRejected) {
  AppConfig config = Parse({"--catalog"});
  EXPECT_FALSE(config.valid);
  EXPECT_EQ(config.error, "Unknown or incomplete argument: --catalog");
}

TEST_F(AppConfigTests, TickMsMustBePositiveInteger) {
  EXPECT_FALSE(Parse({"--tick-ms", "abc"}).valid);
  EXPECT_FALSE(Parse({"--tick-ms", "10ms"}).valid);
  EXPECT_FALSE(Parse({"--tick-ms", "0"}).valid);
  EXPECT_FALSE(Parse({"--tick-ms", "-5"}).valid);
  EXPECT_FALSE(Parse({"--tick-ms", "99999999999999"}).valid);
  EXPECT_TRUE(Parse({"--tick-ms", "1"}).valid);
}

TEST_F(AppConfigTests, EmptyValuesAreRejected) {
  EXPECT_FALSE(Parse({"--catalog", ""}).valid);
  EXPECT_FALSE(Parse({"--listen", ""}).valid);
}

TEST_F(AppConfigTests, CatalogDefaultsFromEnvironment) {
  setenv(kCatalogEnvVar, "/opt/toolshed/catalog", 1);
  EXPECT_EQ(DefaultCatalogDir(), "/opt/toolshed/catalog");
  EXPECT_EQ(Parse({}).catalog_dir, "/opt/toolshed/catalog");

  // The flag wins over the environment.
  EXPECT_EQ(Parse({"--catalog", "/tmp/x"}).catalog_dir, "/tmp/x");

  setenv(kCatalogEnvVar, "", 1);
  EXPECT_EQ(DefaultCatalogDir(), "./catalog");
}

TEST_F(AppConfigTests, UsageMentionsEveryFlag) {
  std::ostringstream os;
  PrintUsage("toolshed", os);
  const std::string usage = os.str();

  for (const char* flag : {"--catalog", "--skip-confirmation", "--override-validation",
                           "--bypass-root", "--listen", "--tick-ms", "--help",
                           kCatalogEnvVar}) {
    EXPECT_NE(usage.find(flag), std::string::npos) << flag;
  }
}

// =============================================================================
// SystemInfo
// =============================================================================

TEST(SystemInfoTests, PrettyNameQuotedAndBare) {
  EXPECT_EQ(ParseOsReleasePrettyName("NAME=\"Ubuntu\"\nPRETTY_NAME=\"Ubuntu 24.04 LTS\"\n"),
            "Ubuntu 24.04 LTS");
  EXPECT_EQ(ParseOsReleasePrettyName("PRETTY_NAME=Arch\n"), "Arch");
  EXPECT_EQ(ParseOsReleasePrettyName("PRETTY_NAME='Fedora 40'\r\n"), "Fedora 40");
}

TEST(SystemInfoTests, PrettyNameAbsent) {
  EXPECT_EQ(ParseOsReleasePrettyName(""), "");
  EXPECT_EQ(ParseOsReleasePrettyName("NAME=Debian\nID=debian\n"), "");
  // Only a key at the start of a line counts.
  EXPECT_EQ(ParseOsReleasePrettyName("X_PRETTY_NAME=nope\n"), "");
}

TEST(SystemInfoTests, CollectDescribesHost) {
  SystemInfo info = CollectSystemInfo();
  EXPECT_FALSE(info.system.empty());
  EXPECT_FALSE(info.architecture.empty());
  EXPECT_NE(info.system.find(info.architecture), std::string::npos);
}

TEST(SystemInfoTests, RootWarningHonoursBypass) {
  EXPECT_FALSE(WarnIfRoot(true));
  EXPECT_EQ(WarnIfRoot(false), IsRunningAsRoot());
}

}  // namespace
}  // namespace toolshed::app::testing
