#include "common/Config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace dyndns::common;

namespace {

void clearAllDynDnsEnv() {
  const char* vVars[] = {
      "DYNDNS_PROVIDER", "DYNDNS_API_BASE_URL", "DYNDNS_ZONE",
      "DYNDNS_API_TOKEN", "DYNDNS_API_TOKEN_FILE", "DYNDNS_DEFAULT_TTL",
      "DYNDNS_ALLOWED_DOMAINS", "DYNDNS_BIND_HOST", "DYNDNS_HTTP_PORT",
      "DYNDNS_BIND_SOCKET", "DYNDNS_HTTP_THREADS", "DYNDNS_UPDATE_PATH",
      "DYNDNS_LOG_LEVEL",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

void setMinimumRequiredEnv() {
  setenv("DYNDNS_ZONE", "example.com", 1);
  setenv("DYNDNS_API_TOKEN", "test-api-token", 1);
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllDynDnsEnv(); }
  void TearDown() override { clearAllDynDnsEnv(); }
};

TEST_F(ConfigTest, LoadWithAllRequiredVars) {
  setMinimumRequiredEnv();
  auto cfg = Config::load();
  EXPECT_EQ(cfg.pcProvider.sType, "hostingde");
  EXPECT_EQ(cfg.pcProvider.sApiBaseUrl, "https://secure.hosting.de/api/dns/v1/json");
  EXPECT_EQ(cfg.pcProvider.sZone, "example.com");
  EXPECT_EQ(cfg.pcProvider.sToken, "test-api-token");
  EXPECT_EQ(cfg.pcProvider.iDefaultTtl, 300);
  EXPECT_EQ(cfg.sBindHost, "127.0.0.1");
  EXPECT_EQ(cfg.iHttpPort, 8080);
  EXPECT_FALSE(cfg.oBindSocket.has_value());
  EXPECT_EQ(cfg.sUpdatePath, "/dyndns");
  EXPECT_EQ(cfg.alAllowedDomains.mode(), AllowList::Mode::Unrestricted);
}

TEST_F(ConfigTest, ThrowsOnMissingZone) {
  setenv("DYNDNS_API_TOKEN", "token", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnMissingToken) {
  setenv("DYNDNS_ZONE", "example.com", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, FallsBackToFileForToken) {
  setenv("DYNDNS_ZONE", "example.com", 1);

  const std::string sPath = "/tmp/dyndns_test_api_token";
  {
    std::ofstream ofs(sPath);
    ofs << "token-from-file\n";
  }
  setenv("DYNDNS_API_TOKEN_FILE", sPath.c_str(), 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.pcProvider.sToken, "token-from-file");

  std::remove(sPath.c_str());
}

TEST_F(ConfigTest, ThrowsOnEmptyTokenFile) {
  setenv("DYNDNS_ZONE", "example.com", 1);

  const std::string sPath = "/tmp/dyndns_test_empty_token";
  {
    std::ofstream ofs(sPath);
    ofs << "\n";
  }
  setenv("DYNDNS_API_TOKEN_FILE", sPath.c_str(), 1);

  EXPECT_THROW(Config::load(), std::runtime_error);

  std::remove(sPath.c_str());
}

TEST_F(ConfigTest, DefaultTtlMustBeAtLeastSixty) {
  setMinimumRequiredEnv();
  setenv("DYNDNS_DEFAULT_TTL", "59", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnNonNumericPort) {
  setMinimumRequiredEnv();
  setenv("DYNDNS_HTTP_PORT", "80a", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnPortOutOfRange) {
  setMinimumRequiredEnv();
  setenv("DYNDNS_HTTP_PORT", "70000", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnUnsupportedProvider) {
  setMinimumRequiredEnv();
  setenv("DYNDNS_PROVIDER", "cloudflare", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnRelativeUpdatePath) {
  setMinimumRequiredEnv();
  setenv("DYNDNS_UPDATE_PATH", "dyndns", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, ThrowsOnMalformedAllowList) {
  setMinimumRequiredEnv();
  setenv("DYNDNS_ALLOWED_DOMAINS", "home.example.com,,nas.example.com", 1);

  EXPECT_THROW(Config::load(), std::runtime_error);
}

TEST_F(ConfigTest, OverrideDefaults) {
  setMinimumRequiredEnv();
  setenv("DYNDNS_DEFAULT_TTL", "120", 1);
  setenv("DYNDNS_HTTP_PORT", "9090", 1);
  setenv("DYNDNS_BIND_SOCKET", "/run/dyndns.sock", 1);
  setenv("DYNDNS_LOG_LEVEL", "debug", 1);
  setenv("DYNDNS_ALLOWED_DOMAINS", "home.example.com, nas.example.com", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.pcProvider.iDefaultTtl, 120);
  EXPECT_EQ(cfg.iHttpPort, 9090);
  ASSERT_TRUE(cfg.oBindSocket.has_value());
  EXPECT_EQ(*cfg.oBindSocket, "/run/dyndns.sock");
  EXPECT_EQ(cfg.sLogLevel, "debug");
  EXPECT_EQ(cfg.alAllowedDomains.mode(), AllowList::Mode::Restricted);
  EXPECT_EQ(cfg.alAllowedDomains.domains().size(), 2u);
}
