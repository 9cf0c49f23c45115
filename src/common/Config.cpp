#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dyndns::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  std::size_t iConsumed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &iConsumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  if (iConsumed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  // Try _FILE fallback
  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Provider ───────────────────────────────────────────────────────────
  const std::string sProvider = getEnv("DYNDNS_PROVIDER");
  if (!sProvider.empty()) {
    cfg.pcProvider.sType = sProvider;
  }
  const std::string sBaseUrl = getEnv("DYNDNS_API_BASE_URL");
  if (!sBaseUrl.empty()) {
    cfg.pcProvider.sApiBaseUrl = sBaseUrl;
  }

  cfg.pcProvider.sZone = getEnv("DYNDNS_ZONE");
  if (cfg.pcProvider.sZone.empty()) {
    throw std::runtime_error("Required environment variable DYNDNS_ZONE is not set");
  }

  cfg.pcProvider.sToken = loadSecret("DYNDNS_API_TOKEN");
  cfg.pcProvider.iDefaultTtl = getEnvInt("DYNDNS_DEFAULT_TTL", 300);

  // ── HTTP ───────────────────────────────────────────────────────────────
  const std::string sBindHost = getEnv("DYNDNS_BIND_HOST");
  if (!sBindHost.empty()) {
    cfg.sBindHost = sBindHost;
  }
  cfg.iHttpPort = getEnvInt("DYNDNS_HTTP_PORT", 8080);
  const std::string sBindSocket = getEnv("DYNDNS_BIND_SOCKET");
  if (!sBindSocket.empty()) {
    cfg.oBindSocket = sBindSocket;
  }
  cfg.iHttpThreads = getEnvInt("DYNDNS_HTTP_THREADS", 2);
  const std::string sUpdatePath = getEnv("DYNDNS_UPDATE_PATH");
  if (!sUpdatePath.empty()) {
    cfg.sUpdatePath = sUpdatePath;
  }

  // ── Access ─────────────────────────────────────────────────────────────
  cfg.alAllowedDomains = AllowList::parse(getEnv("DYNDNS_ALLOWED_DOMAINS"));

  // Logging
  const std::string sLogLevel = getEnv("DYNDNS_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.pcProvider.sType != "hostingde") {
    throw std::runtime_error("Unsupported DYNDNS_PROVIDER: " + cfg.pcProvider.sType +
                             " (only hostingde is implemented)");
  }

  // hosting.de rejects TTLs below 60s
  if (cfg.pcProvider.iDefaultTtl < 60) {
    throw std::runtime_error(
        "DYNDNS_DEFAULT_TTL must be >= 60 (got " +
        std::to_string(cfg.pcProvider.iDefaultTtl) + ")");
  }

  if (cfg.iHttpPort < 1 || cfg.iHttpPort > 65535) {
    throw std::runtime_error(
        "DYNDNS_HTTP_PORT must be in 1..65535 (got " + std::to_string(cfg.iHttpPort) + ")");
  }

  if (cfg.iHttpThreads < 1) {
    throw std::runtime_error(
        "DYNDNS_HTTP_THREADS must be >= 1 (got " + std::to_string(cfg.iHttpThreads) + ")");
  }

  if (cfg.sUpdatePath.front() != '/') {
    throw std::runtime_error("DYNDNS_UPDATE_PATH must start with '/' (got " +
                             cfg.sUpdatePath + ")");
  }

  return cfg;
}

}  // namespace dyndns::common
