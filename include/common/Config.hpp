#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace dyndns::common {

/// Environment variable loader.
/// Loads all env vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Provider ──────────────────────────────────────────────────────────
  ProviderConfig pcProvider;  // sToken zeroed after handoff to the provider

  // ── HTTP ──────────────────────────────────────────────────────────────
  std::string sBindHost = "127.0.0.1";
  int iHttpPort = 8080;
  std::optional<std::string> oBindSocket;  // UNIX socket; overrides host/port
  int iHttpThreads = 2;
  std::string sUpdatePath = "/dyndns";

  // ── Access ────────────────────────────────────────────────────────────
  AllowList alAllowedDomains = AllowList::unrestricted();

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for DYNDNS_API_TOKEN.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace dyndns::common
