#pragma once

#include <optional>
#include <set>
#include <string>

namespace dyndns::common {

/// Record types this service can update.
enum class RecordType { A, AAAA };

/// "A" / "AAAA".
std::string toString(RecordType rtType);

/// DNS record as returned by the provider. Fetched fresh on every update.
/// Class abbreviation: rr
struct ResourceRecord {
  std::string sId;
  std::string sName;
  std::string sType;
  std::string sContent;
  int iTtl = 0;
  std::string sLastChangeDate;
};

/// Connection settings for the single configured DNS provider.
/// Class abbreviation: pc
struct ProviderConfig {
  std::string sType = "hostingde";
  std::string sApiBaseUrl = "https://secure.hosting.de/api/dns/v1/json";
  std::string sZone;
  std::string sToken;
  int iDefaultTtl = 300;
};

/// Raw inbound parameters, exactly as received. Nothing is validated yet.
/// Class abbreviation: up
struct UpdateParams {
  std::optional<std::string> oDomain;
  std::optional<std::string> oIpv4;
  std::optional<std::string> oIpv6;
  std::optional<std::string> oTtl;
};

/// Validated update request.
/// Class abbreviation: ur
struct UpdateRequest {
  std::string sDomain;
  std::optional<std::string> oIpv4;
  std::optional<std::string> oIpv6;
  std::optional<int> oTtl;
};

/// Domains this service may update.
/// Either unrestricted (any domain) or restricted to an explicit set.
/// Class abbreviation: al
class AllowList {
 public:
  enum class Mode { Unrestricted, Restricted };

  static AllowList unrestricted();
  /// An empty set yields an unrestricted list.
  static AllowList restricted(std::set<std::string> setDomains);

  /// Parse the configured value: empty, "false" or "*" mean unrestricted,
  /// otherwise a comma-separated list of domains. Surrounding whitespace
  /// of each item is ignored. Throws std::runtime_error on an empty item.
  static AllowList parse(const std::string& sValue);

  Mode mode() const { return _mode; }
  const std::set<std::string>& domains() const { return _setDomains; }

  bool permits(const std::string& sDomain) const;

 private:
  AllowList(Mode mode, std::set<std::string> setDomains);

  Mode _mode;
  std::set<std::string> _setDomains;
};

}  // namespace dyndns::common
