#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "providers/IProvider.hpp"

namespace dyndns::providers {

class IHttpTransport;

/// hosting.de DNS API v1 (JSON) provider implementation.
///
/// hosting.de answers HTTP 200 for failed operations too and reports the
/// failure in an `errors` list, so every reply goes through a two-step
/// check: HTTP status first, then the embedded errors.
/// Class abbreviation: hdp
class HostingDeProvider : public IProvider {
 public:
  /// Minimum TTL accepted by hosting.de.
  static constexpr int kMinTtl = 60;

  /// Written into the `comments` field of every record this service touches.
  static constexpr const char* kRecordComment =
      "DynDNS Record - automatically managed, do not change!";

  HostingDeProvider(common::ProviderConfig pcConfig, IHttpTransport& htTransport);
  ~HostingDeProvider() override;

  std::string name() const override;
  std::string findRecordId(const std::string& sName, common::RecordType rtType) override;
  common::ResourceRecord updateRecord(const std::string& sName,
                                      common::RecordType rtType,
                                      const std::string& sContent,
                                      std::optional<int> oTtl) override;

  /// oTtl if present and >= kMinTtl, otherwise iDefaultTtl.
  static int effectiveTtl(std::optional<int> oTtl, int iDefaultTtl);

 private:
  /// POST jPayload to {base}/{sEndpoint} and unwrap the `response` member.
  /// Throws common::ApiError for non-200 replies and embedded errors.
  nlohmann::json apiRequest(const std::string& sEndpoint, const nlohmann::json& jPayload);

  static common::ResourceRecord parseRecord(const nlohmann::json& jRecord);

  common::ProviderConfig _pcConfig;
  IHttpTransport& _htTransport;
};

}  // namespace dyndns::providers
