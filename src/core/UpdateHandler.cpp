#include "core/UpdateHandler.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "providers/IProvider.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <charconv>
#include <utility>

namespace dyndns::core {

namespace {

/// Unset and empty parameters are both treated as absent.
bool present(const std::optional<std::string>& oValue) {
  return oValue.has_value() && !oValue->empty();
}

bool isIpv4Literal(const std::string& sAddress) {
  in_addr addr{};
  return inet_pton(AF_INET, sAddress.c_str(), &addr) == 1;
}

bool isIpv6Literal(const std::string& sAddress) {
  in6_addr addr{};
  return inet_pton(AF_INET6, sAddress.c_str(), &addr) == 1;
}

/// Hostname syntax: ASCII letters, digits, '-', '_' and '.', no empty label.
/// A trailing dot (FQDN form) is accepted.
bool isDomainName(const std::string& sDomain) {
  if (sDomain.size() > 253) {
    return false;
  }
  std::size_t iLabelLen = 0;
  for (std::size_t i = 0; i < sDomain.size(); ++i) {
    const char c = sDomain[i];
    if (c == '.') {
      if (iLabelLen == 0) return false;
      iLabelLen = 0;
      continue;
    }
    const bool bAlnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    if (!bAlnum && c != '-' && c != '_') return false;
    if (++iLabelLen > 63) return false;
  }
  return !sDomain.empty();
}

std::optional<int> parseTtl(const std::string& sTtl) {
  int iValue = 0;
  const char* pBegin = sTtl.data();
  const char* pEnd = pBegin + sTtl.size();
  auto [pPtr, ec] = std::from_chars(pBegin, pEnd, iValue);
  if (ec != std::errc{} || pPtr != pEnd) {
    return std::nullopt;
  }
  return iValue;
}

std::string joinLines(const std::vector<std::string>& vLines) {
  std::string sBody;
  for (std::size_t i = 0; i < vLines.size(); ++i) {
    if (i > 0) sBody += '\n';
    sBody += vLines[i];
  }
  return sBody;
}

}  // namespace

UpdateHandler::UpdateHandler(providers::IProvider& ipProvider, common::AllowList alAllowed)
    : _ipProvider(ipProvider), _alAllowed(std::move(alAllowed)) {}

UpdateHandler::~UpdateHandler() = default;

common::UpdateRequest UpdateHandler::validate(const common::UpdateParams& upParams) const {
  auto spLog = common::Logger::get();

  if (!present(upParams.oDomain)) {
    spLog->warn("Update request rejected: target domain missing");
    throw common::ValidationError("domain_missing", "DynDNS target domain missing.");
  }
  const std::string& sDomain = *upParams.oDomain;

  if (!_alAllowed.permits(sDomain)) {
    spLog->warn("Update request for {} rejected: domain is not on the allowlist", sDomain);
    throw common::AuthorizationError("domain_not_allowed",
                                     "Requested DynDNS domain is not on the allowlist.");
  }

  if (!present(upParams.oIpv4) && !present(upParams.oIpv6)) {
    spLog->error("Update request for {} received, but neither a v4 nor a v6 address given.",
                 sDomain);
    throw common::ValidationError("address_missing", "Neither a v4 nor a v6 address given.");
  }

  if (!isDomainName(sDomain)) {
    spLog->warn("Update request rejected: invalid target domain");
    throw common::ValidationError("invalid_domain", "Invalid DynDNS target domain given.");
  }

  common::UpdateRequest urRequest;
  urRequest.sDomain = sDomain;

  if (present(upParams.oTtl)) {
    urRequest.oTtl = parseTtl(*upParams.oTtl);
    if (!urRequest.oTtl.has_value()) {
      spLog->warn("Update request for {} rejected: invalid TTL '{}'", sDomain, *upParams.oTtl);
      throw common::ValidationError("invalid_ttl", "Invalid TTL value given.");
    }
  }

  if (present(upParams.oIpv4)) {
    if (!isIpv4Literal(*upParams.oIpv4)) {
      spLog->warn("Update request for {} rejected: invalid IPv4 address '{}'", sDomain,
                  *upParams.oIpv4);
      throw common::ValidationError("invalid_ipv4", "Invalid IPv4 address given.");
    }
    urRequest.oIpv4 = *upParams.oIpv4;
  }

  if (present(upParams.oIpv6)) {
    if (!isIpv6Literal(*upParams.oIpv6)) {
      spLog->warn("Update request for {} rejected: invalid IPv6 address '{}'", sDomain,
                  *upParams.oIpv6);
      throw common::ValidationError("invalid_ipv6", "Invalid IPv6 address given.");
    }
    urRequest.oIpv6 = *upParams.oIpv6;
  }

  return urRequest;
}

UpdateResult UpdateHandler::handle(const common::UpdateParams& upParams) const {
  common::UpdateRequest urRequest;
  try {
    urRequest = validate(upParams);
  } catch (const common::AppError& e) {
    return UpdateResult{e._iHttpStatus, e.what()};
  }

  UpdateResult ures;
  std::vector<std::string> vLines;

  if (urRequest.oIpv4.has_value() &&
      !updateFamily(urRequest, common::RecordType::A, *urRequest.oIpv4, vLines)) {
    ures.iStatus = 400;
  }
  if (urRequest.oIpv6.has_value() &&
      !updateFamily(urRequest, common::RecordType::AAAA, *urRequest.oIpv6, vLines)) {
    ures.iStatus = 400;
  }

  ures.sBody = joinLines(vLines);
  return ures;
}

bool UpdateHandler::updateFamily(const common::UpdateRequest& urRequest,
                                 common::RecordType rtType, const std::string& sAddress,
                                 std::vector<std::string>& vLines) const {
  auto spLog = common::Logger::get();
  const std::string sType = common::toString(rtType);

  try {
    auto rr = _ipProvider.updateRecord(urRequest.sDomain, rtType, sAddress, urRequest.oTtl);
    spLog->info("Successfully updated {} record for {}: {}, TTL {} at {}", sType, rr.sName,
                rr.sContent, rr.iTtl, rr.sLastChangeDate);
    vLines.push_back("Successfully updated " + sType + " record for " + rr.sName + " to " +
                     rr.sContent);
    return true;
  } catch (const common::ApiError& e) {
    spLog->error("Failed to update {} record for {} with address {} and TTL {}: {}", sType,
                 urRequest.sDomain, sAddress,
                 urRequest.oTtl ? std::to_string(*urRequest.oTtl) : std::string("<default>"),
                 e.what());
    vLines.push_back("Failed to update " + sType + " record: " + e.what());
    return false;
  }
}

}  // namespace dyndns::core
