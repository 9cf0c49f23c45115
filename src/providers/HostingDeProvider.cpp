#include "providers/HostingDeProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "providers/IHttpTransport.hpp"

#include <utility>
#include <vector>

namespace dyndns::providers {

namespace {

std::string stringField(const nlohmann::json& jObject, const char* pKey) {
  auto it = jObject.find(pKey);
  if (it == jObject.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

std::string idOf(const nlohmann::json& jRecord) {
  return jRecord.is_object() ? stringField(jRecord, "id") : std::string{};
}

}  // namespace

HostingDeProvider::HostingDeProvider(common::ProviderConfig pcConfig,
                                     IHttpTransport& htTransport)
    : _pcConfig(std::move(pcConfig)), _htTransport(htTransport) {}

HostingDeProvider::~HostingDeProvider() = default;

std::string HostingDeProvider::name() const { return "hostingde"; }

int HostingDeProvider::effectiveTtl(std::optional<int> oTtl, int iDefaultTtl) {
  if (oTtl.has_value() && *oTtl >= kMinTtl) {
    return *oTtl;
  }
  return iDefaultTtl;
}

nlohmann::json HostingDeProvider::apiRequest(const std::string& sEndpoint,
                                             const nlohmann::json& jPayload) {
  auto spLog = common::Logger::get();
  spLog->debug("hosting.de: POST {}", sEndpoint);

  const HttpResponse hrResponse = _htTransport.postJson(
      _pcConfig.sApiBaseUrl + "/" + sEndpoint,
      jPayload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

  // Step 1: HTTP status
  if (hrResponse.lStatus != 200) {
    auto jBody = nlohmann::json::parse(hrResponse.sBody, nullptr, false);
    if (jBody.is_discarded()) {
      throw common::ApiError(static_cast<int>(hrResponse.lStatus), "http_error",
                             hrResponse.sBody);
    }
    throw common::ApiError(static_cast<int>(hrResponse.lStatus), "http_error",
                           std::move(jBody));
  }

  auto jBody = nlohmann::json::parse(hrResponse.sBody, nullptr, false);
  if (jBody.is_discarded() || !jBody.is_object()) {
    throw common::ApiError(502, "malformed_response",
                           "Provider returned a non-JSON response to " + sEndpoint);
  }

  // Step 2: errors embedded in a 200 reply. Only one transaction is sent per
  // request, so any entry means the transaction failed.
  auto itErrors = jBody.find("errors");
  if (itErrors != jBody.end() && itErrors->is_array() && !itErrors->empty()) {
    const auto& jError = itErrors->front();
    const std::string sValue = stringField(jError, "value");
    const std::string sText = stringField(jError, "text");
    int iCode = 0;
    auto itCode = jError.find("code");
    if (itCode != jError.end() && itCode->is_number_integer()) {
      iCode = itCode->get<int>();
    }
    throw common::ApiError(iCode, "provider_error",
                           sValue.empty() ? sText : sValue + " - " + sText);
  }

  auto itResponse = jBody.find("response");
  if (itResponse == jBody.end() || !itResponse->is_object()) {
    throw common::ApiError(502, "malformed_response",
                           "Provider response to " + sEndpoint + " has no response payload");
  }
  return *itResponse;
}

std::string HostingDeProvider::findRecordId(const std::string& sName,
                                            common::RecordType rtType) {
  const std::string sType = common::toString(rtType);
  nlohmann::json jPayload = {
      {"authToken", _pcConfig.sToken},
      {"filter",
       {{"subFilterConnective", "AND"},
        {"subFilter",
         nlohmann::json::array({{{"field", "RecordName"}, {"value", sName}},
                                {{"field", "RecordType"}, {"value", sType}}})}}},
  };

  const nlohmann::json jResult = apiRequest("recordsFind", jPayload);

  auto itData = jResult.find("data");
  if (itData == jResult.end() || !itData->is_array() || itData->empty()) {
    throw common::ApiError(404, "not_found", "No matching record found.");
  }
  if (itData->size() > 1) {
    throw common::ApiError(400, "ambiguous_record",
                           "More than one matching record found, cannot continue.");
  }

  std::string sId = idOf(itData->front());
  if (sId.empty()) {
    throw common::ApiError(404, "malformed_response",
                           "Could not find ID for record in response.");
  }
  return sId;
}

common::ResourceRecord HostingDeProvider::updateRecord(const std::string& sName,
                                                       common::RecordType rtType,
                                                       const std::string& sContent,
                                                       std::optional<int> oTtl) {
  const std::string sRecordId = findRecordId(sName, rtType);
  const int iTtl = effectiveTtl(oTtl, _pcConfig.iDefaultTtl);

  nlohmann::json jPayload = {
      {"authToken", _pcConfig.sToken},
      {"zoneName", _pcConfig.sZone},
      {"recordsToModify",
       nlohmann::json::array({{{"id", sRecordId},
                               {"name", sName},
                               {"type", common::toString(rtType)},
                               {"content", sContent},
                               {"comments", kRecordComment},
                               {"ttl", iTtl}}})},
  };

  const nlohmann::json jResult = apiRequest("recordsUpdate", jPayload);

  std::vector<const nlohmann::json*> vMatches;
  auto itRecords = jResult.find("records");
  if (itRecords != jResult.end() && itRecords->is_array()) {
    for (const auto& jRecord : *itRecords) {
      if (idOf(jRecord) == sRecordId) {
        vMatches.push_back(&jRecord);
      }
    }
  }

  if (vMatches.empty()) {
    throw common::ApiError(
        500, "inconsistent_response",
        "Update succeeded, but failed to find updated record in success response.");
  }
  if (vMatches.size() > 1) {
    throw common::ApiError(
        500, "inconsistent_response",
        "Update succeeded, but found more than one result in success response.");
  }

  return parseRecord(*vMatches.front());
}

common::ResourceRecord HostingDeProvider::parseRecord(const nlohmann::json& jRecord) {
  common::ResourceRecord rr;
  rr.sId = stringField(jRecord, "id");
  rr.sName = stringField(jRecord, "name");
  rr.sType = stringField(jRecord, "type");
  rr.sContent = stringField(jRecord, "content");
  auto itTtl = jRecord.find("ttl");
  if (itTtl != jRecord.end() && itTtl->is_number_integer()) {
    rr.iTtl = itTtl->get<int>();
  }
  rr.sLastChangeDate = stringField(jRecord, "lastChangeDate");
  return rr;
}

}  // namespace dyndns::providers
