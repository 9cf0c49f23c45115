#include "api/routes/DynDnsRoutes.hpp"

#include "common/Logger.hpp"
#include "core/UpdateHandler.hpp"

#include <optional>
#include <utility>

namespace dyndns::api::routes {

namespace {

const std::string kFormContentType = "application/x-www-form-urlencoded";

std::optional<std::string> param(const crow::query_string& qs, const std::string& sKey) {
  const char* pValue = qs.get(sKey);
  if (pValue == nullptr) {
    return std::nullopt;
  }
  return std::string(pValue);
}

void overlay(std::optional<std::string>& oTarget, std::optional<std::string> oValue) {
  if (oValue.has_value()) {
    oTarget = std::move(oValue);
  }
}

crow::response textResponse(int iStatus, std::string sBody) {
  crow::response resp(iStatus, std::move(sBody));
  resp.set_header("Content-Type", "text/plain");
  return resp;
}

}  // namespace

DynDnsRoutes::DynDnsRoutes(const dyndns::core::UpdateHandler& uhHandler, std::string sPath)
    : _uhHandler(uhHandler), _sPath(std::move(sPath)) {}

DynDnsRoutes::~DynDnsRoutes() = default;

common::UpdateParams DynDnsRoutes::extractParams(const crow::request& req) {
  common::UpdateParams upParams;
  upParams.oDomain = param(req.url_params, "domain");
  upParams.oIpv4 = param(req.url_params, "ipv4");
  upParams.oIpv6 = param(req.url_params, "ipv6");
  upParams.oTtl = param(req.url_params, "ttl");

  const std::string sContentType = req.get_header_value("Content-Type");
  if (req.method == crow::HTTPMethod::Post &&
      sContentType.compare(0, kFormContentType.size(), kFormContentType) == 0) {
    const crow::query_string qsBody("?" + req.body);
    overlay(upParams.oDomain, param(qsBody, "domain"));
    overlay(upParams.oIpv4, param(qsBody, "ipv4"));
    overlay(upParams.oIpv6, param(qsBody, "ipv6"));
    overlay(upParams.oTtl, param(qsBody, "ttl"));
  }
  return upParams;
}

void DynDnsRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET|POST {path}?domain=...&ipv4=...&ipv6=...&ttl=...
  app.route_dynamic(std::string(_sPath))
      .methods("GET"_method, "POST"_method)(
          [this](const crow::request& req) -> crow::response {
            try {
              auto ures = _uhHandler.handle(extractParams(req));
              return textResponse(ures.iStatus, std::move(ures.sBody));
            } catch (const std::exception& e) {
              common::Logger::get()->error("Unhandled error in {}: {}", _sPath, e.what());
              return textResponse(500, "Internal server error.");
            }
          });
}

}  // namespace dyndns::api::routes
