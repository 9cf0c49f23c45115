#pragma once

#include <string>

#include <crow.h>

#include "common/Types.hpp"

namespace dyndns::core {
class UpdateHandler;
}

namespace dyndns::api::routes {

/// Handler for the DynDNS update endpoint (GET and POST).
/// Class abbreviation: ddr
class DynDnsRoutes {
 public:
  DynDnsRoutes(const dyndns::core::UpdateHandler& uhHandler, std::string sPath);
  ~DynDnsRoutes();

  /// Register the update route on the Crow app.
  void registerRoutes(crow::SimpleApp& app);

  /// Collect domain/ipv4/ipv6/ttl from the query string and, for
  /// form-encoded POSTs, from the body. Body values take precedence.
  static common::UpdateParams extractParams(const crow::request& req);

 private:
  const dyndns::core::UpdateHandler& _uhHandler;
  std::string _sPath;
};

}  // namespace dyndns::api::routes
