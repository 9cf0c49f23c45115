#pragma once

#include <string>

namespace dyndns::providers {

/// Raw HTTP exchange result.
/// Class abbreviation: hr
struct HttpResponse {
  long lStatus = 0;
  std::string sBody;
};

/// Pure abstract interface for the HTTP transport used by provider clients.
/// Implementations throw common::ApiError (transport_error) when no HTTP
/// exchange took place; any received status is returned, never thrown.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  /// POST a JSON document to sUrl.
  virtual HttpResponse postJson(const std::string& sUrl, const std::string& sBody) = 0;
};

}  // namespace dyndns::providers
