#pragma once

#include <string>

#include "providers/IHttpTransport.hpp"

namespace dyndns::providers {

/// libcurl-backed transport. Creates one easy handle per request, so a
/// single instance may be shared across threads.
/// The caller is responsible for curl_global_init / curl_global_cleanup.
/// Class abbreviation: cht
class CurlHttpTransport : public IHttpTransport {
 public:
  explicit CurlHttpTransport(std::string sUserAgent = "dyndns-bridge");
  ~CurlHttpTransport() override;

  HttpResponse postJson(const std::string& sUrl, const std::string& sBody) override;

 private:
  std::string _sUserAgent;
};

}  // namespace dyndns::providers
