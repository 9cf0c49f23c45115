#include "providers/CurlHttpTransport.hpp"

#include "common/Errors.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>
#include <utility>

namespace dyndns::providers {

namespace {

std::size_t writeBody(char* pData, std::size_t iSize, std::size_t iCount, void* pUser) {
  auto* pBody = static_cast<std::string*>(pUser);
  pBody->append(pData, iSize * iCount);
  return iSize * iCount;
}

struct CurlEasyDeleter {
  void operator()(CURL* pCurl) const { curl_easy_cleanup(pCurl); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* pList) const { curl_slist_free_all(pList); }
};

[[noreturn]] void throwTransportError(CURLcode code) {
  throw common::ApiError(502, "transport_error",
                         std::string("HTTP request failed: ") + curl_easy_strerror(code));
}

}  // namespace

CurlHttpTransport::CurlHttpTransport(std::string sUserAgent)
    : _sUserAgent(std::move(sUserAgent)) {}

CurlHttpTransport::~CurlHttpTransport() = default;

HttpResponse CurlHttpTransport::postJson(const std::string& sUrl, const std::string& sBody) {
  std::unique_ptr<CURL, CurlEasyDeleter> upCurl(curl_easy_init());
  if (!upCurl) {
    throw common::ApiError(502, "transport_error", "Failed to create HTTP handle");
  }

  curl_slist* pHeaders = nullptr;
  pHeaders = curl_slist_append(pHeaders, "Content-Type: application/json");
  pHeaders = curl_slist_append(pHeaders, "Accept: application/json");
  std::unique_ptr<curl_slist, CurlSlistDeleter> upHeaders(pHeaders);

  HttpResponse hrResponse;
  CURL* pCurl = upCurl.get();
  curl_easy_setopt(pCurl, CURLOPT_URL, sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, sBody.c_str());
  curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(sBody.size()));
  curl_easy_setopt(pCurl, CURLOPT_USERAGENT, _sUserAgent.c_str());
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, &writeBody);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &hrResponse.sBody);

  CURLcode code = curl_easy_perform(pCurl);
  if (code != CURLE_OK) {
    throwTransportError(code);
  }

  code = curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &hrResponse.lStatus);
  if (code != CURLE_OK) {
    throwTransportError(code);
  }
  return hrResponse;
}

}  // namespace dyndns::providers
