#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace dyndns::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: input validation failures.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 403 Forbidden: domain is not on the allow-list.
struct AuthorizationError : AppError {
  explicit AuthorizationError(std::string sCode, std::string sMsg)
      : AppError(403, std::move(sCode), std::move(sMsg)) {}
};

/// Upstream DNS provider failure.
/// _iHttpStatus holds the error code: the HTTP status for transport-level
/// failures, the provider's own code for errors embedded in a 200 reply.
/// The detail is either a plain string or the structured error body.
/// what() renders as "{code} - {detail}".
struct ApiError : AppError {
  nlohmann::json _jDetail;

  explicit ApiError(int iCode, std::string sSlug, nlohmann::json jDetail)
      : AppError(iCode, std::move(sSlug), render(iCode, jDetail)),
        _jDetail(std::move(jDetail)) {}

  /// Detail as text: strings unquoted, anything else as compact JSON.
  std::string detail() const { return detailText(_jDetail); }

 private:
  static std::string detailText(const nlohmann::json& jDetail) {
    return jDetail.is_string() ? jDetail.get<std::string>() : jDetail.dump();
  }

  static std::string render(int iCode, const nlohmann::json& jDetail) {
    return std::to_string(iCode) + " - " + detailText(jDetail);
  }
};

}  // namespace dyndns::common
