#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace dyndns::common;

TEST(ErrorsTest, AppErrorCarriesStatusAndCode) {
  AppError err(500, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ValidationErrorIs400) {
  ValidationError err("domain_missing", "DynDNS target domain missing.");
  EXPECT_EQ(err._iHttpStatus, 400);
  EXPECT_EQ(err._sErrorCode, "domain_missing");
}

TEST(ErrorsTest, AuthorizationErrorIs403) {
  AuthorizationError err("domain_not_allowed", "Not on the allowlist");
  EXPECT_EQ(err._iHttpStatus, 403);
  EXPECT_EQ(err._sErrorCode, "domain_not_allowed");
}

TEST(ErrorsTest, ApiErrorRendersCodeAndTextDetail) {
  ApiError err(404, "not_found", "No matching record found.");
  EXPECT_EQ(err._iHttpStatus, 404);
  EXPECT_EQ(err._sErrorCode, "not_found");
  EXPECT_EQ(err.detail(), "No matching record found.");
  EXPECT_STREQ(err.what(), "404 - No matching record found.");
}

TEST(ErrorsTest, ApiErrorRendersStructuredDetailAsJson) {
  nlohmann::json jBody = {{"status", "error"}};
  ApiError err(401, "http_error", jBody);
  EXPECT_TRUE(err._jDetail.is_object());
  EXPECT_EQ(err.detail(), R"({"status":"error"})");
  EXPECT_STREQ(err.what(), R"(401 - {"status":"error"})");
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  try {
    throw ValidationError("test", "test message");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 400);
    EXPECT_EQ(err._sErrorCode, "test");
    EXPECT_STREQ(err.what(), "test message");
  }

  try {
    throw ApiError(10205, "provider_error", "zone not found");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 10205);
    EXPECT_STREQ(err.what(), "10205 - zone not found");
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw AuthorizationError("nf", "forbidden");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "forbidden");
  }
}
