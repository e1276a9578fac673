#include <gtest/gtest.h>
#include <permitted/errors.hpp>

namespace permitted {
namespace errors {
namespace {

// ==================== Remote code mapping ====================

TEST(ClassifyTest, MapsLicenseCodes) {
    EXPECT_EQ(classify("INVALID_LICENSE", 404).code, ErrorCode::InvalidLicense);
    EXPECT_EQ(classify("LICENSE_EXPIRED", 403).code, ErrorCode::LicenseExpired);
    EXPECT_EQ(classify("LICENSE_SUSPENDED", 403).code, ErrorCode::LicenseSuspended);
    EXPECT_EQ(classify("LICENSE_REVOKED", 403).code, ErrorCode::LicenseRevoked);
}

TEST(ClassifyTest, LegacyHardwareMismatchIsIdentifierMismatch) {
    EXPECT_EQ(classify("IDENTIFIER_MISMATCH", 403).code, ErrorCode::IdentifierMismatch);
    EXPECT_EQ(classify("HWID_MISMATCH", 403).code, ErrorCode::IdentifierMismatch);
}

TEST(ClassifyTest, AllTokenCodesAreTokenFailures) {
    for (const char* code : {"TOKEN_MISSING", "TOKEN_INVALID", "TOKEN_EXPIRED", "TOKEN_REVOKED"}) {
        auto failure = classify(code, 401);
        EXPECT_EQ(failure.code, ErrorCode::TokenInvalid) << code;
        EXPECT_TRUE(is_token_failure(failure)) << code;
    }
}

TEST(ClassifyTest, MapsServiceAndFileCodes) {
    EXPECT_EQ(classify("API_DISABLED", 403).code, ErrorCode::ApiDisabled);
    EXPECT_EQ(classify("FILE_NOT_FOUND", 404).code, ErrorCode::ResourceNotFound);
    EXPECT_EQ(classify("FILE_ACCESS_DENIED", 403).code, ErrorCode::AccessDenied);
    EXPECT_EQ(classify("DOWNLOAD_RATE_LIMITED", 429).code, ErrorCode::DownloadRateLimited);
}

TEST(ClassifyTest, RateLimitedCarriesRetryAfter) {
    auto failure = classify("RATE_LIMITED", 429, std::string("30"));

    EXPECT_EQ(failure.code, ErrorCode::RateLimited);
    ASSERT_TRUE(failure.retry_after_seconds.has_value());
    EXPECT_EQ(*failure.retry_after_seconds, 30);
    EXPECT_EQ(failure.message, "Too many requests");
}

TEST(ClassifyTest, RateLimitedWithoutHeaderHasNoDelay) {
    auto failure = classify("RATE_LIMITED", 429);
    EXPECT_EQ(failure.code, ErrorCode::RateLimited);
    EXPECT_FALSE(failure.retry_after_seconds.has_value());
}

TEST(ClassifyTest, UnknownCodeIsGenericFailureKeepingCodeAndStatus) {
    auto failure = classify("X_WEIRD", 418, std::nullopt, "Strange things");

    EXPECT_EQ(failure.code, ErrorCode::GenericApiFailure);
    EXPECT_EQ(failure.api_code, "X_WEIRD");
    EXPECT_EQ(failure.http_status, 418);
    EXPECT_EQ(failure.message, "Strange things");
}

TEST(ClassifyTest, ServerMessageWinsOverDefault) {
    auto failure = classify("LICENSE_EXPIRED", 403, std::nullopt, "Expired on 2025-01-01");
    EXPECT_EQ(failure.message, "Expired on 2025-01-01");
}

TEST(ClassifyTest, EmptyMessageUsesDefault) {
    EXPECT_EQ(classify("INVALID_LICENSE", 404).message, "License key not found");
    EXPECT_EQ(classify("IDENTIFIER_MISMATCH", 403).message,
              "License is bound to a different device");
}

TEST(ClassifyTest, IsDeterministic) {
    auto a = classify("LICENSE_REVOKED", 403, std::string("5"), "gone");
    auto b = classify("LICENSE_REVOKED", 403, std::string("5"), "gone");
    EXPECT_EQ(a.code, b.code);
    EXPECT_EQ(a.message, b.message);
    EXPECT_TRUE(a.retry_after_seconds == b.retry_after_seconds);
}

// ==================== Retry-After ====================

TEST(RetryAfterTest, AcceptsWholeSeconds) {
    EXPECT_EQ(parse_retry_after("0").value_or(-1), 0);
    EXPECT_EQ(parse_retry_after(" 120 ").value_or(-1), 120);
}

TEST(RetryAfterTest, RejectsEverythingElse) {
    EXPECT_FALSE(parse_retry_after("").has_value());
    EXPECT_FALSE(parse_retry_after("-5").has_value());
    EXPECT_FALSE(parse_retry_after("1.5").has_value());
    EXPECT_FALSE(parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
    EXPECT_FALSE(parse_retry_after("99999999999999").has_value());
}

// ==================== Response classification ====================

TEST(ClassifyResponseTest, ParsesErrorEnvelope) {
    http::Response response;
    response.status_code = 429;
    response.body = R"({"error":{"code":"RATE_LIMITED","message":"Slow down"}})";
    response.retry_after = "30";

    auto failure = classify_response(response);

    EXPECT_EQ(failure.code, ErrorCode::RateLimited);
    EXPECT_EQ(failure.message, "Slow down");
    EXPECT_EQ(failure.retry_after_seconds.value_or(-1), 30);
}

TEST(ClassifyResponseTest, UnparseableBodyIsUnknownError) {
    http::Response response;
    response.status_code = 502;
    response.body = "<html>Bad Gateway</html>";

    auto failure = classify_response(response);

    EXPECT_EQ(failure.code, ErrorCode::GenericApiFailure);
    EXPECT_EQ(failure.api_code, "UNKNOWN_ERROR");
    EXPECT_EQ(failure.message, "Request failed with status 502");
    EXPECT_EQ(failure.http_status, 502);
}

TEST(ClassifyResponseTest, EnvelopeWithoutCodeIsUnknownError) {
    http::Response response;
    response.status_code = 500;
    response.body = R"({"message":"oops"})";

    auto failure = classify_response(response);
    EXPECT_EQ(failure.api_code, "UNKNOWN_ERROR");
}

TEST(NetworkFailureTest, KeepsTransportMessage) {
    auto failure = network_failure("Connection failed");
    EXPECT_EQ(failure.code, ErrorCode::NetworkFailure);
    EXPECT_EQ(failure.message, "Connection failed");
    EXPECT_EQ(failure.http_status, 0);
}

}  // namespace
}  // namespace errors
}  // namespace permitted
