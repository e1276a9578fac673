#include "permitted/errors.hpp"

#include "permitted/json.hpp"

#include <cctype>
#include <limits>

namespace permitted {
namespace errors {

ErrorCode error_code_from_api(const std::string& api_code) noexcept {
    if (api_code == "INVALID_LICENSE")
        return ErrorCode::InvalidLicense;
    if (api_code == "LICENSE_EXPIRED")
        return ErrorCode::LicenseExpired;
    if (api_code == "LICENSE_SUSPENDED")
        return ErrorCode::LicenseSuspended;
    if (api_code == "LICENSE_REVOKED")
        return ErrorCode::LicenseRevoked;
    if (api_code == "IDENTIFIER_MISMATCH" || api_code == "HWID_MISMATCH")
        return ErrorCode::IdentifierMismatch;
    if (api_code == "TOKEN_MISSING" || api_code == "TOKEN_INVALID" ||
        api_code == "TOKEN_EXPIRED" || api_code == "TOKEN_REVOKED")
        return ErrorCode::TokenInvalid;
    if (api_code == "API_DISABLED")
        return ErrorCode::ApiDisabled;
    if (api_code == "RATE_LIMITED")
        return ErrorCode::RateLimited;
    if (api_code == "FILE_NOT_FOUND")
        return ErrorCode::ResourceNotFound;
    if (api_code == "FILE_ACCESS_DENIED")
        return ErrorCode::AccessDenied;
    if (api_code == "DOWNLOAD_RATE_LIMITED")
        return ErrorCode::DownloadRateLimited;
    return ErrorCode::GenericApiFailure;
}

const char* default_message(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidLicense:
            return "License key not found";
        case ErrorCode::LicenseExpired:
            return "License has expired";
        case ErrorCode::LicenseSuspended:
            return "License has been suspended";
        case ErrorCode::LicenseRevoked:
            return "License has been revoked";
        case ErrorCode::IdentifierMismatch:
            return "License is bound to a different device";
        case ErrorCode::TokenInvalid:
            return "Session token is no longer valid";
        case ErrorCode::ApiDisabled:
            return "API access is not enabled for this product";
        case ErrorCode::RateLimited:
            return "Too many requests";
        case ErrorCode::ResourceNotFound:
            return "File not found";
        case ErrorCode::AccessDenied:
            return "Access to this file is denied";
        case ErrorCode::DownloadRateLimited:
            return "Download rate limit exceeded";
        default:
            return error_code_to_string(code);
    }
}

std::optional<int> parse_retry_after(const std::string& header) {
    size_t begin = 0;
    size_t end = header.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(header[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(header[end - 1]))) {
        --end;
    }
    if (begin == end) {
        return std::nullopt;
    }

    // Only delta-seconds are accepted; HTTP dates are ignored
    long long seconds = 0;
    for (size_t i = begin; i < end; ++i) {
        char c = header[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        seconds = seconds * 10 + (c - '0');
        if (seconds > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
    }
    return static_cast<int>(seconds);
}

Failure classify(const std::string& api_code, int http_status,
                 const std::optional<std::string>& retry_after, const std::string& message) {
    Failure failure;
    failure.code = error_code_from_api(api_code);
    failure.api_code = api_code;
    failure.http_status = http_status;
    failure.message = message.empty() ? default_message(failure.code) : message;

    if (failure.code == ErrorCode::RateLimited && retry_after) {
        failure.retry_after_seconds = parse_retry_after(*retry_after);
    }
    return failure;
}

Failure classify_response(const http::Response& response) {
    std::string code;
    std::string message;

    try {
        auto j = nlohmann::json::parse(response.body);
        auto api_error = json::parse_error_response(j);
        code = api_error.code;
        message = api_error.message;
    } catch (const nlohmann::json::exception&) {
        // Not an error envelope
        code.clear();
    }

    if (code.empty()) {
        code = "UNKNOWN_ERROR";
        message = "Request failed with status " + std::to_string(response.status_code);
    }

    return classify(code, response.status_code, response.retry_after, message);
}

Failure network_failure(const std::string& message) {
    Failure failure;
    failure.code = ErrorCode::NetworkFailure;
    failure.message = message.empty() ? "Network request failed" : message;
    return failure;
}

}  // namespace errors
}  // namespace permitted
