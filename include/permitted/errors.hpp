#pragma once

/**
 * @file errors.hpp
 * @brief Mapping of API failures to SDK error codes
 *
 * The API reports failures as {"error": {"code": "...", "message": "..."}}
 * with a non-2xx status. classify() turns the remote code into an ErrorCode,
 * keeping the raw code, the HTTP status and, for rate limiting, the
 * Retry-After delay.
 */

#include "permitted/http.hpp"
#include "permitted/permitted.hpp"

#include <optional>
#include <string>

namespace permitted {
namespace errors {

/// Map a remote error code to an ErrorCode (GenericApiFailure if unknown)
[[nodiscard]] ErrorCode error_code_from_api(const std::string& api_code) noexcept;

/// Default message for an error code when the server sent none
[[nodiscard]] const char* default_message(ErrorCode code) noexcept;

/// Parse a Retry-After header given in whole seconds
[[nodiscard]] std::optional<int> parse_retry_after(const std::string& header);

/**
 * @brief Build a Failure from a remote error
 *
 * @param api_code Remote error code, e.g. "LICENSE_EXPIRED"
 * @param http_status HTTP status of the response
 * @param retry_after Raw Retry-After header, if present
 * @param message Message from the server (default message if empty)
 */
[[nodiscard]] Failure classify(const std::string& api_code, int http_status,
                               const std::optional<std::string>& retry_after = std::nullopt,
                               const std::string& message = "");

/// Build a Failure from a non-2xx response, parsing its error body
[[nodiscard]] Failure classify_response(const http::Response& response);

/// Failure for a request that never produced a response
[[nodiscard]] Failure network_failure(const std::string& message);

/// Whether the failure means the session token can no longer be used
[[nodiscard]] inline bool is_token_failure(const Failure& failure) noexcept {
    return failure.code == ErrorCode::TokenInvalid;
}

}  // namespace errors
}  // namespace permitted
