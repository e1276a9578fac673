#pragma once

/**
 * @file api.hpp
 * @brief Request/response exchange with the Permitted API
 *
 * exchange() is the single place where HTTP responses become SDK results:
 * cancellation, transport failures, API error envelopes and malformed
 * bodies are all reported through Result.
 */

#include "permitted/errors.hpp"
#include "permitted/http.hpp"
#include "permitted/json.hpp"
#include "permitted/log.hpp"

#include <string>
#include <utility>

namespace permitted {
namespace api {

/// Build a GET request for an API path
[[nodiscard]] inline http::Request get(std::string path, const CancellationToken& cancel = {}) {
    http::Request request;
    request.method = http::Method::GET;
    request.path = std::move(path);
    request.cancellation = cancel;
    return request;
}

/// Build a POST request with a JSON body
[[nodiscard]] inline http::Request post(std::string path, const nlohmann::json& body,
                                        const CancellationToken& cancel = {}) {
    http::Request request;
    request.method = http::Method::POST;
    request.path = std::move(path);
    request.body = body.dump();
    request.cancellation = cancel;
    return request;
}

/**
 * @brief Send a request and parse a successful response
 *
 * @param parser Callable taking a nlohmann::json and returning T; may throw
 *               nlohmann::json::exception on missing fields
 */
template <typename T, typename Parser>
[[nodiscard]] Result<T> exchange(http::HttpClientInterface& transport,
                                 const http::Request& request, Parser parser) {
    if (request.cancellation.is_cancelled()) {
        return Result<T>::error(ErrorCode::Cancelled, "Request cancelled");
    }

    auto response = transport.send(request);

    if (response.cancelled || request.cancellation.is_cancelled()) {
        return Result<T>::error(ErrorCode::Cancelled, "Request cancelled");
    }

    if (!response.error_message.empty()) {
        return Result<T>::error(errors::network_failure(response.error_message));
    }

    if (!response.success) {
        auto failure = errors::classify_response(response);
        PERMITTED_LOG(log::get("http"), debug)
            << request.path << " failed: " << failure.api_code << " (" << failure.http_status
            << ")";
        return Result<T>::error(std::move(failure));
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        return Result<T>::ok(parser(j));
    } catch (const nlohmann::json::exception& e) {
        return Result<T>::error(ErrorCode::ParseError,
                                std::string("Failed to parse response: ") + e.what());
    }
}

}  // namespace api
}  // namespace permitted
