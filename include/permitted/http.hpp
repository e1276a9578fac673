#pragma once

/**
 * @file http.hpp
 * @brief HTTP client abstraction for the Permitted SDK
 *
 * Provides a clean HTTP client interface using cpp-httplib under the hood.
 * Handles HTTPS, connection retries and cancellation.
 */

#include "permitted/permitted.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace permitted {
namespace http {

/// HTTP method
enum class Method { GET, POST };

/// HTTP response structure
struct Response {
    int status_code = 0;
    std::string body;
    bool success = false;
    bool cancelled = false;
    bool file_error = false;                 // Local write failure (downloads only)
    std::string error_message;              // Set when no response was received
    std::optional<std::string> retry_after;  // Raw Retry-After header
};

/// HTTP request structure
struct Request {
    Method method = Method::GET;
    std::string path;
    std::string body;
    std::string content_type = "application/json";
    std::optional<std::string> bearer_token;
    CancellationToken cancellation;
};

/**
 * @brief HTTP client interface
 *
 * Abstract interface for HTTP operations. Can be mocked for testing.
 */
class HttpClientInterface {
  public:
    virtual ~HttpClientInterface() = default;

    /// Send an HTTP request and return the response
    [[nodiscard]] virtual Response send(const Request& request) = 0;

    /// Check if the client is properly configured
    [[nodiscard]] virtual bool is_configured() const = 0;
};

/// Components of a base URL
struct UrlParts {
    bool https = false;
    std::string host;
    int port = 80;
    std::string path;  // Without trailing slash, may be empty
};

/// Split "scheme://host[:port][/path]" into its parts
[[nodiscard]] std::optional<UrlParts> parse_url(const std::string& url);

/// Percent-encode a single path segment or query value
[[nodiscard]] std::string url_escape(const std::string& value);

/**
 * @brief HTTP client using cpp-httplib
 *
 * Implements HttpClientInterface using cpp-httplib for actual HTTP communication.
 * Supports HTTPS with SSL certificate verification. Requests are serialized;
 * cancelling a request's token stops the connection it is using.
 */
class HttpClient : public HttpClientInterface {
  public:
    /// Configuration for the HTTP client
    struct Config {
        std::string base_url;
        std::string api_key;
        int timeout_seconds = 30;
        bool verify_ssl = true;
        int max_retries = 3;
        int retry_interval_ms = 1000;
        std::string user_agent = std::string("permitted-cpp/") + VERSION;
        std::map<std::string, std::string> default_headers;
    };

    /// Construct with configuration
    explicit HttpClient(Config config);

    /// Destructor
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Send an HTTP request
    [[nodiscard]] Response send(const Request& request) override;

    /// Check if properly configured
    [[nodiscard]] bool is_configured() const override;

    /// Get the base URL
    [[nodiscard]] const std::string& base_url() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Options for download_to_file()
struct DownloadOptions {
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::string user_agent = std::string("permitted-cpp/") + VERSION;
    ProgressCallback progress;
    CancellationToken cancellation;
};

/**
 * @brief Stream an absolute URL to a file
 *
 * The destination is only left behind when the transfer completes with a
 * 2xx status; partial files are removed.
 *
 * @return Response with the final status; body is empty
 */
[[nodiscard]] Response download_to_file(const std::string& url, const std::string& destination,
                                        const DownloadOptions& options);

}  // namespace http
}  // namespace permitted
