#include "permitted/http.hpp"

#include "permitted/log.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

// Detect SSL support in cpp-httplib
#if defined(CPPHTTPLIB_OPENSSL_SUPPORT)
#define PERMITTED_HTTP_HAS_SSL 1
#else
#define PERMITTED_HTTP_HAS_SSL 0
#endif

namespace permitted {
namespace http {

namespace {

std::string describe_error(httplib::Error error) {
    switch (error) {
        case httplib::Error::Connection:
            return "Connection failed";
        case httplib::Error::Read:
            return "Read failed";
        case httplib::Error::Write:
            return "Write failed";
        case httplib::Error::Canceled:
            return "Request canceled";
#if PERMITTED_HTTP_HAS_SSL
        case httplib::Error::SSLConnection:
            return "SSL connection failed";
        case httplib::Error::SSLServerVerification:
            return "SSL certificate verification failed";
#endif
        default:
            return "Unknown network error";
    }
}

bool is_transient(httplib::Error error) {
    return error == httplib::Error::Connection || error == httplib::Error::Read ||
           error == httplib::Error::Write;
}

template <typename ClientT> void apply_timeouts(ClientT& client, int timeout_seconds) {
    client.set_connection_timeout(timeout_seconds);
    client.set_read_timeout(timeout_seconds);
    client.set_write_timeout(timeout_seconds);
}

// Sleep between retries, waking early when the request is cancelled
void wait_before_retry(int interval_ms, const CancellationToken& cancellation) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(interval_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancellation.is_cancelled()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

}  // namespace

std::optional<UrlParts> parse_url(const std::string& input) {
    std::string url = input;

    // Remove trailing slash
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    UrlParts parts;
    if (url.rfind("https://", 0) == 0) {
        parts.https = true;
        parts.port = 443;
        url = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        url = url.substr(7);
    } else {
        return std::nullopt;
    }

    auto slash_pos = url.find('/');
    auto query_pos = url.find('?');
    auto authority_end = std::min(slash_pos, query_pos);

    std::string authority = url.substr(0, authority_end);
    if (authority_end != std::string::npos) {
        parts.path = url.substr(authority_end);
        if (parts.path.front() == '?') {
            parts.path.insert(parts.path.begin(), '/');
        }
    }

    auto colon_pos = authority.find(':');
    if (colon_pos != std::string::npos) {
        parts.host = authority.substr(0, colon_pos);
        std::string port_str = authority.substr(colon_pos + 1);
        if (port_str.empty() || port_str.size() > 5) {
            return std::nullopt;
        }
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }
        parts.port = std::stoi(port_str);
    } else {
        parts.host = authority;
    }

    if (parts.host.empty()) {
        return std::nullopt;
    }
    return parts;
}

std::string url_escape(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

// ==================== HttpClient Implementation ====================

class HttpClient::Impl {
  public:
    explicit Impl(Config config) : config_(std::move(config)) {
        auto parts = parse_url(config_.base_url);
        if (!parts) {
            PERMITTED_LOG(log::get("http"), warning)
                << "Invalid base URL '" << config_.base_url << "'";
            return;
        }
        base_path_ = parts->path;

        // Create the appropriate client
        if (parts->https) {
#if PERMITTED_HTTP_HAS_SSL
            ssl_client_ = std::make_unique<httplib::SSLClient>(parts->host, parts->port);
            apply_timeouts(*ssl_client_, config_.timeout_seconds);
            if (!config_.verify_ssl) {
                ssl_client_->enable_server_certificate_verification(false);
            }
#else
            // SSL not available - HTTPS URLs will fail at request time
            https_requested_ = true;
            client_ = std::make_unique<httplib::Client>(parts->host, parts->port);
            apply_timeouts(*client_, config_.timeout_seconds);
#endif
        } else {
            client_ = std::make_unique<httplib::Client>(parts->host, parts->port);
            apply_timeouts(*client_, config_.timeout_seconds);
        }

        configured_ = true;
    }

    Response send(const Request& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        Response response;

        if (!configured_) {
            response.error_message = "HTTP client not configured";
            return response;
        }

#if !PERMITTED_HTTP_HAS_SSL
        // If HTTPS was requested but SSL is not available, fail gracefully
        if (https_requested_) {
            response.error_message =
                "HTTPS not supported: cpp-httplib was compiled without SSL support";
            return response;
        }
#endif

        std::string full_path = base_path_ + "/" + request.path;

        httplib::Headers headers;
        headers.emplace("X-API-Key", config_.api_key);
        headers.emplace("User-Agent", config_.user_agent);
        for (const auto& [name, value] : config_.default_headers) {
            headers.emplace(name, value);
        }
        if (request.bearer_token) {
            headers.emplace("Authorization", "Bearer " + *request.bearer_token);
        }

        // Stop the connection if the caller cancels mid-request
        auto registration = request.cancellation.on_cancel([this] { stop(); });

        for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
            if (request.cancellation.is_cancelled()) {
                response.cancelled = true;
                response.error_message = "Request cancelled";
                return response;
            }

            httplib::Result result = dispatch(request.method, full_path, headers, request.body,
                                              request.content_type);

            if (request.cancellation.is_cancelled()) {
                response.cancelled = true;
                response.error_message = "Request cancelled";
                return response;
            }

            if (result) {
                response.status_code = result->status;
                response.body = result->body;
                response.success = (result->status >= 200 && result->status < 300);
                if (result->has_header("Retry-After")) {
                    response.retry_after = result->get_header_value("Retry-After");
                }
                return response;
            }

            // Check if we should retry
            auto error = result.error();
            if (is_transient(error) && attempt < config_.max_retries) {
                PERMITTED_LOG(log::get("http"), debug)
                    << describe_error(error) << " for " << full_path << ", retrying ("
                    << attempt + 1 << "/" << config_.max_retries << ")";
                wait_before_retry(config_.retry_interval_ms, request.cancellation);
                continue;
            }

            response.error_message = describe_error(error);
            PERMITTED_LOG(log::get("http"), warning)
                << response.error_message << " for " << full_path;
            break;
        }

        return response;
    }

    bool is_configured() const { return configured_; }

    const std::string& base_url() const { return config_.base_url; }

  private:
    httplib::Result dispatch(Method method, const std::string& path,
                             const httplib::Headers& headers, const std::string& body,
                             const std::string& content_type) {
#if PERMITTED_HTTP_HAS_SSL
        if (ssl_client_) {
            return dispatch_with(*ssl_client_, method, path, headers, body, content_type);
        }
#endif
        return dispatch_with(*client_, method, path, headers, body, content_type);
    }

    template <typename ClientT>
    static httplib::Result dispatch_with(ClientT& client, Method method, const std::string& path,
                                         const httplib::Headers& headers,
                                         const std::string& body,
                                         const std::string& content_type) {
        switch (method) {
            case Method::GET:
                return client.Get(path, headers);
            case Method::POST:
                return client.Post(path, headers, body, content_type);
        }
        return httplib::Result();
    }

    void stop() {
#if PERMITTED_HTTP_HAS_SSL
        if (ssl_client_) {
            ssl_client_->stop();
        }
#endif
        if (client_) {
            client_->stop();
        }
    }

    Config config_;
    std::string base_path_;
    std::unique_ptr<httplib::Client> client_;
#if PERMITTED_HTTP_HAS_SSL
    std::unique_ptr<httplib::SSLClient> ssl_client_;
#else
    bool https_requested_ = false;
#endif
    bool configured_ = false;
    std::mutex mutex_;
};

HttpClient::HttpClient(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Response HttpClient::send(const Request& request) {
    return impl_->send(request);
}

bool HttpClient::is_configured() const {
    return impl_->is_configured();
}

const std::string& HttpClient::base_url() const {
    return impl_->base_url();
}

// ==================== Streaming downloads ====================

namespace {

template <typename ClientT>
Response stream_to_file(ClientT& client, const UrlParts& parts, const std::string& destination,
                        const DownloadOptions& options) {
    apply_timeouts(client, options.timeout_seconds);

    Response response;
    std::ofstream file;
    int64_t received = 0;
    std::optional<int64_t> total;
    bool write_failed = false;
    bool created = false;

    httplib::Headers headers;
    headers.emplace("User-Agent", options.user_agent);

    auto registration = options.cancellation.on_cancel([&client] { client.stop(); });

    auto result = client.Get(
        parts.path.empty() ? std::string("/") : parts.path, headers,
        [&](const httplib::Response& res) {
            response.status_code = res.status;
            response.success = (res.status >= 200 && res.status < 300);
            if (res.has_header("Retry-After")) {
                response.retry_after = res.get_header_value("Retry-After");
            }
            if (res.has_header("Content-Length")) {
                try {
                    total = std::stoll(res.get_header_value("Content-Length"));
                } catch (const std::exception&) {
                    total.reset();
                }
            }
            if (response.success) {
                file.open(destination, std::ios::binary | std::ios::trunc);
                if (!file.is_open()) {
                    write_failed = true;
                    return false;
                }
                created = true;
            }
            return !options.cancellation.is_cancelled();
        },
        [&](const char* data, size_t length) {
            if (options.cancellation.is_cancelled()) {
                return false;
            }
            if (!response.success) {
                // Keep error bodies for classification
                response.body.append(data, length);
                return true;
            }
            file.write(data, static_cast<std::streamsize>(length));
            if (!file) {
                write_failed = true;
                return false;
            }
            received += static_cast<int64_t>(length);
            if (options.progress) {
                options.progress(received, total);
            }
            return true;
        });

    if (file.is_open()) {
        file.close();
    }

    if (options.cancellation.is_cancelled()) {
        response.success = false;
        response.cancelled = true;
        response.error_message = "Request cancelled";
    } else if (write_failed) {
        response.success = false;
        response.file_error = true;
        response.error_message = "Cannot write to " + destination;
    } else if (!result) {
        response.success = false;
        response.status_code = 0;
        response.error_message = describe_error(result.error());
    }

    if (!response.success && created) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
    }
    return response;
}

}  // namespace

Response download_to_file(const std::string& url, const std::string& destination,
                          const DownloadOptions& options) {
    auto parts = parse_url(url);
    if (!parts) {
        Response response;
        response.error_message = "Invalid download URL";
        return response;
    }

    if (parts->https) {
#if PERMITTED_HTTP_HAS_SSL
        httplib::SSLClient client(parts->host, parts->port);
        if (!options.verify_ssl) {
            client.enable_server_certificate_verification(false);
        }
        return stream_to_file(client, *parts, destination, options);
#else
        Response response;
        response.error_message = "HTTPS not supported: cpp-httplib was compiled without SSL support";
        return response;
#endif
    }

    httplib::Client client(parts->host, parts->port);
    return stream_to_file(client, *parts, destination, options);
}

}  // namespace http
}  // namespace permitted
