#include "permitted/permitted.hpp"
#include "permitted/api.hpp"
#include "permitted/device.hpp"
#include "permitted/http.hpp"
#include "permitted/json.hpp"
#include "permitted/log.hpp"
#include "permitted/session.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>

namespace permitted {

namespace {

std::shared_ptr<http::HttpClientInterface> make_transport(const Config& config) {
    http::HttpClient::Config http_config;
    http_config.base_url = config.api_url;
    http_config.api_key = config.api_key;
    http_config.timeout_seconds = config.timeout_seconds;
    http_config.verify_ssl = config.verify_ssl;
    http_config.max_retries = config.max_retries;
    http_config.retry_interval_ms = config.retry_interval_ms;

    if (config.send_client_ip) {
        auto addresses = device::get_local_ip_addresses();
        if (!addresses.empty()) {
            http_config.default_headers["X-Client-IP"] = addresses.front();
        }
        if (addresses.size() > 1) {
            std::string joined;
            for (const auto& address : addresses) {
                if (!joined.empty()) {
                    joined += ",";
                }
                joined += address;
            }
            http_config.default_headers["X-Client-IPs"] = joined;
        }
    }

    return std::make_shared<http::HttpClient>(std::move(http_config));
}

const Config& checked(const Config& config) {
    if (config.api_key.empty()) {
        throw std::invalid_argument("API key is required");
    }
    return config;
}

}  // namespace

// PIMPL implementation
class Client::Impl {
  public:
    Impl(Config config, std::shared_ptr<http::HttpClientInterface> transport)
        : config_(std::move(config)),
          transport_(transport ? std::move(transport) : make_transport(checked(config_))),
          session_(*transport_, system_unix_now, config_.refresh_margin_seconds) {
        checked(config_);
        log::init(config_.debug);
        PERMITTED_LOG(log::get("client"), debug)
            << "Client created for " << config_.api_url << " (key " << log::mask(config_.api_key)
            << ")";
    }

    // ========== Status ==========

    Result<StatusResult> get_status(const std::string& product_id,
                                    const CancellationToken& cancel) {
        std::string path = "status";
        if (!product_id.empty()) {
            path += "?product_id=" + http::url_escape(product_id);
        }
        return api::exchange<StatusResult>(*transport_, api::get(path, cancel),
                                           json::parse_status);
    }

    // ========== Session ==========

    Result<ValidationResult> validate(const std::string& license_key,
                                      const std::string& identifier,
                                      const CancellationToken& cancel) {
        const std::string& effective = identifier.empty() ? device_identifier() : identifier;
        return session_.validate(license_key, effective, cancel);
    }

    Result<Session> refresh(const CancellationToken& cancel) { return session_.refresh(cancel); }

    Result<void> ensure_valid(const CancellationToken& cancel) {
        return session_.ensure_valid(cancel);
    }

    Result<PingResult> ping(const CancellationToken& cancel) {
        return protected_get<PingResult>("ping", cancel, json::parse_ping);
    }

    bool is_authenticated() const { return session_.is_authenticated(); }

    std::optional<std::string> token() const { return session_.current_token(); }

    std::optional<Timestamp> expires_at() const {
        auto expiry = session_.expires_at_unix();
        if (!expiry) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(*expiry));
    }

    // ========== License & Config ==========

    Result<License> get_license(const CancellationToken& cancel) {
        return protected_get<License>("license", cancel, json::parse_license);
    }

    Result<RemoteConfig> get_config(const CancellationToken& cancel) {
        return protected_get<RemoteConfig>("config", cancel, json::parse_config);
    }

    // ========== Files ==========

    Result<std::vector<FileInfo>> list_files(const CancellationToken& cancel) {
        return protected_get<std::vector<FileInfo>>("files", cancel, json::parse_files);
    }

    Result<DownloadLink> get_download_url(const std::string& file_id,
                                          const CancellationToken& cancel) {
        if (file_id.empty()) {
            return Result<DownloadLink>::error(ErrorCode::InvalidArgument, "File ID is required");
        }
        return protected_get<DownloadLink>("files/" + http::url_escape(file_id) + "/download",
                                           cancel, json::parse_download_link);
    }

    Result<void> download_file(const std::string& file_id, const std::string& destination_path,
                               ProgressCallback progress, const CancellationToken& cancel) {
        if (destination_path.empty()) {
            return Result<void>::error(ErrorCode::InvalidArgument,
                                       "Destination path is required");
        }

        auto link = get_download_url(file_id, cancel);
        if (link.is_error()) {
            return Result<void>::error(link.failure());
        }

        http::DownloadOptions options;
        options.timeout_seconds = config_.timeout_seconds;
        options.verify_ssl = config_.verify_ssl;
        options.progress = std::move(progress);
        options.cancellation = cancel;

        auto response = http::download_to_file(link.value().url, destination_path, options);

        if (response.cancelled) {
            return Result<void>::error(ErrorCode::Cancelled, "Download cancelled");
        }
        if (response.file_error) {
            return Result<void>::error(ErrorCode::FileError, response.error_message);
        }
        if (!response.error_message.empty()) {
            return Result<void>::error(errors::network_failure(response.error_message));
        }
        if (!response.success) {
            return Result<void>::error(errors::classify_response(response));
        }

        PERMITTED_LOG(log::get("client"), debug)
            << "Downloaded " << file_id << " to " << destination_path;
        return Result<void>::ok();
    }

    // ========== Utility ==========

    void reset() { session_.reset(); }

    const Config& config() const noexcept { return config_; }

    const std::string& device_identifier() {
        std::call_once(identifier_once_, [this] {
            if (!config_.device_identifier.empty()) {
                device_identifier_ = config_.device_identifier;
            } else {
                device_identifier_ = device::generate_device_id();
            }
        });
        return device_identifier_;
    }

  private:
    // Run ensure_valid() and send an authenticated GET
    template <typename T, typename Parser>
    Result<T> protected_get(const std::string& path, const CancellationToken& cancel,
                            Parser parser) {
        auto ensured = session_.ensure_valid(cancel);
        if (ensured.is_error()) {
            return Result<T>::error(ensured.failure());
        }

        auto token = session_.current_token();
        if (!token) {
            return Result<T>::error(ErrorCode::InvalidOperation,
                                    "No active session. Call validate first.");
        }

        auto request = api::get(path, cancel);
        request.bearer_token = *token;
        return api::exchange<T>(*transport_, request, parser);
    }

    Config config_;
    std::shared_ptr<http::HttpClientInterface> transport_;
    SessionManager session_;

    std::once_flag identifier_once_;
    std::string device_identifier_;
};

// ==================== Client Public Interface ====================

Client::Client(Config config) : impl_(std::make_unique<Impl>(std::move(config), nullptr)) {}

Client::Client(Config config, std::shared_ptr<http::HttpClientInterface> transport)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(transport))) {}

Client::~Client() = default;

Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

std::string Client::device_id() {
    return device::generate_device_id();
}

std::unordered_map<std::string, std::optional<std::string>> Client::hardware_components() {
    return device::collect_components();
}

Result<StatusResult> Client::get_status(const std::string& product_id,
                                        const CancellationToken& cancel) {
    return impl_->get_status(product_id, cancel);
}

Result<ValidationResult> Client::validate(const std::string& license_key,
                                          const std::string& identifier,
                                          const CancellationToken& cancel) {
    return impl_->validate(license_key, identifier, cancel);
}

Result<Session> Client::refresh(const CancellationToken& cancel) {
    return impl_->refresh(cancel);
}

Result<void> Client::ensure_valid(const CancellationToken& cancel) {
    return impl_->ensure_valid(cancel);
}

Result<PingResult> Client::ping(const CancellationToken& cancel) {
    return impl_->ping(cancel);
}

bool Client::is_authenticated() const {
    return impl_->is_authenticated();
}

std::optional<std::string> Client::token() const {
    return impl_->token();
}

std::optional<Timestamp> Client::expires_at() const {
    return impl_->expires_at();
}

Result<License> Client::get_license(const CancellationToken& cancel) {
    return impl_->get_license(cancel);
}

Result<RemoteConfig> Client::get_config(const CancellationToken& cancel) {
    return impl_->get_config(cancel);
}

Result<std::vector<FileInfo>> Client::list_files(const CancellationToken& cancel) {
    return impl_->list_files(cancel);
}

Result<DownloadLink> Client::get_download_url(const std::string& file_id,
                                              const CancellationToken& cancel) {
    return impl_->get_download_url(file_id, cancel);
}

Result<void> Client::download_file(const std::string& file_id,
                                   const std::string& destination_path,
                                   ProgressCallback progress, const CancellationToken& cancel) {
    return impl_->download_file(file_id, destination_path, std::move(progress), cancel);
}

void Client::reset() {
    impl_->reset();
}

const Config& Client::config() const noexcept {
    return impl_->config();
}

const std::string& Client::device_identifier() const {
    return impl_->device_identifier();
}

}  // namespace permitted
