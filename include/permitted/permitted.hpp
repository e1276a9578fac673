#pragma once

/**
 * @file permitted.hpp
 * @brief Permitted C++ SDK
 *
 * Client SDK for the Permitted licensing API: hardware-bound license
 * validation, session tokens that renew themselves, remote configuration
 * and gated file downloads.
 */

#include "permitted/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace permitted {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Timestamp type used throughout the SDK
using Timestamp = std::chrono::system_clock::time_point;

/// Error codes returned by SDK operations
enum class ErrorCode {
    Success = 0,

    // License errors
    InvalidLicense,
    LicenseExpired,
    LicenseSuspended,
    LicenseRevoked,
    IdentifierMismatch,

    // Session errors
    TokenInvalid,

    // Service errors
    ApiDisabled,
    RateLimited,

    // File errors
    ResourceNotFound,
    AccessDenied,
    DownloadRateLimited,

    // Transport errors
    NetworkFailure,
    GenericApiFailure,

    // Local errors
    InvalidOperation,
    InvalidArgument,
    Cancelled,
    ParseError,
    FileError
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::InvalidLicense:
            return "Invalid license";
        case ErrorCode::LicenseExpired:
            return "License expired";
        case ErrorCode::LicenseSuspended:
            return "License suspended";
        case ErrorCode::LicenseRevoked:
            return "License revoked";
        case ErrorCode::IdentifierMismatch:
            return "Identifier mismatch";
        case ErrorCode::TokenInvalid:
            return "Token invalid";
        case ErrorCode::ApiDisabled:
            return "API disabled";
        case ErrorCode::RateLimited:
            return "Rate limited";
        case ErrorCode::ResourceNotFound:
            return "Resource not found";
        case ErrorCode::AccessDenied:
            return "Access denied";
        case ErrorCode::DownloadRateLimited:
            return "Download rate limited";
        case ErrorCode::NetworkFailure:
            return "Network failure";
        case ErrorCode::GenericApiFailure:
            return "API failure";
        case ErrorCode::InvalidOperation:
            return "Invalid operation";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::FileError:
            return "File error";
    }
    return "Unknown error";
}

/**
 * @brief Description of a failed operation
 *
 * For failures reported by the API, @c api_code and @c http_status carry the
 * raw values the server sent. @c retry_after_seconds is only set for
 * ErrorCode::RateLimited.
 */
struct Failure {
    ErrorCode code = ErrorCode::Success;
    std::string message;
    std::string api_code;
    int http_status = 0;
    std::optional<int> retry_after_seconds;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Failure failure;
        failure.code = code;
        failure.message = std::move(message);
        return error(std::move(failure));
    }

    /// Construct an error result from a full failure description
    static Result error(Failure failure) {
        Result r;
        r.failure_ = std::move(failure);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return failure_.code == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return failure_.code != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return failure_.code; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return failure_.message; }

    /// Get the full failure description
    [[nodiscard]] const Failure& failure() const noexcept { return failure_; }

  private:
    Result() = default;
    std::optional<T> value_;
    Failure failure_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() { return Result(); }

    static Result error(ErrorCode code, std::string message = "") {
        Failure failure;
        failure.code = code;
        failure.message = std::move(message);
        return error(std::move(failure));
    }

    static Result error(Failure failure) {
        Result r;
        r.failure_ = std::move(failure);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return failure_.code == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return failure_.code != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return failure_.code; }
    [[nodiscard]] const std::string& error_message() const noexcept { return failure_.message; }
    [[nodiscard]] const Failure& failure() const noexcept { return failure_; }

  private:
    Result() = default;
    Failure failure_;
};

/// License status as returned by the API
enum class LicenseStatus { Active, Expired, Suspended, Revoked, Unknown };

/// Convert license status to string
[[nodiscard]] constexpr const char* license_status_to_string(LicenseStatus status) noexcept {
    switch (status) {
        case LicenseStatus::Active:
            return "active";
        case LicenseStatus::Expired:
            return "expired";
        case LicenseStatus::Suspended:
            return "suspended";
        case LicenseStatus::Revoked:
            return "revoked";
        case LicenseStatus::Unknown:
            return "unknown";
    }
    return "unknown";
}

/// Parse license status from API string
[[nodiscard]] inline LicenseStatus license_status_from_string(const std::string& str) noexcept {
    if (str == "active")
        return LicenseStatus::Active;
    if (str == "expired")
        return LicenseStatus::Expired;
    if (str == "suspended")
        return LicenseStatus::Suspended;
    if (str == "revoked")
        return LicenseStatus::Revoked;
    return LicenseStatus::Unknown;
}

/// Authenticated session issued by the API
struct Session {
    std::string token;
    int64_t expires_at_unix = 0;

    /// Expiry as a timestamp
    [[nodiscard]] Timestamp expires_at() const {
        return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(expires_at_unix));
    }
};

/**
 * @brief License tier information
 */
struct Tier {
    std::string id;
    std::string name;
    std::optional<std::string> description;
};

/**
 * @brief Product information nested in license responses
 */
struct Product {
    std::string id;
    std::string name;
    std::optional<std::string> description;
};

/**
 * @brief Customer the license was issued to
 */
struct Customer {
    std::string id;
    std::string email;
    std::optional<std::string> name;
};

/**
 * @brief License summary returned together with a validation
 */
struct ValidationLicense {
    std::string id;
    std::string status;
    std::optional<Timestamp> created_at;
    std::optional<Timestamp> expires_at;
    bool is_lifetime = false;
    std::optional<Tier> tier;
    Product product;
};

/**
 * @brief Validation response from the API
 *
 * A successful validation always establishes a session, so the token and
 * its expiry are part of the result.
 */
struct ValidationResult {
    std::string token;
    int64_t expires_at_unix = 0;
    ValidationLicense license;

    /// The session this validation established
    [[nodiscard]] Session session() const { return Session{token, expires_at_unix}; }
};

/**
 * @brief Full license details
 */
struct License {
    std::string id;
    LicenseStatus status = LicenseStatus::Unknown;
    std::optional<Timestamp> created_at;
    std::optional<Timestamp> expires_at;
    bool is_lifetime = false;
    std::optional<int64_t> time_remaining_seconds;  // nullopt for lifetime licenses
    std::optional<Tier> tier;
    Product product;
    std::optional<Customer> customer;
    std::map<std::string, std::string> metadata;

    /// Check if the license is active and not past its expiry
    [[nodiscard]] bool is_valid() const noexcept {
        if (status != LicenseStatus::Active) {
            return false;
        }
        if (!is_lifetime && expires_at.has_value() &&
            std::chrono::system_clock::now() > *expires_at) {
            return false;
        }
        return true;
    }
};

/// Result of a session ping
struct PingResult {
    std::string status;  // "valid" on success
    int64_t expires_at_unix = 0;
};

/// Per-product API availability
struct ProductStatus {
    std::string id;
    bool api_enabled = false;
};

/// API status check result
struct StatusResult {
    std::string status;
    int64_t timestamp_unix = 0;
    std::optional<ProductStatus> product;

    [[nodiscard]] bool is_operational() const noexcept { return status == "operational"; }
};

/// A single remote configuration value
using ConfigValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

/**
 * @brief Remote configuration variables with typed accessors
 *
 * Accessors never fail: a missing key or a value that cannot be converted
 * yields the supplied default.
 */
class RemoteConfig {
  public:
    RemoteConfig() = default;
    explicit RemoteConfig(std::map<std::string, ConfigValue> variables)
        : variables_(std::move(variables)) {}

    [[nodiscard]] bool contains(const std::string& key) const;

    [[nodiscard]] std::optional<std::string> get_string(const std::string& key) const;
    [[nodiscard]] int64_t get_int(const std::string& key, int64_t default_value = 0) const;
    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] double get_double(const std::string& key, double default_value = 0.0) const;

    [[nodiscard]] const std::map<std::string, ConfigValue>& variables() const noexcept {
        return variables_;
    }

  private:
    std::map<std::string, ConfigValue> variables_;
};

/**
 * @brief Downloadable file attached to a product
 */
struct FileInfo {
    std::string id;
    std::string name;
    std::string file_name;
    int64_t size = 0;
    std::string size_formatted;
    std::optional<Timestamp> created_at;
};

/**
 * @brief Signed, short-lived download URL
 */
struct DownloadLink {
    std::string url;
    int64_t expires_at_unix = 0;
};

/// Download progress callback: bytes received so far, total size if known
using ProgressCallback = std::function<void(int64_t, std::optional<int64_t>)>;

/**
 * @brief Configuration for the Permitted client
 */
struct Config {
    /// Product API key (required), e.g. "pk_live_..."
    std::string api_key;

    /// Base URL for the Permitted API (includes /api/v1)
    std::string api_url = "https://permitted.dev/api/v1";

    /// Device identifier (hardware fingerprint if empty)
    std::string device_identifier;

    /// HTTP request timeout in seconds
    int timeout_seconds = 30;

    /// Enable SSL certificate verification (disable only for testing!)
    bool verify_ssl = true;

    /// Number of retry attempts for requests that never reached the server
    int max_retries = 3;

    /// Interval between retries in milliseconds
    int retry_interval_ms = 1000;

    /// Renew the session this many seconds before it expires
    int64_t refresh_margin_seconds = 300;

    /// Report local IPv4 addresses in X-Client-IP / X-Client-IPs headers
    bool send_client_ip = true;

    /// Enable debug logging
    bool debug = false;
};

namespace http {
class HttpClientInterface;
}  // namespace http

/**
 * @brief Main client for interacting with the Permitted API
 *
 * Validating a license establishes a session. Every call that needs the
 * session renews it first when it is about to expire, and falls back to
 * re-validating with the original license key and identifier when the
 * token can no longer be refreshed.
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * ```cpp
 * permitted::Config config;
 * config.api_key = "pk_live_...";
 * permitted::Client client(config);
 *
 * auto result = client.validate("XXXX-XXXX-XXXX-XXXX");
 * if (result.is_ok()) {
 *     auto remote = client.get_config();
 *     auto max_projects = remote.value().get_int("max_projects", 5);
 * }
 * ```
 */
class Client {
  public:
    /// Construct a client with the given configuration
    /// @throws std::invalid_argument if the API key is empty
    explicit Client(Config config);

    /// Construct a client that talks through the given transport
    Client(Config config, std::shared_ptr<http::HttpClientInterface> transport);

    /// Destructor
    ~Client();

    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Movable
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    // ========== Device ==========

    /// Hardware fingerprint of this device (64 lowercase hex chars)
    [[nodiscard]] static std::string device_id();

    /// Raw hardware components behind the fingerprint, for diagnostics
    [[nodiscard]] static std::unordered_map<std::string, std::optional<std::string>>
    hardware_components();

    // ========== Status ==========

    /// Check API availability (no session required)
    /// @param product_id Optional product to report API status for
    [[nodiscard]] Result<StatusResult> get_status(const std::string& product_id = "",
                                                  const CancellationToken& cancel = {});

    // ========== Session ==========

    /// Validate a license key and establish a session
    /// @param license_key The license key to validate
    /// @param identifier Device identifier (config or fingerprint if empty)
    [[nodiscard]] Result<ValidationResult> validate(const std::string& license_key,
                                                    const std::string& identifier = "",
                                                    const CancellationToken& cancel = {});

    /// Exchange the current token for a new one
    [[nodiscard]] Result<Session> refresh(const CancellationToken& cancel = {});

    /// Make sure the session is usable, refreshing or re-validating it if needed
    [[nodiscard]] Result<void> ensure_valid(const CancellationToken& cancel = {});

    /// Check the session with the server
    [[nodiscard]] Result<PingResult> ping(const CancellationToken& cancel = {});

    /// Whether a session exists and has not expired
    [[nodiscard]] bool is_authenticated() const;

    /// The current session token, if any
    [[nodiscard]] std::optional<std::string> token() const;

    /// When the current session token expires
    [[nodiscard]] std::optional<Timestamp> expires_at() const;

    // ========== License & Config ==========

    /// Full details of the licensed product
    [[nodiscard]] Result<License> get_license(const CancellationToken& cancel = {});

    /// Remote configuration variables for this license
    [[nodiscard]] Result<RemoteConfig> get_config(const CancellationToken& cancel = {});

    // ========== Files ==========

    /// List files available for download
    [[nodiscard]] Result<std::vector<FileInfo>> list_files(const CancellationToken& cancel = {});

    /// Get a signed download URL for a file (expires after 15 minutes)
    [[nodiscard]] Result<DownloadLink> get_download_url(const std::string& file_id,
                                                        const CancellationToken& cancel = {});

    /// Download a file to the given path
    /// @param progress Optional callback invoked as data arrives
    [[nodiscard]] Result<void> download_file(const std::string& file_id,
                                             const std::string& destination_path,
                                             ProgressCallback progress = nullptr,
                                             const CancellationToken& cancel = {});

    // ========== Utility ==========

    /// Drop the in-memory session
    void reset();

    /// Get the current configuration
    [[nodiscard]] const Config& config() const noexcept;

    /// Identifier sent when validate() is called without one
    [[nodiscard]] const std::string& device_identifier() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace permitted
