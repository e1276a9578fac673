#include "permitted/session.hpp"

#include "permitted/api.hpp"
#include "permitted/log.hpp"

#include <chrono>

namespace permitted {

int64_t system_unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ==================== SessionState ====================

SessionSnapshot SessionState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void SessionState::establish(const Session& session, const std::string& license_key,
                             const std::string& identifier) {
    SessionSnapshot next;
    next.token = session.token;
    next.expires_at_unix = session.expires_at_unix;
    next.license_key = license_key;
    next.identifier = identifier;

    std::lock_guard<std::mutex> lock(mutex_);
    data_ = std::move(next);
}

bool SessionState::replace_token(const std::string& expected_token, const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (data_.token.empty() || data_.token != expected_token) {
        return false;
    }
    data_.token = session.token;
    data_.expires_at_unix = session.expires_at_unix;
    return true;
}

void SessionState::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = SessionSnapshot{};
}

// ==================== SessionManager ====================

SessionManager::SessionManager(http::HttpClientInterface& transport, Clock clock,
                               int64_t refresh_margin_seconds)
    : transport_(transport),
      clock_(std::move(clock)),
      refresh_margin_seconds_(refresh_margin_seconds) {}

Result<ValidationResult> SessionManager::validate(const std::string& license_key,
                                                  const std::string& identifier,
                                                  const CancellationToken& cancel) {
    if (license_key.empty()) {
        return Result<ValidationResult>::error(ErrorCode::InvalidArgument,
                                               "License key is required");
    }

    auto request = api::post("license/validate",
                             json::build_validate_request(license_key, identifier), cancel);
    auto result =
        api::exchange<ValidationResult>(transport_, request, json::parse_validation_result);

    if (result.is_error()) {
        if (result.error_code() != ErrorCode::Cancelled) {
            PERMITTED_LOG(log::get("session"), warning)
                << "Validation of " << log::mask(license_key)
                << " failed: " << result.error_message();
        }
        return result;
    }

    state_.establish(result.value().session(), license_key, identifier);
    PERMITTED_LOG(log::get("session"), info)
        << "Session established for " << log::mask(license_key) << ", expires at "
        << result.value().expires_at_unix;
    return result;
}

Result<Session> SessionManager::refresh(const CancellationToken& cancel) {
    auto current = state_.snapshot();
    if (!current.has_token()) {
        return Result<Session>::error(ErrorCode::InvalidOperation,
                                      "No active session. Call validate first.");
    }

    auto request =
        api::post("session/refresh", json::build_refresh_request(current.token), cancel);
    auto result = api::exchange<Session>(transport_, request, json::parse_session);

    if (result.is_error()) {
        if (result.error_code() != ErrorCode::Cancelled) {
            PERMITTED_LOG(log::get("session"), debug)
                << "Refresh of " << log::mask(current.token)
                << " failed: " << result.error_message();
        }
        return result;
    }

    if (!state_.replace_token(current.token, result.value())) {
        PERMITTED_LOG(log::get("session"), debug)
            << "Discarding refreshed token, session changed while refreshing";
        return Result<Session>::error(ErrorCode::InvalidOperation,
                                      "Session changed while refreshing");
    }
    PERMITTED_LOG(log::get("session"), debug)
        << "Session refreshed, expires at " << result.value().expires_at_unix;
    return result;
}

Result<void> SessionManager::ensure_valid(const CancellationToken& cancel) {
    auto current = state_.snapshot();
    if (!current.has_token()) {
        return Result<void>::error(ErrorCode::InvalidOperation,
                                   "No active session. Call validate first.");
    }

    if (!inside_margin(current)) {
        return Result<void>::ok();
    }

    auto refreshed = refresh(cancel);
    if (refreshed.is_ok()) {
        return Result<void>::ok();
    }

    if (refreshed.error_code() == ErrorCode::Cancelled) {
        return Result<void>::error(refreshed.failure());
    }

    // Another caller replaced the session while this refresh was in flight
    auto latest = state_.snapshot();
    if (latest.has_token() && latest.token != current.token) {
        return Result<void>::ok();
    }

    if (!errors::is_token_failure(refreshed.failure()) || current.license_key.empty() ||
        current.identifier.empty()) {
        return Result<void>::error(refreshed.failure());
    }

    PERMITTED_LOG(log::get("session"), info) << "Token rejected, re-validating license";
    auto revalidated = validate(current.license_key, current.identifier, cancel);
    if (revalidated.is_error()) {
        return Result<void>::error(revalidated.failure());
    }
    return Result<void>::ok();
}

bool SessionManager::is_authenticated() const {
    auto current = state_.snapshot();
    return current.has_token() && clock_() < current.expires_at_unix;
}

bool SessionManager::needs_refresh() const {
    auto current = state_.snapshot();
    return current.has_token() && inside_margin(current);
}

std::optional<std::string> SessionManager::current_token() const {
    auto current = state_.snapshot();
    if (!current.has_token()) {
        return std::nullopt;
    }
    return current.token;
}

std::optional<int64_t> SessionManager::expires_at_unix() const {
    auto current = state_.snapshot();
    if (!current.has_token()) {
        return std::nullopt;
    }
    return current.expires_at_unix;
}

void SessionManager::reset() {
    state_.clear();
    PERMITTED_LOG(log::get("session"), debug) << "Session cleared";
}

bool SessionManager::inside_margin(const SessionSnapshot& snapshot) const {
    return clock_() >= snapshot.expires_at_unix - refresh_margin_seconds_;
}

}  // namespace permitted
