#pragma once

/**
 * @file session.hpp
 * @brief Session state and lifecycle for the Permitted SDK
 *
 * SessionManager owns the session established by validate(). It renews the
 * token shortly before it expires and re-validates with the original license
 * key and identifier when the server no longer accepts the token.
 *
 * Network calls are made without holding the session lock; the lock is only
 * taken to read a snapshot or to replace the session, so token and expiry
 * always change together.
 */

#include "permitted/http.hpp"
#include "permitted/permitted.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace permitted {

/// Current wall-clock time in Unix seconds
[[nodiscard]] int64_t system_unix_now();

/// Copy of the session fields taken under the lock
struct SessionSnapshot {
    std::string token;
    int64_t expires_at_unix = 0;
    std::string license_key;
    std::string identifier;

    [[nodiscard]] bool has_token() const noexcept { return !token.empty(); }
};

/**
 * @brief Mutex-guarded session fields
 *
 * Fields are only ever replaced as a whole; readers never observe a token
 * paired with another token's expiry.
 */
class SessionState {
  public:
    [[nodiscard]] SessionSnapshot snapshot() const;

    /// Store a new session together with the credentials that produced it
    void establish(const Session& session, const std::string& license_key,
                   const std::string& identifier);

    /**
     * @brief Replace token and expiry, keeping the credentials
     *
     * Only applies while @p expected_token is still the current token, so a
     * refresh that finishes after reset() or a newer validate() is dropped.
     *
     * @return Whether the session was replaced
     */
    bool replace_token(const std::string& expected_token, const Session& session);

    /// Forget everything
    void clear();

  private:
    mutable std::mutex mutex_;
    SessionSnapshot data_;
};

/**
 * @brief Session lifecycle: validate, refresh and ensure_valid
 *
 * Thread Safety: all methods may be called concurrently. Two threads that
 * both find the session close to expiry may both refresh it.
 */
class SessionManager {
  public:
    using Clock = std::function<int64_t()>;

    /// Default lead time before expiry at which the session is renewed
    static constexpr int64_t DEFAULT_REFRESH_MARGIN_SECONDS = 300;

    /**
     * @param transport HTTP transport; must outlive the manager
     * @param clock Source of the current Unix time
     * @param refresh_margin_seconds Renew when fewer seconds than this remain
     */
    explicit SessionManager(http::HttpClientInterface& transport, Clock clock = system_unix_now,
                            int64_t refresh_margin_seconds = DEFAULT_REFRESH_MARGIN_SECONDS);

    /// Validate a license key and establish a session
    [[nodiscard]] Result<ValidationResult> validate(const std::string& license_key,
                                                    const std::string& identifier,
                                                    const CancellationToken& cancel = {});

    /// Exchange the current token for a new one
    [[nodiscard]] Result<Session> refresh(const CancellationToken& cancel = {});

    /**
     * @brief Make sure the session is usable
     *
     * Refreshes when the session is inside the refresh margin. If the server
     * rejects the token, validates once more with the recorded license key
     * and identifier.
     *
     * @return InvalidOperation if validate() never succeeded
     */
    [[nodiscard]] Result<void> ensure_valid(const CancellationToken& cancel = {});

    /// Token present and not yet expired
    [[nodiscard]] bool is_authenticated() const;

    /// Whether the session is inside the refresh margin
    [[nodiscard]] bool needs_refresh() const;

    [[nodiscard]] std::optional<std::string> current_token() const;
    [[nodiscard]] std::optional<int64_t> expires_at_unix() const;

    /// Drop the session
    void reset();

  private:
    [[nodiscard]] bool inside_margin(const SessionSnapshot& snapshot) const;

    http::HttpClientInterface& transport_;
    Clock clock_;
    int64_t refresh_margin_seconds_;
    SessionState state_;
};

}  // namespace permitted
