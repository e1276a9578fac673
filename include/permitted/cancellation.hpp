#pragma once

/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for blocking SDK calls
 *
 * A CancellationSource is owned by the caller; the CancellationToken it hands
 * out is passed into SDK calls. Transports register a callback on the token
 * for the duration of a request so that cancel() can abort the request from
 * another thread.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace permitted {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable callback_finished;
    std::map<uint64_t, std::function<void()>> callbacks;
    uint64_t next_id = 0;
    std::optional<uint64_t> running;  // Callback currently executing in cancel()
    std::thread::id cancelling_thread;

    void cancel() {
        std::unique_lock<std::mutex> lock(mutex);
        if (cancelled.exchange(true)) {
            return;
        }
        cancelling_thread = std::this_thread::get_id();

        // One callback at a time, outside the lock, so it may touch the token again
        while (!callbacks.empty()) {
            auto next = callbacks.begin();
            running = next->first;
            auto callback = std::move(next->second);
            callbacks.erase(next);

            lock.unlock();
            callback();
            lock.lock();

            running.reset();
            callback_finished.notify_all();
        }
    }

    /// Unregister a callback; waits for it if cancel() is running it on another thread
    void remove(uint64_t id) {
        std::unique_lock<std::mutex> lock(mutex);
        if (callbacks.erase(id) > 0) {
            return;
        }
        if (cancelling_thread == std::this_thread::get_id()) {
            return;
        }
        callback_finished.wait(lock, [&] { return running != id; });
    }
};

}  // namespace detail

/**
 * @brief Keeps a cancellation callback registered while alive
 */
class CancellationRegistration {
  public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    ~CancellationRegistration() { reset(); }

    // Non-copyable
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {}

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
        }
        return *this;
    }

    /// Unregister the callback
    void reset() {
        if (state_) {
            state_->remove(id_);
            state_.reset();
        }
    }

  private:
    std::shared_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

/**
 * @brief Read-only view of a cancellation request
 *
 * A default-constructed token can never be cancelled.
 */
class CancellationToken {
  public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    /// Check whether cancellation was requested
    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_ != nullptr && state_->cancelled.load();
    }

    /// Check whether this token is connected to a source
    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }

    /**
     * @brief Run a callback when cancellation is requested
     *
     * If cancellation was already requested the callback runs immediately.
     * The callback stays registered until the returned handle is destroyed.
     * Destroying the handle while the callback runs on another thread waits
     * for it to return.
     */
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const {
        if (!state_) {
            return {};
        }

        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled.load()) {
                auto id = state_->next_id++;
                state_->callbacks.emplace(id, std::move(callback));
                return CancellationRegistration(state_, id);
            }
        }

        callback();
        return {};
    }

  private:
    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owner side of a cancellation request
 */
class CancellationSource {
  public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    /// Token to hand to SDK calls
    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    /// Request cancellation; runs every registered callback once
    void cancel() { state_->cancel(); }

    [[nodiscard]] bool is_cancelled() const noexcept { return state_->cancelled.load(); }

  private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace permitted
