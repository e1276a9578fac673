#include "permitted/log.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace permitted {
namespace log {

namespace {

std::atomic<int> threshold{static_cast<int>(boost::log::trivial::warning)};

}  // namespace

void init(bool debug) {
    if (debug) {
        set_threshold(boost::log::trivial::debug);
    }
}

void set_threshold(severity_level level) noexcept {
    threshold.store(static_cast<int>(level));
}

bool enabled(severity_level level) noexcept {
    return static_cast<int>(level) >= threshold.load(std::memory_order_relaxed);
}

Logger& get(const std::string& channel) {
    static std::mutex mutex;
    static std::map<std::string, std::unique_ptr<Logger>> loggers;

    std::lock_guard<std::mutex> lock(mutex);
    auto& slot = loggers[channel];
    if (!slot) {
        slot = std::make_unique<Logger>(boost::log::keywords::channel = channel);
    }
    return *slot;
}

std::string mask(const std::string& secret) {
    if (secret.size() <= 4) {
        return std::string(secret.size(), '*');
    }
    return std::string(secret.size() - 4, '*') + secret.substr(secret.size() - 4);
}

}  // namespace log
}  // namespace permitted
