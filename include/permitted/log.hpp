#pragma once

/**
 * @file log.hpp
 * @brief Logging for the Permitted SDK (Boost.Log)
 *
 * Every subsystem logs through its own channel ("client", "session",
 * "device", "http", "process"). Records below the SDK's own threshold are
 * never opened; without a call to init() only warnings and errors get
 * through. The Boost.Log core filter and sinks belong to the host
 * application and are left alone.
 */

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>

#include <string>

namespace permitted {
namespace log {

using severity_level = boost::log::trivial::severity_level;
using Logger = boost::log::sources::severity_channel_logger_mt<severity_level, std::string>;

/// Enable debug records when requested; never lowers a level another client raised
void init(bool debug);

/// Set the lowest severity the SDK emits
void set_threshold(severity_level level) noexcept;

/// Whether records at this severity pass the SDK threshold
[[nodiscard]] bool enabled(severity_level level) noexcept;

/// Process-wide logger for a channel
[[nodiscard]] Logger& get(const std::string& channel);

/// Show only the last four characters of a secret
[[nodiscard]] std::string mask(const std::string& secret);

}  // namespace log
}  // namespace permitted

#define PERMITTED_LOG(logger, level)                                      \
    if (!::permitted::log::enabled(::boost::log::trivial::level)) {      \
    } else                                                                \
        BOOST_LOG_SEV(logger, ::boost::log::trivial::level)
