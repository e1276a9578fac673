#pragma once

/**
 * @file process.hpp
 * @brief Run a helper program and capture its standard output
 *
 * Used by the device probes that have to ask system tools (ioreg,
 * system_profiler, powershell) for hardware identifiers.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace permitted {
namespace process {

/**
 * @brief Run argv[0] with the given arguments and return what it printed
 *
 * The program is looked up on PATH when argv[0] is not a path. Standard
 * error is discarded. The child is killed once @p timeout elapses.
 *
 * @return Captured stdout, or nullopt if the program could not be started,
 *         timed out or exited with a non-zero status
 */
[[nodiscard]] std::optional<std::string> run_and_capture(const std::vector<std::string>& argv,
                                                         std::chrono::milliseconds timeout);

}  // namespace process
}  // namespace permitted
