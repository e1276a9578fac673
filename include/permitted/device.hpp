#pragma once

/**
 * @file device.hpp
 * @brief Device identification utilities for the Permitted SDK
 *
 * The device identity is a SHA-256 over a set of named hardware components.
 * Which components are collected depends on the platform family:
 * - Windows: WMI processor, baseboard, BIOS and disk serials, MachineGuid
 * - macOS: IOPlatformUUID, serial number, system_profiler hardware UUID
 * - Linux: machine-id, DMI product UUID and board serial, first disk serial
 * - anything else: host, user and runtime environment
 *
 * Components that cannot be read, or that hold a vendor placeholder, are
 * left out of the hash.
 */

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace permitted {
namespace device {

/// Component name to value; nullopt when the probe yielded nothing usable
using ComponentMap = std::unordered_map<std::string, std::optional<std::string>>;

/// Operating system family that decides which probes run
enum class PlatformFamily { Windows, MacOs, Linux, Other };

/// Platform family of the running build
[[nodiscard]] PlatformFamily detect_platform_family() noexcept;

/// Lowercase name of a platform family
[[nodiscard]] const char* platform_family_to_string(PlatformFamily family) noexcept;

/**
 * @brief Clean up a raw probe value
 *
 * Trims surrounding whitespace and rejects values that carry no identity:
 * empty strings, strings made only of '0' and '-' (zeroed GUIDs and serials),
 * and the case-insensitive placeholders "To Be Filled By O.E.M.",
 * "Default string" and "None".
 */
[[nodiscard]] std::optional<std::string> normalize_component(const std::string& raw);

/**
 * @brief Hash a component mapping into a device identity
 *
 * Absent and empty values are skipped; the rest are sorted by name and
 * hashed as "name:value|" pairs. The result is 64 lowercase hex characters
 * and does not depend on insertion order. An empty string is returned only
 * if OpenSSL cannot produce a digest; that failure is logged as an error.
 */
[[nodiscard]] std::string hash_components(const ComponentMap& components);

/// Collect the hardware components for the running platform (never throws)
[[nodiscard]] ComponentMap collect_components();

/// Collect and hash: the device identity of this machine
[[nodiscard]] std::string generate_device_id();

/**
 * @brief Get the platform name
 *
 * @return "macos", "linux", "windows", or "unknown"
 */
[[nodiscard]] std::string get_platform_name();

/**
 * @brief Get a human-readable hostname
 *
 * @return The system hostname or "unknown" on failure
 */
[[nodiscard]] std::string get_hostname();

/// Local IPv4 addresses, excluding loopback and link-local
[[nodiscard]] std::vector<std::string> get_local_ip_addresses();

}  // namespace device
}  // namespace permitted
