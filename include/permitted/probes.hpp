#pragma once

/**
 * @file probes.hpp
 * @brief Per-platform hardware probe sets
 *
 * Each probe set knows the component names of one platform family and how
 * to read them. Exactly one set runs per collection; it is chosen once by
 * select_probe_set() and dispatched with std::visit.
 */

#include "permitted/device.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace permitted {
namespace device {

/// WMI and registry probes
struct WindowsProbeSet {
    std::chrono::milliseconds timeout{5000};

    [[nodiscard]] ComponentMap collect() const;
};

/// IOKit (or ioreg) and system_profiler probes
struct MacOsProbeSet {
    std::chrono::milliseconds ioreg_timeout{5000};
    std::chrono::milliseconds profiler_timeout{10000};

    [[nodiscard]] ComponentMap collect() const;
};

/// machine-id, DMI and block device probes
struct LinuxProbeSet {
    /// Filesystem root the probe paths are resolved against
    std::filesystem::path root = "/";

    [[nodiscard]] ComponentMap collect() const;
};

/// Runtime environment values; always yields every component
struct FallbackProbeSet {
    [[nodiscard]] ComponentMap collect() const;
};

using ProbeSet = std::variant<WindowsProbeSet, MacOsProbeSet, LinuxProbeSet, FallbackProbeSet>;

/// Probe set for a platform family
[[nodiscard]] ProbeSet select_probe_set(PlatformFamily family);

/// Run a probe set
[[nodiscard]] ComponentMap collect_with(const ProbeSet& probes);

// ==================== Probe helpers ====================

/// First line of a file, normalized; nullopt if unreadable or a placeholder
[[nodiscard]] std::optional<std::string> read_component_file(const std::filesystem::path& path);

/**
 * @brief Serial of the first physical block device under a sysfs block dir
 *
 * Devices are visited in name order; loop, ram and dm- devices are skipped.
 * For each device, device/serial is tried before device/wwid.
 */
[[nodiscard]] std::optional<std::string> first_disk_serial(
    const std::filesystem::path& sys_block);

/**
 * @brief Extract a quoted property from `ioreg -rd1` output
 *
 * Matches lines such as `"IOPlatformUUID" = "ABCD-..."`.
 */
[[nodiscard]] std::optional<std::string> parse_ioreg_property(const std::string& output,
                                                              const std::string& key);

/// Whether a `uname -m` machine name denotes a 64-bit architecture
[[nodiscard]] bool is_64bit_machine(const std::string& machine);

/// Whether the operating system is 64-bit, independent of this process's bitness
[[nodiscard]] bool is_64bit_os();

/// Extract the "Hardware UUID:" value from `system_profiler SPHardwareDataType` output
[[nodiscard]] std::optional<std::string> parse_hardware_uuid(const std::string& output);

}  // namespace device
}  // namespace permitted
