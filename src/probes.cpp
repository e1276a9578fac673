#include "permitted/probes.hpp"

#include "permitted/log.hpp"
#include "permitted/process.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#if defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#endif

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace permitted {
namespace device {

namespace {

std::optional<std::string> run_probe(const std::vector<std::string>& argv,
                                     std::chrono::milliseconds timeout) {
    auto output = process::run_and_capture(argv, timeout);
    if (!output) {
        PERMITTED_LOG(log::get("device"), debug) << "Probe " << argv.front() << " failed";
    }
    return output;
}

std::optional<std::string> wmi_property(const std::string& expression,
                                        std::chrono::milliseconds timeout) {
    auto output = run_probe({"powershell.exe", "-NoProfile", "-Command", expression}, timeout);
    if (!output) {
        return std::nullopt;
    }
    return normalize_component(*output);
}

#if defined(_WIN32)

std::optional<std::string> read_registry_string(HKEY root, const char* subkey,
                                                const char* value_name) {
    HKEY hKey;
    LONG result = RegOpenKeyExA(root, subkey, 0, KEY_READ | KEY_WOW64_64KEY, &hKey);
    if (result != ERROR_SUCCESS) {
        return std::nullopt;
    }

    char data[256] = {0};
    DWORD size = sizeof(data) - 1;
    DWORD type = REG_SZ;
    result = RegQueryValueExA(hKey, value_name, nullptr, &type, reinterpret_cast<LPBYTE>(data),
                              &size);
    RegCloseKey(hKey);

    if (result != ERROR_SUCCESS || type != REG_SZ) {
        return std::nullopt;
    }
    return std::string(data);
}

#endif

#if defined(__APPLE__)

std::optional<std::string> iokit_platform_property(CFStringRef key) {
    io_service_t service = IOServiceGetMatchingService(
        kIOMainPortDefault, IOServiceMatching("IOPlatformExpertDevice"));
    if (service == 0) {
        return std::nullopt;
    }

    CFTypeRef ref = IORegistryEntryCreateCFProperty(service, key, kCFAllocatorDefault, 0);
    IOObjectRelease(service);
    if (ref == nullptr) {
        return std::nullopt;
    }

    std::optional<std::string> result;
    if (CFGetTypeID(ref) == CFStringGetTypeID()) {
        auto str = static_cast<CFStringRef>(ref);
        CFIndex length = CFStringGetLength(str);
        CFIndex max_size = CFStringGetMaximumSizeForEncoding(length, kCFStringEncodingUTF8) + 1;
        std::vector<char> buffer(static_cast<size_t>(max_size));
        if (CFStringGetCString(str, buffer.data(), max_size, kCFStringEncodingUTF8)) {
            result = std::string(buffer.data());
        }
    }
    CFRelease(ref);
    return result;
}

#endif

std::string os_version() {
#if defined(_WIN32)
    auto product = read_registry_string(HKEY_LOCAL_MACHINE,
                                        "SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion",
                                        "ProductName");
    auto build = read_registry_string(HKEY_LOCAL_MACHINE,
                                      "SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion",
                                      "CurrentBuild");
    std::string version = product.value_or("Windows");
    if (build) {
        version += " " + *build;
    }
    return version;
#else
    struct utsname info;
    if (uname(&info) == 0) {
        return std::string(info.sysname) + " " + info.release;
    }
    return get_platform_name();
#endif
}

std::string user_name() {
#if defined(_WIN32)
    char name[256] = {0};
    DWORD size = sizeof(name);
    if (GetUserNameA(name, &size)) {
        return std::string(name);
    }
    const char* env = std::getenv("USERNAME");
#else
    if (struct passwd* pw = getpwuid(geteuid())) {
        if (pw->pw_name != nullptr) {
            return std::string(pw->pw_name);
        }
    }
    const char* env = std::getenv("USER");
#endif
    return env != nullptr ? std::string(env) : std::string();
}

}  // namespace

// ==================== Probe helpers ====================

std::optional<std::string> read_component_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string line;
    std::getline(file, line);
    return normalize_component(line);
}

std::optional<std::string> first_disk_serial(const std::filesystem::path& sys_block) {
    std::error_code ec;
    std::vector<std::string> names;
    for (std::filesystem::directory_iterator it(sys_block, ec), end; !ec && it != end;
         it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        PERMITTED_LOG(log::get("device"), debug)
            << "Cannot list " << sys_block.string() << ": " << ec.message();
    }
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        if (name.rfind("loop", 0) == 0 || name.rfind("ram", 0) == 0 ||
            name.rfind("dm-", 0) == 0) {
            continue;
        }
        auto device_dir = sys_block / name / "device";
        if (auto serial = read_component_file(device_dir / "serial")) {
            return serial;
        }
        if (auto wwid = read_component_file(device_dir / "wwid")) {
            return wwid;
        }
    }
    return std::nullopt;
}

std::optional<std::string> parse_ioreg_property(const std::string& output,
                                                const std::string& key) {
    const std::string quoted_key = "\"" + key + "\"";
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto key_pos = line.find(quoted_key);
        if (key_pos == std::string::npos) {
            continue;
        }
        auto eq = line.find('=', key_pos + quoted_key.size());
        if (eq == std::string::npos) {
            continue;
        }
        auto open = line.find('"', eq);
        if (open == std::string::npos) {
            continue;
        }
        auto close = line.find('"', open + 1);
        if (close == std::string::npos) {
            continue;
        }
        return normalize_component(line.substr(open + 1, close - open - 1));
    }
    return std::nullopt;
}

bool is_64bit_machine(const std::string& machine) {
    return machine.find("64") != std::string::npos || machine == "s390x";
}

bool is_64bit_os() {
#if defined(_WIN32)
    SYSTEM_INFO info;
    GetNativeSystemInfo(&info);
    switch (info.wProcessorArchitecture) {
        case PROCESSOR_ARCHITECTURE_AMD64:
        case PROCESSOR_ARCHITECTURE_ARM64:
        case PROCESSOR_ARCHITECTURE_IA64:
            return true;
        default:
            return false;
    }
#else
    struct utsname info;
    if (uname(&info) == 0) {
        return is_64bit_machine(info.machine);
    }
    return sizeof(void*) == 8;
#endif
}

std::optional<std::string> parse_hardware_uuid(const std::string& output) {
    const std::string label = "Hardware UUID:";
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto pos = line.find(label);
        if (pos != std::string::npos) {
            return normalize_component(line.substr(pos + label.size()));
        }
    }
    return std::nullopt;
}

// ==================== Probe sets ====================

ComponentMap WindowsProbeSet::collect() const {
    ComponentMap components;
    components["cpu_id"] =
        wmi_property("(Get-WmiObject -Class Win32_Processor).ProcessorId", timeout);
    components["baseboard_serial"] =
        wmi_property("(Get-WmiObject -Class Win32_BaseBoard).SerialNumber", timeout);
    components["bios_serial"] =
        wmi_property("(Get-WmiObject -Class Win32_BIOS).SerialNumber", timeout);
    components["disk_serial"] = wmi_property(
        "(Get-WmiObject -Class Win32_DiskDrive | Select-Object -First 1).SerialNumber", timeout);

#if defined(_WIN32)
    auto guid = read_registry_string(HKEY_LOCAL_MACHINE, "SOFTWARE\\Microsoft\\Cryptography",
                                     "MachineGuid");
    components["machine_guid"] = guid ? normalize_component(*guid) : std::nullopt;
#else
    components["machine_guid"] = std::nullopt;
#endif
    return components;
}

ComponentMap MacOsProbeSet::collect() const {
    ComponentMap components;

#if defined(__APPLE__)
    auto uuid = iokit_platform_property(CFSTR(kIOPlatformUUIDKey));
    auto serial = iokit_platform_property(CFSTR(kIOPlatformSerialNumberKey));
    components["platform_uuid"] = uuid ? normalize_component(*uuid) : std::nullopt;
    components["serial_number"] = serial ? normalize_component(*serial) : std::nullopt;
#else
    auto ioreg = run_probe({"/usr/sbin/ioreg", "-rd1", "-c", "IOPlatformExpertDevice"},
                           ioreg_timeout);
    components["platform_uuid"] =
        ioreg ? parse_ioreg_property(*ioreg, "IOPlatformUUID") : std::nullopt;
    components["serial_number"] =
        ioreg ? parse_ioreg_property(*ioreg, "IOPlatformSerialNumber") : std::nullopt;
#endif

    auto profiler =
        run_probe({"/usr/sbin/system_profiler", "SPHardwareDataType"}, profiler_timeout);
    components["hardware_uuid"] = profiler ? parse_hardware_uuid(*profiler) : std::nullopt;
    return components;
}

ComponentMap LinuxProbeSet::collect() const {
    ComponentMap components;

    auto machine_id = read_component_file(root / "etc/machine-id");
    if (!machine_id) {
        machine_id = read_component_file(root / "var/lib/dbus/machine-id");
    }
    components["machine_id"] = machine_id;
    components["product_uuid"] = read_component_file(root / "sys/class/dmi/id/product_uuid");
    components["board_serial"] = read_component_file(root / "sys/class/dmi/id/board_serial");
    components["disk_serial"] = first_disk_serial(root / "sys/block");
    return components;
}

ComponentMap FallbackProbeSet::collect() const {
    auto or_unknown = [](const std::string& raw) -> std::optional<std::string> {
        auto value = normalize_component(raw);
        return value ? value : std::optional<std::string>("unknown");
    };

    unsigned int cpus = std::thread::hardware_concurrency();

    ComponentMap components;
    components["machine_name"] = or_unknown(get_hostname());
    components["user_name"] = or_unknown(user_name());
    components["os_version"] = or_unknown(os_version());
    components["processor_count"] = std::to_string(cpus == 0 ? 1 : cpus);
    components["is_64bit"] = is_64bit_os() ? "true" : "false";
    return components;
}

ProbeSet select_probe_set(PlatformFamily family) {
    switch (family) {
        case PlatformFamily::Windows:
            return WindowsProbeSet{};
        case PlatformFamily::MacOs:
            return MacOsProbeSet{};
        case PlatformFamily::Linux:
            return LinuxProbeSet{};
        case PlatformFamily::Other:
            return FallbackProbeSet{};
    }
    return FallbackProbeSet{};
}

ComponentMap collect_with(const ProbeSet& probes) {
    return std::visit([](const auto& set) { return set.collect(); }, probes);
}

}  // namespace device
}  // namespace permitted
