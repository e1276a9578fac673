#include "permitted/device.hpp"

#include "permitted/log.hpp"
#include "permitted/probes.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

// Platform detection
#if defined(__APPLE__)
#define PERMITTED_PLATFORM_MACOS 1
#elif defined(_WIN32) || defined(_WIN64)
#define PERMITTED_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define PERMITTED_PLATFORM_LINUX 1
#endif

#if defined(PERMITTED_PLATFORM_WINDOWS)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
#include <windows.h>
#else
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <unistd.h>
#endif

namespace permitted {
namespace device {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

constexpr unsigned int SHA256_LENGTH = 32;

// Hash a buffer using SHA-256 and return lowercase hex
std::string sha256_hex(const std::string& input) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool ok = ctx != nullptr && EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
              EVP_DigestFinal_ex(ctx, hash, &len) == 1 && len == SHA256_LENGTH;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        PERMITTED_LOG(log::get("device"), error) << "SHA-256 digest failed, device ID is empty";
        return "";
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < len; i++) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return ss.str();
}

bool is_link_local_or_loopback(const std::string& ip) {
    return ip.rfind("127.", 0) == 0 || ip.rfind("169.254.", 0) == 0;
}

}  // namespace

PlatformFamily detect_platform_family() noexcept {
#if defined(PERMITTED_PLATFORM_MACOS)
    return PlatformFamily::MacOs;
#elif defined(PERMITTED_PLATFORM_WINDOWS)
    return PlatformFamily::Windows;
#elif defined(PERMITTED_PLATFORM_LINUX)
    return PlatformFamily::Linux;
#else
    return PlatformFamily::Other;
#endif
}

const char* platform_family_to_string(PlatformFamily family) noexcept {
    switch (family) {
        case PlatformFamily::Windows:
            return "windows";
        case PlatformFamily::MacOs:
            return "macos";
        case PlatformFamily::Linux:
            return "linux";
        case PlatformFamily::Other:
            return "unknown";
    }
    return "unknown";
}

std::optional<std::string> normalize_component(const std::string& raw) {
    auto begin = std::find_if_not(raw.begin(), raw.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) {
                   return std::isspace(c);
               }).base();
    if (begin >= end) {
        return std::nullopt;
    }

    std::string value(begin, end);

    bool only_zeros = std::all_of(value.begin(), value.end(),
                                  [](char c) { return c == '0' || c == '-'; });
    if (only_zeros) {
        return std::nullopt;
    }

    auto lowered = to_lower(value);
    if (lowered == "to be filled by o.e.m." || lowered == "default string" ||
        lowered == "none") {
        return std::nullopt;
    }

    return value;
}

std::string hash_components(const ComponentMap& components) {
    std::vector<std::pair<std::string, std::string>> present;
    present.reserve(components.size());
    for (const auto& [name, value] : components) {
        if (value && !value->empty()) {
            present.emplace_back(name, *value);
        }
    }
    std::sort(present.begin(), present.end());

    std::string buffer;
    for (const auto& [name, value] : present) {
        buffer += name;
        buffer += ':';
        buffer += value;
        buffer += '|';
    }
    return sha256_hex(buffer);
}

ComponentMap collect_components() {
    auto family = detect_platform_family();
    auto components = collect_with(select_probe_set(family));

    size_t present = 0;
    for (const auto& [name, value] : components) {
        if (value) {
            ++present;
        }
    }
    PERMITTED_LOG(log::get("device"), debug)
        << "Collected " << present << "/" << components.size() << " components ("
        << platform_family_to_string(family) << ")";
    return components;
}

std::string generate_device_id() {
    return hash_components(collect_components());
}

std::string get_platform_name() {
    return platform_family_to_string(detect_platform_family());
}

std::string get_hostname() {
#if defined(PERMITTED_PLATFORM_WINDOWS)
    char hostname[256] = {0};
    DWORD size = sizeof(hostname);
    if (GetComputerNameA(hostname, &size)) {
        return std::string(hostname);
    }
#else
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        return std::string(hostname);
    }
#endif
    return "unknown";
}

std::vector<std::string> get_local_ip_addresses() {
    std::vector<std::string> addresses;
    char buffer[INET_ADDRSTRLEN] = {0};

#if defined(PERMITTED_PLATFORM_WINDOWS)
    ULONG buffer_size = 15000;
    std::vector<unsigned char> storage(buffer_size);
    auto* adapters = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(storage.data());
    ULONG ret = GetAdaptersAddresses(AF_INET, GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST,
                                     nullptr, adapters, &buffer_size);
    if (ret == ERROR_BUFFER_OVERFLOW) {
        storage.resize(buffer_size);
        adapters = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(storage.data());
        ret = GetAdaptersAddresses(AF_INET, GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST,
                                   nullptr, adapters, &buffer_size);
    }
    if (ret != NO_ERROR) {
        return addresses;
    }
    for (auto* adapter = adapters; adapter != nullptr; adapter = adapter->Next) {
        if (adapter->OperStatus != IfOperStatusUp ||
            adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK) {
            continue;
        }
        for (auto* unicast = adapter->FirstUnicastAddress; unicast != nullptr;
             unicast = unicast->Next) {
            auto* sa_in = reinterpret_cast<sockaddr_in*>(unicast->Address.lpSockaddr);
            if (inet_ntop(AF_INET, &sa_in->sin_addr, buffer, sizeof(buffer)) == nullptr) {
                continue;
            }
            std::string ip(buffer);
            if (!is_link_local_or_loopback(ip)) {
                addresses.push_back(ip);
            }
        }
    }
#else
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return addresses;
    }
    for (auto* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP)) {
            continue;
        }
        auto* sa_in = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sa_in->sin_addr, buffer, sizeof(buffer)) == nullptr) {
            continue;
        }
        std::string ip(buffer);
        if (!is_link_local_or_loopback(ip) &&
            std::find(addresses.begin(), addresses.end(), ip) == addresses.end()) {
            addresses.push_back(ip);
        }
    }
    freeifaddrs(ifaddr);
#endif

    return addresses;
}

}  // namespace device
}  // namespace permitted
