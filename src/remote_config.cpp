#include "permitted/permitted.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <type_traits>

namespace permitted {

namespace {

// Full-string numeric parses; anything left over means "not a number"
std::optional<int64_t> parse_int(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::optional<double> parse_double(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

std::string lowercase(std::string text) {
    for (auto& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

}  // namespace

bool RemoteConfig::contains(const std::string& key) const {
    return variables_.count(key) > 0;
}

std::optional<std::string> RemoteConfig::get_string(const std::string& key) const {
    auto it = variables_.find(key);
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return std::visit(
        [](const auto& value) -> std::optional<std::string> {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<V, bool>) {
                return std::string(value ? "true" : "false");
            } else if constexpr (std::is_same_v<V, std::string>) {
                return value;
            } else {
                return std::to_string(value);
            }
        },
        it->second);
}

int64_t RemoteConfig::get_int(const std::string& key, int64_t default_value) const {
    auto it = variables_.find(key);
    if (it == variables_.end()) {
        return default_value;
    }
    if (auto* i = std::get_if<int64_t>(&it->second)) {
        return *i;
    }
    if (auto* d = std::get_if<double>(&it->second)) {
        return static_cast<int64_t>(*d);
    }
    if (auto* s = std::get_if<std::string>(&it->second)) {
        return parse_int(*s).value_or(default_value);
    }
    return default_value;
}

bool RemoteConfig::get_bool(const std::string& key, bool default_value) const {
    auto it = variables_.find(key);
    if (it == variables_.end()) {
        return default_value;
    }
    if (auto* b = std::get_if<bool>(&it->second)) {
        return *b;
    }
    if (auto* i = std::get_if<int64_t>(&it->second)) {
        return *i != 0;
    }
    if (auto* s = std::get_if<std::string>(&it->second)) {
        auto lowered = lowercase(*s);
        if (lowered == "true" || lowered == "1" || lowered == "yes") {
            return true;
        }
        if (lowered == "false" || lowered == "0" || lowered == "no") {
            return false;
        }
    }
    return default_value;
}

double RemoteConfig::get_double(const std::string& key, double default_value) const {
    auto it = variables_.find(key);
    if (it == variables_.end()) {
        return default_value;
    }
    if (auto* d = std::get_if<double>(&it->second)) {
        return *d;
    }
    if (auto* i = std::get_if<int64_t>(&it->second)) {
        return static_cast<double>(*i);
    }
    if (auto* s = std::get_if<std::string>(&it->second)) {
        return parse_double(*s).value_or(default_value);
    }
    return default_value;
}

}  // namespace permitted
