#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for Permitted SDK types
 *
 * Uses nlohmann/json for parsing API responses into SDK types. Parsers throw
 * nlohmann::json::exception when a required field is missing or has the
 * wrong type; api::exchange() turns that into ErrorCode::ParseError.
 */

#include "permitted/permitted.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace permitted {
namespace json {

using nlohmann::json;

// ==================== Timestamp Helpers ====================

/// Convert a broken-down UTC time to time_t
[[nodiscard]] inline std::time_t timegm_portable(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

/// Parse ISO 8601 UTC timestamp string to Timestamp
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    // Parse ISO 8601 format: "2026-01-19T12:00:00Z"; fractions and offsets are ignored
    std::tm tm = {};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        return std::nullopt;
    }

    auto time = timegm_portable(&tm);
    if (time == -1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(time);
}

/// Format Timestamp to ISO 8601 string
[[nodiscard]] inline std::string format_timestamp(const Timestamp& ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm = {};
#if defined(_MSC_VER)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

/// Read an optional ISO timestamp field
[[nodiscard]] inline std::optional<Timestamp> optional_timestamp(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return parse_timestamp(j[key].get<std::string>());
    }
    return std::nullopt;
}

/// Read an optional string field
[[nodiscard]] inline std::optional<std::string> optional_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// ==================== Metadata Helpers ====================

/// Parse JSON object to a string map (scalar values only)
[[nodiscard]] inline std::map<std::string, std::string> parse_metadata(const json& j) {
    std::map<std::string, std::string> result;
    if (j.is_object()) {
        for (auto& [key, value] : j.items()) {
            if (value.is_string()) {
                result[key] = value.get<std::string>();
            } else if (value.is_number_integer()) {
                result[key] = std::to_string(value.get<int64_t>());
            } else if (value.is_number()) {
                result[key] = value.dump();
            } else if (value.is_boolean()) {
                result[key] = value.get<bool>() ? "true" : "false";
            }
        }
    }
    return result;
}

// ==================== Nested Objects ====================

[[nodiscard]] inline Tier parse_tier(const json& j) {
    Tier tier;
    tier.id = j.at("id").get<std::string>();
    tier.name = j.at("name").get<std::string>();
    tier.description = optional_string(j, "description");
    return tier;
}

[[nodiscard]] inline Product parse_product(const json& j) {
    Product product;
    product.id = j.at("id").get<std::string>();
    product.name = j.at("name").get<std::string>();
    product.description = optional_string(j, "description");
    return product;
}

[[nodiscard]] inline Customer parse_customer(const json& j) {
    Customer customer;
    customer.id = j.at("id").get<std::string>();
    customer.email = j.at("email").get<std::string>();
    customer.name = optional_string(j, "name");
    return customer;
}

// ==================== Session Parsing ====================

/// Parse the license summary returned by license/validate
[[nodiscard]] inline ValidationLicense parse_validation_license(const json& j) {
    ValidationLicense license;
    license.id = j.at("id").get<std::string>();
    license.status = j.at("status").get<std::string>();
    license.created_at = optional_timestamp(j, "created_at");
    license.expires_at = optional_timestamp(j, "expires_at");
    license.is_lifetime = j.value("is_lifetime", false);
    if (j.contains("tier") && j["tier"].is_object()) {
        license.tier = parse_tier(j["tier"]);
    }
    if (j.contains("product") && j["product"].is_object()) {
        license.product = parse_product(j["product"]);
    }
    return license;
}

/// Parse license/validate response
[[nodiscard]] inline ValidationResult parse_validation_result(const json& j) {
    ValidationResult result;
    result.token = j.at("token").get<std::string>();
    result.expires_at_unix = j.at("expires_at_unix").get<int64_t>();
    result.license = parse_validation_license(j.at("license"));
    return result;
}

/// Parse session/refresh response
[[nodiscard]] inline Session parse_session(const json& j) {
    Session session;
    session.token = j.at("token").get<std::string>();
    session.expires_at_unix = j.at("expires_at_unix").get<int64_t>();
    return session;
}

/// Parse ping response
[[nodiscard]] inline PingResult parse_ping(const json& j) {
    PingResult ping;
    ping.status = j.at("status").get<std::string>();
    ping.expires_at_unix = j.value("expires_at_unix", int64_t{0});
    return ping;
}

/// Parse status response
[[nodiscard]] inline StatusResult parse_status(const json& j) {
    StatusResult status;
    status.status = j.at("status").get<std::string>();
    status.timestamp_unix = j.value("timestamp_unix", int64_t{0});
    if (j.contains("product") && j["product"].is_object()) {
        ProductStatus product;
        product.id = j["product"].at("id").get<std::string>();
        product.api_enabled = j["product"].value("api_enabled", false);
        status.product = product;
    }
    return status;
}

// ==================== License Parsing ====================

/// Parse full license details
[[nodiscard]] inline License parse_license(const json& j) {
    License license;
    license.id = j.at("id").get<std::string>();
    license.status = license_status_from_string(j.at("status").get<std::string>());
    license.created_at = optional_timestamp(j, "created_at");
    license.expires_at = optional_timestamp(j, "expires_at");
    license.is_lifetime = j.value("is_lifetime", false);

    if (j.contains("time_remaining_seconds") && j["time_remaining_seconds"].is_number()) {
        license.time_remaining_seconds = j["time_remaining_seconds"].get<int64_t>();
    }
    if (j.contains("tier") && j["tier"].is_object()) {
        license.tier = parse_tier(j["tier"]);
    }
    if (j.contains("product") && j["product"].is_object()) {
        license.product = parse_product(j["product"]);
    }
    if (j.contains("customer") && j["customer"].is_object()) {
        license.customer = parse_customer(j["customer"]);
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        license.metadata = parse_metadata(j["metadata"]);
    }
    return license;
}

// ==================== Config Parsing ====================

/// Convert a JSON scalar to a config value (arrays and objects keep their JSON text)
[[nodiscard]] inline ConfigValue parse_config_value(const json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return std::monostate{};
    }
    return value.dump();
}

/// Parse config response: {"variables": {...}}
[[nodiscard]] inline RemoteConfig parse_config(const json& j) {
    std::map<std::string, ConfigValue> variables;
    const auto& vars = j.at("variables");
    if (vars.is_object()) {
        for (auto& [key, value] : vars.items()) {
            variables[key] = parse_config_value(value);
        }
    }
    return RemoteConfig(std::move(variables));
}

// ==================== File Parsing ====================

[[nodiscard]] inline FileInfo parse_file_info(const json& j) {
    FileInfo file;
    file.id = j.at("id").get<std::string>();
    file.name = j.value("name", std::string());
    file.file_name = j.value("file_name", std::string());
    file.size = j.value("size", int64_t{0});
    file.size_formatted = j.value("size_formatted", std::string());
    file.created_at = optional_timestamp(j, "created_at");
    return file;
}

/// Parse files response: {"files": [...]}
[[nodiscard]] inline std::vector<FileInfo> parse_files(const json& j) {
    std::vector<FileInfo> files;
    for (const auto& item : j.at("files")) {
        files.push_back(parse_file_info(item));
    }
    return files;
}

/// Parse files/{id}/download response
[[nodiscard]] inline DownloadLink parse_download_link(const json& j) {
    DownloadLink link;
    link.url = j.at("url").get<std::string>();
    link.expires_at_unix = j.value("expires_at_unix", int64_t{0});
    return link;
}

// ==================== Error Response Parsing ====================

/// API error response structure
struct ApiError {
    std::string code;
    std::string message;
};

/// Parse error response from JSON
/// Format: {"error": {"code": "...", "message": "..."}}
[[nodiscard]] inline ApiError parse_error_response(const json& j) {
    ApiError err;

    if (j.contains("error") && j["error"].is_object()) {
        const auto& error_obj = j["error"];
        if (error_obj.contains("code") && error_obj["code"].is_string()) {
            err.code = error_obj["code"].get<std::string>();
        }
        if (error_obj.contains("message") && error_obj["message"].is_string()) {
            err.message = error_obj["message"].get<std::string>();
        }
    }

    return err;
}

// ==================== Request Body Builders ====================

/// Build JSON body for license/validate
[[nodiscard]] inline json build_validate_request(const std::string& license_key,
                                                 const std::string& identifier) {
    json body;
    body["license_key"] = license_key;
    body["identifier"] = identifier;
    return body;
}

/// Build JSON body for session/refresh
[[nodiscard]] inline json build_refresh_request(const std::string& token) {
    json body;
    body["token"] = token;
    return body;
}

}  // namespace json
}  // namespace permitted
