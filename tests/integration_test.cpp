/**
 * @file integration_test.cpp
 * @brief Integration test against the live Permitted API
 *
 * Required environment variables:
 *   PERMITTED_API_KEY      - Product API key
 *   PERMITTED_LICENSE_KEY  - A valid license key for that product
 *
 * Optional:
 *   PERMITTED_API_URL      - Override the API base URL
 *
 * Run with:
 *   export PERMITTED_API_KEY="pk_live_..."
 *   export PERMITTED_LICENSE_KEY="XXXX-XXXX-XXXX-XXXX"
 *   ./integration_test
 */

#include <permitted/device.hpp>
#include <permitted/permitted.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

namespace {

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string API_KEY;
std::string LICENSE_KEY;
std::string API_URL;

bool load_credentials() {
    API_KEY = get_env("PERMITTED_API_KEY");
    LICENSE_KEY = get_env("PERMITTED_LICENSE_KEY");
    API_URL = get_env("PERMITTED_API_URL");

    if (API_KEY.empty() || LICENSE_KEY.empty()) {
        std::cerr << "Error: Missing required environment variables.\n\n";
        std::cerr << "  PERMITTED_API_KEY      - Product API key\n";
        std::cerr << "  PERMITTED_LICENSE_KEY  - A valid license key for testing\n";
        return false;
    }
    return true;
}

std::atomic<int> tests_passed{0};
std::atomic<int> tests_failed{0};

#define GREEN "\033[32m"
#define RED "\033[31m"
#define YELLOW "\033[33m"
#define CYAN "\033[36m"
#define RESET "\033[0m"

void pass(const std::string& test_name) {
    ++tests_passed;
    std::cout << GREEN << "PASS: " << RESET << test_name << "\n";
}

void fail(const std::string& test_name, const std::string& reason) {
    ++tests_failed;
    std::cout << RED << "FAIL: " << RESET << test_name << " - " << reason << "\n";
}

void section(const std::string& name) {
    std::cout << "\n" << CYAN << "== " << name << " ==" << RESET << "\n\n";
}

void info(const std::string& msg) {
    std::cout << YELLOW << "  i " << RESET << msg << "\n";
}

template <typename T> void check(const std::string& name, const permitted::Result<T>& result) {
    if (result.is_ok()) {
        pass(name);
    } else {
        fail(name, result.error_message());
    }
}

permitted::Config make_config() {
    permitted::Config config;
    config.api_key = API_KEY;
    if (!API_URL.empty()) {
        config.api_url = API_URL;
    }
    config.max_retries = 2;
    return config;
}

// ==================== Test Functions ====================

void test_device() {
    section("Device Fingerprint");

    auto components = permitted::Client::hardware_components();
    for (const auto& [name, value] : components) {
        info(name + " = " + value.value_or("<absent>"));
    }

    auto id = permitted::Client::device_id();
    if (id.size() == 64 && id == permitted::device::generate_device_id()) {
        pass("Device ID is a stable 64 character digest");
        info("Device ID: " + id);
    } else {
        fail("Device ID", "unexpected value: " + id);
    }
}

void test_status() {
    section("Status");

    permitted::Client client(make_config());
    auto status = client.get_status();
    check("GET status", status);
    if (status.is_ok()) {
        info("Status: " + status.value().status);
    }
}

void test_session() {
    section("Session Lifecycle");

    permitted::Client client(make_config());

    auto validation = client.validate(LICENSE_KEY);
    check("Validate license", validation);
    if (validation.is_error()) {
        return;
    }
    info("License status: " + validation.value().license.status);

    if (client.is_authenticated()) {
        pass("Client is authenticated after validate");
    } else {
        fail("Client is authenticated after validate", "is_authenticated() is false");
    }

    check("Ping", client.ping());
    check("Refresh", client.refresh());
    check("Ensure valid", client.ensure_valid());

    auto license = client.get_license();
    check("Get license", license);
    if (license.is_ok()) {
        info(std::string("License valid: ") + (license.value().is_valid() ? "yes" : "no"));
    }

    auto config = client.get_config();
    check("Get remote config", config);
    if (config.is_ok()) {
        info("Variables: " + std::to_string(config.value().variables().size()));
    }

    auto files = client.list_files();
    check("List files", files);
    if (files.is_ok() && !files.value().empty()) {
        const auto& file = files.value().front();
        auto dest = std::filesystem::temp_directory_path() / ("permitted_it_" + file.file_name);
        int64_t last = 0;
        auto download = client.download_file(
            file.id, dest.string(),
            [&last](int64_t received, std::optional<int64_t>) { last = received; });
        check("Download " + file.file_name, download);
        info("Downloaded bytes: " + std::to_string(last));
        std::error_code ec;
        std::filesystem::remove(dest, ec);
    }

    client.reset();
    if (!client.is_authenticated() && client.ping().error_code() ==
                                          permitted::ErrorCode::InvalidOperation) {
        pass("Reset drops the session");
    } else {
        fail("Reset drops the session", "session still usable");
    }
}

void test_error_handling() {
    section("Error Handling");

    permitted::Client client(make_config());
    auto result = client.validate("INVALID-0000-0000-0000");
    if (result.error_code() == permitted::ErrorCode::InvalidLicense) {
        pass("Unknown license key is InvalidLicense");
    } else {
        fail("Unknown license key", permitted::error_code_to_string(result.error_code()));
    }
}

void test_thread_safety() {
    section("Thread Safety");

    permitted::Client client(make_config());
    if (client.validate(LICENSE_KEY).is_error()) {
        fail("Concurrent ensure_valid", "validate failed");
        return;
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (client.ensure_valid().is_error()) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    if (failures == 0) {
        pass("Concurrent ensure_valid");
    } else {
        fail("Concurrent ensure_valid", std::to_string(failures.load()) + " calls failed");
    }
}

}  // namespace

// ==================== Main ====================

int main() {
    if (!load_credentials()) {
        return 1;
    }

    std::cout << CYAN << "Permitted C++ SDK - Live Integration Test" << RESET << "\n";

    auto start_time = std::chrono::steady_clock::now();

    test_device();
    test_status();
    test_session();
    test_error_handling();
    test_thread_safety();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    std::cout << "\n  Passed:   " << tests_passed << "\n";
    std::cout << "  Failed:   " << tests_failed << "\n";
    std::cout << "  Duration: " << duration.count() << "ms\n\n";

    return tests_failed == 0 ? 0 : 1;
}
