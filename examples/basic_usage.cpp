/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the Permitted C++ SDK
 *
 * This example demonstrates how to:
 * - Create a client with configuration
 * - Inspect the hardware fingerprint
 * - Validate a license key and keep the session alive
 * - Read remote configuration
 * - Download product files with progress and cancellation
 * - Handle errors using the Result type
 */

#include <permitted/permitted.hpp>

#include <iostream>
#include <string>
#include <thread>

int main() {
    // Configure the client
    permitted::Config config;
    config.api_key = "pk_live_your-api-key";
    config.api_url = "https://permitted.dev/api/v1";
    // The hardware fingerprint is used if no identifier is given
    // config.device_identifier = "custom-device-id";

    // Renew the session a minute before it expires
    config.refresh_margin_seconds = 60;

    config.debug = true;

    permitted::Client client(config);

    std::cout << "Device ID: " << permitted::Client::device_id() << "\n";

    // Example 0: API status (no session needed)
    std::cout << "\n=== API Status ===\n";
    {
        auto result = client.get_status();
        if (result.is_ok()) {
            std::cout << "Status: " << result.value().status << "\n";
        } else {
            std::cerr << "Status check failed: " << result.error_message() << "\n";
        }
    }

    // Example 1: Validate a license key
    std::cout << "\n=== License Validation ===\n";
    {
        auto result = client.validate("XXXX-XXXX-XXXX-XXXX");

        if (result.is_ok()) {
            const auto& validation = result.value();
            std::cout << "License: " << validation.license.id << "\n";
            std::cout << "Status: " << validation.license.status << "\n";
            std::cout << "Session expires at: " << validation.expires_at_unix << "\n";
        } else {
            std::cerr << "Validation failed: " << result.error_message() << "\n";

            // Handle specific error codes
            switch (result.error_code()) {
                case permitted::ErrorCode::InvalidLicense:
                    std::cerr << "The license key is not recognized.\n";
                    break;
                case permitted::ErrorCode::LicenseExpired:
                    std::cerr << "The license has expired.\n";
                    break;
                case permitted::ErrorCode::IdentifierMismatch:
                    std::cerr << "The license is bound to another device.\n";
                    break;
                case permitted::ErrorCode::NetworkFailure:
                    std::cerr << "Network error - check your connection.\n";
                    break;
                default:
                    break;
            }
            return 1;
        }
    }

    // Example 2: License details and remote configuration
    std::cout << "\n=== License & Config ===\n";
    {
        // Both calls renew the session first if it is about to expire
        auto license = client.get_license();
        if (license.is_ok()) {
            std::cout << "Product: " << license.value().product.name << "\n";
            std::cout << "Valid: " << (license.value().is_valid() ? "yes" : "no") << "\n";
        }

        auto remote = client.get_config();
        if (remote.is_ok()) {
            const auto& vars = remote.value();
            std::cout << "max_projects: " << vars.get_int("max_projects", 5) << "\n";
            std::cout << "beta_features: " << (vars.get_bool("beta_features") ? "on" : "off")
                      << "\n";
            std::cout << "welcome: " << vars.get_string("welcome").value_or("(none)") << "\n";
        }
    }

    // Example 3: Files
    std::cout << "\n=== Files ===\n";
    {
        auto files = client.list_files();
        if (files.is_ok() && !files.value().empty()) {
            const auto& file = files.value().front();
            std::cout << "Downloading " << file.file_name << " (" << file.size_formatted
                      << ")\n";

            permitted::CancellationSource cancel;
            auto result = client.download_file(
                file.id, "/tmp/" + file.file_name,
                [](int64_t received, std::optional<int64_t> total) {
                    std::cout << "\r  " << received;
                    if (total) {
                        std::cout << "/" << *total;
                    }
                    std::cout << " bytes" << std::flush;
                },
                cancel.token());
            std::cout << "\n";

            if (result.is_error()) {
                std::cerr << "Download failed: "
                          << permitted::error_code_to_string(result.error_code()) << " - "
                          << result.error_message() << "\n";
            }
        } else if (files.is_error()) {
            std::cerr << "Failed to list files: " << files.error_message() << "\n";
        }
    }

    // Example 4: Keep the session alive from a background thread
    std::cout << "\n=== Session ===\n";
    {
        std::thread worker([&client] {
            auto result = client.ensure_valid();
            std::cout << "[Worker] Session " << (result.is_ok() ? "usable" : "lost") << "\n";
        });
        worker.join();

        auto ping = client.ping();
        if (ping.is_ok()) {
            std::cout << "Ping: " << ping.value().status << "\n";
        }
    }

    // Reset drops the in-memory session
    client.reset();
    std::cout << "\nAuthenticated after reset: " << (client.is_authenticated() ? "yes" : "no")
              << "\n";

    return 0;
}
