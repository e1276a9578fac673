#include <gtest/gtest.h>
#include <permitted/device.hpp>
#include <permitted/probes.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>

namespace permitted {
namespace device {
namespace {

namespace fs = std::filesystem;

const char* const EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

bool is_lower_hex(const std::string& value) {
    for (char c : value) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

// ==================== Platform Name Tests ====================

TEST(DevicePlatformTest, GetPlatformNameMatchesBuild) {
    auto platform = get_platform_name();

#if defined(__APPLE__)
    EXPECT_EQ(platform, "macos");
    EXPECT_EQ(detect_platform_family(), PlatformFamily::MacOs);
#elif defined(_WIN32) || defined(_WIN64)
    EXPECT_EQ(platform, "windows");
    EXPECT_EQ(detect_platform_family(), PlatformFamily::Windows);
#elif defined(__linux__)
    EXPECT_EQ(platform, "linux");
    EXPECT_EQ(detect_platform_family(), PlatformFamily::Linux);
#else
    EXPECT_EQ(platform, "unknown");
#endif
}

TEST(DeviceHostnameTest, GetHostnameReturnsNonEmpty) {
    auto hostname = get_hostname();
    EXPECT_FALSE(hostname.empty());
    EXPECT_LE(hostname.length(), 255u);
}

TEST(DeviceNetworkTest, LocalAddressesSkipLoopbackAndLinkLocal) {
    for (const auto& ip : get_local_ip_addresses()) {
        EXPECT_NE(ip.rfind("127.", 0), 0u) << ip;
        EXPECT_NE(ip.rfind("169.254.", 0), 0u) << ip;
    }
}

// ==================== Placeholder filter ====================

TEST(NormalizeComponentTest, TrimsWhitespace) {
    EXPECT_EQ(normalize_component("  ABC123\n").value_or(""), "ABC123");
    EXPECT_EQ(normalize_component("\tserial 42 ").value_or(""), "serial 42");
}

TEST(NormalizeComponentTest, RejectsEmptyAndBlank) {
    EXPECT_FALSE(normalize_component("").has_value());
    EXPECT_FALSE(normalize_component("   \r\n").has_value());
}

TEST(NormalizeComponentTest, RejectsVendorPlaceholders) {
    EXPECT_FALSE(normalize_component("To Be Filled By O.E.M.").has_value());
    EXPECT_FALSE(normalize_component("to be filled by o.e.m.").has_value());
    EXPECT_FALSE(normalize_component("Default string").has_value());
    EXPECT_FALSE(normalize_component("DEFAULT STRING").has_value());
    EXPECT_FALSE(normalize_component("None").has_value());
    EXPECT_FALSE(normalize_component(" none ").has_value());
}

TEST(NormalizeComponentTest, RejectsZeroedIdentifiers) {
    EXPECT_FALSE(normalize_component("00000000-0000-0000-0000-000000000000").has_value());
    EXPECT_FALSE(normalize_component("0000000000").has_value());
    EXPECT_FALSE(normalize_component("0").has_value());
}

TEST(NormalizeComponentTest, KeepsRealValues) {
    EXPECT_TRUE(normalize_component("4C4C4544-0042-3510-8051-B4C04F4B4E32").has_value());
    EXPECT_TRUE(normalize_component("10").has_value());
    EXPECT_TRUE(normalize_component("Nonexistent").has_value());
}

// ==================== Hasher ====================

TEST(HashComponentsTest, EmptyMappingHashesEmptyBuffer) {
    EXPECT_EQ(hash_components({}), EMPTY_SHA256);
}

TEST(HashComponentsTest, AbsentValuesAreIgnored) {
    ComponentMap only_absent{{"cpu_id", std::nullopt}, {"bios_serial", std::string()}};
    EXPECT_EQ(hash_components(only_absent), EMPTY_SHA256);

    ComponentMap with_absent{{"machine_id", std::string("abc")}, {"disk_serial", std::nullopt}};
    ComponentMap without{{"machine_id", std::string("abc")}};
    EXPECT_EQ(hash_components(with_absent), hash_components(without));
}

TEST(HashComponentsTest, InsertionOrderDoesNotMatter) {
    std::vector<std::pair<std::string, std::string>> entries = {
        {"machine_id", "0f1e2d3c"},  {"product_uuid", "UUID-1"}, {"board_serial", "BS-9"},
        {"disk_serial", "WD-WX123"}, {"extra", "value"},
    };

    ComponentMap reference;
    for (const auto& [key, value] : entries) {
        reference[key] = value;
    }
    auto expected = hash_components(reference);

    std::mt19937 rng(1234);
    for (int round = 0; round < 10; ++round) {
        std::shuffle(entries.begin(), entries.end(), rng);
        ComponentMap shuffled;
        shuffled.reserve(round + 1);  // vary the bucket layout too
        for (const auto& [key, value] : entries) {
            shuffled[key] = value;
        }
        EXPECT_EQ(hash_components(shuffled), expected);
    }
}

TEST(HashComponentsTest, ProducesLowercaseHexDigest) {
    ComponentMap components{{"machine_id", std::string("abc")}};
    auto digest = hash_components(components);

    EXPECT_EQ(digest.size(), 64u);
    EXPECT_TRUE(is_lower_hex(digest));
    EXPECT_NE(digest, EMPTY_SHA256);
}

TEST(HashComponentsTest, MatchesKnownDigest) {
    ComponentMap components{{"machine_id", std::string("abc")},
                            {"board_serial", std::string("XYZ")},
                            {"disk_serial", std::nullopt}};

    EXPECT_EQ(hash_components(components),
              "36ef0a7b4742679b74310defd432a440652ecc80ea82326c1376a946795ff946");
}

TEST(HashComponentsTest, DifferentValuesGiveDifferentDigests) {
    ComponentMap a{{"machine_id", std::string("abc")}};
    ComponentMap b{{"machine_id", std::string("abd")}};
    ComponentMap c{{"machine_idx", std::string("abc")}};
    EXPECT_NE(hash_components(a), hash_components(b));
    EXPECT_NE(hash_components(a), hash_components(c));
}

// ==================== Collector ====================

TEST(CollectorTest, DeviceIdIsStableHexDigest) {
    auto first = generate_device_id();
    auto second = generate_device_id();

    EXPECT_EQ(first.size(), 64u);
    EXPECT_TRUE(is_lower_hex(first));
    EXPECT_EQ(first, second);
}

TEST(CollectorTest, FallbackProbeSetAlwaysYieldsEveryValue) {
    auto components = collect_with(FallbackProbeSet{});

    for (const char* key :
         {"machine_name", "user_name", "os_version", "processor_count", "is_64bit"}) {
        auto it = components.find(key);
        ASSERT_NE(it, components.end()) << key;
        ASSERT_TRUE(it->second.has_value()) << key;
        EXPECT_FALSE(it->second->empty()) << key;
    }
    EXPECT_NE(hash_components(components), EMPTY_SHA256);
}

TEST(CollectorTest, SelectsOneProbeSetPerFamily) {
    EXPECT_TRUE(std::holds_alternative<WindowsProbeSet>(select_probe_set(PlatformFamily::Windows)));
    EXPECT_TRUE(std::holds_alternative<MacOsProbeSet>(select_probe_set(PlatformFamily::MacOs)));
    EXPECT_TRUE(std::holds_alternative<LinuxProbeSet>(select_probe_set(PlatformFamily::Linux)));
    EXPECT_TRUE(std::holds_alternative<FallbackProbeSet>(select_probe_set(PlatformFamily::Other)));
}

TEST(CollectorTest, CollectedKeysMatchPlatform) {
    auto components = collect_components();

#if defined(__linux__) && !defined(__APPLE__)
    EXPECT_EQ(components.size(), 4u);
    EXPECT_EQ(components.count("machine_id"), 1u);
    EXPECT_EQ(components.count("product_uuid"), 1u);
    EXPECT_EQ(components.count("board_serial"), 1u);
    EXPECT_EQ(components.count("disk_serial"), 1u);
#elif defined(__APPLE__)
    EXPECT_EQ(components.size(), 3u);
    EXPECT_EQ(components.count("platform_uuid"), 1u);
#elif defined(_WIN32)
    EXPECT_EQ(components.size(), 5u);
    EXPECT_EQ(components.count("machine_guid"), 1u);
#endif
    for (const auto& [key, value] : components) {
        if (value) {
            EXPECT_EQ(normalize_component(*value).value_or(""), *value) << key;
        }
    }
}

// ==================== Linux probes against a fixture tree ====================

class LinuxProbeFixture : public ::testing::Test {
  protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() / ("permitted_probe_" + std::to_string(stamp));
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& relative, const std::string& content) {
        auto path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    ComponentMap collect() const {
        LinuxProbeSet probes;
        probes.root = root_;
        return collect_with(probes);
    }

    fs::path root_;
};

TEST_F(LinuxProbeFixture, ReadsAllComponents) {
    write("etc/machine-id", "5c7b1f3e2d4a4e6f8a9b0c1d2e3f4a5b\n");
    write("sys/class/dmi/id/product_uuid", "4C4C4544-0042-3510-8051-B4C04F4B4E32\n");
    write("sys/class/dmi/id/board_serial", ".7X3B0J2.CN1296\n");
    write("sys/block/sda/device/serial", "  WD-WCC4N1234567  \n");

    auto components = collect();

    EXPECT_EQ(components["machine_id"].value_or(""), "5c7b1f3e2d4a4e6f8a9b0c1d2e3f4a5b");
    EXPECT_EQ(components["product_uuid"].value_or(""), "4C4C4544-0042-3510-8051-B4C04F4B4E32");
    EXPECT_EQ(components["board_serial"].value_or(""), ".7X3B0J2.CN1296");
    EXPECT_EQ(components["disk_serial"].value_or(""), "WD-WCC4N1234567");
}

TEST_F(LinuxProbeFixture, FallsBackToDbusMachineId) {
    write("var/lib/dbus/machine-id", "dbus-machine-id\n");

    auto components = collect();

    EXPECT_EQ(components["machine_id"].value_or(""), "dbus-machine-id");
}

TEST_F(LinuxProbeFixture, EmptyMachineIdFallsBackToDbus) {
    write("etc/machine-id", "\n");
    write("var/lib/dbus/machine-id", "from-dbus\n");

    EXPECT_EQ(collect()["machine_id"].value_or(""), "from-dbus");
}

TEST_F(LinuxProbeFixture, PlaceholdersBecomeAbsent) {
    write("etc/machine-id", "abc\n");
    write("sys/class/dmi/id/product_uuid", "00000000-0000-0000-0000-000000000000\n");
    write("sys/class/dmi/id/board_serial", "To Be Filled By O.E.M.\n");

    auto components = collect();

    EXPECT_FALSE(components["product_uuid"].has_value());
    EXPECT_FALSE(components["board_serial"].has_value());

    ComponentMap only_machine{{"machine_id", std::string("abc")}};
    EXPECT_EQ(hash_components(components), hash_components(only_machine));
}

TEST_F(LinuxProbeFixture, MissingTreeYieldsAbsentValues) {
    auto components = collect();

    EXPECT_EQ(components.size(), 4u);
    for (const auto& [key, value] : components) {
        EXPECT_FALSE(value.has_value()) << key;
    }
    EXPECT_EQ(hash_components(components), EMPTY_SHA256);
}

TEST_F(LinuxProbeFixture, DiskSerialSkipsVirtualDevicesInNameOrder) {
    write("sys/block/loop0/device/serial", "LOOPSERIAL\n");
    write("sys/block/dm-0/device/serial", "DMSERIAL\n");
    write("sys/block/ram0/device/serial", "RAMSERIAL\n");
    write("sys/block/sdb/device/serial", "SECOND\n");
    write("sys/block/nvme0n1/device/serial", "None\n");
    write("sys/block/nvme0n1/device/wwid", "eui.0025385b71b0c8a1\n");

    EXPECT_EQ(first_disk_serial(root_ / "sys/block").value_or(""), "eui.0025385b71b0c8a1");
}

TEST_F(LinuxProbeFixture, DiskSerialFallsThroughPlaceholders) {
    write("sys/block/sda/device/serial", "0000\n");
    write("sys/block/sdb/device/serial", "REAL-SERIAL\n");

    EXPECT_EQ(first_disk_serial(root_ / "sys/block").value_or(""), "REAL-SERIAL");
}

// ==================== macOS output parsers ====================

TEST(IoregParserTest, ExtractsQuotedValue) {
    const std::string output =
        "+-o MacBookPro18,3  <class IOPlatformExpertDevice, id 0x100000110>\n"
        "    {\n"
        "      \"IOPlatformSerialNumber\" = \"C02XK1ABCD12\"\n"
        "      \"IOPlatformUUID\" = \"8A1B2C3D-4E5F-6071-8293-A4B5C6D7E8F9\"\n"
        "    }\n";

    EXPECT_EQ(parse_ioreg_property(output, "IOPlatformUUID").value_or(""),
              "8A1B2C3D-4E5F-6071-8293-A4B5C6D7E8F9");
    EXPECT_EQ(parse_ioreg_property(output, "IOPlatformSerialNumber").value_or(""),
              "C02XK1ABCD12");
    EXPECT_FALSE(parse_ioreg_property(output, "board-id").has_value());
}

TEST(IoregParserTest, ZeroedUuidIsAbsent) {
    const std::string output =
        "      \"IOPlatformUUID\" = \"00000000-0000-0000-0000-000000000000\"\n";
    EXPECT_FALSE(parse_ioreg_property(output, "IOPlatformUUID").has_value());
}

// ==================== OS bitness ====================

TEST(OsBitnessTest, RecognizesMachineNames) {
    for (const char* machine : {"x86_64", "aarch64", "arm64", "ppc64le", "riscv64", "s390x"}) {
        EXPECT_TRUE(is_64bit_machine(machine)) << machine;
    }
    for (const char* machine : {"i386", "i686", "armv7l", "s390", "mips"}) {
        EXPECT_FALSE(is_64bit_machine(machine)) << machine;
    }
}

TEST(OsBitnessTest, FallbackReportsOperatingSystemBitness) {
    auto components = collect_with(FallbackProbeSet{});

    EXPECT_EQ(components["is_64bit"].value_or(""), is_64bit_os() ? "true" : "false");
#if !defined(_WIN32)
    if (sizeof(void*) == 8) {
        EXPECT_TRUE(is_64bit_os());
    }
#endif
}

TEST(HardwareUuidParserTest, ExtractsValue) {
    const std::string output =
        "Hardware:\n\n"
        "    Hardware Overview:\n\n"
        "      Model Name: MacBook Pro\n"
        "      Serial Number (system): C02XK1ABCD12\n"
        "      Hardware UUID: 8A1B2C3D-4E5F-6071-8293-A4B5C6D7E8F9\n";

    EXPECT_EQ(parse_hardware_uuid(output).value_or(""), "8A1B2C3D-4E5F-6071-8293-A4B5C6D7E8F9");
    EXPECT_FALSE(parse_hardware_uuid("Model Name: iMac\n").has_value());
}

}  // namespace
}  // namespace device
}  // namespace permitted
