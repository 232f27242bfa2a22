/**
 * @file test_params.cpp
 * @brief Unit tests for launch params loading, validation and monitor arguments.
 */

#include <gtest/gtest.h>
#include "helpers/scratch_dir.hpp"
#include "runtime/params.hpp"
#include "runtime/vmm_args.hpp"

using namespace enclave;
using namespace enclave::runtime;
using json = nlohmann::json;

class ParamsTest : public ::testing::Test {
protected:
    void SetUp() override {
        params = test_support::make_params(dir, dir.write("qemu", "#!/bin/sh\n").string());
    }

    test_support::ScratchDir dir;
    Params params;
};

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(ParamsTest, ValidParamsPass) {
    EXPECT_TRUE(validate_params(params).ok());
}

TEST_F(ParamsTest, MissingKernelIsRejected) {
    params.kernel = dir.path() / "no-such-kernel";
    auto status = validate_params(params);
    EXPECT_EQ(status.kind, ErrorKind::CONFIGURATION);
    EXPECT_NE(status.message.find("kernel does not exist"), std::string::npos);
}

TEST_F(ParamsTest, EmptyVmmBinaryIsRejected) {
    params.vmm_binary.clear();
    auto status = validate_params(params);
    EXPECT_EQ(status.kind, ErrorKind::CONFIGURATION);
    EXPECT_EQ(status.message, "vmm_binary is required");
}

TEST_F(ParamsTest, DirectoryIsNotAFile) {
    params.initrd = dir.path();
    auto status = validate_params(params);
    EXPECT_EQ(status.kind, ErrorKind::CONFIGURATION);
    EXPECT_NE(status.message.find("does not represent a file"), std::string::npos);
}

TEST_F(ParamsTest, AppBinaryCheckedOnlyWhenSet) {
    params.app_binary = dir.path() / "missing-app";
    EXPECT_EQ(validate_params(params).kind, ErrorKind::CONFIGURATION);

    params.app_binary = dir.write("app.bin", "app");
    EXPECT_TRUE(validate_params(params).ok());
}

TEST_F(ParamsTest, ZeroTunablesAreRejected) {
    Params p = params;
    p.gdb = 0;
    EXPECT_EQ(validate_params(p).kind, ErrorKind::CONFIGURATION);

    p = params;
    p.max_frame_size = 0;
    EXPECT_EQ(validate_params(p).kind, ErrorKind::CONFIGURATION);

    p = params;
    p.initial_data_version = InitialDataVersion::V1;
    p.initial_data_v1_header.clear();
    EXPECT_EQ(validate_params(p).kind, ErrorKind::CONFIGURATION);
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

TEST(ParamsJsonTest, MissingKeysKeepDefaults) {
    Params defaults;
    defaults.guest_name = "keep-me";

    auto result = params_from_json(json{{"kernel", "/boot/k"}}, defaults);
    ASSERT_TRUE(result.status.ok());
    EXPECT_EQ(result.params.kernel.string(), "/boot/k");
    EXPECT_EQ(result.params.guest_name, "keep-me");
    EXPECT_EQ(result.params.handshake_timeout, std::chrono::seconds(30));
}

TEST(ParamsJsonTest, AllFields) {
    json j = {
        {"vmm_binary", "/usr/bin/qemu-system-x86_64"},
        {"kernel", "/k"},
        {"app_binary", "/app"},
        {"bios_binary", "/bios"},
        {"gdb", 1234},
        {"memory_size", "2G"},
        {"initrd", "/initrd"},
        {"pci_passthrough", "0000:00:04.0"},
        {"initial_data_version", "v1"},
        {"exchange_evidence", true},
        {"handshake_timeout_secs", 5},
        {"max_frame_size", 4096},
        {"initial_data_v1_header", "HDR"},
        {"guest_name", "oak"},
    };

    auto result = params_from_json(j);
    ASSERT_TRUE(result.status.ok()) << result.status.to_string();
    const Params& p = result.params;
    EXPECT_EQ(p.vmm_binary.string(), "/usr/bin/qemu-system-x86_64");
    ASSERT_TRUE(p.app_binary.has_value());
    EXPECT_EQ(p.app_binary->string(), "/app");
    EXPECT_EQ(p.gdb, std::optional<uint16_t>(1234));
    EXPECT_EQ(p.memory_size, std::optional<std::string>("2G"));
    EXPECT_EQ(p.pci_passthrough, std::optional<std::string>("0000:00:04.0"));
    EXPECT_TRUE(p.initial_data_version == InitialDataVersion::V1);
    EXPECT_TRUE(p.exchange_evidence);
    EXPECT_EQ(p.handshake_timeout, std::chrono::seconds(5));
    EXPECT_EQ(p.max_frame_size, 4096u);
    EXPECT_EQ(p.initial_data_v1_header, "HDR");
    EXPECT_EQ(p.guest_name, "oak");
}

TEST(ParamsJsonTest, NullClearsOptional) {
    Params defaults;
    defaults.memory_size = "1G";
    auto result = params_from_json(json{{"memory_size", nullptr}}, defaults);
    ASSERT_TRUE(result.status.ok());
    EXPECT_FALSE(result.params.memory_size.has_value());
}

TEST(ParamsJsonTest, WrongTypeIsConfigurationError) {
    auto result = params_from_json(json{{"kernel", 42}});
    EXPECT_EQ(result.status.kind, ErrorKind::CONFIGURATION);
}

TEST(ParamsJsonTest, BadValuesAreConfigurationErrors) {
    EXPECT_EQ(params_from_json(json{{"gdb", 70000}}).status.kind, ErrorKind::CONFIGURATION);
    EXPECT_EQ(params_from_json(json{{"initial_data_version", "v9"}}).status.kind, ErrorKind::CONFIGURATION);
    EXPECT_EQ(params_from_json(json{{"handshake_timeout_secs", 0}}).status.kind, ErrorKind::CONFIGURATION);
    EXPECT_EQ(params_from_json(json::array()).status.kind, ErrorKind::CONFIGURATION);
}

TEST(ParamsJsonTest, MaxFrameSizeMustFitU32) {
    EXPECT_EQ(params_from_json(json{{"max_frame_size", -1}}).status.kind, ErrorKind::CONFIGURATION);
    EXPECT_EQ(params_from_json(json{{"max_frame_size", 0}}).status.kind, ErrorKind::CONFIGURATION);
    EXPECT_EQ(params_from_json(json{{"max_frame_size", 4294967296LL}}).status.kind, ErrorKind::CONFIGURATION);

    auto largest = params_from_json(json{{"max_frame_size", 4294967295LL}});
    ASSERT_TRUE(largest.status.ok()) << largest.status.to_string();
    EXPECT_EQ(largest.params.max_frame_size, 4294967295u);
}

TEST(ParamsJsonTest, ToJsonReadsBack) {
    Params original;
    original.kernel = "/k";
    original.gdb = 9000;
    original.initial_data_version = InitialDataVersion::V1;

    auto result = params_from_json(original.to_json());
    ASSERT_TRUE(result.status.ok()) << result.status.to_string();
    EXPECT_EQ(result.params.kernel.string(), "/k");
    EXPECT_EQ(result.params.gdb, std::optional<uint16_t>(9000));
    EXPECT_TRUE(result.params.initial_data_version == InitialDataVersion::V1);
    EXPECT_FALSE(result.params.app_binary.has_value());
}

TEST_F(ParamsTest, LoadFileParseErrorIsConfiguration) {
    auto file = dir.write("broken.json", "{ \"kernel\": ");
    auto result = load_params_file(file);
    EXPECT_EQ(result.status.kind, ErrorKind::CONFIGURATION);
}

TEST_F(ParamsTest, LoadMissingFileIsConfiguration) {
    auto result = load_params_file(dir.path() / "absent.json");
    EXPECT_EQ(result.status.kind, ErrorKind::CONFIGURATION);
}

TEST_F(ParamsTest, LoadFileOverridesDefaults) {
    auto file = dir.write("params.json", R"({"guest_name": "from-file", "memory_size": "512M"})");
    auto result = load_params_file(file, params);
    ASSERT_TRUE(result.status.ok()) << result.status.to_string();
    EXPECT_EQ(result.params.guest_name, "from-file");
    EXPECT_EQ(result.params.memory_size, std::optional<std::string>("512M"));
    EXPECT_EQ(result.params.kernel.string(), params.kernel.string());
}

// ─────────────────────────────────────────────────────────────────────────────
// Monitor arguments
// ─────────────────────────────────────────────────────────────────────────────

TEST(VmmArgsTest, MinimalOrder) {
    Params p;
    p.kernel = "/k";
    p.bios_binary = "/b";
    p.initrd = "/i";

    std::vector<std::string> expected = {
        "-enable-kvm",
        "-d", "int,unimp,guest_errors",
        "-cpu", "IvyBridge-IBRS",
        "-nodefaults",
        "-nographic",
        "-no-reboot",
        "-machine", "microvm,acpi=on",
        "-chardev", "socket,id=consock,fd=5",
        "-serial", "chardev:consock",
        "-chardev", "socket,id=commsock,fd=7",
        "-device", "virtio-serial-device,max_ports=1",
        "-device", "virtconsole,chardev=commsock",
        "-bios", "/b",
        "-kernel", "/k",
        "-initrd", "/i",
    };
    EXPECT_EQ(build_vmm_args(p, 5, 7), expected);
}

TEST(VmmArgsTest, OptionalArgumentsInPlace) {
    Params p;
    p.kernel = "/k";
    p.bios_binary = "/b";
    p.initrd = "/i";
    p.memory_size = "256M";
    p.pci_passthrough = "0000:00:04.0";
    p.gdb = 1234;

    std::vector<std::string> expected = {
        "-enable-kvm",
        "-d", "int,unimp,guest_errors",
        "-cpu", "IvyBridge-IBRS",
        "-m", "256M",
        "-nodefaults",
        "-nographic",
        "-no-reboot",
        "-machine", "microvm,acpi=on",
        "-chardev", "socket,id=consock,fd=3",
        "-serial", "chardev:consock",
        "-chardev", "socket,id=commsock,fd=4",
        "-device", "virtio-serial-device,max_ports=1",
        "-device", "virtconsole,chardev=commsock",
        "-device", "vfio-pci,host=0000:00:04.0",
        "-bios", "/b",
        "-kernel", "/k",
        "-gdb", "tcp::1234",
        "-S",
        "-initrd", "/i",
    };
    EXPECT_EQ(build_vmm_args(p, 3, 4), expected);
}

TEST(VmmArgsTest, FormatCommandQuotesSpaces) {
    EXPECT_EQ(format_command("qemu", {"-kernel", "/a b/k"}), "qemu -kernel \"/a b/k\"");
}
