/**
 * @file test_initial_data.cpp
 * @brief Unit tests for building and decoding bootstrap payloads.
 */

#include <gtest/gtest.h>
#include "runtime/initial_data.hpp"
#include "initial_data.pb.h"
#include <string>

using namespace enclave;
using namespace enclave::runtime;

namespace {

std::vector<uint8_t> sample_app() {
    std::vector<uint8_t> app;
    for (int i = 0; i < 300; ++i) {
        app.push_back(static_cast<uint8_t>(i * 7));
    }
    return app;
}

} // namespace

TEST(InitialDataVersionTest, Names) {
    EXPECT_STREQ(initial_data_version_to_string(InitialDataVersion::V0), "v0");
    EXPECT_STREQ(initial_data_version_to_string(InitialDataVersion::V1), "v1");

    EXPECT_EQ(initial_data_version_from_string("v0"), InitialDataVersion::V0);
    EXPECT_EQ(initial_data_version_from_string("V1"), InitialDataVersion::V1);
    EXPECT_FALSE(initial_data_version_from_string("v2").has_value());
    EXPECT_FALSE(initial_data_version_from_string("").has_value());
}

TEST(InitialDataTest, V0IsRawApplicationBytes) {
    auto app = sample_app();
    auto result = build_initial_data(InitialDataVersion::V0, app);
    ASSERT_TRUE(result.status.ok());
    EXPECT_EQ(result.bytes, app);
}

TEST(InitialDataTest, V0EmptyApplication) {
    auto result = build_initial_data(InitialDataVersion::V0, {});
    ASSERT_TRUE(result.status.ok());
    EXPECT_TRUE(result.bytes.empty());
}

TEST(InitialDataTest, V1StartsWithHeaderAndParses) {
    auto app = sample_app();
    auto result = build_initial_data(InitialDataVersion::V1, app);
    ASSERT_TRUE(result.status.ok());

    std::string header = kInitialDataV1Header;
    ASSERT_GT(result.bytes.size(), header.size());
    EXPECT_EQ(std::string(result.bytes.begin(), result.bytes.begin() + header.size()), header);

    enclave::bootstrap::InitialData message;
    ASSERT_TRUE(message.ParseFromArray(result.bytes.data() + header.size(),
                                       static_cast<int>(result.bytes.size() - header.size())));
    EXPECT_EQ(message.application_bytes(), std::string(app.begin(), app.end()));
    EXPECT_TRUE(message.endorsement_bytes().empty());
}

TEST(InitialDataTest, V1DecodeRecoversApplication) {
    auto app = sample_app();
    auto built = build_initial_data(InitialDataVersion::V1, app);
    ASSERT_TRUE(built.status.ok());

    auto decoded = decode_initial_data_v1(built.bytes);
    ASSERT_TRUE(decoded.status.ok()) << decoded.status.to_string();
    EXPECT_EQ(decoded.application_bytes, app);
    EXPECT_TRUE(decoded.endorsement_bytes.empty());
}

TEST(InitialDataTest, V1CustomHeader) {
    auto built = build_initial_data(InitialDataVersion::V1, {1, 2, 3}, "OAK_V1");
    ASSERT_TRUE(built.status.ok());
    EXPECT_EQ(std::string(built.bytes.begin(), built.bytes.begin() + 6), "OAK_V1");

    EXPECT_TRUE(decode_initial_data_v1(built.bytes, "OAK_V1").status.ok());
    EXPECT_EQ(decode_initial_data_v1(built.bytes).status.kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(InitialDataTest, DecodeRejectsMissingHeader) {
    std::vector<uint8_t> payload = {'n', 'o', 'p', 'e'};
    auto decoded = decode_initial_data_v1(payload);
    EXPECT_EQ(decoded.status.kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(InitialDataTest, DecodeRejectsMalformedMessage) {
    std::string header = kInitialDataV1Header;
    std::vector<uint8_t> payload(header.begin(), header.end());
    // Field 1, length-delimited, claims 100 bytes but carries none.
    payload.push_back(0x0A);
    payload.push_back(100);

    auto decoded = decode_initial_data_v1(payload);
    EXPECT_EQ(decoded.status.kind, ErrorKind::PROTOCOL_VIOLATION);
}
