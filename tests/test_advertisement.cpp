#include "network/advertisement.hpp"
#include "murmur/common.hpp"
#include "murmur/time_utils.hpp"
#include <gtest/gtest.h>

using namespace murmur;
using namespace murmur::network;

class AdvertisementTest : public ::testing::Test {
protected:
    // Fixed clock: 2024-01-01T00:00:00Z in milliseconds
    const Timestamp now_ms = 1704067200000ULL;
    const Timestamp now_s = now_ms / 1000;

    const Timestamp two_hours_ms = 2ULL * 60 * 60 * 1000;
};

// ============================================================================
// JSON grammar
// ============================================================================

TEST_F(AdvertisementTest, JsonSnakeCase) {
    std::string text = R"({"node_id":"n1","address":"10.0.0.5","port":9000,"public_key":"pk1","timestamp":)" +
                       std::to_string(now_ms) + "}";

    auto result = parse_advertisement(text, now_ms);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& adv = result.value();
    EXPECT_EQ(adv.node_id, "n1");
    EXPECT_EQ(adv.address, "10.0.0.5");
    EXPECT_EQ(adv.port, 9000);
    EXPECT_EQ(adv.public_key, "pk1");
    EXPECT_TRUE(adv.capabilities.empty());
    EXPECT_EQ(adv.timestamp, now_ms);
}

TEST_F(AdvertisementTest, JsonCamelCaseAndCapabilities) {
    std::string text = R"({"nodeId":"n7","address":"relay.example","port":"9100","publicKey":"pk7",)"
                       R"("capabilities":["p2p","tor"]})";

    auto result = parse_advertisement(text, now_ms);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& adv = result.value();
    EXPECT_EQ(adv.node_id, "n7");
    EXPECT_EQ(adv.port, 9100);
    EXPECT_EQ(adv.public_key, "pk7");
    EXPECT_EQ(adv.capabilities, (std::vector<std::string>{"p2p", "tor"}));
    EXPECT_EQ(adv.timestamp, now_ms);
}

TEST_F(AdvertisementTest, JsonSecondsTimestampIsNormalized) {
    std::string text = R"({"node_id":"n1","address":"10.0.0.5","port":9000,"timestamp":)" +
                       std::to_string(now_s - 60) + "}";

    auto result = parse_advertisement(text, now_ms);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().timestamp, (now_s - 60) * 1000);
}

TEST_F(AdvertisementTest, JsonMissingRequiredFields) {
    auto no_node = parse_advertisement(R"({"address":"10.0.0.5","port":9000})", now_ms);
    ASSERT_TRUE(no_node.is_err());
    EXPECT_EQ(no_node.error().code(), ErrorCode::MalformedAdvertisement);

    auto no_address = parse_advertisement(R"({"node_id":"n1","port":9000})", now_ms);
    ASSERT_TRUE(no_address.is_err());
    EXPECT_EQ(no_address.error().code(), ErrorCode::MalformedAdvertisement);

    auto no_port = parse_advertisement(R"({"node_id":"n1","address":"10.0.0.5"})", now_ms);
    ASSERT_TRUE(no_port.is_err());
    EXPECT_EQ(no_port.error().code(), ErrorCode::MalformedAdvertisement);
}

TEST_F(AdvertisementTest, JsonInvalidValues) {
    auto bad_port = parse_advertisement(R"({"node_id":"n1","address":"a","port":70000})", now_ms);
    ASSERT_TRUE(bad_port.is_err());
    EXPECT_EQ(bad_port.error().code(), ErrorCode::MalformedAdvertisement);

    auto bad_caps = parse_advertisement(R"({"node_id":"n1","address":"a","port":1,"capabilities":"p2p"})", now_ms);
    ASSERT_TRUE(bad_caps.is_err());
    EXPECT_EQ(bad_caps.error().code(), ErrorCode::MalformedAdvertisement);

    auto broken = parse_advertisement(R"({"node_id":"n1",)", now_ms);
    ASSERT_TRUE(broken.is_err());
    EXPECT_EQ(broken.error().code(), ErrorCode::MalformedAdvertisement);
}

TEST_F(AdvertisementTest, JsonTimestampOutOfRange) {
    for (const char* ts : {"1e30", "1.8446744073709552e19"}) {
        std::string text = std::string(R"({"node_id":"n1","address":"10.0.0.5","port":9000,"timestamp":)") +
                           ts + "}";

        auto result = parse_advertisement(text, now_ms);
        ASSERT_TRUE(result.is_err()) << ts;
        EXPECT_EQ(result.error().code(), ErrorCode::MalformedAdvertisement) << ts;
    }
}

// ============================================================================
// URI grammar
// ============================================================================

TEST_F(AdvertisementTest, UriWithQuery) {
    std::string text = "murmur://10.0.0.9:9200?key=pk%2B9&capabilities=p2p,tor&ts=" + std::to_string(now_ms);

    auto result = parse_advertisement(text, now_ms);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& adv = result.value();
    EXPECT_EQ(adv.node_id, "10.0.0.9");
    EXPECT_EQ(adv.address, "10.0.0.9");
    EXPECT_EQ(adv.port, 9200);
    EXPECT_EQ(adv.public_key, "pk+9");
    EXPECT_EQ(adv.capabilities, (std::vector<std::string>{"p2p", "tor"}));
    EXPECT_EQ(adv.timestamp, now_ms);
}

TEST_F(AdvertisementTest, UriDefaultsPort) {
    auto result = parse_advertisement("murmur://peer.local", now_ms);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    EXPECT_EQ(result.value().port, constants::DEFAULT_PORT);
    EXPECT_EQ(result.value().timestamp, now_ms);
    EXPECT_TRUE(result.value().public_key.empty());
}

TEST_F(AdvertisementTest, UriInvalidPort) {
    auto result = parse_advertisement("murmur://peer.local:abc", now_ms);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::MalformedAdvertisement);
}

// ============================================================================
// Pipe-delimited grammar
// ============================================================================

TEST_F(AdvertisementTest, DelimitedWithCapabilities) {
    auto result = parse_advertisement("n2|10.0.0.6|9001|pk2|p2p,tor", now_ms);
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();

    const auto& adv = result.value();
    EXPECT_EQ(adv.node_id, "n2");
    EXPECT_EQ(adv.address, "10.0.0.6");
    EXPECT_EQ(adv.port, 9001);
    EXPECT_EQ(adv.public_key, "pk2");
    EXPECT_EQ(adv.capabilities, (std::vector<std::string>{"p2p", "tor"}));
    EXPECT_EQ(adv.timestamp, now_ms);
}

TEST_F(AdvertisementTest, DelimitedMinimalAndWithTimestamp) {
    auto minimal = parse_advertisement("n3|10.0.0.7|9002|pk3", now_ms);
    ASSERT_TRUE(minimal.is_ok()) << minimal.error().to_string();
    EXPECT_TRUE(minimal.value().capabilities.empty());

    auto stamped = parse_advertisement("n3|10.0.0.7|9002|pk3||" + std::to_string(now_s), now_ms);
    ASSERT_TRUE(stamped.is_ok()) << stamped.error().to_string();
    EXPECT_EQ(stamped.value().timestamp, now_s * 1000);
}

TEST_F(AdvertisementTest, DelimitedFieldCount) {
    auto too_few = parse_advertisement("n2|10.0.0.6|9001", now_ms);
    ASSERT_TRUE(too_few.is_err());
    EXPECT_EQ(too_few.error().code(), ErrorCode::MalformedAdvertisement);

    auto too_many = parse_advertisement("a|b|1|c|d|2|extra", now_ms);
    ASSERT_TRUE(too_many.is_err());
    EXPECT_EQ(too_many.error().code(), ErrorCode::MalformedAdvertisement);
}

// ============================================================================
// Freshness and rejection
// ============================================================================

TEST_F(AdvertisementTest, StaleRejectedInEveryGrammar) {
    Timestamp old_ms = now_ms - two_hours_ms;

    std::vector<std::string> payloads = {
        R"({"node_id":"n1","address":"a","port":1,"timestamp":)" + std::to_string(old_ms) + "}",
        "murmur://a:1?ts=" + std::to_string(old_ms),
        "n1|a|1|pk||" + std::to_string(old_ms / 1000),
    };

    for (const auto& payload : payloads) {
        auto result = parse_advertisement(payload, now_ms);
        ASSERT_TRUE(result.is_err()) << payload;
        EXPECT_EQ(result.error().code(), ErrorCode::StaleAdvertisement) << payload;
    }
}

TEST_F(AdvertisementTest, JustUnderOneHourAccepted) {
    Timestamp ts = now_ms - constants::ADVERTISEMENT_MAX_AGE_MS + 1000;
    auto result = parse_advertisement("n1|a|1|pk||" + std::to_string(ts), now_ms);
    EXPECT_TRUE(result.is_ok());
}

TEST_F(AdvertisementTest, UnrecognizedFormat) {
    auto garbage = parse_advertisement("hello there", now_ms);
    ASSERT_TRUE(garbage.is_err());
    EXPECT_EQ(garbage.error().code(), ErrorCode::MalformedAdvertisement);

    auto empty = parse_advertisement("   ", now_ms);
    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error().code(), ErrorCode::MalformedAdvertisement);
}

// ============================================================================
// Field helpers
// ============================================================================

TEST_F(AdvertisementTest, PortMustBeWholeNumberInRange) {
    EXPECT_EQ(parse_port("9000"), std::optional<uint16_t>(9000));
    EXPECT_EQ(parse_port("65535"), std::optional<uint16_t>(65535));
    EXPECT_FALSE(parse_port("12abc").has_value());
    EXPECT_FALSE(parse_port("0").has_value());
    EXPECT_FALSE(parse_port("65536").has_value());
    EXPECT_FALSE(parse_port("-1").has_value());
    EXPECT_FALSE(parse_port("").has_value());
}

TEST_F(AdvertisementTest, CapabilityListIsTrimmed) {
    EXPECT_EQ(split_capabilities(" p2p, tor ,,relay "),
              (std::vector<std::string>{"p2p", "tor", "relay"}));
    EXPECT_TRUE(split_capabilities("").empty());
    EXPECT_TRUE(split_capabilities(" , ").empty());
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(AdvertisementTest, EncodedFormsParseBack) {
    PeerAdvertisement adv;
    adv.node_id = "10.1.2.3";
    adv.address = "10.1.2.3";
    adv.port = 9300;
    adv.public_key = "pk/1";
    adv.capabilities = {"p2p", "tor"};
    adv.timestamp = now_ms;

    for (auto format : {AdvertisementFormat::Json, AdvertisementFormat::Uri, AdvertisementFormat::Delimited}) {
        auto text = encode_advertisement(adv, format);
        auto result = parse_advertisement(text, now_ms);
        ASSERT_TRUE(result.is_ok()) << advertisement_format_to_string(format) << ": " << text;
        EXPECT_EQ(result.value(), adv) << text;
    }
}

TEST_F(AdvertisementTest, DelimitedEncodeRejectsPipe) {
    PeerAdvertisement adv;
    adv.node_id = "n|1";
    adv.address = "a";
    adv.port = 1;

    EXPECT_THROW(encode_advertisement(adv, AdvertisementFormat::Delimited), ProtocolException);
}

// ============================================================================
// Scan history
// ============================================================================

TEST_F(AdvertisementTest, ScanHistoryKeepsTenNewestFirst) {
    ScanHistory history;
    EXPECT_EQ(history.capacity(), constants::SCAN_HISTORY_CAPACITY);

    for (int i = 0; i < 12; ++i) {
        PeerAdvertisement adv;
        adv.node_id = "n" + std::to_string(i);
        history.record(adv);
    }

    auto entries = history.entries();
    ASSERT_EQ(entries.size(), 10u);
    EXPECT_EQ(entries.front().node_id, "n11");
    EXPECT_EQ(entries.back().node_id, "n2");

    history.clear();
    EXPECT_EQ(history.size(), 0u);
}
