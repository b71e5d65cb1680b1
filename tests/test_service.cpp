#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "service.h"

using namespace ds;


// ========== Scan Request Tests ==========

TEST(ScanRequestTest, ParsesFullRequest) {
    auto req = parse_scan_request(R"({
        "correlation_id": "abc-123",
        "payload": {"date": "2025-04-07", "symbols": ["TCS.NS", "INFY.NS"], "use_next_open": true}
    })", false);

    EXPECT_EQ(req.correlation_id, "abc-123");
    ASSERT_TRUE(req.date.has_value());
    EXPECT_EQ(*req.date, Date::parse("2025-04-07"));
    ASSERT_TRUE(req.symbols.has_value());
    EXPECT_EQ(*req.symbols, (std::vector<std::string>{"TCS.NS", "INFY.NS"}));
    EXPECT_TRUE(req.use_next_open);
}

TEST(ScanRequestTest, MissingFieldsTakeDefaults) {
    auto req = parse_scan_request(R"({"payload": {}})", true);
    EXPECT_EQ(req.correlation_id, "");
    EXPECT_FALSE(req.date.has_value());
    EXPECT_FALSE(req.symbols.has_value());
    EXPECT_TRUE(req.use_next_open);

    auto bare = parse_scan_request("{}", false);
    EXPECT_FALSE(bare.date.has_value());
    EXPECT_FALSE(bare.use_next_open);

    auto nulls = parse_scan_request(R"({"payload": {"date": null, "symbols": null}})", false);
    EXPECT_FALSE(nulls.date.has_value());
    EXPECT_FALSE(nulls.symbols.has_value());
}

TEST(ScanRequestTest, WrongTypesThrow) {
    EXPECT_THROW(parse_scan_request(R"({"payload": {"date": 20250407}})", false),
                 std::invalid_argument);
    EXPECT_THROW(parse_scan_request(R"({"payload": {"use_next_open": "true"}})", false),
                 std::invalid_argument);
    EXPECT_THROW(parse_scan_request(R"({"payload": {"symbols": "TCS.NS"}})", false),
                 std::invalid_argument);
    EXPECT_THROW(parse_scan_request(R"({"payload": {"symbols": ["TCS.NS", 7]}})", false),
                 std::invalid_argument);
    EXPECT_THROW(parse_scan_request(R"({"payload": [1, 2]})", false), std::invalid_argument);
    EXPECT_THROW(parse_scan_request(R"({"correlation_id": 42})", false), std::invalid_argument);
}

TEST(ScanRequestTest, MalformedJsonThrows) {
    EXPECT_THROW(parse_scan_request("{ not json", false), std::invalid_argument);
    EXPECT_THROW(parse_scan_request("", false), std::invalid_argument);
    EXPECT_THROW(parse_scan_request("[1, 2, 3]", false), std::invalid_argument);
}

TEST(ScanRequestTest, BadDateThrows) {
    EXPECT_THROW(parse_scan_request(R"({"payload": {"date": "2025-02-30"}})", false),
                 std::invalid_argument);
    EXPECT_THROW(parse_scan_request(R"({"payload": {"date": "2025-4-7"}})", false),
                 std::invalid_argument);
}

TEST(ScanRequestTest, CorrelationIdSurvivesBadPayload) {
    const std::string msg = R"({"correlation_id": "req-9", "payload": {"date": 5}})";
    EXPECT_THROW(parse_scan_request(msg, false), std::invalid_argument);
    EXPECT_EQ(correlation_id_of(msg), "req-9");

    EXPECT_EQ(correlation_id_of("{ not json"), "");
    EXPECT_EQ(correlation_id_of(R"({"correlation_id": 42})"), "");
    EXPECT_EQ(correlation_id_of("[]"), "");
}
