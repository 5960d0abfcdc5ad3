#include <gtest/gtest.h>
#include "../cors/config.h"

#include <chrono>

using namespace qb::cors;
using namespace std::chrono_literals;

TEST(ConfigTest, Defaults) {
    const auto config = Config::defaults();

    EXPECT_EQ(config.origins, "*");
    EXPECT_EQ(config.methods, "GET, PUT, POST, DELETE");
    EXPECT_EQ(config.request_headers, "Origin, Authorization, Content-Type");
    EXPECT_EQ(config.exposed_headers, "");
    EXPECT_EQ(config.max_age, std::chrono::milliseconds(60s));
    EXPECT_TRUE(config.credentials);
    EXPECT_FALSE(config.validate_headers);
}

TEST(ConfigTest, DefaultConstructedIsEmpty) {
    const Config config;
    EXPECT_TRUE(config.origins.empty());
    EXPECT_EQ(config.max_age.count(), 0);
    EXPECT_FALSE(config.credentials);
}

TEST(ConfigTest, FromJsonOverridesPresentKeysOnly) {
    qb::json doc = {
        {"origins", "https://a.com, https://b.com"},
        {"credentials", false},
        {"max_age", 600}
    };
    auto result = Config::from_json(doc);
    ASSERT_TRUE(result.success()) << result.error().to_string();

    const auto &config = result.value();
    EXPECT_EQ(config.origins, "https://a.com, https://b.com");
    EXPECT_FALSE(config.credentials);
    EXPECT_EQ(config.max_age, std::chrono::milliseconds(600s));
    // Untouched keys keep their defaults
    EXPECT_EQ(config.methods, "GET, PUT, POST, DELETE");
    EXPECT_FALSE(config.validate_headers);
}

TEST(ConfigTest, FromJsonAcceptsArrays) {
    qb::json doc = {
        {"origins", qb::json::array({"https://a.com", "https://b.com"})},
        {"methods", qb::json::array({"GET", "POST"})},
        {"request_headers", qb::json::array({"Content-Type"})},
        {"exposed_headers", qb::json::array()},
        {"validate_headers", true}
    };
    auto result = Config::from_json(doc);
    ASSERT_TRUE(result.success()) << result.error().to_string();

    const auto &config = result.value();
    EXPECT_EQ(config.origins, "https://a.com, https://b.com");
    EXPECT_EQ(config.methods, "GET, POST");
    EXPECT_EQ(config.request_headers, "Content-Type");
    EXPECT_EQ(config.exposed_headers, "");
    EXPECT_TRUE(config.validate_headers);
}

TEST(ConfigTest, FromJsonFractionalMaxAge) {
    auto result = Config::from_json({{"max_age", 1.5}});
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value().max_age.count(), 1500);
}

TEST(ConfigTest, FromJsonRejectsOutOfRangeMaxAge) {
    auto result = Config::from_json({{"max_age", 1e300}});
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().field, "max_age");
    EXPECT_EQ(result.error().message, "out of range");

    result = Config::from_json({{"max_age", -1e300}});
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().message, "out of range");

    // A year still fits comfortably
    result = Config::from_json({{"max_age", 31536000}});
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value().max_age.count(), 31536000000LL);
}

TEST(ConfigTest, FromJsonRejectsWrongTypes) {
    auto result = Config::from_json({{"credentials", "yes"}});
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().field, "credentials");

    result = Config::from_json({{"methods", 42}});
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().field, "methods");

    result = Config::from_json({{"origins", qb::json::array({"https://a.com", 7})}});
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().field, "origins");

    result = Config::from_json({{"max_age", "1m"}});
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().field, "max_age");
}

TEST(ConfigTest, FromJsonRejectsNonObject) {
    auto result = Config::from_json(qb::json::array());
    ASSERT_FALSE(result.success());
    EXPECT_TRUE(result.error().field.empty());
}

TEST(ConfigTest, FromJsonIgnoresUnknownKeys) {
    auto result = Config::from_json({{"allowed_everything", true}});
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value().origins, "*");
}

TEST(ConfigTest, FromJsonString) {
    auto result = Config::from_json_string(R"({"origins": "https://a.com", "validate_headers": true})");
    ASSERT_TRUE(result.success()) << result.error().to_string();
    EXPECT_EQ(result.value().origins, "https://a.com");
    EXPECT_TRUE(result.value().validate_headers);

    auto broken = Config::from_json_string("{\"origins\": ");
    ASSERT_FALSE(broken.success());
    EXPECT_NE(broken.error().message.find("invalid JSON"), std::string::npos);
}

TEST(ConfigTest, ToJsonRoundTrip) {
    Config config = Config::defaults();
    config.origins = "https://a.com";
    config.exposed_headers = "X-Request-Id";
    config.max_age = std::chrono::milliseconds(90s);
    config.validate_headers = true;

    auto result = Config::from_json(config.to_json());
    ASSERT_TRUE(result.success());
    const auto &loaded = result.value();
    EXPECT_EQ(loaded.origins, config.origins);
    EXPECT_EQ(loaded.exposed_headers, config.exposed_headers);
    EXPECT_EQ(loaded.max_age, config.max_age);
    EXPECT_EQ(loaded.validate_headers, config.validate_headers);
    EXPECT_EQ(loaded.credentials, config.credentials);
}

TEST(ConfigTest, ResultAccessorsThrowOnWrongSide) {
    auto ok = Config::from_json(qb::json::object());
    ASSERT_TRUE(ok.success());
    EXPECT_THROW((void)ok.error(), std::logic_error);

    auto bad = Config::from_json(qb::json::array());
    ASSERT_FALSE(bad);
    EXPECT_THROW((void)bad.value(), std::logic_error);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
