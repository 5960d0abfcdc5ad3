#include <gtest/gtest.h>
#include "../cors/policy.h"

#include <chrono>

using namespace qb::cors;
using namespace std::chrono_literals;

class PolicyTest : public ::testing::Test {
protected:
    static Policy build(const PolicyBuilder &builder) {
        auto result = builder.build();
        if (!result) {
            ADD_FAILURE() << "policy build failed: " << result.error().to_string();
            return PolicyBuilder().origins("*").build().value();
        }
        return std::move(result).value();
    }
};

TEST_F(PolicyTest, EmptyOriginIsAConfigurationError) {
    auto result = PolicyBuilder().methods("GET").build();
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().field, "origins");

    Config config = Config::defaults();
    config.origins.clear();
    auto created = Policy::create(config);
    ASSERT_FALSE(created.success());
    EXPECT_EQ(created.error().field, "origins");
}

TEST_F(PolicyTest, NegativeMaxAgeIsAConfigurationError) {
    auto result = PolicyBuilder().origins("*").max_age(std::chrono::milliseconds(-1000)).build();
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error().field, "max_age");
}

TEST_F(PolicyTest, WildcardOnlyWhenOriginRuleIsExactlyStar) {
    EXPECT_TRUE(build(PolicyBuilder().origins("*")).allow_all_origins());
    EXPECT_FALSE(build(PolicyBuilder().origins("https://a.com, *")).allow_all_origins());
    EXPECT_FALSE(build(PolicyBuilder().origins("https://a.com")).allow_all_origins());
}

TEST_F(PolicyTest, ListsAreSplitOnCommaSpace) {
    auto policy = build(PolicyBuilder()
                            .origins("https://a.com, https://b.com")
                            .methods("GET, PUT, POST")
                            .request_headers("Origin, Authorization, Content-Type"));

    ASSERT_EQ(policy.origins().size(), 2u);
    EXPECT_EQ(policy.origins()[1], "https://b.com");

    ASSERT_EQ(policy.methods().size(), 3u);
    EXPECT_EQ(policy.methods()[0], "GET");
    EXPECT_EQ(policy.methods()[2], "POST");

    ASSERT_EQ(policy.request_headers().size(), 3u);
    EXPECT_EQ(policy.request_headers()[0], "origin");
    EXPECT_EQ(policy.request_headers()[2], "content-type");
}

TEST_F(PolicyTest, RenderedHeadersKeepConfiguredText) {
    auto policy = build(PolicyBuilder()
                            .origins("*")
                            .methods("GET, POST")
                            .request_headers("X-Api-Key, Content-Type")
                            .exposed_headers("X-Request-Id, X-Rate-Limit"));

    EXPECT_EQ(policy.methods_header(), "GET, POST");
    EXPECT_EQ(policy.request_headers_header(), "X-Api-Key, Content-Type");
    EXPECT_EQ(policy.exposed_headers(), "X-Request-Id, X-Rate-Limit");
}

TEST_F(PolicyTest, MaxAgeRenderedAsWholeSeconds) {
    EXPECT_EQ(build(PolicyBuilder().origins("*").max_age(1min)).max_age(), "60");
    EXPECT_EQ(build(PolicyBuilder().origins("*").max_age(0s)).max_age(), "0");
    EXPECT_EQ(build(PolicyBuilder().origins("*").max_age(2min + 30s)).max_age(), "150");
    EXPECT_EQ(build(PolicyBuilder().origins("*").max_age(1400ms)).max_age(), "1");
    EXPECT_EQ(build(PolicyBuilder().origins("*").max_age(1600ms)).max_age(), "2");
    // Ties round to even
    EXPECT_EQ(build(PolicyBuilder().origins("*").max_age(500ms)).max_age(), "0");
    EXPECT_EQ(build(PolicyBuilder().origins("*").max_age(1500ms)).max_age(), "2");
}

TEST_F(PolicyTest, CredentialsRenderedAsText) {
    auto on = build(PolicyBuilder().origins("*").credentials(true));
    EXPECT_TRUE(on.credentials());
    EXPECT_EQ(on.credentials_header(), "true");

    auto off = build(PolicyBuilder().origins("*").credentials(false));
    EXPECT_FALSE(off.credentials());
    EXPECT_EQ(off.credentials_header(), "false");
}

TEST_F(PolicyTest, CreateFromDefaults) {
    auto result = Policy::create(Config::defaults());
    ASSERT_TRUE(result.success());
    const auto &policy = result.value();

    EXPECT_TRUE(policy.allow_all_origins());
    EXPECT_EQ(policy.methods_header(), "GET, PUT, POST, DELETE");
    EXPECT_EQ(policy.request_headers_header(), "Origin, Authorization, Content-Type");
    EXPECT_EQ(policy.max_age(), "60");
    EXPECT_TRUE(policy.credentials());
    EXPECT_FALSE(policy.validate_headers());
}

TEST_F(PolicyTest, BuilderStartsFromConfig) {
    Config config = Config::defaults();
    config.origins = "https://a.com";
    PolicyBuilder builder(config);
    builder.validate_headers(true);

    EXPECT_EQ(builder.config().origins, "https://a.com");
    EXPECT_TRUE(builder.config().validate_headers);
    EXPECT_TRUE(build(builder).validate_headers());
}

TEST_F(PolicyTest, AllowsOrigin) {
    auto list = build(PolicyBuilder().origins("https://a.com, https://b.com"));
    EXPECT_TRUE(list.allows_origin("https://a.com"));
    EXPECT_TRUE(list.allows_origin("https://b.com"));
    EXPECT_FALSE(list.allows_origin("https://c.com"));
    EXPECT_FALSE(list.allows_origin("HTTPS://A.COM"));

    auto any = build(PolicyBuilder().origins("*"));
    EXPECT_TRUE(any.allows_origin("https://whatever.example"));
    EXPECT_TRUE(any.allows_origin("null"));
}

TEST_F(PolicyTest, EmptyRequestHeaderNamesAreKept) {
    auto empty = build(PolicyBuilder().origins("*").request_headers(""));
    EXPECT_EQ(empty.request_headers(), (std::vector<std::string>{""}));
    EXPECT_EQ(empty.request_headers_header(), "");

    auto gap = build(PolicyBuilder().origins("*").request_headers("Origin, , X-A"));
    EXPECT_EQ(gap.request_headers(), (std::vector<std::string>{"origin", "", "x-a"}));
}

TEST_F(PolicyTest, NonStrictModeAllowsAnyProbe) {
    auto policy = build(PolicyBuilder().origins("*").methods("GET").request_headers("Content-Type"));
    EXPECT_TRUE(policy.allows_method("PATCH"));
    EXPECT_TRUE(policy.allows_headers("X-Anything"));
}

TEST_F(PolicyTest, StrictModeChecksProbe) {
    auto policy = build(PolicyBuilder()
                            .origins("*")
                            .methods("GET, POST")
                            .request_headers("Content-Type, Authorization")
                            .validate_headers(true));
    EXPECT_TRUE(policy.allows_method("POST"));
    EXPECT_FALSE(policy.allows_method("post"));
    EXPECT_FALSE(policy.allows_method("DELETE"));
    EXPECT_TRUE(policy.allows_headers("content-type, authorization"));
    EXPECT_FALSE(policy.allows_headers("content-type, x-custom"));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
