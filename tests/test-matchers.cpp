#include <gtest/gtest.h>
#include "../cors/matchers.h"

using namespace qb::cors;

TEST(MatchersTest, OriginIsExactAndCaseSensitive) {
    const std::vector<std::string> allowed = {"https://a.com", "http://localhost:3000"};

    EXPECT_TRUE(match::origin("https://a.com", allowed));
    EXPECT_TRUE(match::origin("http://localhost:3000", allowed));
    EXPECT_FALSE(match::origin("https://A.com", allowed));
    EXPECT_FALSE(match::origin("https://a.com/", allowed));
    EXPECT_FALSE(match::origin("https://sub.a.com", allowed));
    EXPECT_FALSE(match::origin("http://localhost", allowed));
    EXPECT_FALSE(match::origin("", allowed));
}

TEST(MatchersTest, LiteralStarIsNotAWildcard) {
    const std::vector<std::string> allowed = {"https://a.com", "*"};
    EXPECT_FALSE(match::origin("https://b.com", allowed));
    EXPECT_TRUE(match::origin("*", allowed));
}

TEST(MatchersTest, MethodIsCaseSensitive) {
    const std::vector<std::string> allowed = {"GET", "POST"};

    EXPECT_TRUE(match::method("GET", allowed));
    EXPECT_TRUE(match::method("POST", allowed));
    EXPECT_FALSE(match::method("get", allowed));
    EXPECT_FALSE(match::method("DELETE", allowed));
    EXPECT_FALSE(match::method("", allowed));
}

TEST(MatchersTest, HeadersAreCaseInsensitiveSubset) {
    const std::vector<std::string> allowed = {"origin", "authorization", "content-type"};

    EXPECT_TRUE(match::headers("Content-Type", allowed));
    EXPECT_TRUE(match::headers("content-type,AUTHORIZATION", allowed));
    EXPECT_TRUE(match::headers(" Origin ,\tContent-Type\r\n", allowed));
    EXPECT_FALSE(match::headers("Content-Type, X-Custom", allowed));
    EXPECT_FALSE(match::headers("X-Custom", allowed));
}

TEST(MatchersTest, EmptyHeaderTokensMustBeAllowed) {
    const std::vector<std::string> allowed = {"content-type"};
    EXPECT_FALSE(match::headers("", allowed));
    EXPECT_FALSE(match::headers(" , ", allowed));
    EXPECT_FALSE(match::headers("Content-Type,", allowed));
    EXPECT_FALSE(match::headers("", {}));
    EXPECT_FALSE(match::headers("Content-Type", {}));

    // An empty configured name admits empty tokens
    const std::vector<std::string> with_empty = {"content-type", ""};
    EXPECT_TRUE(match::headers("", with_empty));
    EXPECT_TRUE(match::headers("Content-Type,", with_empty));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
