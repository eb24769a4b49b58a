// tests/test_cache_key_builder.cpp
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

#include "../src/cache/CacheKeyBuilder.hpp"

using json = nlohmann::json;

TEST(CacheKeyBuilderTest, SameInputsGiveSameKey) {
    json params = {{"start", "now() - 1h"}, {"limit", 10}};
    std::string first = CacheKeyBuilder::buildKey("conn1", "SELECT * FROM cpu", std::string("mydb"), params);
    std::string second = CacheKeyBuilder::buildKey("conn1", "SELECT * FROM cpu", std::string("mydb"), params);
    EXPECT_EQ(first, second);
    EXPECT_FALSE(first.empty());
}

TEST(CacheKeyBuilderTest, AnyFieldChangeGivesDifferentKey) {
    json params = {{"limit", 10}};
    std::string base = CacheKeyBuilder::buildKey("conn1", "SELECT * FROM cpu", std::string("mydb"), params);

    EXPECT_NE(base, CacheKeyBuilder::buildKey("conn2", "SELECT * FROM cpu", std::string("mydb"), params));
    EXPECT_NE(base, CacheKeyBuilder::buildKey("conn1", "SELECT * FROM mem", std::string("mydb"), params));
    EXPECT_NE(base, CacheKeyBuilder::buildKey("conn1", "SELECT * FROM cpu", std::string("otherdb"), params));
    EXPECT_NE(base, CacheKeyBuilder::buildKey("conn1", "SELECT * FROM cpu", std::string("mydb"), json{{"limit", 11}}));
    EXPECT_NE(base, CacheKeyBuilder::buildKey("conn1", "SELECT * FROM cpu", std::nullopt, params));
    EXPECT_NE(base, CacheKeyBuilder::buildKey("conn1", "SELECT * FROM cpu", std::string("mydb")));
}

TEST(CacheKeyBuilderTest, QueryIsTrimmedAndLowerCased) {
    EXPECT_EQ(CacheKeyBuilder::buildKey("c", "SELECT Value FROM Temp"),
              CacheKeyBuilder::buildKey("c", "\t select value from temp  \n"));
    EXPECT_EQ(CacheKeyBuilder::normalizeQuery("  SHOW DATABASES "), "show databases");
}

TEST(CacheKeyBuilderTest, InnerWhitespaceIsSignificant) {
    EXPECT_NE(CacheKeyBuilder::buildKey("c", "select  1"), CacheKeyBuilder::buildKey("c", "select 1"));
}

TEST(CacheKeyBuilderTest, ParameterOrderDoesNotMatter) {
    json forward = json::object();
    forward["a"] = 1;
    forward["b"] = "two";
    forward["c"] = {{"nested_z", 1}, {"nested_a", 2}};

    json backward = json::object();
    backward["c"] = {{"nested_a", 2}, {"nested_z", 1}};
    backward["b"] = "two";
    backward["a"] = 1;

    EXPECT_EQ(CacheKeyBuilder::buildKey("c", "q", std::nullopt, forward),
              CacheKeyBuilder::buildKey("c", "q", std::nullopt, backward));
}

TEST(CacheKeyBuilderTest, AbsentAndEmptyOptionalFieldsAreEquivalent) {
    std::string bare = CacheKeyBuilder::buildKey("c", "q");
    EXPECT_EQ(bare, CacheKeyBuilder::buildKey("c", "q", std::string(""), nullptr));
    EXPECT_EQ(bare, CacheKeyBuilder::buildKey("c", "q", std::nullopt, json::object()));
}

TEST(CacheKeyBuilderTest, FieldBoundariesCannotBeShifted) {
    // A naive "connection|query" join would make these collide.
    EXPECT_NE(CacheKeyBuilder::buildKey("a|b", "c"), CacheKeyBuilder::buildKey("a", "b|c"));
    EXPECT_NE(CacheKeyBuilder::buildKey("conn", "q", std::string("db")),
              CacheKeyBuilder::buildKey("conn", "q", std::nullopt, json{{"database", "db"}}));
}

TEST(CacheKeyBuilderTest, KeyIsBase64OfCanonicalCbor) {
    // CBOR of {"connectionId":"c","query":"q"}: a2 6c "connectionId" 61 "c" 65 "query" 61 "q"
    EXPECT_EQ(CacheKeyBuilder::buildKey("c", "Q"), "omxjb25uZWN0aW9uSWRhY2VxdWVyeWFx");
}

TEST(CacheKeyBuilderTest, InvalidUtf8BytesStayDistinct) {
    EXPECT_NE(CacheKeyBuilder::buildKey("conn\xff", "q"), CacheKeyBuilder::buildKey("conn\xfe", "q"));
    // Latin-1 query text
    EXPECT_NE(CacheKeyBuilder::buildKey("c", "select '\xe4'"), CacheKeyBuilder::buildKey("c", "select '\xe9'"));
    EXPECT_NE(CacheKeyBuilder::buildKey("c", "q", std::string("db\xff")),
              CacheKeyBuilder::buildKey("c", "q", std::string("db\xfe")));
    EXPECT_NE(CacheKeyBuilder::buildKey("c", "q", std::nullopt, json{{"p", "\xff"}}),
              CacheKeyBuilder::buildKey("c", "q", std::nullopt, json{{"p", "\xfe"}}));
}
