#include <gtest/gtest.h>

#include "../qre/multi_matcher.hpp"
#include "../qre/qre_error.hpp"
#include "../lib/log.h"

using namespace qre;

class MultiMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    static MultiMatcher make(const std::vector<std::string>& patterns, bool strict) {
        return MultiMatcher(patterns, MatcherOptions(), strict);
    }
};

TEST_F(MultiMatcherTest, SearchAnyPattern) {
    MultiMatcher matcher = make({ "One", "Three" }, false);
    EXPECT_FALSE(matcher.search("Two"));
    EXPECT_TRUE(matcher.search("One Two"));
    EXPECT_TRUE(matcher.search("One Two Three"));
    EXPECT_FALSE(matcher.strict());
    EXPECT_EQ(matcher.matchers().size(), 2u);
}

TEST_F(MultiMatcherTest, SearchStrict) {
    MultiMatcher matcher = make({ "One", "Three" }, true);
    EXPECT_FALSE(matcher.search("Two"));
    EXPECT_FALSE(matcher.search("One Two")) << "strict needs every pattern to match";
    EXPECT_TRUE(matcher.search("One Two Three"));
}

TEST_F(MultiMatcherTest, NamedResultsMerge) {
    MultiMatcher matcher = make({ "Key [key:letters]", "Value [value:int]" }, false);

    MatchResult result = matcher.search("Key A");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.size(), 1u);
    EXPECT_EQ(result["key"], Value("A"));

    result = matcher.search("Key A, Value 1");
    ASSERT_TRUE(result);
    EXPECT_EQ(result["key"], Value("A"));
    EXPECT_EQ(result["value"], Value(1));
}

TEST_F(MultiMatcherTest, NamedResultsStrict) {
    MultiMatcher matcher = make({ "Key [key:letters]", "Value [value:int]" }, true);

    MatchResult result = matcher.search("Key A");
    EXPECT_FALSE(result);
    EXPECT_TRUE(result.named().empty()) << "strict failure carries no partial values";

    result = matcher.search("Key A, Value 1");
    ASSERT_TRUE(result);
    EXPECT_EQ(result["key"], Value("A"));
    EXPECT_EQ(result["value"], Value(1));
}

TEST_F(MultiMatcherTest, UnnamedResultsAppend) {
    MultiMatcher matcher = make({ "Key [:letters]", "Value [:int]" }, false);
    EXPECT_EQ(matcher.search("Key A").unnamed(), std::vector<Value>{ Value("A") });
    EXPECT_EQ(matcher.search("Key A, Value 1").unnamed(), (std::vector<Value>{ Value("A"), Value(1) }));
}

TEST_F(MultiMatcherTest, UnnamedResultsStrict) {
    MultiMatcher matcher = make({ "Key [:letters]", "Value [:int]" }, true);
    EXPECT_TRUE(matcher.search("Key A").unnamed().empty());
    EXPECT_EQ(matcher.search("Key A, Value 1").unnamed(), (std::vector<Value>{ Value("A"), Value(1) }));
}

TEST_F(MultiMatcherTest, OverlappingGroupNames) {
    MultiMatcher matcher = make({ "[value:int]", "[value:letters]" }, false);
    EXPECT_EQ(matcher.match("1")["value"], Value(1));
    EXPECT_EQ(matcher.match("A")["value"], Value("A"));
}

TEST_F(MultiMatcherTest, LaterPatternOverwrites) {
    MultiMatcher matcher = make({ "[v:int]*", "*[v:int]" }, false);
    MatchResult result = matcher.match("1 2");
    ASSERT_TRUE(result);
    EXPECT_EQ(result["v"], Value(2));
}

TEST_F(MultiMatcherTest, AnchoredModes) {
    MultiMatcher matcher = make({ "[a:int] *", "* [b:int]" }, true);
    MatchResult result = matcher.match("1 x 2");
    ASSERT_TRUE(result);
    EXPECT_EQ(result["a"], Value(1));
    EXPECT_EQ(result["b"], Value(2));

    MultiMatcher ends = make({ "abc", "xyz" }, false);
    EXPECT_TRUE(ends.match_start("abc..."));
    EXPECT_TRUE(ends.match_end("...xyz"));
    EXPECT_FALSE(ends.match_end("xyz..."));
}

TEST_F(MultiMatcherTest, SearchAll) {
    MultiMatcher matcher = make({ "a[n:int]", "b[n:int]" }, false);
    MatchResultList results = matcher.search_all("a1 b2 a3");
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results.all_values(), (std::vector<Value>{ Value(1), Value(3), Value(2) }))
        << "results of each pattern in turn";

    MultiMatcher strict = make({ "a[n:int]", "c[n:int]" }, true);
    EXPECT_TRUE(strict.search_all("a1 b2 a3").empty());
}

TEST_F(MultiMatcherTest, InvalidConstruction) {
    EXPECT_THROW(make({}, false), Error);
    EXPECT_THROW(make({ "ok", "[bad" }, false), PatternError);
}
