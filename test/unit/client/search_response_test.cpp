#include <gtest/gtest.h>
#include "querygen/client/search_response.h"

namespace querygen {
namespace client {
namespace {

int64_t Count(const std::string& body) {
    auto result = CountSpans(body);
    EXPECT_TRUE(result.ok()) << result.error();
    return result.ok() ? result.value() : -1;
}

TEST(SearchResponseTest, CountsSpanSetsAndSpanSet) {
    const std::string body = R"({
      "traces": [
        { "traceID": "a", "spanSets": [ { "spans": [ {}, {} ] }, { "spans": [ {} ] } ] },
        { "traceID": "b", "spanSet": { "spans": [ {}, {}, {}, {} ] } },
        { "traceID": "c", "spanSets": [ { "spans": [ {} ] } ], "spanSet": { "spans": [ {} ] } }
      ],
      "metrics": { "inspectedTraces": 10 }
    })";
    EXPECT_EQ(Count(body), 9);
}

TEST(SearchResponseTest, EmptyOrMissingTraces) {
    EXPECT_EQ(Count(R"({"traces": []})"), 0);
    EXPECT_EQ(Count(R"({"traces": null})"), 0);
    EXPECT_EQ(Count(R"({"metrics": {}})"), 0);
    EXPECT_EQ(Count(R"({"traces": [ { "traceID": "x" } ]})"), 0);
}

TEST(SearchResponseTest, IgnoresMalformedSpanContainers) {
    EXPECT_EQ(Count(R"({"traces": [ { "spanSets": { "spans": [ {} ] } }, { "spanSet": { "spans": 3 } } ]})"), 0);
}

TEST(SearchResponseTest, ParseFailures) {
    EXPECT_FALSE(CountSpans("").ok());
    EXPECT_FALSE(CountSpans("not json").ok());
    EXPECT_FALSE(CountSpans("[1, 2]").ok());
    EXPECT_FALSE(CountSpans(R"({"traces": "many"})").ok());

    auto result = CountSpans("{\"traces\": [");
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.error().find("error parsing response JSON"), std::string::npos);
}

} // namespace
} // namespace client
} // namespace querygen
