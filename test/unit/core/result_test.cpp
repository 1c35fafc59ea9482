#include <gtest/gtest.h>
#include "querygen/core/result.h"
#include "querygen/core/types.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace querygen {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int64_t>::error("error parsing response JSON: missing traces");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "error parsing response JSON: missing traces");
}

TEST(ResultTest, ErrorOfOkResultThrows) {
    Result<std::string> result("ok");
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, MoveConstruction) {
    std::vector<PlanEntry> entries = {{"q1", "recent"}, {"q1", "immediate"}};
    Result<std::vector<PlanEntry>> original(entries);
    Result<std::vector<PlanEntry>> moved(std::move(original));

    ASSERT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), entries);
}

TEST(ResultTest, MoveAssignmentCarriesError) {
    Result<std::string> target("value");
    target = Result<std::string>::error("Connection refused");
    EXPECT_FALSE(target.ok());
    EXPECT_EQ(target.error(), "Connection refused");
}

TEST(ResultTest, TakeValue) {
    Result<std::string> result("payload");
    std::string value = result.take_value();
    EXPECT_EQ(value, "payload");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());
    EXPECT_THROW(ok.error(), std::runtime_error);

    auto failed = Result<void>::error("bearer token is empty");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error(), "bearer token is empty");
}

} // namespace
} // namespace core
} // namespace querygen
