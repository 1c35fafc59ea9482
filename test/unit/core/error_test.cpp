#include <gtest/gtest.h>
#include "querygen/core/error.h"
#include <string>

namespace querygen {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, DefaultCodeIsUnknown) {
    Error error("something broke");
    EXPECT_EQ(error.code(), Error::Code::UNKNOWN);
}

TEST(ErrorTest, CopyKeepsCode) {
    NotFoundError original("Unknown time bucket: ancient");
    Error copy(original);

    EXPECT_EQ(copy.code(), Error::Code::NOT_FOUND);
    EXPECT_EQ(copy.what(), std::string("Unknown time bucket: ancient"));
}

TEST(ErrorTest, SpecificErrorTypes) {
    InvalidArgumentError invalid_arg("targetQPS must be > 0");
    EXPECT_EQ(invalid_arg.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(invalid_arg.what(), std::string("targetQPS must be > 0"));

    NotFoundError not_found("Query 'q9' is not part of the execution plan");
    EXPECT_EQ(not_found.code(), Error::Code::NOT_FOUND);

    InternalError internal("Executor already started");
    EXPECT_EQ(internal.code(), Error::Code::INTERNAL);
}

TEST(ErrorTest, CaughtAsStdException) {
    try {
        throw InvalidArgumentError("No executionPlan defined in configuration");
    } catch (const std::exception& e) {
        EXPECT_EQ(std::string(e.what()), "No executionPlan defined in configuration");
        return;
    }
    FAIL() << "exception not caught";
}

TEST(ErrorTest, CaughtAsBase) {
    try {
        throw NotFoundError("missing");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::NOT_FOUND);
    }
}

} // namespace
} // namespace core
} // namespace querygen
