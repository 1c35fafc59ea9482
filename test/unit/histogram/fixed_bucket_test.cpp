#include <gtest/gtest.h>
#include "querygen/histogram/histogram.h"
#include "querygen/core/error.h"
#include <cmath>
#include <thread>

namespace querygen {
namespace histogram {
namespace {

class FixedBucketTest : public ::testing::Test {
protected:
    void SetUp() override {
        bounds_ = {0.0, 10.0, 50.0, 100.0};
        hist_ = FixedBucketHistogram::create(bounds_);
    }

    std::vector<core::Value> bounds_;
    std::unique_ptr<FixedBucketHistogram> hist_;
};

TEST_F(FixedBucketTest, EmptyHistogram) {
    EXPECT_EQ(hist_->count(), 0u);
    EXPECT_EQ(hist_->sum(), 0.0);
    EXPECT_FALSE(hist_->min().has_value());
    EXPECT_FALSE(hist_->max().has_value());
    EXPECT_EQ(hist_->quantile(0.5), 0.0);

    auto buckets = hist_->buckets();
    ASSERT_EQ(buckets.size(), bounds_.size() + 1);
    EXPECT_TRUE(std::isinf(buckets.back().upper_bound));
}

TEST_F(FixedBucketTest, UpperBoundsAreInclusive) {
    hist_->add(0.0);
    hist_->add(10.0);
    hist_->add(10.5);
    hist_->add(100.0);
    hist_->add(250.0);

    auto buckets = hist_->buckets();
    EXPECT_EQ(buckets[0].count, 1u);   // le 0
    EXPECT_EQ(buckets[1].count, 1u);   // le 10
    EXPECT_EQ(buckets[2].count, 1u);   // le 50
    EXPECT_EQ(buckets[3].count, 1u);   // le 100
    EXPECT_EQ(buckets[4].count, 1u);   // +Inf

    EXPECT_EQ(hist_->count(), 5u);
    EXPECT_DOUBLE_EQ(hist_->sum(), 370.5);
    EXPECT_EQ(*hist_->min(), 0.0);
    EXPECT_EQ(*hist_->max(), 250.0);
}

TEST_F(FixedBucketTest, RepeatedValuesShareBucket) {
    for (int i = 0; i < 4; ++i) {
        hist_->add(20.0);
    }
    EXPECT_EQ(hist_->count(), 4u);
    EXPECT_DOUBLE_EQ(hist_->sum(), 80.0);
    EXPECT_EQ(hist_->buckets()[2].count, 4u);
}

TEST_F(FixedBucketTest, QuantileStaysWithinObservedRange) {
    for (int i = 1; i <= 100; ++i) {
        hist_->add(static_cast<double>(i) * 0.5);   // 0.5 .. 50
    }
    double p50 = hist_->quantile(0.5);
    double p99 = hist_->quantile(0.99);
    EXPECT_GE(p50, 10.0);
    EXPECT_LE(p50, 50.0);
    EXPECT_LE(p50, p99);
    EXPECT_LE(p99, 50.0);
    EXPECT_EQ(hist_->quantile(1.0), 50.0);
    EXPECT_THROW(hist_->quantile(1.5), core::InvalidArgumentError);
}

TEST_F(FixedBucketTest, ConcurrentAdds) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 1000; ++i) {
                hist_->add(1.0);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(hist_->count(), 4000u);
    EXPECT_EQ(hist_->buckets()[1].count, 4000u);
}

TEST(FixedBucketCreateTest, InvalidBounds) {
    EXPECT_THROW(FixedBucketHistogram::create({}), core::InvalidArgumentError);
    EXPECT_THROW(FixedBucketHistogram::create({1.0, 0.5}), core::InvalidArgumentError);
    EXPECT_THROW(FixedBucketHistogram::create({1.0, 1.0}), core::InvalidArgumentError);
    EXPECT_NO_THROW(FixedBucketHistogram::create(FixedBucketHistogram::DefaultBounds()));
}

} // namespace
} // namespace histogram
} // namespace querygen
