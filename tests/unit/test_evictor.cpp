/**
 * @file test_evictor.cpp
 * @brief Unit tests for eviction outcome classification.
 */

#include "cluster/in_memory_cluster.hpp"
#include "rebalancer/evictor.hpp"
#include "support/builders.hpp"
#include "support/memory_sink.hpp"

#include <gtest/gtest.h>

using namespace kube_balance;
using namespace kube_balance::test;

class EvictorTest : public ::testing::Test {
protected:
    std::shared_ptr<CapturedLines> lines_ = std::make_shared<CapturedLines>();
    std::unique_ptr<Logger> logger_ = capturing_logger(lines_);
    InMemoryCluster cluster_;
    Evictor evictor_{cluster_, *logger_};
    Pod pod_ = make_pod("web-0", "n1");

    void SetUp() override { cluster_.upsert_pod(pod_); }
};

TEST_F(EvictorTest, SuccessUsesFixedGracePeriod) {
    auto result = evictor_.evict(pod_, {});
    EXPECT_EQ(result.outcome, EvictionOutcome::Evicted);
    EXPECT_FALSE(result.error.has_value());

    auto evictions = cluster_.evictions();
    ASSERT_EQ(evictions.size(), 1u);
    EXPECT_EQ(evictions[0].pod, pod_.key());
    EXPECT_EQ(evictions[0].node, "n1");
    EXPECT_EQ(evictions[0].grace_period, Seconds{30});
    EXPECT_TRUE(cluster_.pods().empty());
}

TEST_F(EvictorTest, TooManyRequestsIsRateLimited) {
    cluster_.inject_fault(InMemoryCluster::Operation::Evict,
                          ApiError{ApiError::Code::TooManyRequests, "disruption budget busy"});
    auto result = evictor_.evict(pod_, {});
    EXPECT_EQ(result.outcome, EvictionOutcome::RateLimited);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_TRUE(result.error->is_too_many_requests());
    EXPECT_EQ(cluster_.pods().size(), 1u);
}

TEST_F(EvictorTest, OtherErrorsAreFailures) {
    cluster_.inject_fault(InMemoryCluster::Operation::Evict,
                          ApiError{ApiError::Code::Internal, "etcd unavailable"});
    auto result = evictor_.evict(pod_, {});
    EXPECT_EQ(result.outcome, EvictionOutcome::Failed);
    EXPECT_TRUE(lines_->contains("etcd unavailable"));

    Pod ghost = make_pod("ghost", "n1");
    cluster_.clear_faults();
    EXPECT_EQ(evictor_.evict(ghost, {}).outcome, EvictionOutcome::Failed);
}

TEST_F(EvictorTest, CancelledToken) {
    std::stop_source source;
    source.request_stop();
    EXPECT_EQ(evictor_.evict(pod_, source.get_token()).outcome, EvictionOutcome::Cancelled);
    EXPECT_TRUE(cluster_.evictions().empty());
}
