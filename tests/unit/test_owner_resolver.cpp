/**
 * @file test_owner_resolver.cpp
 * @brief Unit tests for pod owner resolution.
 */

#include "cluster/in_memory_cluster.hpp"
#include "rebalancer/owner_resolver.hpp"
#include "support/builders.hpp"

#include <gtest/gtest.h>

using namespace kube_balance;
using namespace kube_balance::test;

class OwnerResolverTest : public ::testing::Test {
protected:
    InMemoryCluster cluster_;

    void SetUp() override {
        cluster_.upsert_owner(make_owner(OwnerKind::Deployment, "web"));
        cluster_.upsert_owner(make_owner(OwnerKind::StatefulSet, "db"));

        Owner rs = make_owner(OwnerKind::ReplicaSet, "web-5c8f");
        rs.owner_references.push_back({"Deployment", "web", true});
        cluster_.upsert_owner(rs);

        cluster_.upsert_owner(make_owner(OwnerKind::ReplicaSet, "bare-rs"));
    }

    ApiResult<std::optional<Owner>> resolve(const Pod& pod) {
        return resolve_owner(cluster_, pod, {});
    }
};

TEST_F(OwnerResolverTest, DeploymentAndStatefulSetAreDirect) {
    auto deploy = resolve(owned_by(make_pod("p", "n1"), "Deployment", "web"));
    ASSERT_TRUE(deploy.has_value());
    ASSERT_TRUE(deploy->has_value());
    EXPECT_EQ((*deploy)->kind, OwnerKind::Deployment);

    auto sts = resolve(owned_by(make_pod("db-0", "n1"), "StatefulSet", "db"));
    ASSERT_TRUE(sts.has_value() && sts->has_value());
    EXPECT_EQ((*sts)->name, "db");
    EXPECT_EQ(cluster_.call_count(InMemoryCluster::Operation::GetOwner), 2u);
}

TEST_F(OwnerResolverTest, ReplicaSetResolvesToItsDeployment) {
    auto owner = resolve(owned_by(make_pod("web-5c8f-abcde", "n1"), "ReplicaSet", "web-5c8f"));
    ASSERT_TRUE(owner.has_value() && owner->has_value());
    EXPECT_EQ((*owner)->kind, OwnerKind::Deployment);
    EXPECT_EQ((*owner)->name, "web");
    EXPECT_EQ(cluster_.call_count(InMemoryCluster::Operation::GetOwner), 2u);
}

TEST_F(OwnerResolverTest, ReplicaSetWithoutDeploymentIsTerminal) {
    auto owner = resolve(owned_by(make_pod("bare-rs-xyz", "n1"), "ReplicaSet", "bare-rs"));
    ASSERT_TRUE(owner.has_value() && owner->has_value());
    EXPECT_EQ((*owner)->kind, OwnerKind::ReplicaSet);
    EXPECT_EQ((*owner)->name, "bare-rs");
}

TEST_F(OwnerResolverTest, NoControllerOrUnsupportedKindIsNoOwner) {
    auto orphan = resolve(make_pod("orphan", "n1"));
    ASSERT_TRUE(orphan.has_value());
    EXPECT_FALSE(orphan->has_value());

    auto job = resolve(owned_by(make_pod("job-pod", "n1"), "Job", "nightly"));
    ASSERT_TRUE(job.has_value());
    EXPECT_FALSE(job->has_value());

    Pod non_controller = make_pod("p", "n1");
    non_controller.owner_references.push_back({"Deployment", "web", false});
    auto none = resolve(non_controller);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none->has_value());

    EXPECT_EQ(cluster_.call_count(InMemoryCluster::Operation::GetOwner), 0u);
}

TEST_F(OwnerResolverTest, FetchFailureIsAnErrorNotNoOwner) {
    auto missing = resolve(owned_by(make_pod("p", "n1"), "Deployment", "gone"));
    ASSERT_FALSE(missing.has_value());
    EXPECT_TRUE(missing.error().is_not_found());

    cluster_.inject_fault(InMemoryCluster::Operation::GetOwner,
                          ApiError{ApiError::Code::Timeout, "apiserver timeout"}, "web");
    auto parent_fails = resolve(owned_by(make_pod("web-5c8f-abcde", "n1"), "ReplicaSet", "web-5c8f"));
    ASSERT_FALSE(parent_fails.has_value());
    EXPECT_EQ(parent_fails.error().code, ApiError::Code::Timeout);
}

TEST_F(OwnerResolverTest, CancelledTokenPropagates) {
    std::stop_source source;
    source.request_stop();
    auto owner = resolve_owner(cluster_, owned_by(make_pod("p", "n1"), "Deployment", "web"),
                               source.get_token());
    ASSERT_FALSE(owner.has_value());
    EXPECT_TRUE(owner.error().is_cancelled());
}
