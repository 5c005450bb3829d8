/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"
#include "support/builders.hpp"

#include <gtest/gtest.h>

using namespace kube_balance;

TEST(ObjectKeyTest, StrAndOrdering) {
    ObjectKey a{"default", "api-0"};
    ObjectKey b{"default", "api-1"};
    ObjectKey c{"batch", "zzz"};

    EXPECT_EQ(a.str(), "default/api-0");
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(c < a);
    EXPECT_EQ(a, (ObjectKey{"default", "api-0"}));
}

TEST(PodPhaseTest, ParseRoundTripsKnownPhases) {
    for (auto phase : {PodPhase::Pending, PodPhase::Running, PodPhase::Succeeded,
                       PodPhase::Failed, PodPhase::Unknown}) {
        EXPECT_EQ(parse_pod_phase(to_string(phase)), phase);
    }
    EXPECT_FALSE(parse_pod_phase("running").has_value());
}

TEST(OwnerKindTest, ParseIsCaseSensitiveAndClosed) {
    EXPECT_EQ(parse_owner_kind("ReplicaSet"), OwnerKind::ReplicaSet);
    EXPECT_EQ(parse_owner_kind("StatefulSet"), OwnerKind::StatefulSet);
    EXPECT_FALSE(parse_owner_kind("DaemonSet").has_value());
    EXPECT_FALSE(parse_owner_kind("Job").has_value());
    EXPECT_FALSE(parse_owner_kind("deployment").has_value());
}

TEST(NodeTest, DegradedIgnoresAnnotationValue) {
    Node node = test::make_node("n1");
    EXPECT_FALSE(node.is_degraded());

    node.annotations.emplace(std::string{kDegradedAnnotation}, "");
    EXPECT_TRUE(node.is_degraded());
}

TEST(PodTest, WorkloadTypeAndControllerReference) {
    Pod pod = test::make_pod("p", "n1", "batch");
    EXPECT_EQ(pod.workload_type(), "batch");
    EXPECT_EQ(pod.controller_reference(), nullptr);

    pod.owner_references.push_back({"Job", "not-controller", false});
    pod.owner_references.push_back({"ReplicaSet", "rs-1", true});
    ASSERT_NE(pod.controller_reference(), nullptr);
    EXPECT_EQ(pod.controller_reference()->name, "rs-1");

    Pod unlabelled = test::make_pod("q", "n1");
    EXPECT_FALSE(unlabelled.workload_type().has_value());
}
