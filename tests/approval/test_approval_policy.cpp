/**
 * @file test_approval_policy.cpp
 * @brief v1 approval rules and policy lookup
 */

#include "depimpact/approval_policy.hpp"

#include <gtest/gtest.h>

namespace depimpact::approval::test {

namespace {

using aggregation::OverallImpact;
using pathing::ImpactLevel;

OverallImpact at_level(ImpactLevel level)
{
    OverallImpact overall;
    overall.worst_impact_level = level;
    return overall;
}

TEST(ApprovalPolicyV1, HighAndCriticalRequireApproval)
{
    const ApprovalPolicyV1 policy;
    EXPECT_FALSE(policy.requires_approval(at_level(ImpactLevel::kNone), false));
    EXPECT_FALSE(policy.requires_approval(at_level(ImpactLevel::kLow), false));
    EXPECT_FALSE(policy.requires_approval(at_level(ImpactLevel::kMedium), false));
    EXPECT_TRUE(policy.requires_approval(at_level(ImpactLevel::kHigh), false));
    EXPECT_TRUE(policy.requires_approval(at_level(ImpactLevel::kCritical), false));
}

TEST(ApprovalPolicyV1, TruncationAlwaysRequiresApproval)
{
    const ApprovalPolicyV1 policy;
    EXPECT_TRUE(policy.requires_approval(at_level(ImpactLevel::kNone), true));
    EXPECT_TRUE(policy.requires_approval(at_level(ImpactLevel::kLow), true));
    EXPECT_TRUE(policy.requires_approval(at_level(ImpactLevel::kMedium), true));
}

TEST(ApprovalPolicy, LookupByVersion)
{
    auto policy = make_approval_policy("approval.v1");
    ASSERT_TRUE(policy);
    ASSERT_NE(*policy, nullptr);
    EXPECT_EQ((*policy)->version(), "approval.v1");

    auto unknown = make_approval_policy("approval.v9");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, "InvalidArgument");
}

}  // namespace

}  // namespace depimpact::approval::test
