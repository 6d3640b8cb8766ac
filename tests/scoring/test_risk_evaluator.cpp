/**
 * @file test_risk_evaluator.cpp
 * @brief Path scoring: formula, rounding, depth decay, classification
 */

#include "depimpact/risk_evaluator.hpp"

#include <cstddef>
#include <vector>

#include <gtest/gtest.h>

namespace depimpact::scoring::test {

namespace {

using graph::DependencyType;
using graph::EntityRef;
using graph::EntityType;
using pathing::DependencyPath;
using pathing::ImpactLevel;

/// Unscored path of @p depth hops whose every edge is @p type.
DependencyPath make_path(int depth, DependencyType type, int criticality)
{
    DependencyPath path;
    for (int i = 0; i <= depth; ++i) {
        path.nodes.push_back(EntityRef{.type = i == 0 ? EntityType::kTable : EntityType::kView,
                                       .id = i + 1,
                                       .name = {}});
    }
    path.edges.assign(static_cast<std::size_t>(depth), type);
    path.depth = depth;
    path.max_dependency_type = type;
    path.max_criticality_level = criticality;
    path.path_id = pathing::make_path_id(path.nodes);
    return path;
}

constexpr DependencyType kAllDependencyTypes[] = {DependencyType::kUnknown,
                                                  DependencyType::kSelect,
                                                  DependencyType::kInsert,
                                                  DependencyType::kUpdate,
                                                  DependencyType::kDelete,
                                                  DependencyType::kSchemaDependency,
                                                  DependencyType::kApiCall,
                                                  DependencyType::kLogicalFk};
constexpr ChangeType kAllChangeTypes[] = {ChangeType::kCreate,
                                          ChangeType::kModify,
                                          ChangeType::kDelete};

TEST(PathRiskEvaluator, DeleteOfCriticalDirectDependentIsCritical)
{
    const PathRiskEvaluator evaluator;
    auto scored = evaluator.evaluate(make_path(1, DependencyType::kDelete, 5), ChangeType::kDelete);
    ASSERT_TRUE(scored);
    EXPECT_EQ(scored->risk_score, 150);
    EXPECT_EQ(scored->impact_level, ImpactLevel::kCritical);
    EXPECT_EQ(scored->dominant_dependency_type, DependencyType::kDelete);
    EXPECT_EQ(scored->dominant_entity.id, 2);
}

TEST(PathRiskEvaluator, DistantReadOnCreateIsLow)
{
    const PathRiskEvaluator evaluator;
    // 4 x 1 x 3 x 0.6 = 7.2
    auto scored = evaluator.evaluate(make_path(3, DependencyType::kSelect, 3), ChangeType::kCreate);
    ASSERT_TRUE(scored);
    EXPECT_EQ(scored->risk_score, 7);
    EXPECT_EQ(scored->impact_level, ImpactLevel::kLow);
}

TEST(PathRiskEvaluator, WeightsAndMultipliersMatchPolicy)
{
    const PathRiskEvaluator evaluator;
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kDelete), 10);
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kSchemaDependency), 9);
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kUpdate), 8);
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kInsert), 7);
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kApiCall), 6);
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kLogicalFk), 6);
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kUnknown), 5);
    EXPECT_EQ(evaluator.dependency_weight(DependencyType::kSelect), 4);

    EXPECT_EQ(evaluator.change_multiplier(ChangeType::kDelete), 3);
    EXPECT_EQ(evaluator.change_multiplier(ChangeType::kModify), 2);
    EXPECT_EQ(evaluator.change_multiplier(ChangeType::kCreate), 1);
    EXPECT_EQ(evaluator.version(), "v1.0");
}

TEST(PathRiskEvaluator, DepthFactorDecaysToFloor)
{
    const PathRiskEvaluator evaluator;
    EXPECT_DOUBLE_EQ(evaluator.depth_factor(1), 1.0);
    EXPECT_DOUBLE_EQ(evaluator.depth_factor(2), 0.8);
    EXPECT_DOUBLE_EQ(evaluator.depth_factor(3), 0.6);
    EXPECT_DOUBLE_EQ(evaluator.depth_factor(5), 0.2);
    for (int depth = 6; depth <= 40; ++depth) {
        EXPECT_DOUBLE_EQ(evaluator.depth_factor(depth), 0.2) << "depth " << depth;
    }
}

TEST(PathRiskEvaluator, ScoreNeverIncreasesWithDepth)
{
    const PathRiskEvaluator evaluator;
    for (auto type : kAllDependencyTypes) {
        for (auto change : kAllChangeTypes) {
            for (int criticality = graph::kMinCriticality; criticality <= graph::kMaxCriticality;
                 ++criticality) {
                int previous = -1;
                for (int depth = 1; depth <= 8; ++depth) {
                    auto scored = evaluator.evaluate(make_path(depth, type, criticality), change);
                    ASSERT_TRUE(scored);
                    EXPECT_GE(scored->risk_score, 0);
                    if (previous >= 0) {
                        EXPECT_LE(scored->risk_score, previous);
                    }
                    previous = scored->risk_score;
                }
            }
        }
    }
}

TEST(PathRiskEvaluator, ClassificationBoundaries)
{
    const PathRiskEvaluator evaluator;
    EXPECT_EQ(evaluator.classify_impact(0), ImpactLevel::kNone);
    EXPECT_EQ(evaluator.classify_impact(1), ImpactLevel::kLow);
    EXPECT_EQ(evaluator.classify_impact(14), ImpactLevel::kLow);
    EXPECT_EQ(evaluator.classify_impact(15), ImpactLevel::kMedium);
    EXPECT_EQ(evaluator.classify_impact(29), ImpactLevel::kMedium);
    EXPECT_EQ(evaluator.classify_impact(30), ImpactLevel::kHigh);
    EXPECT_EQ(evaluator.classify_impact(49), ImpactLevel::kHigh);
    EXPECT_EQ(evaluator.classify_impact(50), ImpactLevel::kCritical);
    EXPECT_EQ(evaluator.classify_impact(1000), ImpactLevel::kCritical);
}

TEST(PathRiskEvaluator, EvaluateIsPureAndRepeatable)
{
    const PathRiskEvaluator evaluator;
    const auto path = make_path(2, DependencyType::kUpdate, 4);
    auto first = evaluator.evaluate(path, ChangeType::kModify);
    auto second = evaluator.evaluate(path, ChangeType::kModify);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->risk_score, second->risk_score);
    EXPECT_EQ(first->impact_level, second->impact_level);

    // Input untouched; re-scoring under another change type works on the same value.
    EXPECT_EQ(path.risk_score, 0);
    auto hypothetical = evaluator.evaluate(path, ChangeType::kCreate);
    ASSERT_TRUE(hypothetical);
    EXPECT_LT(hypothetical->risk_score, first->risk_score);
}

TEST(PathRiskEvaluator, RoundsHalfAwayFromZero)
{
    auto policy = make_policy_v1();
    policy.version = "test.half";
    policy.depth_decay_permille = 500;
    policy.depth_factor_floor_permille = 100;
    auto evaluator = PathRiskEvaluator::from_snapshot(policy);
    ASSERT_TRUE(evaluator);

    // 5 x 1 x 1 x 0.5 = 2.5
    auto scored = evaluator->evaluate(make_path(2, DependencyType::kUnknown, 1), ChangeType::kCreate);
    ASSERT_TRUE(scored);
    EXPECT_EQ(scored->risk_score, 3);
}

TEST(PathRiskEvaluator, UnlistedDependencyTypeUsesDefaultWeight)
{
    auto policy = make_policy_v1();
    policy.dependency_weights.erase(DependencyType::kApiCall);
    auto evaluator = PathRiskEvaluator::from_snapshot(policy);
    ASSERT_TRUE(evaluator);
    EXPECT_EQ(evaluator->dependency_weight(DependencyType::kApiCall),
              policy.default_dependency_weight);
}

TEST(PathRiskEvaluator, RejectsDegeneratePaths)
{
    const PathRiskEvaluator evaluator;

    DependencyPath empty;
    auto no_nodes = evaluator.evaluate(empty, ChangeType::kModify);
    ASSERT_FALSE(no_nodes);
    EXPECT_EQ(no_nodes.error().code, "InvalidArgument");

    auto root_only = make_path(0, DependencyType::kSelect, 3);
    auto zero_depth = evaluator.evaluate(root_only, ChangeType::kModify);
    ASSERT_FALSE(zero_depth);
    EXPECT_EQ(zero_depth.error().code, "InvalidArgument");

    auto mismatched = make_path(2, DependencyType::kSelect, 3);
    mismatched.edges.pop_back();
    auto bad_shape = evaluator.evaluate(mismatched, ChangeType::kModify);
    ASSERT_FALSE(bad_shape);
    EXPECT_EQ(bad_shape.error().code, "InvalidArgument");
}

TEST(ChangeType, ParsesCaseInsensitively)
{
    EXPECT_EQ(parse_change_type("delete").value(), ChangeType::kDelete);
    EXPECT_EQ(parse_change_type("MODIFY").value(), ChangeType::kModify);
    EXPECT_EQ(parse_change_type("Create").value(), ChangeType::kCreate);
    auto bad = parse_change_type("Rename");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, "InvalidArgument");
}

}  // namespace

}  // namespace depimpact::scoring::test
