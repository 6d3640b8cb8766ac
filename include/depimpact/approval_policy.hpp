#pragma once

/**
 * @file approval_policy.hpp
 * @brief Manual-approval decision, versioned independently of scoring
 */

#include "depimpact/aggregator.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace depimpact::approval {

class ApprovalPolicy
{
public:
    virtual ~ApprovalPolicy() = default;

    [[nodiscard]] virtual std::string_view version() const noexcept = 0;

    /**
     * @param overall Aggregated impact
     * @param enumeration_truncated Whether path enumeration stopped at max_paths
     */
    [[nodiscard]] virtual bool requires_approval(const aggregation::OverallImpact& overall,
                                                 bool enumeration_truncated) const = 0;
};

/**
 * Rules:
 * - High or Critical worst-case impact requires approval.
 * - A truncated enumeration requires approval; it cannot prove lower risk.
 * - Medium and below otherwise do not.
 */
class ApprovalPolicyV1 final : public ApprovalPolicy
{
public:
    [[nodiscard]] std::string_view version() const noexcept override;
    [[nodiscard]] bool requires_approval(const aggregation::OverallImpact& overall,
                                         bool enumeration_truncated) const override;
};

/// @return Policy for @p version, or InvalidArgument for an unknown version
[[nodiscard]] depimpact::Result<std::unique_ptr<ApprovalPolicy>>
make_approval_policy(std::string_view version);

}  // namespace depimpact::approval
