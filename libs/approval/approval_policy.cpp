/**
 * @file approval_policy.cpp
 * @brief Approval policy v1 and the versioned policy factory
 */

#include "depimpact/approval_policy.hpp"

#include "depimpact/version.hpp"

#include <format>

namespace depimpact::approval {

std::string_view ApprovalPolicyV1::version() const noexcept
{
    return kApprovalPolicyVersion;
}

bool ApprovalPolicyV1::requires_approval(const aggregation::OverallImpact& overall,
                                         bool enumeration_truncated) const
{
    if (enumeration_truncated) {
        return true;
    }
    return overall.worst_impact_level >= pathing::ImpactLevel::kHigh;
}

depimpact::Result<std::unique_ptr<ApprovalPolicy>> make_approval_policy(std::string_view version)
{
    if (version == kApprovalPolicyVersion) {
        return std::make_unique<ApprovalPolicyV1>();
    }
    return std::unexpected(Error::make(
        "InvalidArgument",
        std::format("Unknown approval policy '{}' (supported: {})", version, kApprovalPolicyVersion)));
}

}  // namespace depimpact::approval
