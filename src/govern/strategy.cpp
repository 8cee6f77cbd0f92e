/// @file strategy.cpp
/// @brief Approval strategy predicates

#include <weave/govern/strategy.hpp>

#include <algorithm>
#include <cctype>

namespace weave_govern {

const char* approval_strategy_name(ApprovalStrategy strategy) {
    switch (strategy) {
        case ApprovalStrategy::All: return "all";
        case ApprovalStrategy::Any: return "any";
        case ApprovalStrategy::Majority: return "majority";
    }
    return "unknown";
}

std::optional<ApprovalStrategy> parse_approval_strategy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "all") return ApprovalStrategy::All;
    if (lower == "any") return ApprovalStrategy::Any;
    if (lower == "majority") return ApprovalStrategy::Majority;
    return std::nullopt;
}

const char* approval_status_name(ApprovalStatus status) {
    switch (status) {
        case ApprovalStatus::Pending: return "pending";
        case ApprovalStatus::Approved: return "approved";
        case ApprovalStatus::Rejected: return "rejected";
        case ApprovalStatus::Timeout: return "timeout";
    }
    return "unknown";
}

bool strategy_satisfied(ApprovalStrategy strategy, std::size_t approved, std::size_t required) {
    if (required == 0) {
        return true;
    }

    switch (strategy) {
        case ApprovalStrategy::All:
            return approved >= required;
        case ApprovalStrategy::Any:
            return approved >= 1;
        case ApprovalStrategy::Majority:
            return approved * 2 > required;
    }
    return false;
}

} // namespace weave_govern
