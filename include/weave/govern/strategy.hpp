#pragma once

/// @file strategy.hpp
/// @brief Approval strategies and resolution states

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace weave_govern {

/// How many required approvers must sign off
enum class ApprovalStrategy : std::uint8_t {
    All = 0,   ///< Every required approver
    Any,       ///< At least one
    Majority,  ///< Strictly more than half
};

/// Lifecycle of a pending approval. Every state except Pending is terminal.
enum class ApprovalStatus : std::uint8_t {
    Pending = 0,
    Approved,
    Rejected,
    Timeout,
};

[[nodiscard]] const char* approval_strategy_name(ApprovalStrategy strategy);
[[nodiscard]] std::optional<ApprovalStrategy> parse_approval_strategy(const std::string& name);

[[nodiscard]] const char* approval_status_name(ApprovalStatus status);

/// @brief Strategy predicate over approval counts
///
/// An empty required set satisfies every strategy.
[[nodiscard]] bool strategy_satisfied(ApprovalStrategy strategy, std::size_t approved, std::size_t required);

} // namespace weave_govern
