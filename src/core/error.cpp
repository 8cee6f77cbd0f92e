/// @file error.cpp
/// @brief Error handling implementation for weave_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Process-wide error statistics

#include <weave/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace weave_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_graph_error(const GraphError& err) {
    std::ostringstream oss;
    oss << (err.kind == GraphError::Kind::Cycle ? "[Cycle] " : "[SelfDependency] ")
        << err.message;

    if (!err.node.empty()) {
        oss << " (node: " << err.node << ")";
    }
    if (!err.dependency.empty() && err.dependency != err.node) {
        oss << " (dependency: " << err.dependency << ")";
    }

    return oss.str();
}

std::string format_ledger_error(const LedgerError& err) {
    std::ostringstream oss;
    oss << "[LedgerError] " << err.message;
    return oss.str();
}

std::string format_approval_error(const ApprovalError& err) {
    std::ostringstream oss;
    oss << "[ApprovalError] " << err.message;

    if (!err.request_id.empty()) {
        oss << " (request: " << err.request_id << ")";
    }
    if (!err.approver.empty()) {
        oss << " (approver: " << err.approver << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, GraphError>) {
            oss << detail::format_graph_error(err);
        } else if constexpr (std::is_same_v<T, LedgerError>) {
            oss << detail::format_ledger_error(err);
        } else if constexpr (std::is_same_v<T, ApprovalError>) {
            oss << detail::format_approval_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> graph_errors{0};
    std::atomic<std::uint64_t> ledger_errors{0};
    std::atomic<std::uint64_t> approval_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<GraphError>()) {
        s_error_stats.graph_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<LedgerError>()) {
        s_error_stats.ledger_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ApprovalError>()) {
        s_error_stats.approval_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t graph_error_count() {
    return s_error_stats.graph_errors.load(std::memory_order_relaxed);
}

std::uint64_t approval_error_count() {
    return s_error_stats.approval_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.graph_errors.store(0, std::memory_order_relaxed);
    s_error_stats.ledger_errors.store(0, std::memory_order_relaxed);
    s_error_stats.approval_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Graph: " << s_error_stats.graph_errors.load() << "\n"
        << "  Ledger: " << s_error_stats.ledger_errors.load() << "\n"
        << "  Approval: " << s_error_stats.approval_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace weave_core
