#pragma once

/// @file yield_handler.hpp
/// @brief Multi-party approval coordinator for Yield turns
///
/// The requester blocks in request_approval() while approvers, on other
/// threads, call approve()/reject() with the same request id. Each request owns
/// its own mutex and condition variable; the table lock is never held while a
/// request lock is taken.
///
/// ```cpp
/// weave_govern::YieldHandler<std::string> handler;
/// handler.on_rejected([](const auto& turn, const auto& who, const auto& why) {
///     spdlog::warn("{} vetoed by {}: {}", turn.id().str(), who, why);
/// });
///
/// std::thread approver([&] { (void)handler.approve(turn.id(), "alice"); });
/// auto result = handler.request_approval(turn, std::chrono::seconds(30));
/// approver.join();
/// ```

#include <weave/core/error.hpp>
#include <weave/core/id.hpp>
#include <weave/core/log.hpp>
#include <weave/govern/strategy.hpp>
#include <weave/turn/turn.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace weave_govern {

using weave_core::EventId;
using weave_turn::YieldTurn;

// =============================================================================
// ApprovalResult
// =============================================================================

/// Outcome handed back to the requester
template<typename T>
struct ApprovalResult {
    ApprovalStatus status;
    YieldTurn<T> turn;                       ///< Turn with every approval received
    std::optional<std::string> rejected_by;
    std::optional<std::string> reason;

    [[nodiscard]] bool approved() const noexcept { return status == ApprovalStatus::Approved; }
};

// =============================================================================
// YieldHandler
// =============================================================================

template<typename T>
class YieldHandler {
public:
    using ApprovedCallback = std::function<void(const YieldTurn<T>&)>;
    using RejectedCallback = std::function<void(const YieldTurn<T>&, const std::string& rejector,
                                                const std::string& reason)>;
    using TimeoutCallback = std::function<void(const YieldTurn<T>&)>;

    YieldHandler() = default;

    YieldHandler(const YieldHandler&) = delete;
    YieldHandler& operator=(const YieldHandler&) = delete;

    // ==========================================================================
    // Requests
    // ==========================================================================

    /// @brief Register a yield and block until it resolves
    ///
    /// Returns immediately when the strategy already holds. Otherwise waits
    /// for approval, any rejection, or the timeout (no timeout waits forever).
    /// @return ApprovalError::already_pending if the id is in flight
    [[nodiscard]] weave_core::Result<ApprovalResult<T>> request_approval(
        const YieldTurn<T>& turn,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt,
        ApprovalStrategy strategy = ApprovalStrategy::All) {
        auto pending = std::make_shared<PendingApproval>(turn, strategy);
        const EventId id = turn.id();

        // Once registered, status belongs to approvers and is only read under
        // the request lock.
        bool registered = false;
        {
            std::lock_guard lock(m_table_mutex);
            if (m_pending.count(id) > 0) {
                weave_core::Error error(weave_core::ApprovalError::already_pending(id.str()));
                weave_core::governance_logger()->warn("{}", error.message());
                weave_core::debug::record_error(error);
                return weave_core::Err<ApprovalResult<T>>(std::move(error));
            }

            if (pending->satisfied()) {
                pending->status = ApprovalStatus::Approved;
            } else {
                m_pending.emplace(id, pending);
                registered = true;
            }
        }

        if (registered) {
            weave_core::governance_logger()->debug("Waiting on {} ({}, {} required)", id.str(),
                                                   approval_strategy_name(strategy),
                                                   turn.required_approvers().size());
        }

        std::unique_lock request_lock(pending->mutex);
        auto resolved = [&pending] { return pending->status != ApprovalStatus::Pending; };
        if (timeout) {
            if (!pending->cv.wait_for(request_lock, *timeout, resolved)) {
                pending->status = ApprovalStatus::Timeout;
            }
        } else {
            pending->cv.wait(request_lock, resolved);
        }

        ApprovalResult<T> result{pending->status, pending->turn, pending->rejected_by, pending->reason};
        request_lock.unlock();

        {
            std::lock_guard lock(m_table_mutex);
            auto it = m_pending.find(id);
            if (it != m_pending.end() && it->second == pending) {
                m_pending.erase(it);
            }
        }

        weave_core::governance_logger()->info("Yield {} resolved: {}", id.str(),
                                              approval_status_name(result.status));
        dispatch(result);
        return weave_core::Ok(std::move(result));
    }

    /// @brief Record one approval
    ///
    /// Wakes the requester once the strategy holds.
    /// @return false for unknown or already resolved ids,
    ///         ApprovalError::invalid_approver if approver is not required
    [[nodiscard]] weave_core::Result<bool> approve(const EventId& id, const std::string& approver) {
        auto pending = lookup(id);
        if (!pending) {
            return weave_core::Ok(false);
        }

        std::lock_guard lock(pending->mutex);
        if (pending->status != ApprovalStatus::Pending) {
            return weave_core::Ok(false);
        }

        auto next = pending->turn.approve(approver);
        if (!next) {
            weave_core::governance_logger()->warn("{}", next.error().message());
            weave_core::debug::record_error(next.error());
            return weave_core::Err<bool>(next.error());
        }

        pending->turn = std::move(*next);
        weave_core::governance_logger()->debug("{} approved {} ({}/{})", approver, id.str(),
                                               pending->turn.approved_by().size(),
                                               pending->turn.required_approvers().size());

        if (pending->satisfied()) {
            pending->status = ApprovalStatus::Approved;
            pending->cv.notify_all();
        }
        return weave_core::Ok(true);
    }

    /// @brief Veto a request regardless of strategy
    /// @return false for unknown or already resolved ids
    bool reject(const EventId& id, const std::string& rejector, const std::string& reason = {}) {
        auto pending = lookup(id);
        if (!pending) {
            return false;
        }

        std::lock_guard lock(pending->mutex);
        if (pending->status != ApprovalStatus::Pending) {
            return false;
        }

        pending->status = ApprovalStatus::Rejected;
        pending->rejected_by = rejector;
        pending->reason = reason;
        pending->cv.notify_all();

        weave_core::governance_logger()->debug("{} rejected {}: {}", rejector, id.str(), reason);
        return true;
    }

    // ==========================================================================
    // Queries
    // ==========================================================================

    /// Snapshot of every unresolved request
    [[nodiscard]] std::vector<YieldTurn<T>> list_pending() const {
        std::vector<std::shared_ptr<PendingApproval>> entries;
        {
            std::lock_guard lock(m_table_mutex);
            entries.reserve(m_pending.size());
            for (const auto& [id, pending] : m_pending) {
                entries.push_back(pending);
            }
        }

        std::vector<YieldTurn<T>> result;
        result.reserve(entries.size());
        for (const auto& pending : entries) {
            std::lock_guard lock(pending->mutex);
            if (pending->status == ApprovalStatus::Pending) {
                result.push_back(pending->turn);
            }
        }
        return result;
    }

    [[nodiscard]] bool is_pending(const EventId& id) const {
        auto pending = lookup(id);
        if (!pending) {
            return false;
        }
        std::lock_guard lock(pending->mutex);
        return pending->status == ApprovalStatus::Pending;
    }

    [[nodiscard]] std::size_t pending_count() const {
        std::lock_guard lock(m_table_mutex);
        return m_pending.size();
    }

    // ==========================================================================
    // Callbacks
    // ==========================================================================

    void on_approved(ApprovedCallback callback) {
        std::lock_guard lock(m_callback_mutex);
        m_on_approved.push_back(std::move(callback));
    }

    void on_rejected(RejectedCallback callback) {
        std::lock_guard lock(m_callback_mutex);
        m_on_rejected.push_back(std::move(callback));
    }

    void on_timeout(TimeoutCallback callback) {
        std::lock_guard lock(m_callback_mutex);
        m_on_timeout.push_back(std::move(callback));
    }

private:
    struct PendingApproval {
        PendingApproval(YieldTurn<T> t, ApprovalStrategy s)
            : turn(std::move(t)), strategy(s) {}

        [[nodiscard]] bool satisfied() const {
            return strategy_satisfied(strategy, turn.approved_by().size(), turn.required_approvers().size());
        }

        YieldTurn<T> turn;
        ApprovalStrategy strategy;
        ApprovalStatus status = ApprovalStatus::Pending;
        std::optional<std::string> rejected_by;
        std::optional<std::string> reason;
        std::mutex mutex;
        std::condition_variable cv;
    };

    [[nodiscard]] std::shared_ptr<PendingApproval> lookup(const EventId& id) const {
        std::lock_guard lock(m_table_mutex);
        auto it = m_pending.find(id);
        return it != m_pending.end() ? it->second : nullptr;
    }

    /// Invoke the callbacks for a resolution; no lock is held
    void dispatch(const ApprovalResult<T>& result) {
        std::vector<ApprovedCallback> approved;
        std::vector<RejectedCallback> rejected;
        std::vector<TimeoutCallback> timed_out;
        {
            std::lock_guard lock(m_callback_mutex);
            approved = m_on_approved;
            rejected = m_on_rejected;
            timed_out = m_on_timeout;
        }

        switch (result.status) {
            case ApprovalStatus::Approved:
                for (const auto& callback : approved) {
                    invoke_guarded("on_approved", result.turn, [&] { callback(result.turn); });
                }
                break;
            case ApprovalStatus::Rejected: {
                const std::string rejector = result.rejected_by.value_or("");
                const std::string reason = result.reason.value_or("");
                for (const auto& callback : rejected) {
                    invoke_guarded("on_rejected", result.turn, [&] { callback(result.turn, rejector, reason); });
                }
                break;
            }
            case ApprovalStatus::Timeout:
                for (const auto& callback : timed_out) {
                    invoke_guarded("on_timeout", result.turn, [&] { callback(result.turn); });
                }
                break;
            case ApprovalStatus::Pending:
                break;
        }
    }

    template<typename F>
    static void invoke_guarded(const char* name, const YieldTurn<T>& turn, F&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            weave_core::governance_logger()->error("{} callback failed for {}: {}", name, turn.id().str(), e.what());
        } catch (...) {
            weave_core::governance_logger()->error("{} callback failed for {}: unknown exception",
                                                   name, turn.id().str());
        }
    }

    mutable std::mutex m_table_mutex;
    std::unordered_map<EventId, std::shared_ptr<PendingApproval>> m_pending;

    std::mutex m_callback_mutex;
    std::vector<ApprovedCallback> m_on_approved;
    std::vector<RejectedCallback> m_on_rejected;
    std::vector<TimeoutCallback> m_on_timeout;
};

} // namespace weave_govern
