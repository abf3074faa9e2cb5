#pragma once
/**
 * @file lifecycle.hpp
 * @brief Incident lifecycle state machine: the single gate for status changes.
 *
 * Legal transitions (source → targets):
 *   pending            → workflow_triggered, failed
 *   workflow_triggered → in_progress, failed
 *   in_progress        → pr_created, failed, no_fix_needed
 *   pr_created         → resolved, failed
 *   failed             → pending              (explicit retry)
 *   resolved, no_fix_needed                    (terminal)
 *
 * Atomicity: transition() persists through IncidentStore::compare_and_update
 * keyed on the status it validated against, so of two racing transitions on
 * one incident exactly one wins and the other fails with InvalidTransition.
 */

#include <array>
#include <cstdint>
#include <functional>
#include <vector>

#include <nlohmann/json.hpp>

#include "remedy/clock.hpp"
#include "remedy/error.hpp"
#include "remedy/incident/incident.hpp"
#include "remedy/incident/incident_store.hpp"

namespace remedy::incident {

namespace detail {

constexpr uint8_t bit(IncidentStatus s) noexcept {
    return static_cast<uint8_t>(1u << static_cast<uint8_t>(s));
}

/// Allowed-target bitmask per source status, indexed by IncidentStatus.
inline constexpr std::array<uint8_t, kStatusCount> kTransitionTable{
    /* Pending           */ static_cast<uint8_t>(bit(IncidentStatus::WorkflowTriggered) | bit(IncidentStatus::Failed)),
    /* WorkflowTriggered */ static_cast<uint8_t>(bit(IncidentStatus::InProgress) | bit(IncidentStatus::Failed)),
    /* InProgress        */ static_cast<uint8_t>(bit(IncidentStatus::PrCreated) | bit(IncidentStatus::Failed) |
                                                 bit(IncidentStatus::NoFixNeeded)),
    /* PrCreated         */ static_cast<uint8_t>(bit(IncidentStatus::Resolved) | bit(IncidentStatus::Failed)),
    /* Resolved          */ 0,
    /* Failed            */ bit(IncidentStatus::Pending),
    /* NoFixNeeded       */ 0,
};

} // namespace detail

/** @class Lifecycle
 *  @brief Validates and applies status transitions, stamping timestamps and audit events.
 */
class Lifecycle {
public:
    /// Extra field changes persisted in the same write as the status change.
    using Amend = std::function<void(Incident&)>;

    Lifecycle(IncidentStore& store, const Clock& clock = SystemClock::instance()) noexcept
        : store_(store), clock_(clock) {}

    /// True when `to` is in the allowed set of `from`.
    static constexpr bool allowed(IncidentStatus from, IncidentStatus to) noexcept {
        return (detail::kTransitionTable[static_cast<uint8_t>(from)] & detail::bit(to)) != 0;
    }

    /// Allowed targets of `from`, in declaration order.
    static std::vector<IncidentStatus> allowed_targets(IncidentStatus from);

    /// No outgoing transitions at all.
    static constexpr bool is_terminal(IncidentStatus s) noexcept {
        return detail::kTransitionTable[static_cast<uint8_t>(s)] == 0;
    }

    /**
     * @brief Move `incident` to `target`.
     * @param incident Caller's copy; updated only on success.
     * @param target   Desired status.
     * @param amend    Optional extra field changes (run id, PR URL, diagnosis).
     * @param detail   Extra keys merged into the status_changed event payload.
     * @return InvalidTransition if the move is illegal or lost a race (incident unchanged),
     *         Store/NotFound if persistence failed.
     */
    Result<void> transition(Incident& incident, IncidentStatus target,
                            const Amend& amend = {},
                            const nlohmann::json& detail = nlohmann::json::object());

private:
    IncidentStore& store_;
    const Clock&   clock_;
};

} // namespace remedy::incident
