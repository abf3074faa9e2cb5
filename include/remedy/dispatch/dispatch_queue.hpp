#pragma once
/**
 * @file dispatch_queue.hpp
 * @brief Per-repository admission control with a FIFO backlog.
 *
 * Per repository the manager tracks `active` (jobs in flight) and a FIFO of
 * incidents waiting for a slot.
 *
 * Invariants (per repository, independently):
 *  - 0 <= active <= max_concurrency passed to admit().
 *  - active counts jobs actually admitted; a dequeued incident does not hold
 *    a slot until it is admitted again.
 *  - release() hands back queued incidents strictly in arrival order.
 *
 * The abstract DispatchQueueManager is the seam for moving this state to a
 * shared coordination store; LocalDispatchQueueManager keeps it in-process
 * (reset on restart, see Orchestrator::reconcile()).
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "remedy/incident/incident.hpp"
#include "remedy/incident/incident_store.hpp"

namespace remedy::dispatch {

/// Outcome of an admission request.
enum class Admission : uint8_t {
    DispatchNow,  ///< Slot taken; caller must dispatch (and release on failure)
    Queued        ///< Appended to the backlog
};

/// Where a saturated admit() parks the incident.
enum class QueuePosition : uint8_t {
    Tail,  ///< New work
    Head   ///< Work just released from the backlog keeps its turn
};

/** @class DispatchQueueManager
 *  @brief Admission control contract used by the orchestrator.
 */
class DispatchQueueManager {
public:
    virtual ~DispatchQueueManager() = default;

    /**
     * @brief Take a slot if `active < max_concurrency`, otherwise queue the incident.
     * @return DispatchNow (active incremented) or Queued (queued_for_remediation logged).
     */
    virtual Admission admit(std::string_view repository, const incident::Incident& incident,
                            uint32_t max_concurrency,
                            QueuePosition position = QueuePosition::Tail) = 0;

    /**
     * @brief Free one slot (floored at zero) and pop the oldest queued incident.
     * @return The popped incident (dequeued_for_remediation logged) or std::nullopt.
     */
    virtual std::optional<incident::Incident> release(std::string_view repository) = 0;

    /**
     * @brief Pop the oldest queued incident without touching `active`.
     * @details Used when a dequeued incident is no longer eligible and the slot
     *          it was handed passes straight to the next one in line.
     */
    virtual std::optional<incident::Incident> pop_queued(std::string_view repository) = 0;

    [[nodiscard]] virtual uint32_t active_count(std::string_view repository) const = 0;
    [[nodiscard]] virtual std::size_t queued_count(std::string_view repository) const = 0;

    /// The incident is waiting in the repository's backlog.
    [[nodiscard]] virtual bool is_queued(std::string_view repository,
                                         std::string_view incident_id) const = 0;

    /// Overwrite the active count (startup reconciliation only).
    virtual void restore_active(std::string_view repository, uint32_t active) = 0;
};

/** @class LocalDispatchQueueManager
 *  @brief In-process implementation. One mutex guards the map of repositories.
 *
 * Audit events are appended after the lock is dropped; a failed append is
 * logged and does not undo the admission decision.
 */
class LocalDispatchQueueManager final : public DispatchQueueManager {
public:
    explicit LocalDispatchQueueManager(incident::IncidentStore& audit) noexcept : audit_(audit) {}

    Admission admit(std::string_view repository, const incident::Incident& incident,
                    uint32_t max_concurrency,
                    QueuePosition position = QueuePosition::Tail) override;
    std::optional<incident::Incident> release(std::string_view repository) override;
    std::optional<incident::Incident> pop_queued(std::string_view repository) override;

    [[nodiscard]] uint32_t active_count(std::string_view repository) const override;
    [[nodiscard]] std::size_t queued_count(std::string_view repository) const override;
    [[nodiscard]] bool is_queued(std::string_view repository,
                                 std::string_view incident_id) const override;
    void restore_active(std::string_view repository, uint32_t active) override;

    /// Repositories with any state, for operator listings.
    [[nodiscard]] std::vector<std::string> repositories() const;

    struct Stats {
        uint64_t admitted{0}, queued{0}, released{0}, dequeued{0}, underflows{0};
    };
    [[nodiscard]] Stats stats() const;

private:
    struct RepoState {
        uint32_t active{0};
        std::deque<incident::Incident> queue;
    };

    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    RepoState& state_for(std::string_view repository);
    const RepoState* find_state(std::string_view repository) const;

    std::optional<incident::Incident> pop_locked(RepoState& st, std::size_t& depth);

    void audit(const std::string& incident_id, incident::EventType type,
               std::string_view repository, std::size_t depth);

    incident::IncidentStore& audit_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, RepoState, SKeyHash, SKeyEq> repos_;
    Stats stats_{};
};

} // namespace remedy::dispatch
