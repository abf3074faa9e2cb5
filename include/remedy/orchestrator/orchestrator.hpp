#pragma once
/**
 * @file orchestrator.hpp
 * @brief Composition root of the incident orchestration engine.
 *
 * Flow for a new incident:
 *   validate → deduplicate → custom rules → route → persist (+incident_received)
 *   → admit → {dispatch with retry | queue}
 * Flow for a completion callback:
 *   find incident → lifecycle transition(s) → release slot → dispatch the next
 *   queued incident, if any.
 *
 * Thread-safety: every public method may be called concurrently. Tunables,
 * rules and routing are published as immutable snapshots by apply_config();
 * a call in flight keeps the snapshot it started with. Dispatch state lives
 * in the DispatchQueueManager, incident state in the IncidentStore.
 *
 * Error propagation: unroutable services and exhausted dispatch retries are
 * recorded on the incident and not returned. Validation, Store, Timeout,
 * NotFound and InvalidTransition errors are returned to the caller.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "remedy/clock.hpp"
#include "remedy/config/config_loader.hpp"
#include "remedy/dispatch/dispatch_queue.hpp"
#include "remedy/dispatch/dispatch_transport.hpp"
#include "remedy/dispatch/retry_policy.hpp"
#include "remedy/error.hpp"
#include "remedy/incident/deduplicator.hpp"
#include "remedy/incident/incident.hpp"
#include "remedy/incident/incident_store.hpp"
#include "remedy/incident/lifecycle.hpp"
#include "remedy/obs/observability.hpp"
#include "remedy/routing/routing_table.hpp"
#include "remedy/routing/rule_engine.hpp"

namespace remedy::orchestrator {

/// Result reported by the remediation job.
enum class WorkflowOutcome : uint8_t {
    InProgress,   ///< Job started working; the slot stays taken
    Success,      ///< pr_created with a PR URL, otherwise no_fix_needed
    Failed,
    NoFixNeeded
};

const char* to_string(WorkflowOutcome o) noexcept;
std::optional<WorkflowOutcome> parse_outcome(std::string_view name) noexcept;

/** @struct CompletionReport
 *  @brief Completion callback payload. The incident is addressed by id when
 *         present, otherwise by the external run identifier.
 */
struct CompletionReport {
    std::string                repository;
    std::string                run_id;
    std::optional<std::string> incident_id;
    WorkflowOutcome            outcome{WorkflowOutcome::Success};
    std::optional<std::string> diagnosis;
    std::optional<std::string> pr_url;
};

/** @struct ReconcileReport
 *  @brief What reconcile() rebuilt from persisted state.
 */
struct ReconcileReport {
    std::size_t repositories{0};     ///< Repositories with in-flight jobs
    uint32_t    active_restored{0};  ///< Sum of restored active counts
    std::size_t dispatched{0};       ///< Pending incidents dispatched
    std::size_t queued{0};           ///< Pending incidents put back in the backlog
    std::size_t failed{0};           ///< Pending incidents whose re-dispatch failed
};

/** @struct Collaborators
 *  @brief External dependencies. All referenced objects must outlive the orchestrator.
 */
struct Collaborators {
    incident::IncidentStore&              store;
    dispatch::DispatchTransport&          transport;
    dispatch::DispatchQueueManager&       queue;
    const Clock&                          clock    = SystemClock::instance();
    obs::Observer*                        observer = nullptr; ///< Defaults to the process-wide observer
    dispatch::RetryingDispatcher::Sleeper sleeper{};          ///< Defaults to std::this_thread::sleep_for
};

class Orchestrator {
public:
    /// Validate `cfg` and build an orchestrator over it. Config error when validation fails.
    static Result<std::unique_ptr<Orchestrator>> create(Collaborators c, const config::OrchestratorConfig& cfg);

    /// `cfg` is expected to have passed config::validate(). Rejected mappings are
    /// logged at error level and leave routing empty until apply_config().
    Orchestrator(Collaborators c, const config::OrchestratorConfig& cfg);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Ingest a normalized incident.
     * @return The existing incident for a duplicate, otherwise the new incident
     *         in its post-admission state. Validation/Store/Timeout on error.
     */
    Result<incident::Incident> create_incident(incident::Incident raw);

    /**
     * @brief Re-enter admission for a pending or failed incident.
     * @return InvalidTransition while a job is in flight or from a terminal
     *         state, UnroutableService when a failed incident still has no mapping.
     */
    Result<void> manual_trigger(std::string_view incident_id);

    /**
     * @brief Apply a completion callback, free the slot and advance the backlog.
     * @details Callbacks for incidents that are not in flight are ignored.
     */
    Result<void> on_workflow_completion(const CompletionReport& report);

    /// PR merged: pr_created → resolved.
    Result<incident::Incident> resolve_incident(std::string_view incident_id);

    /// Validate and publish a new configuration. In-flight dispatch state is untouched.
    Result<void> apply_config(const config::OrchestratorConfig& cfg);

    /**
     * @brief Rebuild dispatch state after a restart.
     * @details Active counts come from incidents in workflow_triggered or
     *          in_progress. Routed pending incidents (not rule-skipped) are
     *          admitted again, oldest first. Call once, before serving traffic.
     */
    Result<ReconcileReport> reconcile();

    Result<incident::Incident> get_incident(std::string_view incident_id) const;
    Result<std::vector<incident::Incident>> list_incidents() const;
    Result<std::vector<incident::IncidentEvent>> events_for(std::string_view incident_id) const;

    [[nodiscard]] uint32_t active_count(std::string_view repository) const;
    [[nodiscard]] std::size_t queued_count(std::string_view repository) const;
    [[nodiscard]] obs::Counters counters() const;

    /// Provider data key marking an incident suppressed by a custom rule.
    static constexpr const char* kSkippedKey = "remediation_skipped";

private:
    struct Settings {
        config::GitHubConfig      github;
        config::DedupConfig       dedup;
        config::ConcurrencyConfig concurrency;
        dispatch::RetryConfig     retry;
        routing::RuleEngine       rules;
    };

    std::shared_ptr<const Settings> settings() const noexcept;
    static std::shared_ptr<const Settings> make_settings(const config::OrchestratorConfig& cfg);

    /// Repository for a service after rule overrides; empty when unroutable.
    std::string route(const incident::Incident& in, const std::vector<routing::RuleMatch>& matches) const;

    std::string branch_for(const incident::Incident& in, const Settings& s) const;

    /// Admit and, when a slot was granted, dispatch. Releases the slot on failure.
    Result<void> admit_and_dispatch(incident::Incident& in, const Settings& s,
                                    dispatch::QueuePosition position);

    /**
     * @brief Dispatch an incident that holds a slot.
     * @details Only one thread dispatches a given incident at a time; a second
     *          caller gets InvalidTransition without reaching the transport. The
     *          incident is re-read under that claim and must still be pending.
     * @param launched Set when the transport accepted the job. On error the caller
     *        releases the slot only if nothing was launched.
     */
    Result<void> dispatch_admitted(incident::Incident& in, const Settings& s, bool& launched);

    /// Release one slot and dispatch queued incidents while slots are free.
    void release_and_drain(const std::string& repository);

    void audit(const std::string& incident_id, incident::EventType type, nlohmann::json data);

    incident::IncidentStore&        store_;
    dispatch::DispatchQueueManager& queue_;
    const Clock&                    clock_;
    obs::Observer&                  observer_;

    dispatch::RetryingDispatcher dispatcher_;
    incident::Lifecycle          lifecycle_;
    incident::Deduplicator       dedup_;
    routing::RoutingTable        routing_;

    std::shared_ptr<const Settings> settings_;

    std::mutex                      claims_mu_;
    std::unordered_set<std::string> claims_;  ///< Incident ids with a dispatch in progress
};

} // namespace remedy::orchestrator
