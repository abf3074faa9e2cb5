#pragma once
/**
 * @file incident.hpp
 * @brief Incident record, lifecycle status and audit event model.
 *
 * The status set is closed and the transition table is static data
 * (see lifecycle.hpp); nothing compares status strings ad hoc. Strings only
 * appear at the edges (JSON, logs) through to_string().
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "remedy/clock.hpp"
#include "remedy/error.hpp"

namespace remedy::incident {

/**
 * @enum IncidentStatus
 * @brief Lifecycle states. Declaration order is the index into the transition table.
 */
enum class IncidentStatus : std::uint8_t {
    Pending = 0,        ///< Routed, waiting for a dispatch slot
    WorkflowTriggered,  ///< Remediation job accepted by the transport
    InProgress,         ///< Job reported that it started working
    PrCreated,          ///< Job opened a pull request
    Resolved,           ///< Pull request merged (terminal)
    Failed,             ///< Unroutable, dispatch exhausted or job failed
    NoFixNeeded         ///< Job decided nothing needs changing (terminal)
};

inline constexpr std::size_t kStatusCount = 7;

/// Every status, in declaration order (handy for exhaustive tests).
inline constexpr std::array<IncidentStatus, kStatusCount> kAllStatuses{
    IncidentStatus::Pending,   IncidentStatus::WorkflowTriggered, IncidentStatus::InProgress,
    IncidentStatus::PrCreated, IncidentStatus::Resolved,          IncidentStatus::Failed,
    IncidentStatus::NoFixNeeded};

/**
 * @enum EventType
 * @brief Audit event kinds. One event is appended per state-changing action.
 */
enum class EventType : std::uint8_t {
    IncidentReceived,
    WorkflowTriggered,
    WorkflowInProgress,
    PrCreated,
    IncidentResolved,
    IncidentFailed,
    ManualTrigger,
    StatusChanged,
    DuplicateDetected,
    QueuedForRemediation,
    DequeuedForRemediation
};

/// Schema-less provider payload. Never interpreted by the engine.
using Metadata = nlohmann::json;

/**
 * @struct Incident
 * @brief Normalized record of one detected failure.
 *
 * `status` is only ever changed through Lifecycle::transition(); the sole
 * exception is creation, where an unroutable incident starts in Failed.
 */
struct Incident {
    std::string id;                          ///< Opaque, immutable once created
    std::string service_name;
    std::string repository;                  ///< "owner/repo", empty when unroutable
    std::string error_message;
    std::optional<std::string> stack_trace;
    std::string severity;
    std::string provider;
    Metadata    provider_data = Metadata::object();

    std::optional<std::string> workflow_run_id;
    std::optional<std::string> pull_request_url;
    std::optional<std::string> diagnosis;

    IncidentStatus status{IncidentStatus::Pending};

    TimePoint created_at{};
    TimePoint updated_at{};
    std::optional<TimePoint> triggered_at;   ///< First entry into WorkflowTriggered
    std::optional<TimePoint> completed_at;   ///< First entry into Resolved/Failed/NoFixNeeded
};

/** @struct IncidentEvent
 *  @brief Append-only audit record.
 */
struct IncidentEvent {
    std::int64_t id{0};       ///< Assigned by the store
    std::string  incident_id;
    EventType    type{EventType::StatusChanged};
    nlohmann::json data = nlohmann::json::object();
    TimePoint    created_at{};
};

// ----------------------------- Names ----------------------------------------

const char* to_string(IncidentStatus s) noexcept;
const char* to_string(EventType t) noexcept;

/// Resolved, Failed and NoFixNeeded stamp completed_at.
constexpr bool is_completion_status(IncidentStatus s) noexcept {
    return s == IncidentStatus::Resolved || s == IncidentStatus::Failed ||
           s == IncidentStatus::NoFixNeeded;
}

/// A remediation job is (believed to be) running for the incident.
constexpr bool is_active_dispatch(IncidentStatus s) noexcept {
    return s == IncidentStatus::WorkflowTriggered || s == IncidentStatus::InProgress;
}

// ----------------------------- Helpers --------------------------------------

/// RFC 3339 UTC rendering with millisecond precision.
std::string format_time(TimePoint tp);

/// Random UUID v4 text used for incidents created without an id.
std::string make_incident_id();

/// Validate a normalized inbound record before persistence.
Result<void> validate_new_incident(const Incident& in);

// ----------------------------- JSON -----------------------------------------

nlohmann::json to_json(const Incident& in);
nlohmann::json to_json(const IncidentEvent& ev);

/**
 * @brief Build a normalized incident from an adapter-produced JSON object.
 * @details Accepts the field names of the original webhook contract
 *          (service_name, error_message, stack_trace, severity, provider,
 *          provider_data, id). Status and timestamps are not read.
 */
Result<Incident> incident_from_json(const nlohmann::json& j);

} // namespace remedy::incident
