#include "remedy/incident/lifecycle.hpp"

#include "remedy/obs/observability.hpp"

namespace remedy::incident {

std::vector<IncidentStatus> Lifecycle::allowed_targets(IncidentStatus from) {
    std::vector<IncidentStatus> out;
    for (auto s : kAllStatuses) {
        if (allowed(from, s)) out.push_back(s);
    }
    return out;
}

Result<void> Lifecycle::transition(Incident& incident, IncidentStatus target,
                                   const Amend& amend, const nlohmann::json& detail) {
    const IncidentStatus from = incident.status;
    if (!allowed(from, target)) {
        return make_error(ErrorCode::InvalidTransition,
                          std::string("invalid status transition from ") + to_string(from) +
                          " to " + to_string(target));
    }

    const auto now = clock_.now();
    Incident next = incident;
    next.status     = target;
    next.updated_at = now;
    if (target == IncidentStatus::WorkflowTriggered && !next.triggered_at) next.triggered_at = now;
    if (is_completion_status(target) && !next.completed_at) next.completed_at = now;
    if (amend) amend(next);

    if (auto r = store_.compare_and_update(next, from); !r) {
        return forward_error(r.error());
    }
    incident = std::move(next);

    nlohmann::json data = detail.is_object() ? detail : nlohmann::json::object();
    data["from"] = to_string(from);
    data["to"]   = to_string(target);
    if (auto r = store_.log_event(IncidentEvent{.incident_id = incident.id,
                                                .type = EventType::StatusChanged,
                                                .data = std::move(data)});
        !r) {
        // Status is already persisted; a failed audit append is only logged.
        obs::logger()->warn("failed to log status change incident_id={} error={}",
                            incident.id, r.error().message);
    }

    obs::logger()->debug("status changed incident_id={} from={} to={}",
                         incident.id, to_string(from), to_string(target));
    return {};
}

} // namespace remedy::incident
