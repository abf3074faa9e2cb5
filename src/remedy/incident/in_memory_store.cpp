#include "remedy/incident/in_memory_store.hpp"

#include <algorithm>

namespace remedy::incident {

Result<void> InMemoryIncidentStore::create(Incident& incident) {
    std::lock_guard<std::mutex> lk(mu_);
    if (incident.id.empty())
        return make_error(ErrorCode::Store, "failed to create incident: empty id");
    if (incidents_.count(incident.id) != 0)
        return make_error(ErrorCode::Store, "failed to create incident: duplicate id " + incident.id);

    const auto now = clock_.now();
    incident.created_at = now;
    incident.updated_at = now;
    incidents_.emplace(incident.id, incident);
    return {};
}

Result<Incident> InMemoryIncidentStore::get_by_id(std::string_view id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = incidents_.find(std::string(id));
    if (it == incidents_.end())
        return make_error(ErrorCode::NotFound, "incident not found: " + std::string(id));
    return it->second;
}

Result<void> InMemoryIncidentStore::update(const Incident& incident) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = incidents_.find(incident.id);
    if (it == incidents_.end())
        return make_error(ErrorCode::NotFound, "incident not found: " + incident.id);
    it->second = incident;
    return {};
}

Result<void> InMemoryIncidentStore::update_status(std::string_view id, IncidentStatus status) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = incidents_.find(std::string(id));
    if (it == incidents_.end())
        return make_error(ErrorCode::NotFound, "incident not found: " + std::string(id));
    it->second.status     = status;
    it->second.updated_at = clock_.now();
    return {};
}

Result<Incident> InMemoryIncidentStore::touch(std::string_view id, TimePoint at) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = incidents_.find(std::string(id));
    if (it == incidents_.end())
        return make_error(ErrorCode::NotFound, "incident not found: " + std::string(id));
    it->second.updated_at = at;
    return it->second;
}

Result<std::vector<Incident>> InMemoryIncidentStore::list() const {
    std::vector<Incident> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        out.reserve(incidents_.size());
        for (const auto& kv : incidents_) out.push_back(kv.second);
    }
    std::stable_sort(out.begin(), out.end(), [](const Incident& a, const Incident& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id < b.id;
    });
    return out;
}

Result<std::optional<Incident>>
InMemoryIncidentStore::find_duplicate(std::string_view service_name,
                                      std::string_view error_message,
                                      std::chrono::milliseconds window) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto cutoff = clock_.now() - window;
    const Incident* best = nullptr;
    for (const auto& kv : incidents_) {
        const auto& in = kv.second;
        if (in.service_name != service_name || in.error_message != error_message) continue;
        if (!(in.created_at > cutoff)) continue;
        if (!best || in.created_at > best->created_at) best = &in;
    }
    if (!best) return std::optional<Incident>{};
    return std::optional<Incident>{*best};
}

Result<void> InMemoryIncidentStore::compare_and_update(const Incident& next, IncidentStatus expected) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = incidents_.find(next.id);
    if (it == incidents_.end())
        return make_error(ErrorCode::NotFound, "incident not found: " + next.id);
    if (it->second.status != expected) {
        return make_error(ErrorCode::InvalidTransition,
                          std::string("concurrent transition on ") + next.id + ": expected " +
                          to_string(expected) + ", found " + to_string(it->second.status));
    }
    it->second = next;
    return {};
}

Result<std::optional<Incident>> InMemoryIncidentStore::find_by_run_id(std::string_view run_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : incidents_) {
        if (kv.second.workflow_run_id && *kv.second.workflow_run_id == run_id)
            return std::optional<Incident>{kv.second};
    }
    return std::optional<Incident>{};
}

Result<void> InMemoryIncidentStore::log_event(IncidentEvent event) {
    std::lock_guard<std::mutex> lk(mu_);
    event.id         = next_event_id_++;
    event.created_at = clock_.now();
    events_.push_back(std::move(event));
    return {};
}

Result<std::vector<IncidentEvent>> InMemoryIncidentStore::events_for(std::string_view incident_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<IncidentEvent> out;
    for (const auto& ev : events_) {
        if (ev.incident_id == incident_id) out.push_back(ev);
    }
    return out;
}

std::size_t InMemoryIncidentStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return incidents_.size();
}

std::size_t InMemoryIncidentStore::event_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_.size();
}

} // namespace remedy::incident
