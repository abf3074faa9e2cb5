#include "remedy/dispatch/dispatch_queue.hpp"

#include <algorithm>

#include "remedy/obs/observability.hpp"

namespace remedy::dispatch {

using incident::EventType;
using incident::Incident;

LocalDispatchQueueManager::RepoState&
LocalDispatchQueueManager::state_for(std::string_view repository) {
    auto it = repos_.find(repository);
    if (it == repos_.end()) it = repos_.emplace(std::string(repository), RepoState{}).first;
    return it->second;
}

const LocalDispatchQueueManager::RepoState*
LocalDispatchQueueManager::find_state(std::string_view repository) const {
    auto it = repos_.find(repository);
    return it == repos_.end() ? nullptr : &it->second;
}

Admission LocalDispatchQueueManager::admit(std::string_view repository, const Incident& incident,
                                           uint32_t max_concurrency, QueuePosition position) {
    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& st = state_for(repository);
        if (st.active < max_concurrency) {
            ++st.active;
            ++stats_.admitted;
            return Admission::DispatchNow;
        }
        if (position == QueuePosition::Head) st.queue.push_front(incident);
        else                                 st.queue.push_back(incident);
        depth = st.queue.size();
        ++stats_.queued;
    }

    obs::logger()->info("incident queued incident_id={} repository={} depth={} limit={}",
                        incident.id, repository, depth, max_concurrency);
    audit(incident.id, EventType::QueuedForRemediation, repository, depth);
    return Admission::Queued;
}

std::optional<Incident> LocalDispatchQueueManager::release(std::string_view repository) {
    std::optional<Incident> next;
    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& st = state_for(repository);
        if (st.active > 0) --st.active;
        else               ++stats_.underflows;
        ++stats_.released;
        next = pop_locked(st, depth);
    }
    if (!next) return std::nullopt;

    obs::logger()->info("incident dequeued incident_id={} repository={} remaining={}",
                        next->id, repository, depth);
    audit(next->id, EventType::DequeuedForRemediation, repository, depth);
    return next;
}

std::optional<Incident> LocalDispatchQueueManager::pop_queued(std::string_view repository) {
    std::optional<Incident> next;
    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = repos_.find(repository);
        if (it == repos_.end()) return std::nullopt;
        next = pop_locked(it->second, depth);
    }
    if (!next) return std::nullopt;

    obs::logger()->info("incident dequeued incident_id={} repository={} remaining={}",
                        next->id, repository, depth);
    audit(next->id, EventType::DequeuedForRemediation, repository, depth);
    return next;
}

std::optional<Incident> LocalDispatchQueueManager::pop_locked(RepoState& st, std::size_t& depth) {
    if (st.queue.empty()) return std::nullopt;
    std::optional<Incident> next(std::move(st.queue.front()));
    st.queue.pop_front();
    depth = st.queue.size();
    ++stats_.dequeued;
    return next;
}

uint32_t LocalDispatchQueueManager::active_count(std::string_view repository) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto* st = find_state(repository);
    return st ? st->active : 0;
}

std::size_t LocalDispatchQueueManager::queued_count(std::string_view repository) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto* st = find_state(repository);
    return st ? st->queue.size() : 0;
}

bool LocalDispatchQueueManager::is_queued(std::string_view repository,
                                          std::string_view incident_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto* st = find_state(repository);
    if (!st) return false;
    return std::any_of(st->queue.begin(), st->queue.end(),
                       [&](const Incident& in) { return in.id == incident_id; });
}

void LocalDispatchQueueManager::restore_active(std::string_view repository, uint32_t active) {
    std::lock_guard<std::mutex> lk(mu_);
    state_for(repository).active = active;
}

std::vector<std::string> LocalDispatchQueueManager::repositories() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(repos_.size());
    for (const auto& kv : repos_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

LocalDispatchQueueManager::Stats LocalDispatchQueueManager::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stats_;
}

void LocalDispatchQueueManager::audit(const std::string& incident_id, EventType type,
                                      std::string_view repository, std::size_t depth) {
    auto r = audit_.log_event(incident::IncidentEvent{
        .incident_id = incident_id,
        .type = type,
        .data = {{"repository", std::string(repository)}, {"queue_depth", depth}}});
    if (!r) {
        obs::logger()->warn("failed to log {} event incident_id={} error={}",
                            incident::to_string(type), incident_id, r.error().message);
    }
}

} // namespace remedy::dispatch
