#include "remedy/incident/deduplicator.hpp"

#include "remedy/obs/observability.hpp"

namespace remedy::incident {

Result<std::optional<Incident>> Deduplicator::resolve(std::string_view service_name,
                                                      std::string_view error_message,
                                                      std::chrono::milliseconds window) {
    auto found = store_.find_duplicate(service_name, error_message, window);
    if (!found) {
        return make_error(ErrorCode::Store,
                          "failed to check for duplicates: " + found.error().message);
    }
    if (!found->has_value()) return std::optional<Incident>{};

    // Only updated_at is written; concurrent field updates stay intact.
    auto touched = store_.touch((*found)->id, clock_.now());
    if (!touched) {
        return make_error(ErrorCode::Store,
                          "failed to update duplicate incident: " + touched.error().message);
    }
    Incident dup = std::move(*touched);

    if (auto r = store_.log_event(IncidentEvent{
            .incident_id = dup.id,
            .type = EventType::DuplicateDetected,
            .data = {{"service_name", dup.service_name},
                     {"window_ms", window.count()},
                     {"status", to_string(dup.status)}}});
        !r) {
        obs::logger()->warn("failed to log duplicate event incident_id={} error={}",
                            dup.id, r.error().message);
    }

    obs::logger()->info("duplicate incident collapsed incident_id={} service={}",
                        dup.id, dup.service_name);
    return std::optional<Incident>{std::move(dup)};
}

} // namespace remedy::incident
