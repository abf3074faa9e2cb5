#pragma once
/**
 * @file in_memory_store.hpp
 * @brief Mutex-guarded IncidentStore used by the replay app and the tests.
 *
 * Thread-safety: every operation takes one mutex, so each call is atomic and
 * compare_and_update() gives the per-incident optimistic check the lifecycle
 * gate relies on.
 */

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "remedy/clock.hpp"
#include "remedy/incident/incident_store.hpp"

namespace remedy::incident {

class InMemoryIncidentStore : public IncidentStore {
public:
    explicit InMemoryIncidentStore(const Clock& clock = SystemClock::instance()) noexcept
        : clock_(clock) {}

    Result<void> create(Incident& incident) override;
    Result<Incident> get_by_id(std::string_view id) const override;
    Result<void> update(const Incident& incident) override;
    Result<void> update_status(std::string_view id, IncidentStatus status) override;
    Result<Incident> touch(std::string_view id, TimePoint at) override;
    Result<std::vector<Incident>> list() const override;
    Result<std::optional<Incident>>
    find_duplicate(std::string_view service_name, std::string_view error_message,
                   std::chrono::milliseconds window) const override;
    Result<void> compare_and_update(const Incident& next, IncidentStatus expected) override;
    Result<std::optional<Incident>> find_by_run_id(std::string_view run_id) const override;
    Result<void> log_event(IncidentEvent event) override;
    Result<std::vector<IncidentEvent>> events_for(std::string_view incident_id) const override;

    /// Number of stored incidents.
    [[nodiscard]] std::size_t size() const;

    /// Total audit events across all incidents.
    [[nodiscard]] std::size_t event_count() const;

private:
    const Clock& clock_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Incident> incidents_;
    std::vector<IncidentEvent> events_;
    std::int64_t next_event_id_{1};
};

} // namespace remedy::incident
