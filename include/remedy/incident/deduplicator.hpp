#pragma once
/**
 * @file deduplicator.hpp
 * @brief Time-windowed collapse of identical (service, error) incidents.
 *
 * Policy: an incoming incident duplicates an existing one when both share
 * service_name and error_message and the existing record was created within
 * `window` of now. The match gets updated_at refreshed and a
 * duplicate_detected audit event; no new record, received event or dispatch.
 *
 * Concurrency: best effort. Two creates racing for the same pair in the same
 * instant may both miss each other and produce one extra record.
 */

#include <chrono>
#include <optional>
#include <string_view>

#include "remedy/clock.hpp"
#include "remedy/error.hpp"
#include "remedy/incident/incident.hpp"
#include "remedy/incident/incident_store.hpp"

namespace remedy::incident {

class Deduplicator {
public:
    Deduplicator(IncidentStore& store, const Clock& clock = SystemClock::instance()) noexcept
        : store_(store), clock_(clock) {}

    /**
     * @brief Look for an existing incident the new one collapses into.
     * @return The refreshed existing incident, std::nullopt when the caller
     *         should create a new record, or a Store error.
     */
    Result<std::optional<Incident>> resolve(std::string_view service_name,
                                            std::string_view error_message,
                                            std::chrono::milliseconds window);

private:
    IncidentStore& store_;
    const Clock&   clock_;
};

} // namespace remedy::incident
