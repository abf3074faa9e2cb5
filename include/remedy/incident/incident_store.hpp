#pragma once
/**
 * @file incident_store.hpp
 * @brief Persistence contract required by the orchestration engine.
 * @details The engine depends only on this interface. Implementations must
 *          give at least read-your-writes consistency and must make
 *          compare_and_update() atomic per incident.
 */

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

#include "remedy/error.hpp"
#include "remedy/incident/incident.hpp"

namespace remedy::incident {

/** @class IncidentStore
 *  @brief Durable incident + audit log storage. Shared, externally synchronized.
 */
class IncidentStore {
public:
    virtual ~IncidentStore() = default;

    /// Insert a new incident. Stamps created_at/updated_at. Fails if the id exists.
    virtual Result<void> create(Incident& incident) = 0;

    /// Fetch by id. ErrorCode::NotFound when absent.
    virtual Result<Incident> get_by_id(std::string_view id) const = 0;

    /// Overwrite every field of an existing incident as given.
    virtual Result<void> update(const Incident& incident) = 0;

    /// Raw status write (maintenance tooling). The engine routes status through Lifecycle.
    virtual Result<void> update_status(std::string_view id, IncidentStatus status) = 0;

    /// Set only updated_at and return the stored incident. Other fields are left as stored.
    virtual Result<Incident> touch(std::string_view id, TimePoint at) = 0;

    /// All incidents, newest created first.
    virtual Result<std::vector<Incident>> list() const = 0;

    /**
     * @brief Newest incident with equal service and error created within `window` of now.
     * @return std::nullopt when none matches.
     */
    virtual Result<std::optional<Incident>>
    find_duplicate(std::string_view service_name, std::string_view error_message,
                   std::chrono::milliseconds window) const = 0;

    /**
     * @brief Optimistic write: persist `next` only if the stored status still equals `expected`.
     * @return ErrorCode::InvalidTransition when the stored status moved on.
     */
    virtual Result<void> compare_and_update(const Incident& next, IncidentStatus expected) = 0;

    /// Incident carrying the given external run identifier, if any.
    virtual Result<std::optional<Incident>> find_by_run_id(std::string_view run_id) const = 0;

    /// Append an audit event. The store assigns id and created_at.
    virtual Result<void> log_event(IncidentEvent event) = 0;

    /// Audit trail of one incident in append order.
    virtual Result<std::vector<IncidentEvent>> events_for(std::string_view incident_id) const = 0;
};

} // namespace remedy::incident
