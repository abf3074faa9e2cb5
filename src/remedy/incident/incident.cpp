/**
 * @file incident.cpp
 * @brief Names, validation and JSON mapping for the incident model.
 */
#include "remedy/incident/incident.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>

namespace remedy::incident {

namespace {

constexpr std::size_t kMaxServiceNameLen = 256;
constexpr std::size_t kMaxErrorLen       = 16 * 1024;
constexpr std::size_t kMaxStackTraceLen  = 256 * 1024;
constexpr std::size_t kMaxIdLen          = 128;

constexpr std::array<std::string_view, 4> kSeverities{"critical", "high", "medium", "low"};

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

const char* to_string(IncidentStatus s) noexcept {
    switch (s) {
        case IncidentStatus::Pending:           return "pending";
        case IncidentStatus::WorkflowTriggered: return "workflow_triggered";
        case IncidentStatus::InProgress:        return "in_progress";
        case IncidentStatus::PrCreated:         return "pr_created";
        case IncidentStatus::Resolved:          return "resolved";
        case IncidentStatus::Failed:            return "failed";
        case IncidentStatus::NoFixNeeded:       return "no_fix_needed";
    }
    return "unknown";
}

const char* to_string(EventType t) noexcept {
    switch (t) {
        case EventType::IncidentReceived:       return "incident_received";
        case EventType::WorkflowTriggered:      return "workflow_triggered";
        case EventType::WorkflowInProgress:     return "workflow_in_progress";
        case EventType::PrCreated:              return "pr_created";
        case EventType::IncidentResolved:       return "incident_resolved";
        case EventType::IncidentFailed:         return "incident_failed";
        case EventType::ManualTrigger:          return "manual_trigger";
        case EventType::StatusChanged:          return "status_changed";
        case EventType::DuplicateDetected:      return "duplicate_detected";
        case EventType::QueuedForRemediation:   return "queued_for_remediation";
        case EventType::DequeuedForRemediation: return "dequeued_for_remediation";
    }
    return "unknown";
}

std::string format_time(TimePoint tp) {
    using namespace std::chrono;
    const auto secs = time_point_cast<seconds>(tp);
    const auto ms   = duration_cast<milliseconds>(tp - secs).count();
    const std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
    return buf;
}

std::string make_incident_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    const uint64_t hi = rng();
    const uint64_t lo = rng();

    std::array<uint8_t, 16> b{};
    for (int i = 0; i < 8; ++i) {
        b[i]     = static_cast<uint8_t>(hi >> (56 - 8 * i));
        b[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40); // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80); // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return buf;
}

Result<void> validate_new_incident(const Incident& in) {
    if (in.service_name.empty())
        return make_error(ErrorCode::Validation, "service_name is required");
    if (in.service_name.size() > kMaxServiceNameLen)
        return make_error(ErrorCode::Validation, "service_name exceeds maximum length");
    if (in.error_message.empty())
        return make_error(ErrorCode::Validation, "error_message is required");
    if (in.error_message.size() > kMaxErrorLen)
        return make_error(ErrorCode::Validation, "error_message exceeds maximum length");
    if (in.stack_trace && in.stack_trace->size() > kMaxStackTraceLen)
        return make_error(ErrorCode::Validation, "stack_trace exceeds maximum length");
    if (in.id.size() > kMaxIdLen)
        return make_error(ErrorCode::Validation, "id exceeds maximum length");
    if (!in.severity.empty() &&
        std::find(kSeverities.begin(), kSeverities.end(), in.severity) == kSeverities.end())
        return make_error(ErrorCode::Validation, "unknown severity '" + in.severity + "'");
    if (!in.provider_data.is_object())
        return make_error(ErrorCode::Validation, "provider_data must be an object");
    return {};
}

nlohmann::json to_json(const Incident& in) {
    nlohmann::json j{
        {"id", in.id},
        {"service_name", in.service_name},
        {"repository", in.repository},
        {"error_message", in.error_message},
        {"severity", in.severity},
        {"status", to_string(in.status)},
        {"provider", in.provider},
        {"provider_data", in.provider_data},
        {"created_at", format_time(in.created_at)},
        {"updated_at", format_time(in.updated_at)},
    };
    if (in.stack_trace)      j["stack_trace"]      = *in.stack_trace;
    if (in.workflow_run_id)  j["workflow_run_id"]  = *in.workflow_run_id;
    if (in.pull_request_url) j["pull_request_url"] = *in.pull_request_url;
    if (in.diagnosis)        j["diagnosis"]        = *in.diagnosis;
    if (in.triggered_at)     j["triggered_at"]     = format_time(*in.triggered_at);
    if (in.completed_at)     j["completed_at"]     = format_time(*in.completed_at);
    return j;
}

nlohmann::json to_json(const IncidentEvent& ev) {
    return nlohmann::json{
        {"id", ev.id},
        {"incident_id", ev.incident_id},
        {"event_type", to_string(ev.type)},
        {"event_data", ev.data},
        {"created_at", format_time(ev.created_at)},
    };
}

Result<Incident> incident_from_json(const nlohmann::json& j) {
    if (!j.is_object())
        return make_error(ErrorCode::Validation, "incident payload must be a JSON object");

    Incident in;
    try {
        in.id            = j.value("id", std::string{});
        in.service_name  = j.value("service_name", std::string{});
        in.error_message = j.value("error_message", std::string{});
        in.severity      = j.value("severity", std::string{});
        in.provider      = j.value("provider", std::string{});
    } catch (const nlohmann::json::exception& e) {
        return make_error(ErrorCode::Validation, std::string("malformed incident field: ") + e.what());
    }
    in.stack_trace = optional_string(j, "stack_trace");

    if (auto it = j.find("provider_data"); it != j.end() && !it->is_null()) {
        in.provider_data = *it;
    }
    return in;
}

} // namespace remedy::incident
