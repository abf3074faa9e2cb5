#include "remedy/orchestrator/orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace remedy::orchestrator {

using dispatch::Admission;
using dispatch::QueuePosition;
using incident::EventType;
using incident::Incident;
using incident::IncidentStatus;
using obs::Signal;

namespace {

// Only exhausted transport retries are recorded instead of returned.
bool propagates(const Error& e) noexcept {
    return e.code != ErrorCode::DispatchFailure;
}

bool is_skipped(const Incident& in) {
    auto it = in.provider_data.find(Orchestrator::kSkippedKey);
    return it != in.provider_data.end() && it->is_boolean() && it->get<bool>();
}

// Holds an incident id in the claim set for the lifetime of one dispatch attempt.
class DispatchClaim {
public:
    DispatchClaim(std::mutex& mu, std::unordered_set<std::string>& claims, std::string id)
        : mu_(mu), claims_(claims), id_(std::move(id)) {
        std::lock_guard<std::mutex> lk(mu_);
        held_ = claims_.insert(id_).second;
    }

    ~DispatchClaim() {
        if (!held_) return;
        std::lock_guard<std::mutex> lk(mu_);
        claims_.erase(id_);
    }

    DispatchClaim(const DispatchClaim&) = delete;
    DispatchClaim& operator=(const DispatchClaim&) = delete;

    explicit operator bool() const noexcept { return held_; }

private:
    std::mutex&                      mu_;
    std::unordered_set<std::string>& claims_;
    std::string                      id_;
    bool                             held_{false};
};

} // namespace

const char* to_string(WorkflowOutcome o) noexcept {
    switch (o) {
        case WorkflowOutcome::InProgress:  return "in_progress";
        case WorkflowOutcome::Success:     return "success";
        case WorkflowOutcome::Failed:      return "failed";
        case WorkflowOutcome::NoFixNeeded: return "no_fix_needed";
    }
    return "unknown";
}

std::optional<WorkflowOutcome> parse_outcome(std::string_view name) noexcept {
    for (auto o : {WorkflowOutcome::InProgress, WorkflowOutcome::Success,
                   WorkflowOutcome::Failed, WorkflowOutcome::NoFixNeeded}) {
        if (name == to_string(o)) return o;
    }
    return std::nullopt;
}

Orchestrator::Orchestrator(Collaborators c, const config::OrchestratorConfig& cfg)
    : store_(c.store),
      queue_(c.queue),
      clock_(c.clock),
      observer_(c.observer ? *c.observer : *obs::make_simple_observer()),
      dispatcher_(c.transport, std::move(c.sleeper)),
      lifecycle_(c.store, c.clock),
      dedup_(c.store, c.clock),
      settings_(make_settings(cfg)) {
    if (const auto err = routing_.reload(cfg.service_mappings); err != routing::RoutingErr::Ok) {
        obs::logger()->error("service mappings rejected, every incident is unroutable error={} mappings={}",
                             routing::to_string(err), cfg.service_mappings.size());
    }
}

Result<std::unique_ptr<Orchestrator>> Orchestrator::create(Collaborators c, const config::OrchestratorConfig& cfg) {
    if (auto v = config::validate(cfg); !v) {
        obs::logger()->error("orchestrator not created error={}", v.error().message);
        return forward_error(v.error());
    }
    return std::make_unique<Orchestrator>(std::move(c), cfg);
}

std::shared_ptr<const Orchestrator::Settings>
Orchestrator::make_settings(const config::OrchestratorConfig& cfg) {
    return std::make_shared<const Settings>(Settings{
        .github      = cfg.github,
        .dedup       = cfg.dedup,
        .concurrency = cfg.concurrency,
        .retry       = cfg.retry,
        .rules       = routing::RuleEngine(cfg.custom_rules),
    });
}

std::shared_ptr<const Orchestrator::Settings> Orchestrator::settings() const noexcept {
    return std::atomic_load_explicit(&settings_, std::memory_order_acquire);
}

// ------------------------------ Ingest ---------------------------------------

Result<Incident> Orchestrator::create_incident(Incident raw) {
    if (auto v = incident::validate_new_incident(raw); !v) {
        obs::logger()->warn("incident rejected service={} error={}", raw.service_name, v.error().message);
        return forward_error(v.error());
    }
    const auto s = settings();

    auto dup = dedup_.resolve(raw.service_name, raw.error_message, s->dedup.time_window);
    if (!dup) return forward_error(dup.error());
    if (dup->has_value()) {
        observer_.record(Signal::Duplicate);
        return std::move(**dup);
    }

    Incident in = std::move(raw);
    if (in.id.empty()) in.id = incident::make_incident_id();
    in.status = IncidentStatus::Pending;
    in.workflow_run_id.reset();
    in.pull_request_url.reset();
    in.diagnosis.reset();
    in.triggered_at.reset();
    in.completed_at.reset();

    const auto matches = s->rules.evaluate(in);
    routing::RuleEngine::apply_actions(in, matches);
    in.repository = route(in, matches);

    const bool routed = !in.repository.empty();
    const bool skip = routed && routing::RuleEngine::should_skip_remediation(matches);
    if (!routed) {
        // Unroutable incidents are born failed and never enter the queue.
        in.status = IncidentStatus::Failed;
        in.completed_at = clock_.now();
    }
    if (skip) in.provider_data[kSkippedKey] = true;

    if (auto r = store_.create(in); !r) {
        obs::logger()->error("failed to persist incident incident_id={} error={}", in.id, r.error().message);
        return forward_error(r.error());
    }
    observer_.record(Signal::IncidentReceived);

    nlohmann::json received{{"service_name", in.service_name},
                            {"repository", in.repository},
                            {"severity", in.severity},
                            {"provider", in.provider}};
    if (!matches.empty()) {
        auto names = nlohmann::json::array();
        for (const auto& m : matches) names.push_back(m.rule_name);
        received["matched_rules"] = std::move(names);
    }
    audit(in.id, EventType::IncidentReceived, std::move(received));

    obs::logger()->info("incident received incident_id={} service={} repository={} rules={}",
                        in.id, in.service_name, in.repository, matches.size());

    if (!routed) {
        observer_.record(Signal::Unroutable);
        obs::logger()->warn("no repository mapping incident_id={} service={}", in.id, in.service_name);
        audit(in.id, EventType::IncidentFailed,
              {{"reason", to_string(ErrorCode::UnroutableService)}, {"service_name", in.service_name}});
        return in;
    }
    if (skip) {
        observer_.record(Signal::RemediationSkipped);
        obs::logger()->info("remediation skipped by rule incident_id={}", in.id);
        return in;
    }

    if (auto r = admit_and_dispatch(in, *s, QueuePosition::Tail); !r) {
        if (r.error().code != ErrorCode::InvalidTransition) return forward_error(r.error());
        // A manual trigger dispatched it first; report the stored state.
        obs::logger()->info("incident dispatched elsewhere incident_id={}", in.id);
        if (auto fresh = store_.get_by_id(in.id)) return std::move(*fresh);
    }
    return in;
}

std::string Orchestrator::route(const Incident& in, const std::vector<routing::RuleMatch>& matches) const {
    if (auto over = routing::RuleEngine::repository_override(matches)) return *over;
    bool found = false;
    auto repo = routing_.lookup_repository(in.service_name, found);
    return found ? repo : std::string{};
}

std::string Orchestrator::branch_for(const Incident& in, const Settings& s) const {
    if (auto m = routing_.lookup(in.service_name); m && m->repository == in.repository && !m->branch.empty())
        return m->branch;
    if (auto b = routing_.branch_for_repository(in.repository); b && !b->empty()) return *b;
    return s.github.default_branch;
}

// ------------------------------ Dispatch -------------------------------------

Result<void> Orchestrator::admit_and_dispatch(Incident& in, const Settings& s, QueuePosition position) {
    const auto limit = s.concurrency.limit_for(in.repository);
    if (queue_.admit(in.repository, in, limit, position) == Admission::Queued) {
        observer_.record(Signal::Queued);
        return {};
    }

    bool launched = false;
    auto r = dispatch_admitted(in, s, launched);
    if (r) return {};

    if (!launched) release_and_drain(in.repository);
    if (propagates(r.error())) return forward_error(r.error());
    return {};
}

Result<void> Orchestrator::dispatch_admitted(Incident& in, const Settings& s, bool& launched) {
    launched = false;
    const DispatchClaim claim(claims_mu_, claims_, in.id);
    if (!claim) {
        return make_error(ErrorCode::InvalidTransition, "incident " + in.id + " is already being dispatched");
    }
    auto fresh = store_.get_by_id(in.id);
    if (!fresh) return forward_error(fresh.error());
    if (fresh->status != IncidentStatus::Pending) {
        return make_error(ErrorCode::InvalidTransition,
                          "incident " + in.id + " is no longer pending: " + incident::to_string(fresh->status));
    }
    in = std::move(*fresh);

    const dispatch::DispatchRequest req{
        .repository    = in.repository,
        .branch        = branch_for(in, s),
        .workflow      = s.github.workflow_name,
        .incident_id   = in.id,
        .service_name  = in.service_name,
        .error_message = in.error_message,
        .stack_trace   = in.stack_trace.value_or(std::string{}),
        .timestamp     = incident::format_time(in.created_at),
    };

    auto receipt = dispatcher_.dispatch(req, s.retry);
    if (!receipt) {
        observer_.record(Signal::DispatchFailed);
        obs::logger()->error("dispatch failed incident_id={} repository={} error={}",
                             in.id, in.repository, receipt.error().message);
        if (auto t = lifecycle_.transition(in, IncidentStatus::Failed, {},
                                           {{"reason", to_string(receipt.error().code)}});
            !t) {
            obs::logger()->error("failed to mark incident failed incident_id={} error={}",
                                 in.id, t.error().message);
        }
        audit(in.id, EventType::IncidentFailed,
              {{"reason", to_string(receipt.error().code)},
               {"error", receipt.error().message},
               {"attempts", s.retry.max_attempts},
               {"repository", in.repository}});
        return forward_error(receipt.error());
    }

    launched = true;
    const std::string run_id = receipt->run_id;
    auto t = lifecycle_.transition(
        in, IncidentStatus::WorkflowTriggered,
        [&run_id](Incident& next) { next.workflow_run_id = run_id; },
        {{"run_id", run_id}});
    if (!t) {
        // The job is running and keeps its slot until reconcile() recounts from the store.
        obs::logger()->error("failed to record dispatch, slot kept incident_id={} repository={} run_id={} error={}",
                             in.id, in.repository, run_id, t.error().message);
        return forward_error(t.error());
    }

    observer_.record(Signal::Dispatched);
    audit(in.id, EventType::WorkflowTriggered,
          {{"run_id", run_id},
           {"attempts", receipt->attempts},
           {"repository", req.repository},
           {"branch", req.branch},
           {"workflow", req.workflow}});
    obs::logger()->info("workflow triggered incident_id={} repository={} run_id={} attempts={}",
                        in.id, in.repository, run_id, receipt->attempts);
    return {};
}

void Orchestrator::release_and_drain(const std::string& repository) {
    auto next = queue_.release(repository);
    while (next) {
        observer_.record(Signal::Dequeued);
        const auto s = settings();

        Incident in = std::move(*next);
        next.reset();
        if (auto fresh = store_.get_by_id(in.id)) {
            in = std::move(*fresh);
        } else {
            obs::logger()->warn("using queued copy incident_id={} error={}", in.id, fresh.error().message);
        }

        if (in.status != IncidentStatus::Pending) {
            obs::logger()->info("dequeued incident no longer pending incident_id={} status={}",
                                in.id, incident::to_string(in.status));
            next = queue_.pop_queued(repository);
            continue;
        }

        // Re-admit at the head so a slot taken meanwhile does not cost the incident its turn.
        const auto limit = s->concurrency.limit_for(repository);
        if (queue_.admit(repository, in, limit, QueuePosition::Head) == Admission::Queued) {
            observer_.record(Signal::Queued);
            return;
        }
        bool launched = false;
        if (auto r = dispatch_admitted(in, *s, launched); !r && !launched) {
            next = queue_.release(repository);
        }
    }
}

// ------------------------------ Callbacks ------------------------------------

Result<void> Orchestrator::on_workflow_completion(const CompletionReport& report) {
    Incident in;
    if (report.incident_id) {
        auto r = store_.get_by_id(*report.incident_id);
        if (!r) return forward_error(r.error());
        in = std::move(*r);
    } else {
        auto r = store_.find_by_run_id(report.run_id);
        if (!r) return forward_error(r.error());
        if (!r->has_value())
            return make_error(ErrorCode::NotFound, "no incident for run id " + report.run_id);
        in = std::move(**r);
    }

    const std::string repository = in.repository.empty() ? report.repository : in.repository;
    if (!report.repository.empty() && report.repository != repository) {
        obs::logger()->warn("completion repository mismatch incident_id={} reported={} recorded={}",
                            in.id, report.repository, repository);
    }

    auto ignore = [&](const char* why) -> Result<void> {
        observer_.record(Signal::CompletionIgnored);
        obs::logger()->info("completion ignored incident_id={} run_id={} status={} reason={}",
                            in.id, report.run_id, incident::to_string(in.status), why);
        return {};
    };

    if (!incident::is_active_dispatch(in.status)) return ignore("not in flight");
    if (report.outcome == WorkflowOutcome::InProgress && in.status == IncidentStatus::InProgress)
        return ignore("already in progress");

    const nlohmann::json detail{{"run_id", report.run_id}, {"outcome", to_string(report.outcome)}};

    auto to_in_progress = [&]() -> Result<void> {
        if (in.status != IncidentStatus::WorkflowTriggered) return {};
        if (auto r = lifecycle_.transition(in, IncidentStatus::InProgress, {}, detail); !r)
            return forward_error(r.error());
        audit(in.id, EventType::WorkflowInProgress, {{"run_id", report.run_id}});
        return {};
    };

    if (report.outcome == WorkflowOutcome::InProgress) {
        if (auto r = to_in_progress(); !r) {
            if (r.error().code == ErrorCode::InvalidTransition) return ignore("lost transition race");
            return forward_error(r.error());
        }
        return {};
    }

    IncidentStatus target = IncidentStatus::Failed;
    switch (report.outcome) {
        case WorkflowOutcome::Success:
            target = report.pr_url ? IncidentStatus::PrCreated : IncidentStatus::NoFixNeeded;
            break;
        case WorkflowOutcome::NoFixNeeded: target = IncidentStatus::NoFixNeeded; break;
        case WorkflowOutcome::Failed:      target = IncidentStatus::Failed; break;
        case WorkflowOutcome::InProgress:  break;
    }

    if (target != IncidentStatus::Failed) {
        if (auto r = to_in_progress(); !r) {
            if (r.error().code == ErrorCode::InvalidTransition) return ignore("lost transition race");
            return forward_error(r.error());
        }
    }

    auto amend = [&report](Incident& next) {
        if (report.diagnosis) next.diagnosis = report.diagnosis;
        if (report.pr_url)    next.pull_request_url = report.pr_url;
    };
    if (auto r = lifecycle_.transition(in, target, amend, detail); !r) {
        if (r.error().code == ErrorCode::InvalidTransition) return ignore("lost transition race");
        return forward_error(r.error());
    }

    if (target == IncidentStatus::PrCreated) {
        audit(in.id, EventType::PrCreated, {{"pull_request_url", *report.pr_url}, {"run_id", report.run_id}});
    } else if (target == IncidentStatus::Failed) {
        audit(in.id, EventType::IncidentFailed,
              {{"reason", "workflow_failed"}, {"run_id", report.run_id},
               {"diagnosis", report.diagnosis.value_or(std::string{})}});
    }

    observer_.record(Signal::Completed);
    obs::logger()->info("workflow completed incident_id={} repository={} run_id={} status={}",
                        in.id, repository, report.run_id, incident::to_string(in.status));

    release_and_drain(repository);
    return {};
}

Result<void> Orchestrator::manual_trigger(std::string_view incident_id) {
    auto got = store_.get_by_id(incident_id);
    if (!got) return forward_error(got.error());
    Incident in = std::move(*got);

    if (incident::is_active_dispatch(in.status)) {
        return make_error(ErrorCode::InvalidTransition,
                          "incident " + in.id + " is already being remediated");
    }
    if (in.status != IncidentStatus::Pending && in.status != IncidentStatus::Failed) {
        return make_error(ErrorCode::InvalidTransition,
                          std::string("cannot manually trigger incident in status ") +
                          incident::to_string(in.status));
    }

    const auto s = settings();
    const IncidentStatus previous = in.status;

    if (in.repository.empty()) {
        in.repository = route(in, s->rules.evaluate(in));
        if (in.repository.empty()) {
            return make_error(ErrorCode::UnroutableService,
                              "no repository mapping for service " + in.service_name);
        }
    }

    if (previous == IncidentStatus::Failed) {
        const std::string repo = in.repository;
        auto r = lifecycle_.transition(
            in, IncidentStatus::Pending,
            [&repo](Incident& next) {
                next.repository = repo;
                next.provider_data.erase(std::string(kSkippedKey));
            },
            {{"reason", "manual_trigger"}});
        if (!r) return forward_error(r.error());
    } else if (is_skipped(in)) {
        Incident next = in;
        next.provider_data.erase(std::string(kSkippedKey));
        next.updated_at = clock_.now();
        if (auto r = store_.compare_and_update(next, IncidentStatus::Pending); !r) return forward_error(r.error());
        in = std::move(next);
    }

    audit(in.id, EventType::ManualTrigger,
          {{"previous_status", incident::to_string(previous)}, {"repository", in.repository}});
    obs::logger()->info("manual trigger incident_id={} repository={} previous={}",
                        in.id, in.repository, incident::to_string(previous));

    if (queue_.is_queued(in.repository, in.id)) return {};
    return admit_and_dispatch(in, *s, QueuePosition::Tail);
}

Result<Incident> Orchestrator::resolve_incident(std::string_view incident_id) {
    auto got = store_.get_by_id(incident_id);
    if (!got) return forward_error(got.error());
    Incident in = std::move(*got);

    if (auto r = lifecycle_.transition(in, IncidentStatus::Resolved); !r) return forward_error(r.error());
    audit(in.id, EventType::IncidentResolved,
          {{"pull_request_url", in.pull_request_url.value_or(std::string{})}});
    obs::logger()->info("incident resolved incident_id={}", in.id);
    return in;
}

// ------------------------------ Operations -----------------------------------

Result<void> Orchestrator::apply_config(const config::OrchestratorConfig& cfg) {
    if (auto v = config::validate(cfg); !v) return forward_error(v.error());
    if (const auto err = routing_.reload(cfg.service_mappings); err != routing::RoutingErr::Ok) {
        return make_error(ErrorCode::Config,
                          std::string("routing reload rejected: ") + routing::to_string(err));
    }
    std::atomic_store_explicit(&settings_, make_settings(cfg), std::memory_order_release);
    obs::configure_logging(cfg.log_level);
    obs::logger()->info("configuration applied mappings={} rules={} routing_version={}",
                        cfg.service_mappings.size(), cfg.custom_rules.size(), routing_.version());
    return {};
}

Result<ReconcileReport> Orchestrator::reconcile() {
    auto all = store_.list();
    if (!all) return forward_error(all.error());

    ReconcileReport report;
    std::map<std::string, uint32_t> in_flight;
    for (const auto& in : *all) {
        if (incident::is_active_dispatch(in.status) && !in.repository.empty()) ++in_flight[in.repository];
    }
    for (const auto& [repo, count] : in_flight) {
        queue_.restore_active(repo, count);
        ++report.repositories;
        report.active_restored += count;
        obs::logger()->info("restored active count repository={} active={}", repo, count);
    }

    const auto s = settings();
    // list() is newest first; re-admit oldest first to keep arrival order.
    for (auto it = all->rbegin(); it != all->rend(); ++it) {
        Incident in = *it;
        if (in.status != IncidentStatus::Pending || in.repository.empty() || is_skipped(in)) continue;
        if (queue_.is_queued(in.repository, in.id)) continue;

        const auto limit = s->concurrency.limit_for(in.repository);
        if (queue_.admit(in.repository, in, limit, QueuePosition::Tail) == Admission::Queued) {
            observer_.record(Signal::Queued);
            ++report.queued;
            continue;
        }
        bool launched = false;
        if (auto r = dispatch_admitted(in, *s, launched); !r) {
            ++report.failed;
            if (!launched) release_and_drain(in.repository);
            continue;
        }
        ++report.dispatched;
    }

    obs::logger()->info("reconcile complete repositories={} active={} dispatched={} queued={} failed={}",
                        report.repositories, report.active_restored, report.dispatched,
                        report.queued, report.failed);
    return report;
}

Result<Incident> Orchestrator::get_incident(std::string_view incident_id) const {
    return store_.get_by_id(incident_id);
}

Result<std::vector<Incident>> Orchestrator::list_incidents() const {
    return store_.list();
}

Result<std::vector<incident::IncidentEvent>> Orchestrator::events_for(std::string_view incident_id) const {
    return store_.events_for(incident_id);
}

uint32_t Orchestrator::active_count(std::string_view repository) const {
    return queue_.active_count(repository);
}

std::size_t Orchestrator::queued_count(std::string_view repository) const {
    return queue_.queued_count(repository);
}

obs::Counters Orchestrator::counters() const {
    return observer_.snapshot();
}

void Orchestrator::audit(const std::string& incident_id, EventType type, nlohmann::json data) {
    auto r = store_.log_event(incident::IncidentEvent{
        .incident_id = incident_id, .type = type, .data = std::move(data)});
    if (!r) {
        obs::logger()->warn("failed to log {} event incident_id={} error={}",
                            incident::to_string(type), incident_id, r.error().message);
    }
}

} // namespace remedy::orchestrator
