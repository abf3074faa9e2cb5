/**
 * @file main.cpp
 * @brief remedy_app: replay a JSON-lines incident feed through the orchestration engine.
 *
 * Usage:
 *   remedy_app <config.json> <feed.jsonl> [failure_rate]
 *
 * Each feed line is one JSON object with a "type":
 *   - "incident"        normalized incident (service_name, error_message, ...)
 *   - "completion"      repository, run_id | incident_id, outcome, diagnosis?, pr_url?
 *   - "manual_trigger"  incident_id
 *   - "resolve"         incident_id
 *
 * Dispatch goes to a simulated transport that fails with the given probability.
 * The final incident table is printed as JSON on stdout.
 */

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include <nlohmann/json.hpp>

#include "remedy/config/config_loader.hpp"
#include "remedy/config/config_watcher.hpp"
#include "remedy/dispatch/dispatch_queue.hpp"
#include "remedy/incident/in_memory_store.hpp"
#include "remedy/obs/observability.hpp"
#include "remedy/orchestrator/orchestrator.hpp"
#include "remedy/version.hpp"

namespace {

using remedy::ErrorCode;
using remedy::Result;

class SimulatedTransport final : public remedy::dispatch::DispatchTransport {
public:
    explicit SimulatedTransport(double failure_rate) : failure_rate_(failure_rate) {}

    Result<std::string> dispatch(const remedy::dispatch::DispatchRequest& req,
                                 std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (dist_(rng_) < failure_rate_) {
            return remedy::make_error(ErrorCode::DispatchFailure,
                                      "simulated transport error for " + req.repository);
        }
        return "run-" + std::to_string(++next_run_);
    }

private:
    double failure_rate_;
    std::mutex mu_;
    std::mt19937 rng_{std::random_device{}()};
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
    uint64_t next_run_{0};
};

std::optional<std::string> opt(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

Result<void> replay_line(remedy::orchestrator::Orchestrator& orch, const nlohmann::json& line) {
    using remedy::make_error;
    const std::string type = line.value("type", std::string{"incident"});

    if (type == "incident") {
        auto in = remedy::incident::incident_from_json(line);
        if (!in) return remedy::forward_error(in.error());
        auto created = orch.create_incident(std::move(*in));
        if (!created) return remedy::forward_error(created.error());
        remedy::obs::logger()->info("replayed incident incident_id={} status={}", created->id,
                                    remedy::incident::to_string(created->status));
        return {};
    }
    if (type == "completion") {
        remedy::orchestrator::CompletionReport report{
            .repository  = line.value("repository", std::string{}),
            .run_id      = line.value("run_id", std::string{}),
            .incident_id = opt(line, "incident_id"),
            .diagnosis   = opt(line, "diagnosis"),
            .pr_url      = opt(line, "pr_url"),
        };
        auto outcome = remedy::orchestrator::parse_outcome(line.value("outcome", std::string{"success"}));
        if (!outcome) return make_error(ErrorCode::Validation, "unknown outcome in completion line");
        report.outcome = *outcome;
        return orch.on_workflow_completion(report);
    }
    if (type == "manual_trigger") {
        return orch.manual_trigger(line.value("incident_id", std::string{}));
    }
    if (type == "resolve") {
        auto r = orch.resolve_incident(line.value("incident_id", std::string{}));
        if (!r) return remedy::forward_error(r.error());
        return {};
    }
    return make_error(ErrorCode::Validation, "unknown feed line type '" + type + "'");
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.json> <feed.jsonl> [failure_rate]\n";
        return 2;
    }
    const std::string config_path = argv[1];
    const std::string feed_path = argv[2];
    const double failure_rate = (argc > 3) ? std::strtod(argv[3], nullptr) : 0.0;

    auto log = remedy::obs::logger();
    auto cfg = remedy::config::Loader::load_from_file(config_path);
    if (!cfg) {
        log->critical("cannot start: {}", cfg.error().message);
        return 1;
    }
    remedy::obs::configure_logging(cfg->log_level);
    log->info("remedy_app {} starting config={} feed={} failure_rate={}",
              remedy::version_string, config_path, feed_path, failure_rate);

    remedy::incident::InMemoryIncidentStore store;
    remedy::dispatch::LocalDispatchQueueManager queue(store);
    SimulatedTransport transport(failure_rate);

    auto built = remedy::orchestrator::Orchestrator::create(
        remedy::orchestrator::Collaborators{.store = store, .transport = transport, .queue = queue},
        *cfg);
    if (!built) {
        log->critical("cannot start: {}", built.error().message);
        return 1;
    }
    remedy::orchestrator::Orchestrator& orch = **built;

    remedy::config::ConfigWatcher watcher(config_path, *cfg);
    watcher.on_reload([&orch, &log](const remedy::config::OrchestratorConfig& next) {
        if (auto r = orch.apply_config(next); !r) log->error("reload not applied: {}", r.error().message);
    });
    watcher.start();

    std::ifstream feed(feed_path);
    if (!feed) {
        log->critical("cannot open feed {}", feed_path);
        return 1;
    }

    std::size_t line_no = 0, failures = 0;
    std::string text;
    while (std::getline(feed, text)) {
        ++line_no;
        if (text.empty() || text.front() == '#') continue;
        auto line = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (line.is_discarded() || !line.is_object()) {
            ++failures;
            log->warn("skipping malformed feed line line={}", line_no);
            continue;
        }
        if (auto r = replay_line(orch, line); !r) {
            ++failures;
            log->warn("feed line failed line={} code={} error={}", line_no,
                      remedy::to_string(r.error().code), r.error().message);
        }
    }
    watcher.stop();

    const auto c = orch.counters();
    log->info("replay finished lines={} failures={} received={} duplicates={} unroutable={} "
              "skipped={} dispatched={} dispatch_failures={} queued={} dequeued={} completions={} ignored={}",
              line_no, failures, c.incidents_received, c.duplicates, c.unroutable,
              c.remediation_skipped, c.dispatched, c.dispatch_failures, c.queued, c.dequeued,
              c.completions, c.completions_ignored);

    auto all = orch.list_incidents();
    if (!all) {
        log->error("cannot list incidents: {}", all.error().message);
        return 1;
    }
    auto out = nlohmann::json::array();
    for (const auto& in : *all) out.push_back(remedy::incident::to_json(in));
    std::cout << out.dump(2) << std::endl;
    return failures == 0 ? 0 : 3;
}
