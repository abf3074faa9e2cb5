/**
 * @file test_orchestrator.cpp
 * @brief End-to-end tests of the orchestration engine over the in-memory store
 *        and a scripted transport.
 *
 * Validates:
 *  - create: validation, dedup, routing, unroutable, rules, admission
 *  - dispatch retry exhaustion releases the slot and advances the backlog
 *  - completion callbacks (by run id and by incident id), stale callbacks
 *  - manual trigger, resolve, config reload, restart reconciliation
 *  - store errors surface to the caller
 *  - one dispatch per incident under concurrent manual triggers
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "remedy/dispatch/dispatch_queue.hpp"
#include "remedy/incident/in_memory_store.hpp"
#include "remedy/obs/observability.hpp"
#include "remedy/orchestrator/orchestrator.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using remedy::ErrorCode;
using remedy::config::OrchestratorConfig;
using remedy::dispatch::LocalDispatchQueueManager;
using remedy::incident::EventType;
using remedy::incident::Incident;
using remedy::incident::IncidentStatus;
using remedy::incident::InMemoryIncidentStore;
using remedy::orchestrator::Collaborators;
using remedy::orchestrator::CompletionReport;
using remedy::orchestrator::Orchestrator;
using remedy::orchestrator::WorkflowOutcome;
using remedy::routing::ServiceMapping;
using remedy::testing::ManualClock;
using remedy::testing::ScriptedTransport;
using remedy::testing::count_events;
using remedy::testing::make_raw;

namespace {

constexpr const char* kShop = "acme/shop";
constexpr const char* kBilling = "acme/billing";

OrchestratorConfig base_config() {
  OrchestratorConfig cfg;
  cfg.github.default_branch = "trunk";
  cfg.service_mappings = {
    ServiceMapping{.service_name = "checkout", .repository = kShop, .branch = "main"},
    ServiceMapping{.service_name = "cart", .repository = kShop, .branch = "main"},
    ServiceMapping{.service_name = "billing", .repository = kBilling, .branch = ""},
  };
  cfg.concurrency.max_workflows_per_repo = 2;
  cfg.concurrency.per_repository[kShop] = 1;
  cfg.retry.base_delay = 1ms;
  return cfg;
}

class FailingCreateStore final : public InMemoryIncidentStore {
public:
  using InMemoryIncidentStore::InMemoryIncidentStore;
  remedy::Result<void> create(Incident&) override {
    return remedy::make_error(ErrorCode::Store, "disk full");
  }
};

// Accepts every write except the one recording a triggered workflow.
class UnrecordedDispatchStore final : public InMemoryIncidentStore {
public:
  using InMemoryIncidentStore::InMemoryIncidentStore;
  remedy::Result<void> compare_and_update(const Incident& next, IncidentStatus expected) override {
    if (next.status == IncidentStatus::WorkflowTriggered)
      return remedy::make_error(ErrorCode::Store, "write timed out");
    return InMemoryIncidentStore::compare_and_update(next, expected);
  }
};

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  OrchestratorTest() : store(clock), queue(store), orch(collaborators(), base_config()) {}

  Collaborators collaborators() {
    return Collaborators{.store = store, .transport = transport, .queue = queue, .clock = clock,
                         .observer = &observer, .sleeper = [](std::chrono::milliseconds) {}};
  }

  Incident create(const std::string& service, const std::string& error) {
    auto r = orch.create_incident(make_raw(service, error));
    EXPECT_TRUE(r.has_value()) << (r ? "" : r.error().message);
    return r ? *r : Incident{};
  }

  Incident fetch(const std::string& id) {
    auto r = orch.get_incident(id);
    EXPECT_TRUE(r.has_value());
    return r ? *r : Incident{};
  }

  std::vector<remedy::incident::IncidentEvent> events(const std::string& id) {
    auto r = orch.events_for(id);
    EXPECT_TRUE(r.has_value());
    return r ? *r : std::vector<remedy::incident::IncidentEvent>{};
  }

  CompletionReport done(const Incident& in, WorkflowOutcome outcome,
                        std::optional<std::string> pr = std::nullopt) {
    return CompletionReport{.repository = in.repository, .run_id = in.workflow_run_id.value_or(""),
                            .outcome = outcome, .diagnosis = "analysis", .pr_url = std::move(pr)};
  }

  ManualClock clock;
  InMemoryIncidentStore store;
  LocalDispatchQueueManager queue;
  ScriptedTransport transport;
  remedy::obs::CountingObserver observer;
  Orchestrator orch;
};

// --------------------------- Ingest ----------------------------------------

/**
 * @test Create_Routed_Dispatches
 * @brief A routed incident is persisted, admitted and triggered with the mapping's branch.
 */
TEST_F(OrchestratorTest, Create_Routed_Dispatches) {
  const Incident in = create("checkout", "NullPointerException");

  EXPECT_FALSE(in.id.empty());
  EXPECT_EQ(in.repository, kShop);
  EXPECT_EQ(in.status, IncidentStatus::WorkflowTriggered);
  EXPECT_EQ(in.workflow_run_id, std::optional<std::string>{"run-1"});
  EXPECT_TRUE(in.triggered_at.has_value());
  EXPECT_EQ(orch.active_count(kShop), 1u);

  const auto reqs = transport.requests();
  ASSERT_EQ(reqs.size(), 1u);
  EXPECT_EQ(reqs[0].repository, kShop);
  EXPECT_EQ(reqs[0].branch, "main");
  EXPECT_EQ(reqs[0].workflow, "remediate.yml");
  EXPECT_EQ(reqs[0].incident_id, in.id);
  EXPECT_EQ(transport.last_timeout(), 30s);

  const auto ev = events(in.id);
  EXPECT_EQ(count_events(ev, EventType::IncidentReceived), 1u);
  EXPECT_EQ(count_events(ev, EventType::StatusChanged), 1u);
  EXPECT_EQ(count_events(ev, EventType::WorkflowTriggered), 1u);

  const auto c = orch.counters();
  EXPECT_EQ(c.incidents_received, 1u);
  EXPECT_EQ(c.dispatched, 1u);
}

TEST_F(OrchestratorTest, Create_Uses_Default_Branch_When_Mapping_Has_None) {
  (void)create("billing", "boom");
  ASSERT_EQ(transport.calls(), 1u);
  EXPECT_EQ(transport.requests()[0].branch, "trunk");
}

TEST_F(OrchestratorTest, Create_Keeps_Supplied_Id) {
  Incident raw = make_raw("checkout", "boom");
  raw.id = "external-123";
  auto r = orch.create_incident(raw);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->id, "external-123");
}

TEST_F(OrchestratorTest, Create_Validation_Rejected_Before_Persist) {
  auto r = orch.create_incident(make_raw("", "boom"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Validation);

  Incident bad_sev = make_raw("checkout", "boom");
  bad_sev.severity = "apocalyptic";
  auto r2 = orch.create_incident(bad_sev);
  ASSERT_FALSE(r2.has_value());
  EXPECT_EQ(r2.error().code, ErrorCode::Validation);

  EXPECT_EQ(store.size(), 0u);
  EXPECT_EQ(transport.calls(), 0u);
}

/**
 * @test Create_Unroutable_Is_Failed
 * @brief No mapping: persisted failed with completed_at, never admitted, not an error.
 */
TEST_F(OrchestratorTest, Create_Unroutable_Is_Failed) {
  const Incident in = create("mystery", "boom");
  EXPECT_EQ(in.status, IncidentStatus::Failed);
  EXPECT_TRUE(in.repository.empty());
  EXPECT_TRUE(in.completed_at.has_value());
  EXPECT_FALSE(in.triggered_at.has_value());
  EXPECT_EQ(transport.calls(), 0u);
  EXPECT_EQ(orch.counters().unroutable, 1u);

  const auto ev = events(in.id);
  EXPECT_EQ(count_events(ev, EventType::IncidentReceived), 1u);
  EXPECT_EQ(count_events(ev, EventType::IncidentFailed), 1u);
}

/**
 * @test Create_Duplicate_Within_Window
 * @brief Same service and error 10 seconds apart with a 5 minute window: same id, one row.
 */
TEST_F(OrchestratorTest, Create_Duplicate_Within_Window) {
  const Incident first = create("checkout", "boom");
  clock.advance(10s);
  const Incident second = create("checkout", "boom");

  EXPECT_EQ(second.id, first.id);
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(transport.calls(), 1u);
  EXPECT_EQ(orch.counters().duplicates, 1u);
  EXPECT_EQ(count_events(events(first.id), EventType::DuplicateDetected), 1u);

  clock.advance(6min);
  const Incident third = create("checkout", "boom");
  EXPECT_NE(third.id, first.id);
  EXPECT_EQ(store.size(), 2u);
}

// --------------------------- Admission & completion ------------------------

/**
 * @test Ceiling_Queues_And_Completion_Advances
 * @brief Ceiling 1: second incident waits; completing the first dispatches it.
 */
TEST_F(OrchestratorTest, Ceiling_Queues_And_Completion_Advances) {
  const Incident a = create("checkout", "a");
  const Incident b = create("cart", "b");

  EXPECT_EQ(b.status, IncidentStatus::Pending);
  EXPECT_EQ(orch.active_count(kShop), 1u);
  EXPECT_EQ(orch.queued_count(kShop), 1u);
  EXPECT_EQ(count_events(events(b.id), EventType::QueuedForRemediation), 1u);

  ASSERT_TRUE(orch.on_workflow_completion(done(a, WorkflowOutcome::Success, "https://git/pr/1")).has_value());

  const Incident a2 = fetch(a.id);
  EXPECT_EQ(a2.status, IncidentStatus::PrCreated);
  EXPECT_EQ(a2.pull_request_url, std::optional<std::string>{"https://git/pr/1"});
  EXPECT_EQ(a2.diagnosis, std::optional<std::string>{"analysis"});
  EXPECT_EQ(count_events(events(a.id), EventType::WorkflowInProgress), 1u);
  EXPECT_EQ(count_events(events(a.id), EventType::PrCreated), 1u);

  const Incident b2 = fetch(b.id);
  EXPECT_EQ(b2.status, IncidentStatus::WorkflowTriggered);
  EXPECT_EQ(b2.workflow_run_id, std::optional<std::string>{"run-2"});
  EXPECT_EQ(orch.active_count(kShop), 1u);
  EXPECT_EQ(orch.queued_count(kShop), 0u);
  EXPECT_EQ(count_events(events(b.id), EventType::DequeuedForRemediation), 1u);
}

TEST_F(OrchestratorTest, Repositories_Have_Independent_Ceilings) {
  (void)create("checkout", "a");
  (void)create("cart", "b");
  (void)create("billing", "c");
  (void)create("billing", "d");
  (void)create("billing", "e");

  EXPECT_EQ(orch.active_count(kShop), 1u);
  EXPECT_EQ(orch.queued_count(kShop), 1u);
  EXPECT_EQ(orch.active_count(kBilling), 2u);
  EXPECT_EQ(orch.queued_count(kBilling), 1u);
}

TEST_F(OrchestratorTest, Completion_InProgress_Keeps_Slot) {
  const Incident a = create("checkout", "a");
  const Incident b = create("cart", "b");

  ASSERT_TRUE(orch.on_workflow_completion(done(a, WorkflowOutcome::InProgress)).has_value());
  EXPECT_EQ(fetch(a.id).status, IncidentStatus::InProgress);
  EXPECT_EQ(orch.active_count(kShop), 1u);
  EXPECT_EQ(fetch(b.id).status, IncidentStatus::Pending);

  // Success without a PR ends as no_fix_needed.
  ASSERT_TRUE(orch.on_workflow_completion(done(a, WorkflowOutcome::Success)).has_value());
  const Incident a2 = fetch(a.id);
  EXPECT_EQ(a2.status, IncidentStatus::NoFixNeeded);
  EXPECT_TRUE(a2.completed_at.has_value());
  EXPECT_EQ(fetch(b.id).status, IncidentStatus::WorkflowTriggered);
}

TEST_F(OrchestratorTest, Completion_Failed_Records_Diagnosis) {
  const Incident a = create("checkout", "a");
  ASSERT_TRUE(orch.on_workflow_completion(done(a, WorkflowOutcome::Failed)).has_value());

  const Incident a2 = fetch(a.id);
  EXPECT_EQ(a2.status, IncidentStatus::Failed);
  EXPECT_EQ(a2.diagnosis, std::optional<std::string>{"analysis"});
  EXPECT_EQ(orch.active_count(kShop), 0u);
  EXPECT_EQ(count_events(events(a.id), EventType::IncidentFailed), 1u);
}

TEST_F(OrchestratorTest, Completion_By_Incident_Id) {
  const Incident a = create("checkout", "a");
  CompletionReport report{.repository = kShop, .run_id = "", .incident_id = a.id,
                          .outcome = WorkflowOutcome::NoFixNeeded};
  ASSERT_TRUE(orch.on_workflow_completion(report).has_value());
  EXPECT_EQ(fetch(a.id).status, IncidentStatus::NoFixNeeded);
}

/**
 * @test Completion_Stale_Is_Ignored
 * @brief A repeated callback is ignored: no error, no second release, no underflow.
 */
TEST_F(OrchestratorTest, Completion_Stale_Is_Ignored) {
  const Incident a = create("checkout", "a");
  const auto report = done(a, WorkflowOutcome::Success, "https://git/pr/9");

  ASSERT_TRUE(orch.on_workflow_completion(report).has_value());
  ASSERT_TRUE(orch.on_workflow_completion(report).has_value());

  EXPECT_EQ(fetch(a.id).status, IncidentStatus::PrCreated);
  EXPECT_EQ(orch.active_count(kShop), 0u);
  EXPECT_EQ(queue.stats().underflows, 0u);
  const auto c = orch.counters();
  EXPECT_EQ(c.completions, 1u);
  EXPECT_EQ(c.completions_ignored, 1u);
}

TEST_F(OrchestratorTest, Completion_Unknown_Run_NotFound) {
  auto r = orch.on_workflow_completion(
      CompletionReport{.repository = kShop, .run_id = "run-404", .outcome = WorkflowOutcome::Success});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(OrchestratorTest, Resolve_After_Pr) {
  const Incident a = create("checkout", "a");
  auto early = orch.resolve_incident(a.id);
  ASSERT_FALSE(early.has_value());
  EXPECT_EQ(early.error().code, ErrorCode::InvalidTransition);

  ASSERT_TRUE(orch.on_workflow_completion(done(a, WorkflowOutcome::Success, "https://git/pr/2")).has_value());
  auto resolved = orch.resolve_incident(a.id);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(resolved->status, IncidentStatus::Resolved);
  EXPECT_EQ(count_events(events(a.id), EventType::IncidentResolved), 1u);
}

// --------------------------- Dispatch failures -----------------------------

/**
 * @test Dispatch_Exhaustion_Fails_And_Releases
 * @brief Three failed attempts: incident failed, slot freed, error not returned.
 */
TEST_F(OrchestratorTest, Dispatch_Exhaustion_Fails_And_Releases) {
  transport.fail_next(ErrorCode::DispatchFailure, 3);
  const Incident a = create("checkout", "a");

  EXPECT_EQ(a.status, IncidentStatus::Failed);
  EXPECT_TRUE(a.completed_at.has_value());
  EXPECT_EQ(transport.calls(), 3u);
  EXPECT_EQ(orch.active_count(kShop), 0u);
  EXPECT_EQ(orch.counters().dispatch_failures, 1u);
  EXPECT_EQ(count_events(events(a.id), EventType::IncidentFailed), 1u);

  // The freed slot is usable.
  const Incident b = create("cart", "b");
  EXPECT_EQ(b.status, IncidentStatus::WorkflowTriggered);
}

TEST_F(OrchestratorTest, Dispatch_Exhaustion_Advances_Backlog) {
  const Incident a = create("checkout", "a");
  const Incident b = create("cart", "b");
  const Incident c = create("checkout", "c");
  ASSERT_EQ(orch.queued_count(kShop), 2u);

  transport.fail_next(ErrorCode::DispatchFailure, 3);
  ASSERT_TRUE(orch.on_workflow_completion(done(a, WorkflowOutcome::Success, "https://git/pr/3")).has_value());

  EXPECT_EQ(fetch(b.id).status, IncidentStatus::Failed);
  const Incident c2 = fetch(c.id);
  EXPECT_EQ(c2.status, IncidentStatus::WorkflowTriggered);
  EXPECT_EQ(c2.workflow_run_id, std::optional<std::string>{"run-5"});
  EXPECT_EQ(orch.active_count(kShop), 1u);
  EXPECT_EQ(orch.queued_count(kShop), 0u);
}

TEST_F(OrchestratorTest, Dispatch_Timeout_Propagates) {
  transport.fail_next(ErrorCode::Timeout, 3);
  auto r = orch.create_incident(make_raw("checkout", "slow"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Timeout);

  auto all = orch.list_incidents();
  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 1u);
  EXPECT_EQ(all->front().status, IncidentStatus::Failed);
  EXPECT_EQ(orch.active_count(kShop), 0u);
}

// --------------------------- Manual trigger --------------------------------

TEST_F(OrchestratorTest, ManualTrigger_Rejected_While_In_Flight) {
  const Incident a = create("checkout", "a");
  auto r = orch.manual_trigger(a.id);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidTransition);
  EXPECT_EQ(transport.calls(), 1u);
}

TEST_F(OrchestratorTest, ManualTrigger_Retries_Failed) {
  transport.fail_next(ErrorCode::DispatchFailure, 3);
  const Incident a = create("checkout", "a");
  ASSERT_EQ(a.status, IncidentStatus::Failed);
  const auto first_completion = *a.completed_at;

  ASSERT_TRUE(orch.manual_trigger(a.id).has_value());
  const Incident a2 = fetch(a.id);
  EXPECT_EQ(a2.status, IncidentStatus::WorkflowTriggered);
  EXPECT_EQ(*a2.completed_at, first_completion);
  EXPECT_EQ(count_events(events(a.id), EventType::ManualTrigger), 1u);
  EXPECT_EQ(orch.active_count(kShop), 1u);
}

TEST_F(OrchestratorTest, ManualTrigger_Terminal_Rejected) {
  const Incident a = create("checkout", "a");
  ASSERT_TRUE(orch.on_workflow_completion(done(a, WorkflowOutcome::NoFixNeeded)).has_value());
  auto r = orch.manual_trigger(a.id);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidTransition);

  auto missing = orch.manual_trigger("nope");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(OrchestratorTest, ManualTrigger_Queued_Only_Logs) {
  (void)create("checkout", "a");
  const Incident b = create("cart", "b");
  ASSERT_TRUE(orch.manual_trigger(b.id).has_value());
  EXPECT_EQ(orch.queued_count(kShop), 1u);
  EXPECT_EQ(transport.calls(), 1u);
}

/**
 * @test ManualTrigger_Unroutable_After_Reload
 * @brief Unroutable stays an error until a mapping is added; then it dispatches.
 */
TEST_F(OrchestratorTest, ManualTrigger_Unroutable_After_Reload) {
  const Incident in = create("search", "boom");
  ASSERT_EQ(in.status, IncidentStatus::Failed);

  auto r = orch.manual_trigger(in.id);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::UnroutableService);

  auto cfg = base_config();
  cfg.service_mappings.push_back(ServiceMapping{.service_name = "search", .repository = "acme/search"});
  ASSERT_TRUE(orch.apply_config(cfg).has_value());

  ASSERT_TRUE(orch.manual_trigger(in.id).has_value());
  const Incident in2 = fetch(in.id);
  EXPECT_EQ(in2.repository, "acme/search");
  EXPECT_EQ(in2.status, IncidentStatus::WorkflowTriggered);
}

// --------------------------- Rules & config --------------------------------

TEST_F(OrchestratorTest, Rule_Skip_Then_Manual_Trigger) {
  auto cfg = base_config();
  remedy::routing::CustomRule quiet;
  quiet.name = "quiet-staging";
  quiet.conditions.metadata = {{"env", "staging"}};
  quiet.actions.skip_remediation = true;
  cfg.custom_rules.push_back(quiet);
  ASSERT_TRUE(orch.apply_config(cfg).has_value());

  Incident raw = make_raw("checkout", "boom");
  raw.provider_data = {{"env", "staging"}};
  auto r = orch.create_incident(raw);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, IncidentStatus::Pending);
  EXPECT_EQ(r->repository, kShop);
  EXPECT_EQ(r->provider_data.at(Orchestrator::kSkippedKey), true);
  EXPECT_EQ(transport.calls(), 0u);
  EXPECT_EQ(orch.counters().remediation_skipped, 1u);

  ASSERT_TRUE(orch.manual_trigger(r->id).has_value());
  const Incident after = fetch(r->id);
  EXPECT_EQ(after.status, IncidentStatus::WorkflowTriggered);
  EXPECT_FALSE(after.provider_data.contains(Orchestrator::kSkippedKey));
}

TEST_F(OrchestratorTest, Rule_Overrides_Repository_And_Severity) {
  auto cfg = base_config();
  remedy::routing::CustomRule r;
  r.name = "payments-oom";
  r.conditions.service_name = "checkout";
  r.conditions.error_pattern = "OutOfMemory";
  r.actions.set_repository = "acme/platform";
  r.actions.set_severity = "critical";
  cfg.custom_rules.push_back(r);
  ASSERT_TRUE(orch.apply_config(cfg).has_value());

  const Incident in = create("checkout", "java.lang.OutOfMemoryError");
  EXPECT_EQ(in.repository, "acme/platform");
  EXPECT_EQ(in.severity, "critical");
  EXPECT_EQ(in.status, IncidentStatus::WorkflowTriggered);
  // No mapping targets acme/platform: default branch.
  EXPECT_EQ(transport.requests()[0].branch, "trunk");
}

TEST_F(OrchestratorTest, ApplyConfig_Rejects_And_Keeps_Previous) {
  auto bad = base_config();
  bad.service_mappings.push_back(ServiceMapping{.service_name = "checkout", .repository = "x/y"});
  auto r = orch.apply_config(bad);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Config);

  EXPECT_EQ(create("checkout", "a").repository, kShop);
}

TEST_F(OrchestratorTest, ApplyConfig_Raises_Ceiling) {
  (void)create("checkout", "a");
  EXPECT_EQ(create("cart", "b").status, IncidentStatus::Pending);

  auto cfg = base_config();
  cfg.concurrency.per_repository[kShop] = 3;
  ASSERT_TRUE(orch.apply_config(cfg).has_value());

  EXPECT_EQ(create("checkout", "c").status, IncidentStatus::WorkflowTriggered);
  EXPECT_EQ(orch.active_count(kShop), 2u);
}

// --------------------------- Restart ---------------------------------------

/**
 * @test Reconcile_Restores_Active_And_Backlog
 * @brief A fresh queue manager over the same store rebuilds active counts and the backlog.
 */
TEST_F(OrchestratorTest, Reconcile_Restores_Active_And_Backlog) {
  const Incident a = create("checkout", "a");
  const Incident b = create("cart", "b");
  ASSERT_EQ(b.status, IncidentStatus::Pending);

  LocalDispatchQueueManager fresh_queue(store);
  Orchestrator restarted(
      Collaborators{.store = store, .transport = transport, .queue = fresh_queue, .clock = clock,
                    .observer = &observer, .sleeper = [](std::chrono::milliseconds) {}},
      base_config());

  auto report = restarted.reconcile();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->repositories, 1u);
  EXPECT_EQ(report->active_restored, 1u);
  EXPECT_EQ(report->queued, 1u);
  EXPECT_EQ(report->dispatched, 0u);
  EXPECT_EQ(restarted.active_count(kShop), 1u);
  EXPECT_EQ(restarted.queued_count(kShop), 1u);

  ASSERT_TRUE(restarted.on_workflow_completion(done(a, WorkflowOutcome::Success)).has_value());
  EXPECT_EQ(fetch(b.id).status, IncidentStatus::WorkflowTriggered);
  EXPECT_EQ(restarted.active_count(kShop), 1u);
}

TEST_F(OrchestratorTest, Reconcile_Dispatches_When_Capacity_Free) {
  (void)create("checkout", "a");
  const Incident b = create("cart", "b");

  // Restart with a larger ceiling: b no longer has to wait.
  auto cfg = base_config();
  cfg.concurrency.per_repository[kShop] = 2;
  LocalDispatchQueueManager fresh_queue(store);
  Orchestrator restarted(
      Collaborators{.store = store, .transport = transport, .queue = fresh_queue, .clock = clock,
                    .observer = &observer, .sleeper = [](std::chrono::milliseconds) {}},
      cfg);

  auto report = restarted.reconcile();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->dispatched, 1u);
  EXPECT_EQ(fetch(b.id).status, IncidentStatus::WorkflowTriggered);
  EXPECT_EQ(restarted.active_count(kShop), 2u);
}

// --------------------------- Store failures --------------------------------

TEST(OrchestratorStore, Create_Store_Error_Propagates) {
  ManualClock clock;
  FailingCreateStore store(clock);
  LocalDispatchQueueManager queue(store);
  ScriptedTransport transport;
  remedy::obs::CountingObserver observer;
  Orchestrator orch(Collaborators{.store = store, .transport = transport, .queue = queue,
                                  .clock = clock, .observer = &observer},
                    base_config());

  auto r = orch.create_incident(make_raw("checkout", "boom"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Store);
  EXPECT_EQ(transport.calls(), 0u);
  EXPECT_EQ(orch.active_count(kShop), 0u);
  EXPECT_EQ(observer.snapshot().incidents_received, 0u);
}

/**
 * @test Unrecorded_Dispatch_Keeps_Slot
 * @brief The job was launched but its run id could not be stored: the error is
 *        returned and the slot stays taken, so the backlog does not overtake it.
 */
TEST(OrchestratorStore, Unrecorded_Dispatch_Keeps_Slot) {
  ManualClock clock;
  UnrecordedDispatchStore store(clock);
  LocalDispatchQueueManager queue(store);
  ScriptedTransport transport;
  remedy::obs::CountingObserver observer;
  Orchestrator orch(Collaborators{.store = store, .transport = transport, .queue = queue,
                                  .clock = clock, .observer = &observer},
                    base_config());

  auto r = orch.create_incident(make_raw("checkout", "boom"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::Store);
  EXPECT_EQ(transport.calls(), 1u);
  EXPECT_EQ(orch.active_count(kShop), 1u);

  auto next = orch.create_incident(make_raw("cart", "other"));
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->status, IncidentStatus::Pending);
  EXPECT_EQ(orch.queued_count(kShop), 1u);
  EXPECT_EQ(transport.calls(), 1u);
}

// --------------------------- Construction ----------------------------------

TEST(OrchestratorConfig, Create_Rejects_Invalid_Config) {
  ManualClock clock;
  InMemoryIncidentStore store(clock);
  LocalDispatchQueueManager queue(store);
  ScriptedTransport transport;
  remedy::obs::CountingObserver observer;
  const Collaborators c{.store = store, .transport = transport, .queue = queue,
                        .clock = clock, .observer = &observer};

  auto bad = base_config();
  bad.service_mappings.push_back(ServiceMapping{.service_name = "checkout", .repository = "x/y"});
  auto rejected = Orchestrator::create(c, bad);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().code, ErrorCode::Config);

  auto built = Orchestrator::create(c, base_config());
  ASSERT_TRUE(built.has_value());
  auto in = (*built)->create_incident(make_raw("checkout", "boom"));
  ASSERT_TRUE(in.has_value());
  EXPECT_EQ(in->repository, kShop);
  EXPECT_EQ(in->status, IncidentStatus::WorkflowTriggered);
}

/**
 * @test Constructor_Rejected_Mappings_Route_Nothing
 * @brief Built directly from an invalid config, no mapping is published until a
 *        valid configuration is applied.
 */
TEST(OrchestratorConfig, Constructor_Rejected_Mappings_Route_Nothing) {
  ManualClock clock;
  InMemoryIncidentStore store(clock);
  LocalDispatchQueueManager queue(store);
  ScriptedTransport transport;
  remedy::obs::CountingObserver observer;

  auto bad = base_config();
  bad.service_mappings.push_back(ServiceMapping{.service_name = "billing", .repository = "x/y"});
  Orchestrator orch(Collaborators{.store = store, .transport = transport, .queue = queue,
                                  .clock = clock, .observer = &observer},
                    bad);

  auto lost = orch.create_incident(make_raw("checkout", "boom"));
  ASSERT_TRUE(lost.has_value());
  EXPECT_EQ(lost->status, IncidentStatus::Failed);
  EXPECT_TRUE(lost->repository.empty());
  EXPECT_EQ(transport.calls(), 0u);

  ASSERT_TRUE(orch.apply_config(base_config()).has_value());
  auto routed = orch.create_incident(make_raw("checkout", "other"));
  ASSERT_TRUE(routed.has_value());
  EXPECT_EQ(routed->status, IncidentStatus::WorkflowTriggered);
}

// --------------------------- Concurrency -----------------------------------

/**
 * @test Concurrent_Creates_Respect_Ceiling
 * @brief Parallel distinct incidents for one repository: exactly the ceiling is in flight.
 */
TEST_F(OrchestratorTest, Concurrent_Creates_Respect_Ceiling) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 10;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto r = orch.create_incident(make_raw("billing", "err-" + std::to_string(t) + "-" + std::to_string(i)));
        EXPECT_TRUE(r.has_value());
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(orch.active_count(kBilling), 2u);
  EXPECT_EQ(orch.queued_count(kBilling), static_cast<std::size_t>(kThreads * kPerThread - 2));
  EXPECT_EQ(transport.calls(), 2u);

  auto all = orch.list_incidents();
  ASSERT_TRUE(all.has_value());
  std::size_t triggered = 0;
  for (const auto& in : *all) triggered += in.status == IncidentStatus::WorkflowTriggered ? 1 : 0;
  EXPECT_EQ(triggered, 2u);
}

/**
 * @test Concurrent_Manual_Triggers_Dispatch_Once
 * @brief Two triggers race on one held incident with a slow transport and free
 *        capacity: one job is launched, the loser is rejected and frees its slot.
 */
TEST_F(OrchestratorTest, Concurrent_Manual_Triggers_Dispatch_Once) {
  auto cfg = base_config();
  remedy::routing::CustomRule hold;
  hold.name = "hold-billing";
  hold.conditions.service_name = "billing";
  hold.actions.skip_remediation = true;
  cfg.custom_rules.push_back(hold);
  ASSERT_TRUE(orch.apply_config(cfg).has_value());

  auto held = orch.create_incident(make_raw("billing", "boom"));
  ASSERT_TRUE(held.has_value());
  ASSERT_EQ(held->status, IncidentStatus::Pending);
  ASSERT_EQ(transport.calls(), 0u);

  transport.set_delay(200ms);
  std::atomic<int> ok{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 2; ++t) {
    threads.emplace_back([&] {
      auto r = orch.manual_trigger(held->id);
      if (r) {
        ++ok;
      } else if (r.error().code == ErrorCode::InvalidTransition) {
        ++rejected;
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(transport.calls(), 1u);
  EXPECT_EQ(ok.load(), 1);
  EXPECT_EQ(rejected.load(), 1);
  EXPECT_EQ(orch.active_count(kBilling), 1u);
  EXPECT_EQ(fetch(held->id).status, IncidentStatus::WorkflowTriggered);
}
