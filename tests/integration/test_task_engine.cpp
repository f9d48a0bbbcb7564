/**
 * @file test_task_engine.cpp
 * @brief Integration tests driving tasks through the engine against the simulated runtime.
 */

#include "engine_harness.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <ctime>
#include <latch>
#include <thread>
#include <vector>

using namespace node_agent;
using namespace node_agent::harness;

class TaskEngineTest : public ::testing::Test {
protected:
    void start_engine(Config config = fast_config(),
                      ResourceRequirements capacity = {.cpu_units = 1024, .memory_mb = 1024}) {
        engine_ = std::make_unique<TaskEngine>(TaskEngine::Options{
            .config = std::move(config),
            .capacity = std::move(capacity),
            .driver = runtime_,
            .provisioner = provisioner_,
            .logger = logger_,
        });
        ASSERT_TRUE(engine_->start().has_value());
        recorder_ = std::make_unique<EventRecorder>(*engine_);
    }

    void TearDown() override {
        recorder_.reset();
        engine_.reset();
    }

    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error};
    SimulatedRuntime runtime_;
    RecordingProvisioner provisioner_{runtime_};
    std::unique_ptr<TaskEngine> engine_;
    std::unique_ptr<EventRecorder> recorder_;
};

// ═══════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════

TEST_F(TaskEngineTest, TaskReachesRunningThenStops) {
    start_engine();
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/1", 256, 256)).has_value());

    ASSERT_TRUE(recorder_->wait_for_task("arn:task/1", TaskStatus::Running));
    EXPECT_TRUE(recorder_->container_event("arn:task/1", "app", ContainerStatus::Running).has_value());
    EXPECT_EQ(runtime_.status_of("arn:task/1", "app").value_or(ContainerStatus::None),
              ContainerStatus::Running);
    EXPECT_TRUE(engine_->ledger().is_consuming("arn:task/1"));

    // The resolved digest makes MANIFEST_PULLED reportable, before RUNNING.
    auto manifest = recorder_->task_event("arn:task/1", TaskStatus::ManifestPulled);
    ASSERT_TRUE(manifest.has_value());
    const int manifest_at = recorder_->index_of([](const StateChangeEvent& e) {
        const auto* c = std::get_if<TaskStateChange>(&e);
        return c != nullptr && c->status == TaskStatus::ManifestPulled;
    });
    const int running_at = recorder_->index_of([](const StateChangeEvent& e) {
        const auto* c = std::get_if<TaskStateChange>(&e);
        return c != nullptr && c->status == TaskStatus::Running;
    });
    EXPECT_LT(manifest_at, running_at);

    ASSERT_TRUE(engine_->add_task(stop_request("arn:task/1")).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/1", TaskStatus::Stopped));

    auto stopped = recorder_->container_event("arn:task/1", "app", ContainerStatus::Stopped);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->exit_code.value_or(-1), 0);
    EXPECT_TRUE(eventually([&] { return !engine_->ledger().is_consuming("arn:task/1"); }));

    auto task = engine_->task_by_arn("arn:task/1");
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->known_status(), TaskStatus::Stopped);
    EXPECT_TRUE(eventually([&] { return task->sent_status() == TaskStatus::Stopped; }));
}

TEST_F(TaskEngineTest, EachStatusIsReportedOnce) {
    start_engine();
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/1", 128, 128)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/1", TaskStatus::Running));
    recorder_->drain(Duration{200});

    size_t running_events = 0;
    for (const auto& event : recorder_->seen()) {
        if (const auto* c = std::get_if<TaskStateChange>(&event); c && c->status == TaskStatus::Running) {
            ++running_events;
        }
    }
    EXPECT_EQ(running_events, 1u);
}

TEST_F(TaskEngineTest, EssentialExitStopsWholeTask) {
    start_engine();
    auto sidecar = container("sidecar");
    sidecar.essential = false;
    runtime_.script_exit("app", 1, Duration{50});

    ASSERT_TRUE(engine_->add_task(task("arn:task/ess", {container("app"), sidecar})).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/ess", TaskStatus::Stopped));

    auto stopped = recorder_->task_event("arn:task/ess", TaskStatus::Stopped);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->reason, "Essential container in task exited");
    EXPECT_TRUE(stopped->execution_stopped_at.has_value());

    auto app = recorder_->container_event("arn:task/ess", "app", ContainerStatus::Stopped);
    ASSERT_TRUE(app.has_value());
    EXPECT_EQ(app->exit_code.value_or(-1), 1);
    EXPECT_EQ(runtime_.status_of("arn:task/ess", "sidecar").value_or(ContainerStatus::None),
              ContainerStatus::Stopped);
}

TEST_F(TaskEngineTest, NonEssentialExitKeepsTaskRunning) {
    start_engine();
    auto helper = container("helper");
    helper.essential = false;
    runtime_.script_exit("helper", 0, Duration{10});

    ASSERT_TRUE(engine_->add_task(task("arn:task/ne", {container("app"), helper})).has_value());
    ASSERT_TRUE(recorder_->wait_for_container("arn:task/ne", "helper", ContainerStatus::Stopped));
    recorder_->drain(Duration{150});

    EXPECT_FALSE(recorder_->task_event("arn:task/ne", TaskStatus::Stopped).has_value());
    EXPECT_EQ(runtime_.status_of("arn:task/ne", "app").value_or(ContainerStatus::None),
              ContainerStatus::Running);
}

// ═══════════════════════════════════════════════
// Dependencies
// ═══════════════════════════════════════════════

TEST_F(TaskEngineTest, CompleteDependencyOrdersStartup) {
    start_engine();
    auto init = container("init");
    init.essential = false;
    auto app = container("app");
    app.depends_on = {DependsOn{.container_name = "init", .condition = DependencyCondition::Complete}};
    runtime_.script_exit("init", 0, Duration{100});

    ASSERT_TRUE(engine_->add_task(task("arn:task/dep", {init, app})).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/dep", TaskStatus::Running));

    const int init_stopped = recorder_->index_of(
        is_container_event("arn:task/dep", "init", ContainerStatus::Stopped));
    const int app_running = recorder_->index_of(
        is_container_event("arn:task/dep", "app", ContainerStatus::Running));
    ASSERT_GE(init_stopped, 0);
    ASSERT_GE(app_running, 0);
    EXPECT_LT(init_stopped, app_running);
}

TEST_F(TaskEngineTest, ManifestPullIsNotGatedByDependencies) {
    start_engine();
    auto init = container("init");
    init.essential = false;
    auto app = container("app");
    app.depends_on = {DependsOn{.container_name = "init", .condition = DependencyCondition::Complete}};
    runtime_.script_exit("init", 0, Duration{300});

    ASSERT_TRUE(engine_->add_task(task("arn:task/mp", {init, app})).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/mp", TaskStatus::Running));

    const int app_manifest = recorder_->index_of(
        is_container_event("arn:task/mp", "app", ContainerStatus::ManifestPulled));
    const int init_stopped = recorder_->index_of(
        is_container_event("arn:task/mp", "init", ContainerStatus::Stopped));
    ASSERT_GE(app_manifest, 0);
    ASSERT_GE(init_stopped, 0);
    EXPECT_LT(app_manifest, init_stopped);
}

TEST_F(TaskEngineTest, FailedSuccessDependencyStopsTask) {
    start_engine();
    auto migrate = container("migrate");
    migrate.essential = false;
    auto app = container("app");
    app.depends_on = {DependsOn{.container_name = "migrate", .condition = DependencyCondition::Success}};
    runtime_.script_exit("migrate", 3, Duration{10});

    ASSERT_TRUE(engine_->add_task(task("arn:task/succ", {migrate, app})).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/succ", TaskStatus::Stopped));

    auto app_stopped = recorder_->container_event("arn:task/succ", "app", ContainerStatus::Stopped);
    ASSERT_TRUE(app_stopped.has_value());
    EXPECT_NE(app_stopped->reason.find("exited with code 3"), std::string::npos);
    EXPECT_FALSE(runtime_.status_of("arn:task/succ", "app").has_value());
}

TEST_F(TaskEngineTest, RetryBlockedOnDependencyWaitsQuietly) {
    auto config = fast_config();
    config.engine.retry_backoff_ms = 200;
    start_engine(config);

    auto db = container("db");
    db.essential = false;
    auto web = container("web");
    web.depends_on = {DependsOn{.container_name = "db", .condition = DependencyCondition::Healthy}};
    runtime_.set_health("db", HealthStatus::Healthy);
    runtime_.inject_failure(RuntimeOperation::Create, ErrorKind::Transient, "daemon busy", 1, "web");

    ASSERT_TRUE(engine_->add_task(task("arn:task/idle", {db, web})).has_value());
    ASSERT_TRUE(eventually([&] { return runtime_.call_count(RuntimeOperation::Create) >= 2; }));

    // db turns unhealthy while web's create is backing off; let the backoff lapse.
    runtime_.set_health("db", HealthStatus::Unhealthy);
    std::this_thread::sleep_for(400ms);

    const std::clock_t cpu_before = std::clock();
    std::this_thread::sleep_for(500ms);
    const double cpu_ms = 1000.0 * static_cast<double>(std::clock() - cpu_before) / CLOCKS_PER_SEC;
    EXPECT_LT(cpu_ms, 200.0);
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::Create), 2u);

    runtime_.set_health("db", HealthStatus::Healthy);
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/idle", TaskStatus::Running));
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::Create), 3u);
}

// ═══════════════════════════════════════════════
// Task network, resources and managed agents
// ═══════════════════════════════════════════════

TEST_F(TaskEngineTest, PauseContainerProvisionsNetworkBeforeAppContainers) {
    auto config = fast_config();
    config.engine.task_cleanup_wait_ms = 50;
    start_engine(config);

    auto pause = container("~internal~pause");
    pause.kind = ContainerKind::Pause;
    pause.essential = false;
    auto app = container("app");
    app.managed_agents = {"ExecuteCommandAgent"};
    auto def = task("arn:task/net", {pause, app});
    def.resources = {TaskResource{.name = "data", .kind = TaskResourceKind::Volume}};
    def.attachments = {Attachment{.arn = "arn:eni/1"}};

    ASSERT_TRUE(engine_->add_task(std::move(def)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/net", TaskStatus::Running));

    // Only the pause container existed when the network was set up.
    EXPECT_EQ(provisioner_.containers_at_network_setup(), std::optional<size_t>{1});
    auto calls = provisioner_.calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_EQ(calls[0], "create data");
    EXPECT_EQ(calls[1], "network");

    auto is_agent = [](ManagedAgentStatus status) {
        return [status](const StateChangeEvent& e) {
            const auto* c = std::get_if<ManagedAgentStateChange>(&e);
            return c != nullptr && c->container_name == "app" && c->name == "ExecuteCommandAgent" &&
                   c->status == status;
        };
    };
    auto is_task = [](TaskStatus status) {
        return [status](const StateChangeEvent& e) {
            const auto* c = std::get_if<TaskStateChange>(&e);
            return c != nullptr && c->task_arn == "arn:task/net" && c->status == status;
        };
    };
    const int attached = recorder_->index_of([](const StateChangeEvent& e) {
        const auto* c = std::get_if<AttachmentStateChange>(&e);
        return c != nullptr && c->attachment_arn == "arn:eni/1" && c->status == AttachmentStatus::Attached;
    });
    const int app_running = recorder_->index_of(
        is_container_event("arn:task/net", "app", ContainerStatus::Running));
    const int agent_running = recorder_->index_of(is_agent(ManagedAgentStatus::Running));
    const int task_running = recorder_->index_of(is_task(TaskStatus::Running));
    ASSERT_GE(attached, 0);
    ASSERT_GE(app_running, 0);
    ASSERT_GE(agent_running, 0);
    EXPECT_LT(app_running, agent_running);
    EXPECT_LT(agent_running, task_running);
    EXPECT_LT(attached, task_running);

    ASSERT_TRUE(engine_->add_task(stop_request("arn:task/net")).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/net", TaskStatus::Stopped));

    const int app_stopped = recorder_->index_of(
        is_container_event("arn:task/net", "app", ContainerStatus::Stopped));
    const int agent_stopped = recorder_->index_of(is_agent(ManagedAgentStatus::Stopped));
    const int task_stopped = recorder_->index_of(is_task(TaskStatus::Stopped));
    ASSERT_GE(app_stopped, 0);
    ASSERT_GE(agent_stopped, 0);
    EXPECT_LT(app_stopped, agent_stopped);
    EXPECT_LT(agent_stopped, task_stopped);

    // The pause container is internal and never reported.
    const auto& seen = recorder_->seen();
    EXPECT_EQ(std::count_if(seen.begin(), seen.end(), [](const StateChangeEvent& e) {
                  const auto* c = std::get_if<ContainerStateChange>(&e);
                  return c != nullptr && c->container_name == "~internal~pause";
              }),
              0);

    EXPECT_TRUE(eventually([&] {
        auto now = provisioner_.calls();
        return std::find(now.begin(), now.end(), "cleanup data") != now.end();
    }));
    EXPECT_TRUE(eventually([&] { return engine_->task_by_arn("arn:task/net") == nullptr; }));
}

// ═══════════════════════════════════════════════
// Admission
// ═══════════════════════════════════════════════

TEST_F(TaskEngineTest, WaitingTasksAreAdmittedInArrivalOrder) {
    start_engine();
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/a", 600, 100)).has_value());
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/b", 600, 100)).has_value());
    // Would fit right now, but must not overtake b.
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/c", 100, 100)).has_value());

    EXPECT_EQ(engine_->waiting_count(), 2u);
    ASSERT_NE(engine_->top_task(), nullptr);
    EXPECT_EQ(engine_->top_task()->arn(), "arn:task/b");
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/a", TaskStatus::Running));
    recorder_->drain(Duration{100});
    EXPECT_EQ(recorder_->count_for("arn:task/c"), 0u);
    EXPECT_FALSE(runtime_.status_of("arn:task/c", "app").has_value());

    ASSERT_TRUE(engine_->add_task(stop_request("arn:task/a")).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/a", TaskStatus::Stopped));
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/b", TaskStatus::Running));
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/c", TaskStatus::Running));
    EXPECT_EQ(engine_->waiting_count(), 0u);
    EXPECT_EQ(engine_->ledger().consumed().cpu_units, 700u);
}

TEST_F(TaskEngineTest, ConcurrentAddsOfOneTaskAdmitItOnce) {
    constexpr int kCallers = 8;
    start_engine();
    std::atomic<int> accepted{0};

    {
        std::latch start(kCallers);
        std::vector<std::jthread> callers;
        for (int i = 0; i < kCallers; ++i) {
            callers.emplace_back([&] {
                start.arrive_and_wait();
                if (engine_->add_task(sized_task("arn:task/race", 300, 300))) ++accepted;
            });
        }
    }

    EXPECT_EQ(accepted.load(), kCallers);
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/race", TaskStatus::Running));
    recorder_->drain(Duration{100});

    EXPECT_EQ(engine_->list_tasks().size(), 1u);
    EXPECT_EQ(engine_->managed_task_count(), 1u);
    EXPECT_EQ(engine_->ledger().consumed().cpu_units, 300u);
    EXPECT_EQ(engine_->ledger().snapshot().size(), 1u);
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::Create), 1u);
}

TEST_F(TaskEngineTest, QueuedTaskStopsWithoutTouchingRuntime) {
    start_engine();
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/a", 1000, 100)).has_value());
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/b", 1000, 100)).has_value());
    ASSERT_EQ(engine_->waiting_count(), 1u);

    ASSERT_TRUE(engine_->add_task(stop_request("arn:task/b")).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/b", TaskStatus::Stopped, Duration{1000}));

    EXPECT_EQ(engine_->waiting_count(), 0u);
    EXPECT_FALSE(engine_->ledger().is_consuming("arn:task/b"));
    EXPECT_FALSE(runtime_.status_of("arn:task/b", "app").has_value());
    EXPECT_FALSE(recorder_->task_event("arn:task/b", TaskStatus::Running).has_value());
}

TEST_F(TaskEngineTest, TaskAddedAlreadyStoppedIsReportedStopped) {
    start_engine();
    auto def = sized_task("arn:task/late", 100, 100);
    def.desired_status = TaskStatus::Stopped;
    ASSERT_TRUE(engine_->add_task(std::move(def)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/late", TaskStatus::Stopped));
    EXPECT_FALSE(runtime_.status_of("arn:task/late", "app").has_value());
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::PullManifest), 0u);
}

TEST_F(TaskEngineTest, ExemptLaunchTypeBypassesQueue) {
    start_engine();
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/a", 1000, 100)).has_value());
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/b", 1000, 100)).has_value());
    ASSERT_EQ(engine_->waiting_count(), 1u);

    auto fargate = sized_task("arn:task/f", 8000, 8000);
    fargate.launch_type = "FARGATE";
    ASSERT_TRUE(engine_->add_task(std::move(fargate)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/f", TaskStatus::Running));
    EXPECT_FALSE(engine_->ledger().is_consuming("arn:task/f"));
    EXPECT_EQ(engine_->waiting_count(), 1u);
}

TEST_F(TaskEngineTest, ImpossibleTaskIsRefusedAndStopped) {
    start_engine();
    auto result = engine_->add_task(sized_task("arn:task/huge", 4096, 100));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);

    ASSERT_TRUE(recorder_->wait_for_task("arn:task/huge", TaskStatus::Stopped));
    auto stopped = recorder_->task_event("arn:task/huge", TaskStatus::Stopped);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_NE(stopped->reason.find("more than the host can ever provide"), std::string::npos);
    EXPECT_EQ(engine_->waiting_count(), 0u);
}

TEST_F(TaskEngineTest, ReservedPortMakesTaskImpossible) {
    start_engine(fast_config(), ResourceRequirements{.cpu_units = 1024, .memory_mb = 1024, .ports = {22}});
    auto def = sized_task("arn:task/ssh", 10, 10);
    def.containers[0].port_bindings = {PortBinding{.container_port = 22, .host_port = 22}};
    auto result = engine_->add_task(std::move(def));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
}

// ═══════════════════════════════════════════════
// Invalid definitions
// ═══════════════════════════════════════════════

TEST_F(TaskEngineTest, DependencyCycleIsRefusedAndStopped) {
    start_engine();
    auto a = container("a");
    a.depends_on = {DependsOn{.container_name = "b"}};
    auto b = container("b");
    b.depends_on = {DependsOn{.container_name = "a"}};

    auto result = engine_->add_task(task("arn:task/cycle", {a, b}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);

    ASSERT_TRUE(recorder_->wait_for_task("arn:task/cycle", TaskStatus::Stopped));
    auto stopped = recorder_->task_event("arn:task/cycle", TaskStatus::Stopped);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_NE(stopped->reason.find("cycle"), std::string::npos);
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::PullManifest), 0u);
}

TEST_F(TaskEngineTest, TaskWithoutContainersIsRefused) {
    start_engine();
    auto result = engine_->add_task(task("arn:task/empty", {}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Configuration);
    EXPECT_EQ(engine_->task_by_arn("arn:task/empty"), nullptr);
    EXPECT_EQ(engine_->managed_task_count(), 0u);
}

// ═══════════════════════════════════════════════
// Runtime failures
// ═══════════════════════════════════════════════

TEST_F(TaskEngineTest, ManifestPullTimeoutStopsTask) {
    auto config = fast_config();
    config.engine.manifest_pull_timeout_ms = 50;
    runtime_.set_delay(RuntimeOperation::PullManifest, Duration{5000});
    start_engine(config);

    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/slow", 100, 100)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/slow", TaskStatus::Stopped));

    auto container_stopped =
        recorder_->container_event("arn:task/slow", "app", ContainerStatus::Stopped);
    ASSERT_TRUE(container_stopped.has_value());
    EXPECT_EQ(container_stopped->reason,
              "could not transition to MANIFEST_PULLED; timed out after 50ms");
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::PullManifest), 3u);
    EXPECT_FALSE(runtime_.status_of("arn:task/slow", "app").has_value());
}

TEST_F(TaskEngineTest, TransientFailureIsRetried) {
    start_engine();
    runtime_.inject_failure(RuntimeOperation::Create, ErrorKind::Transient, "daemon busy", 2);
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/retry", 100, 100)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/retry", TaskStatus::Running));
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::Create), 3u);
}

TEST_F(TaskEngineTest, TerminalFailureIsNotRetried) {
    start_engine();
    runtime_.inject_failure(RuntimeOperation::PullImage, ErrorKind::Terminal, "manifest unknown");
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/term", 100, 100)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/term", TaskStatus::Stopped));
    EXPECT_EQ(runtime_.call_count(RuntimeOperation::PullImage), 1u);

    auto stopped = recorder_->container_event("arn:task/term", "app", ContainerStatus::Stopped);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->reason, "manifest unknown");
}

TEST_F(TaskEngineTest, ContainerIgnoringStopIsKilled) {
    start_engine();
    runtime_.ignore_stop_signal("app");
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/stubborn", 100, 100)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/stubborn", TaskStatus::Running));

    ASSERT_TRUE(engine_->add_task(stop_request("arn:task/stubborn")).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/stubborn", TaskStatus::Stopped));
    auto stopped = recorder_->container_event("arn:task/stubborn", "app", ContainerStatus::Stopped);
    ASSERT_TRUE(stopped.has_value());
    EXPECT_EQ(stopped->exit_code.value_or(-1), SimulatedRuntime::kKilledExitCode);
}

// ═══════════════════════════════════════════════
// Cleanup and shutdown
// ═══════════════════════════════════════════════

TEST_F(TaskEngineTest, StoppedTaskIsCleanedUpAfterWait) {
    auto config = fast_config();
    config.engine.task_cleanup_wait_ms = 50;
    start_engine(config);

    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/gc", 100, 100)).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/gc", TaskStatus::Running));
    ASSERT_TRUE(engine_->add_task(stop_request("arn:task/gc")).has_value());
    ASSERT_TRUE(recorder_->wait_for_task("arn:task/gc", TaskStatus::Stopped));

    EXPECT_TRUE(eventually([&] { return engine_->task_by_arn("arn:task/gc") == nullptr; }));
    EXPECT_EQ(runtime_.container_count(), 0u);
    EXPECT_TRUE(engine_->list_tasks().empty());
}

TEST_F(TaskEngineTest, InternalTaskRunsWithoutEvents) {
    auto config = fast_config();
    config.engine.task_cleanup_wait_ms = 20;
    start_engine(config);

    auto def = sized_task("arn:task/internal", 100, 100);
    def.is_internal = true;
    ASSERT_TRUE(engine_->add_task(std::move(def)).has_value());
    ASSERT_TRUE(eventually([&] {
        return runtime_.status_of("arn:task/internal", "app") == ContainerStatus::Running;
    }));

    ASSERT_TRUE(engine_->add_task(stop_request("arn:task/internal")).has_value());
    EXPECT_TRUE(eventually([&] { return engine_->task_by_arn("arn:task/internal") == nullptr; }));
    EXPECT_FALSE(engine_->ledger().is_consuming("arn:task/internal"));
    recorder_->drain(Duration{50});
    EXPECT_EQ(recorder_->count_for("arn:task/internal"), 0u);
}

TEST_F(TaskEngineTest, ShutdownCancelsPendingRuntimeCalls) {
    start_engine();
    runtime_.set_delay(RuntimeOperation::PullImage, Duration{10000});
    ASSERT_TRUE(engine_->add_task(sized_task("arn:task/pending", 100, 100)).has_value());
    ASSERT_TRUE(eventually([&] { return runtime_.call_count(RuntimeOperation::PullImage) > 0; }));

    const auto started = std::chrono::steady_clock::now();
    engine_->shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));

    EXPECT_TRUE(engine_->events().closed());
    auto late = engine_->add_task(sized_task("arn:task/after", 1, 1));
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().kind, ErrorKind::Cancelled);
}

TEST_F(TaskEngineTest, ReportsAgentVersion) {
    start_engine();
    EXPECT_EQ(engine_->version(), kAgentVersion);
    EXPECT_FALSE(engine_->version().empty());
}
