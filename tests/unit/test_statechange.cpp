/**
 * @file test_statechange.cpp
 * @brief Unit tests for state-change event eligibility and formatting.
 */

#include "api/statechange.hpp"

#include <gtest/gtest.h>

using namespace node_agent;

namespace {

std::unique_ptr<Task> make_task(bool internal = false) {
    ContainerDefinition app;
    app.name = "app";
    app.image = "registry.local/app:1";
    app.port_bindings = {PortBinding{.container_port = 80, .host_port = 8080}};
    app.managed_agents = {"exec"};

    ContainerDefinition pause;
    pause.name = "~internal~pause";
    pause.kind = ContainerKind::Pause;

    TaskDefinition def;
    def.arn = "arn:task/events";
    def.is_internal = internal;
    def.containers = {pause, app};
    def.attachments = {Attachment{.arn = "arn:eni/1"}};
    return std::make_unique<Task>(std::move(def));
}

}  // namespace

// ─────────────────────────────────────────────
// Task events
// ─────────────────────────────────────────────

TEST(TaskStateChangeTest, RunningIsReportable) {
    auto task = make_task();
    task->advance_known_status(TaskStatus::Running);
    auto event = make_task_state_change(*task, "");
    ASSERT_TRUE(event.has_value()) << event.error().message;
    EXPECT_EQ(event->status, TaskStatus::Running);
    EXPECT_EQ(event->task_arn, "arn:task/events");
}

TEST(TaskStateChangeTest, InternalTaskShouldNotSend) {
    auto task = make_task(true);
    task->advance_known_status(TaskStatus::Running);
    auto event = make_task_state_change(*task, "");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().kind, ErrorKind::ShouldNotSend);
}

TEST(TaskStateChangeTest, UnrecognizedStatusIsAnError) {
    auto task = make_task();
    task->advance_known_status(TaskStatus::Created);
    auto event = make_task_state_change(*task, "");
    ASSERT_FALSE(event.has_value());
    EXPECT_NE(event.error().kind, ErrorKind::ShouldNotSend);
    EXPECT_NE(event.error().message.find("not recognized"), std::string::npos);
}

TEST(TaskStateChangeTest, AlreadySentIsAnError) {
    auto task = make_task();
    task->advance_known_status(TaskStatus::Running);
    ASSERT_TRUE(task->set_sent_status(TaskStatus::Running));
    auto event = make_task_state_change(*task, "");
    ASSERT_FALSE(event.has_value());
    EXPECT_NE(event.error().message.find("already sent"), std::string::npos);
}

TEST(TaskStateChangeTest, ManifestPulledNeedsResolvedDigest) {
    auto task = make_task();
    task->advance_known_status(TaskStatus::ManifestPulled);
    auto without = make_task_state_change(*task, "");
    ASSERT_FALSE(without.has_value());
    EXPECT_EQ(without.error().kind, ErrorKind::ShouldNotSend);

    task->container_by_name("app")->set_image_digest("sha256:feed");
    auto with = make_task_state_change(*task, "");
    ASSERT_TRUE(with.has_value());
    EXPECT_EQ(with->status, TaskStatus::ManifestPulled);
}

TEST(TaskStateChangeTest, StoppedFallsBackToStopReason) {
    auto task = make_task();
    task->set_stop_reason("Essential container in task exited");
    task->advance_known_status(TaskStatus::Stopped);

    auto event = make_task_state_change(*task, "");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->reason, "Essential container in task exited");

    auto explicit_reason = make_task_state_change(*task, "operator request");
    ASSERT_TRUE(explicit_reason.has_value());
    EXPECT_EQ(explicit_reason->reason, "operator request");
}

// ─────────────────────────────────────────────
// Container events
// ─────────────────────────────────────────────

TEST(ContainerStateChangeTest, SteadyStateReportedAsRunning) {
    auto task = make_task();
    auto app = task->container_by_name("app");
    app->advance_known_status(ContainerStatus::Running);
    app->set_runtime_id("rt-1");

    auto event = make_container_state_change(*task, *app, "");
    ASSERT_TRUE(event.has_value()) << event.error().message;
    EXPECT_EQ(event->status, ContainerStatus::Running);
    EXPECT_EQ(event->runtime_id, "rt-1");
    ASSERT_EQ(event->port_bindings.size(), 1u);
    EXPECT_EQ(event->port_bindings[0].host_port, 8080);
}

TEST(ContainerStateChangeTest, InternalContainerShouldNotSend) {
    auto task = make_task();
    auto pause = task->pause_container();
    ASSERT_NE(pause, nullptr);
    pause->advance_known_status(ContainerStatus::ResourcesProvisioned);
    auto event = make_container_state_change(*task, *pause, "");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().kind, ErrorKind::ShouldNotSend);
}

TEST(ContainerStateChangeTest, IntermediateStatusShouldNotSend) {
    auto task = make_task();
    auto app = task->container_by_name("app");
    app->advance_known_status(ContainerStatus::Created);
    auto event = make_container_state_change(*task, *app, "");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().kind, ErrorKind::ShouldNotSend);
}

TEST(ContainerStateChangeTest, ManifestPulledWithoutDigestShouldNotSend) {
    auto task = make_task();
    auto app = task->container_by_name("app");
    app->advance_known_status(ContainerStatus::ManifestPulled);
    auto event = make_container_state_change(*task, *app, "");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().kind, ErrorKind::ShouldNotSend);

    app->set_image_digest("sha256:beef");
    auto with_digest = make_container_state_change(*task, *app, "");
    ASSERT_TRUE(with_digest.has_value());
    EXPECT_EQ(with_digest->status, ContainerStatus::ManifestPulled);
    EXPECT_EQ(with_digest->image_digest, "sha256:beef");
}

TEST(ContainerStateChangeTest, StoppedCarriesExitCodeAndApplyingError) {
    auto task = make_task();
    auto app = task->container_by_name("app");
    app->advance_known_status(ContainerStatus::Stopped);
    app->set_known_exit_code(137);
    app->set_applying_error("could not transition to RUNNING; timed out after 50ms");

    auto event = make_container_state_change(*task, *app, "");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->status, ContainerStatus::Stopped);
    EXPECT_EQ(event->exit_code.value_or(0), 137);
    EXPECT_EQ(event->reason, "could not transition to RUNNING; timed out after 50ms");
}

TEST(ContainerStateChangeTest, AlreadySentShouldNotSend) {
    auto task = make_task();
    auto app = task->container_by_name("app");
    app->advance_known_status(ContainerStatus::Running);
    ASSERT_TRUE(app->set_sent_status(ContainerStatus::Running));
    auto event = make_container_state_change(*task, *app, "");
    ASSERT_FALSE(event.has_value());
    EXPECT_EQ(event.error().kind, ErrorKind::ShouldNotSend);
}

// ─────────────────────────────────────────────
// Managed agents and attachments
// ─────────────────────────────────────────────

TEST(ManagedAgentStateChangeTest, PendingIsNotReportable) {
    auto task = make_task();
    auto app = task->container_by_name("app");
    EXPECT_FALSE(make_managed_agent_state_change(*task, *app, "exec").has_value());

    app->set_managed_agent_status("exec", ManagedAgentStatus::Running);
    auto event = make_managed_agent_state_change(*task, *app, "exec");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->status, ManagedAgentStatus::Running);

    auto missing = make_managed_agent_state_change(*task, *app, "ssm");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST(AttachmentStateChangeTest, OnlyAttachedIsReportable) {
    auto task = make_task();
    auto attachments = task->attachments();
    EXPECT_FALSE(make_attachment_state_change(*task, attachments[0]).has_value());

    task->set_attachment_status("arn:eni/1", AttachmentStatus::Attached);
    auto event = make_attachment_state_change(*task, task->attachments()[0]);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->attachment_arn, "arn:eni/1");
}

// ─────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────

TEST(StateChangeFormatTest, EventHelpersDispatchOnVariant) {
    StateChangeEvent event = TaskStateChange{
        .task_arn = "arn:task/9",
        .status = TaskStatus::Stopped,
        .reason = "done",
    };
    EXPECT_EQ(event_task_arn(event), "arn:task/9");
    EXPECT_EQ(event_to_string(event), "arn:task/9 -> STOPPED reason=done");

    auto fields = event_fields(event);
    ASSERT_FALSE(fields.empty());
    EXPECT_EQ(fields[0].second, "TaskStateChange");
}

TEST(StateChangeFormatTest, TimestampIsIsoUtcWithMillis) {
    Timestamp at{std::chrono::milliseconds(1'700'000'000'123)};
    EXPECT_EQ(format_timestamp(at), "2023-11-14T22:13:20.123Z");
}
