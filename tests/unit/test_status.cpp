/**
 * @file test_status.cpp
 * @brief Unit tests for status ordering, parsing and backend mapping.
 */

#include "api/container.hpp"
#include "api/status.hpp"

#include <gtest/gtest.h>

using namespace node_agent;

TEST(StatusTest, ContainerStatusesAreOrdered) {
    EXPECT_LT(ContainerStatus::None, ContainerStatus::ManifestPulled);
    EXPECT_LT(ContainerStatus::ManifestPulled, ContainerStatus::Pulled);
    EXPECT_LT(ContainerStatus::Pulled, ContainerStatus::Created);
    EXPECT_LT(ContainerStatus::Created, ContainerStatus::Running);
    EXPECT_LT(ContainerStatus::Running, ContainerStatus::ResourcesProvisioned);
    EXPECT_LT(ContainerStatus::ResourcesProvisioned, ContainerStatus::Stopped);
    EXPECT_LT(ContainerStatus::Stopped, ContainerStatus::Zombie);
}

TEST(StatusTest, TaskStatusesAreOrdered) {
    EXPECT_LT(TaskStatus::None, TaskStatus::ManifestPulled);
    EXPECT_LT(TaskStatus::Created, TaskStatus::Running);
    EXPECT_LT(TaskStatus::Running, TaskStatus::Stopped);
    EXPECT_LT(TaskStatus::Stopped, TaskStatus::Zombie);
}

TEST(StatusTest, ContainerStatusStringsRoundTrip) {
    for (auto status : {ContainerStatus::None, ContainerStatus::ManifestPulled,
                        ContainerStatus::Pulled, ContainerStatus::Created,
                        ContainerStatus::Running, ContainerStatus::ResourcesProvisioned,
                        ContainerStatus::Stopped, ContainerStatus::Zombie}) {
        auto parsed = parse_container_status(to_string(status));
        ASSERT_TRUE(parsed.has_value()) << to_string(status);
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(parse_container_status("running").has_value());
    EXPECT_FALSE(parse_container_status("").has_value());
}

TEST(StatusTest, TaskStatusParse) {
    EXPECT_EQ(parse_task_status("STOPPED").value_or(TaskStatus::None), TaskStatus::Stopped);
    EXPECT_EQ(parse_task_status("MANIFEST_PULLED").value_or(TaskStatus::None),
              TaskStatus::ManifestPulled);
    EXPECT_FALSE(parse_task_status("DEAD").has_value());
}

TEST(StatusTest, BackendRecognizedStatuses) {
    EXPECT_TRUE(backend_recognized(ContainerStatus::Running));
    EXPECT_TRUE(backend_recognized(ContainerStatus::Stopped));
    EXPECT_FALSE(backend_recognized(ContainerStatus::Created));
    EXPECT_FALSE(backend_recognized(ContainerStatus::ManifestPulled));

    EXPECT_TRUE(backend_recognized(TaskStatus::Running));
    EXPECT_TRUE(backend_recognized(TaskStatus::Stopped));
    EXPECT_FALSE(backend_recognized(TaskStatus::Pulled));
    EXPECT_FALSE(backend_recognized(TaskStatus::Zombie));
}

TEST(StatusTest, ReportedStatusMapsSteadyStateToRunning) {
    const auto pause_steady = ContainerStatus::ResourcesProvisioned;
    EXPECT_EQ(reported_container_status(pause_steady, pause_steady), ContainerStatus::Running);
    EXPECT_EQ(reported_container_status(ContainerStatus::Running, ContainerStatus::Running),
              ContainerStatus::Running);

    // A pause container that is merely running has not reached its steady state.
    EXPECT_EQ(reported_container_status(ContainerStatus::Running, pause_steady),
              ContainerStatus::None);
    EXPECT_EQ(reported_container_status(ContainerStatus::ManifestPulled, ContainerStatus::Running),
              ContainerStatus::ManifestPulled);
    EXPECT_EQ(reported_container_status(ContainerStatus::Stopped, ContainerStatus::Running),
              ContainerStatus::Stopped);
    EXPECT_EQ(reported_container_status(ContainerStatus::Created, ContainerStatus::Running),
              ContainerStatus::None);
}

TEST(StatusTest, SteadyStateByKind) {
    EXPECT_EQ(steady_state_status(ContainerKind::Normal), ContainerStatus::Running);
    EXPECT_EQ(steady_state_status(ContainerKind::Pause), ContainerStatus::ResourcesProvisioned);
    EXPECT_TRUE(is_internal(ContainerKind::Pause));
    EXPECT_TRUE(is_internal(ContainerKind::ManagedDaemon));
    EXPECT_FALSE(is_internal(ContainerKind::Normal));
}

TEST(StatusTest, DependencyConditionParseIsCaseInsensitive) {
    EXPECT_EQ(parse_dependency_condition("complete").value_or(DependencyCondition::Start),
              DependencyCondition::Complete);
    EXPECT_EQ(parse_dependency_condition("HEALTHY").value_or(DependencyCondition::Start),
              DependencyCondition::Healthy);
    EXPECT_FALSE(parse_dependency_condition("finished").has_value());
}

TEST(StatusTest, DesiredTaskStatusMapsToContainerStatus) {
    EXPECT_EQ(to_container_status(TaskStatus::Running), ContainerStatus::Running);
    EXPECT_EQ(to_container_status(TaskStatus::Stopped), ContainerStatus::Stopped);
}
