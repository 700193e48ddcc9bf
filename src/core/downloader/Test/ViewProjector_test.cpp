/**
 * ViewProjector_test.cpp
 */

#include "../ViewProjector.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace downpour::core::downloader;

namespace {

Task makeTask(const std::string& id, const std::string& name, TaskState state) {
    Task task;
    task.id = id;
    task.name = name;
    task.state = state;
    return task;
}

std::vector<std::string> idsOf(const std::vector<Task>& tasks) {
    std::vector<std::string> ids;
    for (const auto& task : tasks) {
        ids.push_back(task.id);
    }
    return ids;
}

class ViewProjectorTest : public ::testing::Test {
protected:
    std::vector<Task> tasks_ = {
        makeTask("dl_1", "a.zip", TaskState::Running),
        makeTask("dl_2", "b.iso", TaskState::Done),
        makeTask("dl_3", "c.zip", TaskState::Error),
        makeTask("dl_4", "d.tar", TaskState::Paused),
        makeTask("dl_5", "e.zip", TaskState::Idle),
        makeTask("dl_6", "f.iso", TaskState::Done),
    };
};

TEST_F(ViewProjectorTest, DoneFilterWithEmptySearch)
{
    std::vector<Task> tasks = {
        makeTask("dl_1", "a.zip", TaskState::Running),
        makeTask("dl_2", "b.iso", TaskState::Done),
    };

    auto view = ViewProjector::project(tasks, TaskFilter::Done, "");

    ASSERT_EQ(view.size(), 1u);
    EXPECT_EQ(view[0].name, "b.iso");
}

TEST_F(ViewProjectorTest, AllKeepsEveryTaskInOrder)
{
    auto view = ViewProjector::project(tasks_, TaskFilter::All, "");
    EXPECT_EQ(idsOf(view), idsOf(tasks_));
}

TEST_F(ViewProjectorTest, StateFilters)
{
    EXPECT_EQ(idsOf(ViewProjector::project(tasks_, TaskFilter::Running, "")),
              (std::vector<std::string>{"dl_1"}));
    EXPECT_EQ(idsOf(ViewProjector::project(tasks_, TaskFilter::Done, "")),
              (std::vector<std::string>{"dl_2", "dl_6"}));
    EXPECT_EQ(idsOf(ViewProjector::project(tasks_, TaskFilter::Error, "")),
              (std::vector<std::string>{"dl_3"}));
}

TEST_F(ViewProjectorTest, PausedAndIdleOnlyUnderAll)
{
    for (auto filter : {TaskFilter::Running, TaskFilter::Done, TaskFilter::Error}) {
        for (const auto& task : ViewProjector::project(tasks_, filter, "")) {
            EXPECT_NE(task.state, TaskState::Paused);
            EXPECT_NE(task.state, TaskState::Idle);
        }
    }
}

TEST_F(ViewProjectorTest, SearchIsCaseSensitiveSubstring)
{
    EXPECT_EQ(idsOf(ViewProjector::project(tasks_, TaskFilter::All, ".zip")),
              (std::vector<std::string>{"dl_1", "dl_3", "dl_5"}));
    EXPECT_TRUE(ViewProjector::project(tasks_, TaskFilter::All, ".ZIP").empty());
    EXPECT_EQ(idsOf(ViewProjector::project(tasks_, TaskFilter::Done, "iso")),
              (std::vector<std::string>{"dl_2", "dl_6"}));
}

TEST_F(ViewProjectorTest, ProjectionDoesNotModifyInput)
{
    auto before = idsOf(tasks_);
    ViewProjector::project(tasks_, TaskFilter::Done, "b");
    EXPECT_EQ(idsOf(tasks_), before);
}

TEST_F(ViewProjectorTest, ParseFilter)
{
    EXPECT_EQ(ViewProjector::parseFilter("all"), TaskFilter::All);
    EXPECT_EQ(ViewProjector::parseFilter("running"), TaskFilter::Running);
    EXPECT_EQ(ViewProjector::parseFilter("done"), TaskFilter::Done);
    EXPECT_EQ(ViewProjector::parseFilter("error"), TaskFilter::Error);
    EXPECT_FALSE(ViewProjector::parseFilter("paused").has_value());
    EXPECT_STREQ(ViewProjector::toString(TaskFilter::Done), "done");
}

TEST_F(ViewProjectorTest, LabelsAndSeverities)
{
    EXPECT_STREQ(ViewProjector::stateLabel(TaskState::Idle), "Waiting");
    EXPECT_STREQ(ViewProjector::stateLabel(TaskState::Running), "Downloading");
    EXPECT_STREQ(ViewProjector::stateLabel(TaskState::Paused), "Paused");
    EXPECT_STREQ(ViewProjector::stateLabel(TaskState::Done), "Completed");
    EXPECT_STREQ(ViewProjector::stateLabel(TaskState::Error), "Failed");

    EXPECT_EQ(ViewProjector::stateSeverity(TaskState::Idle), Severity::Info);
    EXPECT_EQ(ViewProjector::stateSeverity(TaskState::Running), Severity::Primary);
    EXPECT_EQ(ViewProjector::stateSeverity(TaskState::Paused), Severity::Warning);
    EXPECT_EQ(ViewProjector::stateSeverity(TaskState::Done), Severity::Success);
    EXPECT_EQ(ViewProjector::stateSeverity(TaskState::Error), Severity::Danger);
    EXPECT_STREQ(ViewProjector::toString(Severity::Danger), "danger");
}

TEST_F(ViewProjectorTest, FormatSpeedThresholds)
{
    EXPECT_EQ(ViewProjector::formatSpeed(0.0), "0 B/s");
    EXPECT_EQ(ViewProjector::formatSpeed(1023.9), "1023 B/s");
    EXPECT_EQ(ViewProjector::formatSpeed(1024.0), "1.0 KB/s");
    EXPECT_EQ(ViewProjector::formatSpeed(1536.0), "1.5 KB/s");
    EXPECT_EQ(ViewProjector::formatSpeed(1024.0 * 1024.0), "1.0 MB/s");
    EXPECT_EQ(ViewProjector::formatSpeed(2.5 * 1024.0 * 1024.0), "2.5 MB/s");
}

TEST_F(ViewProjectorTest, FormatSpeedRejectsBadInput)
{
    EXPECT_EQ(ViewProjector::formatSpeed(-10.0), "0 B/s");
    EXPECT_EQ(ViewProjector::formatSpeed(std::numeric_limits<double>::quiet_NaN()), "0 B/s");
}

} // namespace
