/**
 * ProgressReconciler_test.cpp
 */

#include "../ProgressReconciler.hpp"
#include "../TaskRegistry.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace downpour::core::downloader;

namespace {

class ProgressReconcilerTest : public ::testing::Test {
protected:
    std::string runningTask(const std::string& url) {
        auto task = registry_.create(url, "/tmp");
        registry_.admit(task.id);
        return task.id;
    }

    TaskRegistry registry_;
    ProgressReconciler reconciler_{registry_};
};

TEST_F(ProgressReconcilerTest, FlushWithoutConsumerDrainsOnCaller)
{
    auto id = runningTask("http://x/a.zip");

    reconciler_.post({id, 100, 10.0, 25.0});
    reconciler_.post({id, 200, 10.0, 50.0});
    EXPECT_EQ(reconciler_.pending(), 2u);
    // Nothing applied until someone drains the channel
    EXPECT_DOUBLE_EQ(registry_.find(id)->progress, 0.0);

    reconciler_.flush();

    EXPECT_EQ(reconciler_.pending(), 0u);
    EXPECT_DOUBLE_EQ(registry_.find(id)->progress, 50.0);
    EXPECT_EQ(registry_.find(id)->transferredBytes, 200u);
}

TEST_F(ProgressReconcilerTest, ConsumerAppliesEventsInOrder)
{
    auto id = runningTask("http://x/a.zip");
    reconciler_.start();
    ASSERT_TRUE(reconciler_.isRunning());

    auto sink = reconciler_.sink();
    for (int i = 1; i <= 99; ++i) {
        sink({id, static_cast<uint64_t>(i), 1.0, static_cast<double>(i)});
    }
    reconciler_.flush();

    auto task = *registry_.find(id);
    EXPECT_EQ(task.state, TaskState::Running);
    EXPECT_DOUBLE_EQ(task.progress, 99.0);
    EXPECT_EQ(task.transferredBytes, 99u);

    reconciler_.stop();
    EXPECT_FALSE(reconciler_.isRunning());
}

TEST_F(ProgressReconcilerTest, ProducersOnSeveralThreads)
{
    auto a = runningTask("http://x/a.zip");
    auto b = runningTask("http://x/b.zip");
    reconciler_.start();

    auto produce = [this](const std::string& id) {
        for (int i = 0; i <= 80; ++i) {
            reconciler_.post({id, 0, 0.0, static_cast<double>(i)});
        }
    };
    std::thread t1(produce, a);
    std::thread t2(produce, b);
    t1.join();
    t2.join();

    reconciler_.flush();

    EXPECT_DOUBLE_EQ(registry_.find(a)->progress, 80.0);
    EXPECT_DOUBLE_EQ(registry_.find(b)->progress, 80.0);
}

TEST_F(ProgressReconcilerTest, StopDrainsPendingEvents)
{
    auto id = runningTask("http://x/a.zip");
    reconciler_.start();

    reconciler_.post({id, 0, 0.0, 100.0});
    reconciler_.stop();

    EXPECT_EQ(registry_.find(id)->state, TaskState::Done);
}

TEST_F(ProgressReconcilerTest, ReconcileReportsDrops)
{
    auto id = runningTask("http://x/a.zip");

    EXPECT_EQ(reconciler_.reconcile({"dl_404", 0, 0.0, 10.0}), ReconcileResult::DroppedUnknown);
    EXPECT_EQ(reconciler_.reconcile({id, 0, 0.0, 10.0}), ReconcileResult::Applied);
    EXPECT_EQ(reconciler_.reconcile({id, 0, 0.0, 100.0}), ReconcileResult::Completed);
    EXPECT_EQ(reconciler_.reconcile({id, 0, 0.0, 100.0}), ReconcileResult::DroppedNotRunning);
}

TEST_F(ProgressReconcilerTest, QueuedEventOfPausedCycleDoesNotCompleteResumedTask)
{
    auto task = registry_.create("http://x/a.zip", "/tmp");
    auto first = registry_.admit(task.id);
    ASSERT_TRUE(first.has_value());

    // Posted by the old transfer, still in the channel across pause and resume
    reconciler_.post({task.id, 1000, 50.0, 100.0, first->cycle});
    registry_.pause(task.id);
    auto second = registry_.admit(task.id, TaskState::Paused);
    ASSERT_TRUE(second.has_value());
    reconciler_.post({task.id, 100, 50.0, 10.0, second->cycle});

    reconciler_.flush();

    EXPECT_EQ(registry_.find(task.id)->state, TaskState::Running);
    EXPECT_DOUBLE_EQ(registry_.find(task.id)->progress, 10.0);
    EXPECT_EQ(registry_.find(task.id)->transferredBytes, 100u);
}

TEST_F(ProgressReconcilerTest, OutcomeOfOlderCycleIsIgnored)
{
    auto id = runningTask("http://x/a.zip");
    registry_.pause(id);
    auto second = registry_.admit(id, TaskState::Paused);
    ASSERT_TRUE(second.has_value());

    EXPECT_FALSE(reconciler_.reconcileOutcome(id, 1, TransferOutcome::cancelled()));
    EXPECT_EQ(registry_.find(id)->state, TaskState::Running);

    EXPECT_TRUE(reconciler_.reconcileOutcome(id, second->cycle, TransferOutcome::failed("timeout")));
    EXPECT_EQ(registry_.find(id)->state, TaskState::Error);
    EXPECT_EQ(registry_.find(id)->error, "timeout");
}

} // namespace
