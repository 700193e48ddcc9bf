/**
 * AdmissionQueue_test.cpp
 */

#include "../AdmissionQueue.hpp"
#include "../ProgressReconciler.hpp"
#include "../TaskRegistry.hpp"
#include "FakeTransferEngine.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace downpour::core::downloader;
using downpour::core::downloader::testing::FakeTransferEngine;

namespace {

class AdmissionQueueTest : public ::testing::Test {
protected:
    void makeQueue(size_t limit) {
        queue_ = std::make_unique<AdmissionQueue>(registry_, reconciler_, engine_, limit);
    }

    std::string addTask(const std::string& name) {
        return registry_.create("http://x/" + name, "/tmp").id;
    }

    TaskState stateOf(const std::string& id) const {
        return registry_.find(id)->state;
    }

    FakeTransferEngine engine_;
    TaskRegistry registry_;
    ProgressReconciler reconciler_{registry_};
    std::unique_ptr<AdmissionQueue> queue_;
};

TEST_F(AdmissionQueueTest, LimitIsAtLeastOne)
{
    makeQueue(0);
    EXPECT_EQ(queue_->limit(), 1u);
}

TEST_F(AdmissionQueueTest, DefaultConcurrencyIsThree)
{
    EXPECT_EQ(AdmissionQueue::kDefaultConcurrency, 3u);
}

TEST_F(AdmissionQueueTest, ConcurrencyNeverExceedsLimit)
{
    makeQueue(3);

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(addTask("file" + std::to_string(i) + ".bin"));
        ASSERT_TRUE(queue_->admit(ids.back()));
    }

    ASSERT_TRUE(engine_.waitForStarts(3));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // Every task shows Running, only three are inside the engine
    for (const auto& id : ids) {
        EXPECT_EQ(stateOf(id), TaskState::Running);
    }
    EXPECT_EQ(engine_.started().size(), 3u);
    EXPECT_EQ(queue_->activeCount(), 3u);
    EXPECT_EQ(queue_->queuedCount(), 2u);

    engine_.complete(ids[0]);
    ASSERT_TRUE(engine_.waitForStarts(4));

    for (const auto& id : ids) {
        engine_.complete(id);
    }
    queue_->waitIdle();

    EXPECT_EQ(engine_.peakConcurrency(), 3u);
    EXPECT_EQ(queue_->activeCount(), 0u);
    for (const auto& id : ids) {
        EXPECT_EQ(stateOf(id), TaskState::Done);
    }
}

TEST_F(AdmissionQueueTest, StartsInAdmissionOrder)
{
    makeQueue(1);

    auto a = addTask("a.bin");
    auto b = addTask("b.bin");
    auto c = addTask("c.bin");
    engine_.resolveAllWith(TransferOutcome::completed());

    queue_->admit(c);
    queue_->admit(a);
    queue_->admit(b);
    queue_->waitIdle();

    EXPECT_EQ(engine_.started(), (std::vector<std::string>{c, a, b}));
}

TEST_F(AdmissionQueueTest, RejectsTasksNotInAdmittableState)
{
    makeQueue(3);
    auto id = addTask("a.bin");

    EXPECT_FALSE(queue_->admit("dl_404"));
    EXPECT_FALSE(queue_->admit(id, TaskState::Paused));
    EXPECT_TRUE(queue_->admit(id));
    EXPECT_FALSE(queue_->admit(id));

    engine_.complete(id);
    queue_->waitIdle();
    EXPECT_FALSE(queue_->admit(id));
    EXPECT_EQ(engine_.started().size(), 1u);
}

TEST_F(AdmissionQueueTest, PauseWhileQueuedSkipsEngine)
{
    makeQueue(1);
    auto a = addTask("a.bin");
    auto b = addTask("b.bin");

    queue_->admit(a);
    ASSERT_TRUE(engine_.waitForRunning(a));
    queue_->admit(b);

    EXPECT_TRUE(queue_->pause(b));
    EXPECT_EQ(stateOf(b), TaskState::Paused);

    engine_.complete(a);
    queue_->waitIdle();

    EXPECT_EQ(engine_.started(), (std::vector<std::string>{a}));
    EXPECT_EQ(stateOf(a), TaskState::Done);
    EXPECT_EQ(stateOf(b), TaskState::Paused);
}

TEST_F(AdmissionQueueTest, ResumeBeforeQueuedJobRunsStartsOnce)
{
    makeQueue(1);
    auto a = addTask("a.bin");
    auto b = addTask("b.bin");

    queue_->admit(a);
    ASSERT_TRUE(engine_.waitForRunning(a));
    queue_->admit(b);
    queue_->pause(b);
    ASSERT_TRUE(queue_->admit(b, TaskState::Paused));

    engine_.complete(a);
    engine_.complete(b);
    queue_->waitIdle();

    // The first cycle of b was superseded before it reached the engine
    EXPECT_EQ(engine_.started(), (std::vector<std::string>{a, b}));
    EXPECT_EQ(stateOf(b), TaskState::Done);
}

TEST_F(AdmissionQueueTest, PauseRunningTaskCancelsEngine)
{
    makeQueue(3);
    auto id = addTask("a.bin");

    queue_->admit(id);
    ASSERT_TRUE(engine_.waitForRunning(id));

    EXPECT_TRUE(queue_->pause(id));
    EXPECT_EQ(stateOf(id), TaskState::Paused);

    EXPECT_TRUE(isCancelled(engine_.requests()[0].cancel));

    queue_->waitIdle();
    EXPECT_EQ(engine_.cancelled(), (std::vector<std::string>{id}));
    EXPECT_EQ(stateOf(id), TaskState::Paused);
    EXPECT_FALSE(queue_->pause(id));
}

TEST_F(AdmissionQueueTest, PauseJustBeforeEngineStartIsHonoured)
{
    makeQueue(1);
    auto id = addTask("a.bin");

    // Paused after the job passed its queue check, before the engine began
    engine_.setBeforeStart([this](const TransferRequest& request) {
        queue_->pause(request.taskId);
    });

    ASSERT_TRUE(queue_->admit(id));
    queue_->waitIdle();

    EXPECT_EQ(stateOf(id), TaskState::Paused);
    EXPECT_EQ(engine_.skippedStarts(), 1u);
    EXPECT_EQ(engine_.cancelled(), (std::vector<std::string>{id}));
    EXPECT_EQ(engine_.peakConcurrency(), 0u);
    EXPECT_EQ(queue_->activeCount(), 0u);
}

TEST_F(AdmissionQueueTest, ResumeWaitsForCancelledTransferToLeaveEngine)
{
    makeQueue(3);
    engine_.setCancelDelay(std::chrono::milliseconds(100));
    auto id = addTask("a.bin");

    queue_->admit(id);
    ASSERT_TRUE(engine_.waitForRunning(id));
    ASSERT_TRUE(queue_->pause(id));
    ASSERT_TRUE(queue_->admit(id, TaskState::Paused));

    ASSERT_TRUE(engine_.waitForStarts(2));
    engine_.complete(id);
    queue_->waitIdle();

    EXPECT_EQ(engine_.peakSameTask(), 1u);
    // One cancel command, for the paused cycle only
    EXPECT_EQ(engine_.cancelled(), (std::vector<std::string>{id}));

    auto requests = engine_.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].cycle, 1u);
    EXPECT_EQ(requests[1].cycle, 2u);
    EXPECT_TRUE(isCancelled(requests[0].cancel));
    EXPECT_FALSE(isCancelled(requests[1].cancel));
    EXPECT_EQ(stateOf(id), TaskState::Done);
}

TEST_F(AdmissionQueueTest, EngineExceptionBecomesError)
{
    makeQueue(3);
    auto id = addTask("a.bin");
    engine_.throwOnStart(id);

    queue_->admit(id);
    queue_->waitIdle();

    auto task = *registry_.find(id);
    EXPECT_EQ(task.state, TaskState::Error);
    EXPECT_EQ(task.error, "engine exploded");
    EXPECT_EQ(queue_->activeCount(), 0u);
}

TEST_F(AdmissionQueueTest, EngineCancellationBecomesPaused)
{
    makeQueue(3);
    auto id = addTask("a.bin");
    engine_.resolveAllWith(TransferOutcome::cancelled());

    queue_->admit(id);
    queue_->waitIdle();

    auto task = *registry_.find(id);
    EXPECT_EQ(task.state, TaskState::Paused);
    EXPECT_TRUE(task.error.empty());
}

TEST_F(AdmissionQueueTest, FailureIsTerminal)
{
    makeQueue(3);
    auto id = addTask("a.bin");

    queue_->admit(id);
    engine_.fail(id, "HTTP 404");
    queue_->waitIdle();

    EXPECT_EQ(stateOf(id), TaskState::Error);
    EXPECT_EQ(registry_.find(id)->error, "HTTP 404");
    EXPECT_FALSE(queue_->admit(id));
}

TEST_F(AdmissionQueueTest, ShutdownPausesActiveAndQueuedTasks)
{
    makeQueue(1);
    auto a = addTask("a.bin");
    auto b = addTask("b.bin");

    queue_->admit(a);
    ASSERT_TRUE(engine_.waitForRunning(a));
    queue_->admit(b);

    queue_->shutdown();

    EXPECT_EQ(stateOf(a), TaskState::Paused);
    EXPECT_EQ(stateOf(b), TaskState::Paused);
    EXPECT_EQ(engine_.started(), (std::vector<std::string>{a}));

    auto c = addTask("c.bin");
    EXPECT_FALSE(queue_->admit(c));
    EXPECT_EQ(stateOf(c), TaskState::Idle);
}

} // namespace
