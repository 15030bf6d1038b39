#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <basalt/task_scheduler.h>

namespace basalt {
namespace {

TEST(TaskSchedulerTest, RunsEveryTaskInGroup) {
    TaskScheduler scheduler(4);
    EXPECT_EQ(scheduler.GetThreadCount(), 4u);

    std::atomic<int> ran{0};
    TaskGroup group;
    group.Add(50);
    for (int i = 0; i < 50; ++i) {
        scheduler.Schedule(MakeTask([&ran]() {
            ran.fetch_add(1);
            return Status::OK();
        }), &group);
    }
    EXPECT_TRUE(group.Wait().ok());
    EXPECT_EQ(ran.load(), 50);
}

TEST(TaskSchedulerTest, GroupReportsFirstFailure) {
    TaskScheduler scheduler(2);
    TaskGroup group;
    group.Add(3);
    scheduler.Schedule(MakeTask([]() { return Status::OK(); }), &group);
    scheduler.Schedule(MakeTask([]() { return Status::IOError("disk gone"); }), &group);
    scheduler.Schedule(MakeTask([]() { return Status::OK(); }), &group);

    auto status = group.Wait();
    EXPECT_TRUE(status.IsIOError());
    EXPECT_EQ(status.message(), "disk gone");
    EXPECT_TRUE(group.failed());
}

TEST(TaskSchedulerTest, ThrowingTaskStillCompletesGroup) {
    TaskScheduler scheduler(1);
    TaskGroup group;
    group.Add();
    scheduler.Schedule(MakeTask([]() -> Status {
        throw std::runtime_error("boom");
    }), &group);

    auto status = group.Wait();
    EXPECT_TRUE(status.IsInternalError()) << status.ToString();
}

TEST(TaskSchedulerTest, ScheduleAfterShutdownAbortsTask) {
    TaskScheduler scheduler(1);
    scheduler.Shutdown();
    EXPECT_TRUE(scheduler.IsShutdown());

    bool ran = false;
    TaskGroup group;
    group.Add();
    scheduler.Schedule(MakeTask([&ran]() {
        ran = true;
        return Status::OK();
    }), &group);
    EXPECT_TRUE(group.Wait().IsAborted());
    EXPECT_FALSE(ran);
}

TEST(TaskSchedulerTest, ShutdownAbortsQueuedGroupedTasks) {
    TaskScheduler scheduler(1);
    std::promise<void> started;
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<int> ran{0};

    TaskGroup group;
    group.Add(10);
    scheduler.Schedule(MakeTask([&started, released, &ran]() {
        started.set_value();
        released.wait();
        ran.fetch_add(1);
        return Status::OK();
    }), &group);
    for (int i = 1; i < 10; ++i) {
        scheduler.Schedule(MakeTask([&ran]() {
            ran.fetch_add(1);
            return Status::OK();
        }), &group);
    }

    // The scheduler stays alive while the group is waited on
    started.get_future().wait();
    scheduler.Shutdown();
    release.set_value();

    auto status = group.Wait();
    EXPECT_TRUE(status.IsAborted()) << status.ToString();
    EXPECT_EQ(ran.load(), 1);
}

TEST(TaskSchedulerTest, ExecuteTaskRunsInline) {
    TaskScheduler scheduler(1);
    EXPECT_TRUE(scheduler.ExecuteTask(MakeTask([]() { return Status::OK(); })).ok());
    EXPECT_TRUE(scheduler.ExecuteTask(nullptr).IsInvalidArgument());
}

TEST(TaskSchedulerTest, EmptyGroupDoesNotBlock) {
    TaskGroup group;
    EXPECT_TRUE(group.Wait().ok());
}

} // namespace
} // namespace basalt
