#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <basalt/status.h>

namespace basalt {

class Task;

class ConcurrentQueue {
public:
    // Returns false once the queue is closed; the task is not queued
    bool Push(std::shared_ptr<Task> task);
    bool Pop(std::shared_ptr<Task>* task, std::chrono::milliseconds timeout);

    // Refuse further pushes and hand back whatever is still queued
    void Close(std::vector<std::shared_ptr<Task>>* remaining);

private:
    std::queue<std::shared_ptr<Task>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

// Task interface - represents a unit of work
class Task {
public:
    virtual ~Task() = default;
    virtual Status Execute() = 0;
};

/**
 * @brief Tracks a set of tasks and the first failure among them
 *
 * Tasks are added with Add() before scheduling and report back through
 * Done(). Wait() returns once every added task has reported.
 */
class TaskGroup {
public:
    void Add(size_t count = 1);
    void Done(const Status& status);

    // Blocks until all tasks reported; returns the first failure
    Status Wait();

    // True once any task in the group failed
    bool failed() const { return failed_.load(); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    size_t pending_ = 0;
    Status first_error_;
    std::atomic<bool> failed_{false};
};

/**
 * @brief Fixed-size worker pool fed from one shared queue
 */
class TaskScheduler {
public:
    explicit TaskScheduler(size_t thread_count = 0); // 0 = auto-detect
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /**
     * @brief Queue a task for a worker thread
     *
     * When `group` is given the task's result is reported to it. A task
     * scheduled after Shutdown() is not run and reports Aborted.
     */
    void Schedule(std::shared_ptr<Task> task, TaskGroup* group = nullptr);

    // Run a task on the calling thread
    Status ExecuteTask(const std::shared_ptr<Task>& task);

    size_t GetThreadCount() const { return threads_.size(); }

    // Stop the workers after their current task. Grouped tasks still
    // queued report Aborted to their group.
    void Shutdown();
    bool IsShutdown() const;

private:
    void LaunchThreads(size_t count);
    void JoinThreads();
    void ExecuteForever();

    std::atomic<bool> shutdown_;
    std::vector<std::thread> threads_;
    std::unique_ptr<ConcurrentQueue> queue_;
};

// Helper class for lambda-based tasks
class LambdaTask : public Task {
public:
    explicit LambdaTask(std::function<Status()> func) : func_(std::move(func)) {}
    Status Execute() override { return func_(); }

private:
    std::function<Status()> func_;
};

inline std::shared_ptr<Task> MakeTask(std::function<Status()> func) {
    return std::make_shared<LambdaTask>(std::move(func));
}

} // namespace basalt
