#include "basalt/task_scheduler.h"

#include "basalt/logging.h"

namespace basalt {

BASALT_LOG_TAG(TaskScheduler);

namespace {

// Task plus the group it reports to
class GroupedTask : public Task {
public:
    GroupedTask(std::shared_ptr<Task> task, TaskGroup* group)
        : task_(std::move(task)), group_(group) {}

    Status Execute() override {
        Status status;
        try {
            status = task_->Execute();
        } catch (const std::exception& e) {
            status = Status::InternalError(std::string("Task execution failed: ") + e.what());
        }
        group_->Done(status);
        return status;
    }

    void Abort() { group_->Done(Status::Aborted("task scheduler is shut down")); }

private:
    std::shared_ptr<Task> task_;
    TaskGroup* group_;
};

} // namespace

// ConcurrentQueue implementation
bool ConcurrentQueue::Push(std::shared_ptr<Task> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    queue_.push(std::move(task));
    cv_.notify_one();
    return true;
}

bool ConcurrentQueue::Pop(std::shared_ptr<Task>* task, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); }) ||
        queue_.empty()) {
        return false;
    }
    *task = std::move(queue_.front());
    queue_.pop();
    return true;
}

void ConcurrentQueue::Close(std::vector<std::shared_ptr<Task>>* remaining) {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    while (!queue_.empty()) {
        remaining->push_back(std::move(queue_.front()));
        queue_.pop();
    }
    cv_.notify_all();
}

// TaskGroup implementation
void TaskGroup::Add(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ += count;
}

void TaskGroup::Done(const Status& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!status.ok() && first_error_.ok()) {
        first_error_ = status;
        failed_.store(true);
    }
    if (pending_ > 0 && --pending_ == 0) {
        cv_.notify_all();
    }
}

Status TaskGroup::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return pending_ == 0; });
    return first_error_;
}

// TaskScheduler implementation
TaskScheduler::TaskScheduler(size_t thread_count) : shutdown_(false) {
    if (thread_count == 0) {
        thread_count = std::thread::hardware_concurrency();
        if (thread_count == 0) thread_count = 4; // fallback
    }

    queue_ = std::make_unique<ConcurrentQueue>();
    LaunchThreads(thread_count);
}

TaskScheduler::~TaskScheduler() {
    Shutdown();
    JoinThreads();
}

void TaskScheduler::Schedule(std::shared_ptr<Task> task, TaskGroup* group) {
    if (group) {
        task = std::make_shared<GroupedTask>(std::move(task), group);
    }
    if (!queue_->Push(task) && group) {
        group->Done(Status::Aborted("task scheduler is shut down"));
    }
}

Status TaskScheduler::ExecuteTask(const std::shared_ptr<Task>& task) {
    if (!task) return Status::InvalidArgument("Task cannot be null");

    try {
        return task->Execute();
    } catch (const std::exception& e) {
        return Status::InternalError(std::string("Task execution failed: ") + e.what());
    }
}

void TaskScheduler::Shutdown() {
    shutdown_ = true;

    // Queued tasks will never run; release their waiters
    std::vector<std::shared_ptr<Task>> remaining;
    queue_->Close(&remaining);
    for (const auto& task : remaining) {
        if (auto grouped = std::dynamic_pointer_cast<GroupedTask>(task)) {
            grouped->Abort();
        }
    }
    if (!remaining.empty()) {
        BASALT_LOG_DEBUG(TaskScheduler) << "aborted " << remaining.size()
                                        << " queued tasks on shutdown";
    }
}

bool TaskScheduler::IsShutdown() const {
    return shutdown_;
}

void TaskScheduler::LaunchThreads(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        threads_.emplace_back([this]() { ExecuteForever(); });
    }
}

void TaskScheduler::JoinThreads() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void TaskScheduler::ExecuteForever() {
    while (!shutdown_) {
        std::shared_ptr<Task> task;
        if (queue_->Pop(&task, std::chrono::milliseconds(100))) {
            auto status = ExecuteTask(task);
            if (!status.ok()) {
                BASALT_LOG_DEBUG(TaskScheduler) << "task failed: " << status.ToString();
            }
        }
    }
}

} // namespace basalt
