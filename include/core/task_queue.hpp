#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace voicebridge {
namespace core {

/**
 * Priority levels for tasks in the queue
 */
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3
};

/**
 * Base task interface. The optional tag groups tasks that belong to one
 * session so they can be cancelled together.
 */
class Task {
public:
    Task(TaskPriority priority = TaskPriority::NORMAL, std::string tag = "")
        : priority_(priority), tag_(std::move(tag)), created_at_(std::chrono::steady_clock::now()) {}

    virtual ~Task() = default;
    virtual void execute() = 0;

    TaskPriority getPriority() const { return priority_; }
    const std::string& getTag() const { return tag_; }
    std::chrono::steady_clock::time_point getCreatedAt() const { return created_at_; }

    uint64_t getOrder() const { return order_; }
    void setOrder(uint64_t order) { order_ = order; }

private:
    TaskPriority priority_;
    std::string tag_;
    std::chrono::steady_clock::time_point created_at_;
    uint64_t order_ = 0;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    FunctionTask(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL,
                 std::string tag = "")
        : Task(priority, std::move(tag)), func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Higher priority first, then insertion order
 */
struct TaskComparator {
    bool operator()(const std::shared_ptr<Task>& a, const std::shared_ptr<Task>& b) const {
        if (a->getPriority() != b->getPriority()) {
            return static_cast<int>(a->getPriority()) < static_cast<int>(b->getPriority());
        }
        return a->getOrder() > b->getOrder();
    }
};

/**
 * Thread-safe task queue with priority support
 */
class TaskQueue {
public:
    TaskQueue();
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * Add a task to the queue. Returns false once the queue is shut down.
     */
    bool enqueue(std::shared_ptr<Task> task);
    bool enqueue(std::function<void()> func, TaskPriority priority = TaskPriority::NORMAL,
                 const std::string& tag = "");

    /**
     * Add a task with future support for result retrieval.
     * A task rejected by a shut down queue leaves a broken promise behind.
     */
    template<typename F, typename... Args>
    auto enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /**
     * Get the next task from the queue (blocks if empty)
     * Returns nullptr if queue is shutting down
     */
    std::shared_ptr<Task> dequeue();

    /**
     * Try to get the next task without blocking
     * Returns nullptr if queue is empty
     */
    std::shared_ptr<Task> tryDequeue();

    /**
     * Drop every pending task carrying the given tag; returns how many were dropped
     */
    size_t cancelTagged(const std::string& tag);

    size_t size() const;
    bool empty() const;
    void clear();

    /**
     * Shutdown the queue (wake up all waiting threads)
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    using Queue = std::priority_queue<std::shared_ptr<Task>, std::vector<std::shared_ptr<Task>>, TaskComparator>;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    Queue queue_;
    uint64_t next_order_ = 0;
    std::atomic<bool> shutdown_;
};

/**
 * Thread pool for executing tasks from TaskQueue
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency(),
                        std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Stop the thread pool and wait for all threads to finish.
     * Tasks still queued are not executed.
     */
    void stop();

    size_t getNumThreads() const { return num_threads_; }
    size_t getActiveThreads() const;
    size_t getFailedTasks() const { return failed_tasks_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop();

    size_t num_threads_;
    std::string name_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_threads_;
    std::atomic<size_t> failed_tasks_;
};

template<typename F, typename... Args>
auto TaskQueue::enqueueWithFuture(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {

    using return_type = std::invoke_result_t<F, Args...>;

    auto task_ptr = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task_ptr->get_future();

    auto wrapper_task = std::make_shared<FunctionTask>(
        [task_ptr]() { (*task_ptr)(); },
        priority
    );

    enqueue(wrapper_task);

    return result;
}

} // namespace core
} // namespace voicebridge
