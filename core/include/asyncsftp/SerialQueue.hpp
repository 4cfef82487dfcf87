// Execution contexts: a fixed pool of threads draining one FIFO of tasks, and
// the single-threaded serial queue built on it.
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace asyncsftp {

class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(std::size_t threads, std::string name);
    // Runs every task still queued, then joins.
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // context of any thread, non-blocking
    void async(Task task);
    bool isWorkerThread() const;
    // Stop accepting work, drain the queue and join. Tasks submitted after
    // this point run on the submitting thread. Idempotent.
    void shutdown();

    const std::string &name() const { return name_; }

private:
    // Shared with the worker threads; they never touch the pool itself.
    struct WorkLoad {
        std::mutex lock;
        std::condition_variable conditionNewTask;
        std::deque<Task> tasks; // FIFO
        bool stopping = false;
    };

    std::shared_ptr<WorkLoad> workLoad_ = std::make_shared<WorkLoad>();
    std::vector<std::thread> workers_;
    std::vector<std::thread::id> workerIds_;
    std::string name_;
    std::mutex shutdownLock_;
};

class SerialQueue {
public:
    using Task = WorkerPool::Task;

    explicit SerialQueue(std::string name) : pool_(1, std::move(name)) {}

    void async(Task task) { pool_.async(std::move(task)); }
    // Run task on the queue and wait for it. Runs inline when called from the
    // queue itself.
    void sync(const Task &task);
    bool isCurrent() const { return pool_.isWorkerThread(); }
    void shutdown() { pool_.shutdown(); }

private:
    WorkerPool pool_;
};

} // namespace asyncsftp
