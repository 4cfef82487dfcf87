#include "asyncsftp/SerialQueue.hpp"
#include "asyncsftp/Log.hpp"

#include <algorithm>
#include <exception>
#include <future>

namespace asyncsftp {

namespace {

void runTask(const WorkerPool::Task &task, const std::string &name) {
    try {
        task();
    } catch (const std::exception &e) {
        LOGE("%s: task threw: %s", name.c_str(), e.what());
    }
}

} // namespace

WorkerPool::WorkerPool(std::size_t threads, std::string name)
    : name_(std::move(name)) {
    if (threads == 0)
        threads = 1;
    for (std::size_t i = 0; i < threads; ++i) {
        // don't capture "this": a worker may outlive the pool after detach()
        workers_.emplace_back([workLoad = workLoad_, name = name_] {
            std::unique_lock<std::mutex> lk(workLoad->lock);
            for (;;) {
                workLoad->conditionNewTask.wait(lk, [&] {
                    return !workLoad->tasks.empty() || workLoad->stopping;
                });
                if (workLoad->tasks.empty())
                    return; // stopping and drained

                Task task = std::move(workLoad->tasks.front());
                workLoad->tasks.pop_front();

                lk.unlock();
                runTask(task, name);
                lk.lock();
            }
        });
        workerIds_.push_back(workers_.back().get_id());
    }
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::async(Task task) {
    {
        std::lock_guard<std::mutex> lk(workLoad_->lock);
        if (!workLoad_->stopping) {
            workLoad_->tasks.push_back(std::move(task));
            task = nullptr;
        }
    }
    if (task) {
        LOGD("%s: stopped, running task on the calling thread", name_.c_str());
        runTask(task, name_);
        return;
    }
    workLoad_->conditionNewTask.notify_one();
}

bool WorkerPool::isWorkerThread() const {
    const auto self = std::this_thread::get_id();
    return std::find(workerIds_.begin(), workerIds_.end(), self) !=
           workerIds_.end();
}

void WorkerPool::shutdown() {
    std::lock_guard<std::mutex> guard(shutdownLock_);
    {
        std::lock_guard<std::mutex> lk(workLoad_->lock);
        workLoad_->stopping = true;
    }
    workLoad_->conditionNewTask.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto &w : workers_) {
        if (!w.joinable())
            continue;
        if (w.get_id() == self)
            w.detach(); // shut down from one of our own tasks
        else
            w.join();
    }
}

void SerialQueue::sync(const Task &task) {
    if (isCurrent()) {
        task();
        return;
    }
    std::promise<void> done;
    std::future<void> fut = done.get_future();
    async([&task, &done] {
        try {
            task();
        } catch (...) {
            done.set_exception(std::current_exception()); // rethrown by get()
            return;
        }
        done.set_value();
    });
    fut.get();
}

} // namespace asyncsftp
