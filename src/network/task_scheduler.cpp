#include "network/task_scheduler.hpp"
#include "murmur/error.hpp"
#include "utils/logger.hpp"

namespace murmur::network {

TaskScheduler::~TaskScheduler() {
    cancel_all();
    join_all();
}

TaskScheduler::TaskHandle TaskScheduler::schedule_every(const std::string& name,
                                                        std::chrono::milliseconds interval,
                                                        Job job) {
    if (interval.count() <= 0) {
        throw MurmurException(ErrorCode::InvalidArgument, "Task interval must be positive: " + name);
    }
    
    reap_finished();
    
    auto task = std::make_shared<Task>();
    task->name = name;
    task->interval = interval;
    task->job = std::move(job);
    
    std::lock_guard<std::mutex> lock(mutex_);
    TaskHandle handle = next_handle_++;
    task->worker = std::thread([task]() { run_loop(task); });
    tasks_.emplace(handle, task);
    
    MURMUR_LOG_DEBUG("Scheduled task '{}' every {} ms", name, interval.count());
    return handle;
}

void TaskScheduler::run_loop(const std::shared_ptr<Task>& task) {
    std::unique_lock<std::mutex> lock(task->mutex);
    
    while (!task->cancelled) {
        // Wait for the interval or cancellation
        if (task->wake.wait_for(lock, task->interval, [&task]() { return task->cancelled; })) {
            break;
        }
        
        lock.unlock();
        try {
            task->job();
        } catch (const std::exception& e) {
            MURMUR_LOG_ERROR("Task '{}' failed: {}", task->name, e.what());
        } catch (...) {
            MURMUR_LOG_ERROR("Task '{}' failed with an unknown exception", task->name);
        }
        task->runs++;
        lock.lock();
    }
    
    task->finished = true;
    MURMUR_LOG_DEBUG("Task '{}' stopped after {} run(s)", task->name, task->runs.load());
}

void TaskScheduler::request_stop(Task& task) {
    {
        std::lock_guard<std::mutex> lock(task.mutex);
        task.cancelled = true;
    }
    task.wake.notify_all();
}

void TaskScheduler::join_worker(Task& task) {
    if (!task.worker.joinable()) {
        return;
    }
    
    // A job that cancels its own task cannot join itself
    if (task.worker.get_id() == std::this_thread::get_id()) {
        task.worker.detach();
        return;
    }
    task.worker.join();
}

bool TaskScheduler::cancel(TaskHandle handle) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(handle);
        if (it == tasks_.end()) {
            return false;
        }
        task = it->second;
        tasks_.erase(it);
        retired_.push_back(task);
    }
    
    request_stop(*task);
    MURMUR_LOG_DEBUG("Cancelled task '{}'", task->name);
    return true;
}

void TaskScheduler::cancel_all() {
    std::vector<std::shared_ptr<Task>> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [handle, task] : tasks_) {
            cancelled.push_back(task);
            retired_.push_back(task);
        }
        tasks_.clear();
    }
    
    for (auto& task : cancelled) {
        request_stop(*task);
    }
}

void TaskScheduler::join_all() {
    std::vector<std::shared_ptr<Task>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(retired_);
    }
    
    for (auto& task : retired) {
        join_worker(*task);
    }
}

void TaskScheduler::reap_finished() {
    std::vector<std::shared_ptr<Task>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = retired_.begin();
        while (it != retired_.end()) {
            if ((*it)->finished) {
                finished.push_back(*it);
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }
    
    for (auto& task : finished) {
        join_worker(*task);
    }
}

bool TaskScheduler::is_scheduled(TaskHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.find(handle) != tasks_.end();
}

size_t TaskScheduler::scheduled_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

uint64_t TaskScheduler::run_count(TaskHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(handle);
    if (it == tasks_.end()) {
        return 0;
    }
    return it->second->runs;
}

} // namespace murmur::network
