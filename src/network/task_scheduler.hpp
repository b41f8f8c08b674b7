#pragma once

#include "murmur/common.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace murmur::network {

/**
 * TaskScheduler - Runs jobs on fixed periods, one worker thread per job
 * 
 * A job first runs one interval after scheduling. Runs of the same job never
 * overlap. Cancelling stops future runs without waiting for a run in flight;
 * workers are joined lazily and on destruction.
 */
class TaskScheduler {
public:
    using Job = std::function<void()>;
    using TaskHandle = uint64_t;
    
    TaskScheduler() = default;
    ~TaskScheduler();
    
    MURMUR_DISALLOW_COPY_AND_MOVE(TaskScheduler);
    
    TaskHandle schedule_every(const std::string& name, std::chrono::milliseconds interval, Job job);
    
    bool cancel(TaskHandle handle);
    void cancel_all();
    
    // Block until every cancelled worker has exited
    void join_all();
    
    bool is_scheduled(TaskHandle handle) const;
    size_t scheduled_count() const;
    uint64_t run_count(TaskHandle handle) const;
    
private:
    struct Task {
        std::string name;
        std::chrono::milliseconds interval;
        Job job;
        std::thread worker;
        std::mutex mutex;
        std::condition_variable wake;
        bool cancelled = false;
        std::atomic<bool> finished{false};
        std::atomic<uint64_t> runs{0};
    };
    
    static void run_loop(const std::shared_ptr<Task>& task);
    static void request_stop(Task& task);
    static void join_worker(Task& task);
    
    void reap_finished();
    
    mutable std::mutex mutex_;
    std::map<TaskHandle, std::shared_ptr<Task>> tasks_;
    std::vector<std::shared_ptr<Task>> retired_;
    TaskHandle next_handle_ = 1;
};

} // namespace murmur::network
