/*
 * agentmem - Worker pool implementation
 */
#include <agentmem/core/thread_pool.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

ThreadPool::ThreadPool(size_t num_threads) : stop_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    LOG_DEBUG("Thread pool started with %zu workers", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("Cannot enqueue task - thread pool is stopped");
            return false;
        }
        tasks_.push(task);
    }
    condition_.notify_one();
    return true;
}

size_t ThreadPool::pending() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown() {
    size_t dropped = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;  // Already stopped
        stop_ = true;
        dropped = tasks_.size();
        std::queue<std::function<void()> >().swap(tasks_);
    }
    
    condition_.notify_all();
    if (dropped > 0) {
        LOG_DEBUG("Thread pool dropped %zu queued tasks", dropped);
    }
    
    for (size_t i = 0; i < threads_.size(); ++i) {
        if (threads_[i].joinable()) {
            threads_[i].join();
        }
    }
    
    LOG_DEBUG("Thread pool shutdown complete");
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;
        
        {
            std::unique_lock<std::mutex> lock(mutex_);
            
            condition_.wait(lock, [this] { 
                return stop_ || !tasks_.empty(); 
            });
            
            if (stop_) {
                return;
            }
            
            task = tasks_.front();
            tasks_.pop();
        }
        
        // Execute task outside the lock
        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("Thread pool task threw exception: %s", e.what());
            }
        }
    }
}

} // namespace agentmem
