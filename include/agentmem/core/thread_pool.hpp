/*
 * agentmem - Worker pool for provider calls that must honour a deadline
 */
#ifndef AGENTMEM_CORE_THREAD_POOL_HPP
#define AGENTMEM_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <future>
#include <memory>
#include <type_traits>

namespace agentmem {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 2);
    ~ThreadPool();
    
    // Add a task to the queue. Returns false once the pool is stopped.
    bool enqueue(std::function<void()> task);
    
    // Run f on a worker and hand back its result. If the pool is stopped
    // the call runs inline so the future is always satisfied.
    template<typename F>
    std::future<typename std::result_of<F()>::type> submit(F f) {
        typedef typename std::result_of<F()>::type R;
        std::shared_ptr<std::packaged_task<R()> > task =
            std::make_shared<std::packaged_task<R()> >(f);
        std::future<R> result = task->get_future();
        if (!enqueue([task]() { (*task)(); })) {
            (*task)();
        }
        return result;
    }
    
    size_t size() const { return threads_.size(); }
    
    size_t pending() const;
    
    // Stop accepting work, drop tasks that have not started and join the
    // workers. Futures of dropped submit() calls report broken_promise.
    void shutdown();

private:
    void worker();
    
    std::vector<std::thread> threads_;
    std::queue<std::function<void()> > tasks_;
    
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace agentmem

#endif // AGENTMEM_CORE_THREAD_POOL_HPP
