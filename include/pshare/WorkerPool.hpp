#ifndef PSHARE_WORKER_POOL_HPP
#define PSHARE_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace pshare {

    // Thrown by WorkerPool::submit when the queue is full or the pool is shut down.
    class PoolRejected : public std::runtime_error {
    public:
        explicit PoolRejected(const std::string& msg) : std::runtime_error(msg) {}
    };

    // Fixed set of threads with a bounded queue of waiting tasks.
    // Exceptions thrown by a task are stored in the future returned by submit().
    class WorkerPool {
    public:
        WorkerPool(size_t threads, size_t maxQueued);
        ~WorkerPool();

        std::future<void> submit(std::function<void()> task);

        // Stops accepting work, runs what is already queued and joins the workers.
        void shutdown();

        size_t queued() const;

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

    private:
        const size_t maxQueued_;
        std::vector<std::thread> workers_;
        std::queue<std::packaged_task<void()>> tasks_;
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        bool stopping_ = false;

        void run_();
    };

} // namespace pshare

#endif // PSHARE_WORKER_POOL_HPP
