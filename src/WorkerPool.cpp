#include "pshare/WorkerPool.hpp"

namespace pshare {

    WorkerPool::WorkerPool(size_t threads, size_t maxQueued) : maxQueued_(maxQueued) {
        if (threads == 0) throw std::invalid_argument("WorkerPool needs at least one thread");
        workers_.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back(&WorkerPool::run_, this);
        }
    }

    WorkerPool::~WorkerPool(){ shutdown(); }

    std::future<void> WorkerPool::submit(std::function<void()> task){
        std::packaged_task<void()> job(std::move(task));
        std::future<void> fut = job.get_future();
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (stopping_) throw PoolRejected("worker pool is shut down");
            if (tasks_.size() >= maxQueued_) {
                throw PoolRejected("worker pool queue is full (" + std::to_string(maxQueued_) + " waiting)");
            }
            tasks_.push(std::move(job));
        }
        cv_.notify_one();
        return fut;
    }

    void WorkerPool::shutdown(){
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (stopping_ && workers_.empty()) return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (!w.joinable()) continue;
            if (w.get_id() == std::this_thread::get_id()) w.detach();
            else w.join();
        }
        workers_.clear();
    }

    size_t WorkerPool::queued() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return tasks_.size();
    }

    void WorkerPool::run_(){
        for (;;) {
            std::packaged_task<void()> job;
            {
                std::unique_lock<std::mutex> lk(mtx_);
                cv_.wait(lk, [this]{ return stopping_ || !tasks_.empty(); });
                if (tasks_.empty()) return;
                job = std::move(tasks_.front());
                tasks_.pop();
            }
            // packaged_task stores any exception in the future
            job();
        }
    }

} // namespace pshare
