#ifndef PSHARE_SCHEDULER_HPP
#define PSHARE_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "Logger.hpp"

namespace pshare {

    // Runs fn immediately and then every intervalSec seconds until stop().
    // A tick that throws is logged; later ticks still run.
    class RepeatingTask {
    public:
        template<class F>
        RepeatingTask(Logger& logger, std::string name, int intervalSec, F&& f)
        : logger_(logger), name_(std::move(name)), interval_(intervalSec), fn_(std::forward<F>(f)) {}
        ~RepeatingTask() { stop(); }

        void start() {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (running_) return;
                running_ = true;
            }
            thr_ = std::thread([this]{
                std::unique_lock<std::mutex> lk(mtx_);
                while (running_) {
                    auto next = std::chrono::steady_clock::now() + std::chrono::seconds(interval_);
                    lk.unlock();
                    try {
                        fn_();
                    } catch (const std::exception& e) {
                        logger_.error(name_ + " failed: " + e.what());
                    }
                    lk.lock();
                    cv_.wait_until(lk, next, [this]{ return !running_; });
                }
            });
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                running_ = false;
            }
            cv_.notify_all();
            if (thr_.joinable()) thr_.join();
        }

        RepeatingTask(const RepeatingTask&) = delete;
        RepeatingTask& operator=(const RepeatingTask&) = delete;

    private:
        Logger& logger_;
        std::string name_;
        int interval_;
        std::function<void()> fn_;
        std::mutex mtx_;
        std::condition_variable cv_;
        bool running_ = false;
        std::thread thr_;
    };

} // namespace pshare

#endif // PSHARE_SCHEDULER_HPP
