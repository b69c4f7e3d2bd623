#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "pshare/Config.hpp"
#include "pshare/Logger.hpp"
#include "pshare/TrackerServer.hpp"
#include "pshare/WorkerPool.hpp"

using namespace pshare;

static std::atomic<bool> gShouldTerminate{false};

static void onSignal(int){ gShouldTerminate.store(true); }

int main(int argc, char** argv){
    try {
        if (argc < 2){ std::cerr << "Usage: trackerProcess <config>\n"; return 1; }

        TrackerConfig cfg = TrackerConfig::fromFile(argv[1]);
        Logger logger(cfg.logFile, cfg.logLevel);

        WorkerPool pool(static_cast<size_t>(cfg.workerThreads), static_cast<size_t>(cfg.maxQueuedTasks));
        TrackerServer tracker(logger, pool, cfg.port, cfg.seedTtlSec, cfg.ioTimeoutSec);
        tracker.start();
        logger.info("trackerProcess listening on port " + std::to_string(tracker.port()));

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        while (!gShouldTerminate.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logger.info("Shutting down tracker.");
        tracker.stop();
        pool.shutdown();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << "\n";
        return 2;
    }
}
