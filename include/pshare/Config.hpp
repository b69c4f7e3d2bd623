#ifndef PSHARE_CONFIG_HPP
#define PSHARE_CONFIG_HPP

#include <cstdint>
#include <string>

#include "Logger.hpp"

namespace pshare {

    constexpr long long DEFAULT_PART_SIZE = 10LL * 1024 * 1024;

    struct NodeConfig {
        std::string trackerHost = "127.0.0.1";
        uint16_t trackerPort = 8081;
        uint16_t listenPort = 0;            // 0 picks an ephemeral port
        std::string homeDir = ".";
        long long partSizeBytes = DEFAULT_PART_SIZE;
        int heartbeatIntervalSec = 300;
        int workerThreads = 8;
        int maxQueuedTasks = 64;
        int ioTimeoutSec = 30;              // 0 disables socket timeouts
        std::string logFile;                // empty logs to stderr
        LogLevel logLevel = LogLevel::INFO;

        static NodeConfig fromFile(const std::string& path);
        void validate() const;
    };

    struct TrackerConfig {
        uint16_t port = 8081;
        int workerThreads = 8;
        int maxQueuedTasks = 64;
        int seedTtlSec = 600;
        int ioTimeoutSec = 30;
        std::string logFile;
        LogLevel logLevel = LogLevel::INFO;

        static TrackerConfig fromFile(const std::string& path);
        void validate() const;
    };

} // namespace pshare

#endif // PSHARE_CONFIG_HPP
