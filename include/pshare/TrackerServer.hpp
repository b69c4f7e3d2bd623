#ifndef PSHARE_TRACKER_SERVER_HPP
#define PSHARE_TRACKER_SERVER_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <vector>

#include "Logger.hpp"
#include "Net.hpp"
#include "TrackerClient.hpp"
#include "WorkerPool.hpp"

namespace pshare {

    // Directory of shared files and of the seeds that announced them.
    // A seed stays listed for seedTtlSec after its last heartbeat.
    class TrackerServer {
    public:
        TrackerServer(Logger& logger, WorkerPool& pool, uint16_t port, int seedTtlSec, int ioTimeoutSec = 0);

        void start() { server_.start(); }
        void stop() { server_.stop(); }
        uint16_t port() const { return server_.port(); }

        // Handles the requests on one accepted connection.
        void serve(Connection& conn);

        std::vector<FileInfo> files() const;
        std::vector<Endpoint> seedsOf(int32_t fileId) const;

        // (file, seed) pairs held in memory, expired or not. Expired pairs are
        // dropped on the next update.
        size_t storedSeedEntries() const;

    private:
        using Clock = std::chrono::steady_clock;

        Logger& logger_;
        const std::chrono::seconds seedTtl_;

        mutable std::mutex mtx_;
        int32_t nextId_ = 0;
        std::map<int32_t, FileInfo> files_;
        std::map<int32_t, std::map<Endpoint, Clock::time_point>> seeds_;

        // Last, so it stops accepting before the state above goes away.
        TcpServer server_;

        void handleList_(Connection& conn);
        void handleUpload_(Connection& conn);
        void handleSources_(Connection& conn);
        void handleUpdate_(Connection& conn);
        std::vector<Endpoint> liveSeeds_(int32_t fileId) const;
    };

} // namespace pshare

#endif // PSHARE_TRACKER_SERVER_HPP
