#ifndef PSHARE_NODE_HPP
#define PSHARE_NODE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "CatalogStore.hpp"
#include "Config.hpp"
#include "Downloader.hpp"
#include "FileStore.hpp"
#include "Logger.hpp"
#include "Net.hpp"
#include "PartStore.hpp"
#include "Scheduler.hpp"
#include "SeedResponder.hpp"
#include "TrackerClient.hpp"
#include "WorkerPool.hpp"

namespace pshare {

    // A peer: serves the parts it owns, downloads the parts it misses and
    // keeps its registration with the tracker fresh.
    class Node {
    public:
        Node(const NodeConfig& cfg, Logger& logger);
        // Lets callers supply their own part I/O (tests count writes this way).
        Node(const NodeConfig& cfg, Logger& logger, std::unique_ptr<FileStore> files);
        ~Node();

        // Restores the catalog, starts serving and the heartbeat, then
        // downloads every file that is not full. Throws std::runtime_error after stop().
        void start();

        // Stops serving, drains the pool and saves the catalog.
        // The pool is gone afterwards, so a stopped node cannot be started again.
        void stop();

        // Registers a file that exists under the home directory. Returns its id,
        // or std::nullopt when the file does not exist.
        std::optional<int32_t> addFile(const std::string& name);

        std::vector<FileInfo> listFiles() const;

        // Downloads a file listed by the tracker. Returns true when the file is full afterwards,
        // false for unknown ids and for names that would leave the home directory.
        bool getFile(int32_t id);

        DownloadReport download(const std::shared_ptr<TorrentFile>& file);

        // Announces every known file. Returns the tracker's acknowledgement.
        bool update();

        uint16_t port() const { return server_.port(); }
        Catalog& catalog() { return catalog_; }
        const Catalog& catalog() const { return catalog_; }
        FileStore& files() { return *files_; }

        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;

    private:
        const NodeConfig cfg_;
        Logger& logger_;
        Catalog catalog_;
        std::unique_ptr<FileStore> files_;
        CatalogStore state_;
        WorkerPool pool_;
        TrackerClient tracker_;
        SeedResponder responder_;
        TcpServer server_;
        DownloadCoordinator coordinator_;
        RepeatingTask heartbeat_;
        std::mutex updateMtx_;   // held across reading the ids and sending them
        bool started_ = false;
        bool stopped_ = false;

        void heartbeatTick_();
    };

} // namespace pshare

#endif // PSHARE_NODE_HPP
