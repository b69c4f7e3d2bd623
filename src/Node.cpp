#include "pshare/Node.hpp"

#include <stdexcept>

namespace pshare {

    static const NodeConfig& validated(const NodeConfig& cfg){
        cfg.validate();
        return cfg;
    }

    Node::Node(const NodeConfig& cfg, Logger& logger)
    : Node(cfg, logger, std::make_unique<FileStore>(cfg.homeDir)) {}

    Node::Node(const NodeConfig& cfg, Logger& logger, std::unique_ptr<FileStore> files)
    : cfg_(validated(cfg)),
      logger_(logger),
      files_(std::move(files)),
      state_(cfg.homeDir, cfg.partSizeBytes),
      pool_(static_cast<size_t>(cfg.workerThreads), static_cast<size_t>(cfg.maxQueuedTasks)),
      tracker_(Endpoint{cfg.trackerHost, cfg.trackerPort}, cfg.listenPort, cfg.ioTimeoutSec),
      responder_(catalog_, *files_, logger),
      server_(logger, cfg.listenPort, pool_,
              [this](Connection& conn){ responder_.serve(conn); }, cfg.ioTimeoutSec),
      coordinator_(tracker_, pool_, *files_, catalog_, logger, cfg.ioTimeoutSec),
      heartbeat_(logger, "Heartbeat", cfg.heartbeatIntervalSec, [this]{ heartbeatTick_(); }) {}

    Node::~Node(){
        try {
            stop();
        } catch (const std::exception& e) {
            logger_.error(std::string("Shutdown failed: ") + e.what());
        }
    }

    void Node::start(){
        if (started_) return;
        if (stopped_) throw std::runtime_error("A stopped node cannot be restarted");
        state_.load(catalog_);
        server_.start();
        tracker_.setLocalPort(server_.port());
        started_ = true;
        heartbeat_.start();
        logger_.info("Node started on port " + std::to_string(server_.port()) + " with " +
                     std::to_string(catalog_.size()) + " known files.");

        for (const auto& file : catalog_.files()) {
            if (file->isFull()) continue;
            try {
                download(file);
            } catch (const std::exception& e) {
                logger_.error("Could not resume file " + std::to_string(file->id()) + ": " + e.what());
            }
        }
    }

    void Node::stop(){
        if (!started_) return;
        started_ = false;
        stopped_ = true;
        heartbeat_.stop();
        server_.stop();
        pool_.shutdown();
        state_.save(catalog_);
        logger_.info("Node on port " + std::to_string(server_.port()) + " stopped.");
    }

    void Node::heartbeatTick_(){
        // The tick itself only schedules; the exchange runs on the shared pool.
        pool_.submit([this]{
            try {
                update();
            } catch (const std::exception& e) {
                logger_.warn(std::string("Heartbeat failed: ") + e.what());
            }
        });
    }

    bool Node::update(){
        std::lock_guard<std::mutex> lk(updateMtx_);
        bool updated = tracker_.heartbeat(catalog_.ids());
        if (!updated) logger_.onHeartbeatRejected();
        return updated;
    }

    std::optional<int32_t> Node::addFile(const std::string& name){
        if (!FileStore::isLocalName(name) || !files_->exists(name)) {
            logger_.onFileNotFound(name);
            return std::nullopt;
        }
        long long size = files_->fileSize(name);
        int32_t id = tracker_.registerFile(name, size);
        catalog_.put(TorrentFile::createFull(id, name, size, cfg_.partSizeBytes));
        logger_.onFileRegistered(id, name, size);
        update();
        return id;
    }

    std::vector<FileInfo> Node::listFiles() const {
        return tracker_.listFiles();
    }

    bool Node::getFile(int32_t id){
        for (const auto& info : listFiles()) {
            if (info.id != id) continue;
            if (!FileStore::isLocalName(info.name)) {
                logger_.warn("Refusing file " + std::to_string(id) + ": name " + info.name +
                             " leaves the home directory.");
                return false;
            }
            auto file = catalog_.add(TorrentFile::createEmpty(info.id, info.name, info.size, cfg_.partSizeBytes));
            return download(file).complete;
        }
        logger_.onFileNotFound("with id = " + std::to_string(id));
        return false;
    }

    DownloadReport Node::download(const std::shared_ptr<TorrentFile>& file){
        return coordinator_.download(file);
    }

} // namespace pshare
