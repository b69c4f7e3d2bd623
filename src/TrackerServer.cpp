#include "pshare/TrackerServer.hpp"

#include <arpa/inet.h>

#include "pshare/Protocol.hpp"

namespace pshare {

    TrackerServer::TrackerServer(Logger& logger, WorkerPool& pool, uint16_t port,
                                 int seedTtlSec, int ioTimeoutSec)
    : logger_(logger),
      seedTtl_(seedTtlSec),
      server_(logger, port, pool, [this](Connection& conn){ serve(conn); }, ioTimeoutSec) {}

    void TrackerServer::serve(Connection& conn){
        uint8_t tag = 0;
        while (conn.tryReadU8(tag)) {
            switch (static_cast<TrackerRequest>(tag)) {
                case TrackerRequest::LIST:    handleList_(conn); break;
                case TrackerRequest::UPLOAD:  handleUpload_(conn); break;
                case TrackerRequest::SOURCES: handleSources_(conn); break;
                case TrackerRequest::UPDATE:  handleUpdate_(conn); break;
                default:
                    throw ProtocolFault("unknown tracker request " + std::to_string(tag));
            }
        }
    }

    void TrackerServer::handleList_(Connection& conn){
        ByteWriter w;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            w.put32(static_cast<uint32_t>(files_.size()));
            for (const auto& kv : files_) {
                w.put32(static_cast<uint32_t>(kv.second.id))
                 .putText(kv.second.name)
                 .put64(static_cast<uint64_t>(kv.second.size));
            }
        }
        conn.send(w.bytes());
    }

    void TrackerServer::handleUpload_(Connection& conn){
        std::string name = conn.readText();
        int64_t size = conn.readI64();
        if (size < 0) throw ProtocolFault("negative size for " + name);

        int32_t id;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            id = nextId_++;
            files_[id] = FileInfo{id, name, size};
        }
        conn.send(ByteWriter().put32(static_cast<uint32_t>(id)).bytes());
        logger_.onFileRegistered(id, name, size);
    }

    void TrackerServer::handleSources_(Connection& conn){
        int32_t id = conn.readI32();
        std::vector<Endpoint> seeds = liveSeeds_(id);

        ByteWriter w;
        w.put32(static_cast<uint32_t>(seeds.size()));
        for (const auto& seed : seeds) {
            in_addr addr{};
            if (inet_pton(AF_INET, seed.host.c_str(), &addr) != 1) {
                throw ProtocolFault("seed " + seed.str() + " is not an IPv4 address");
            }
            w.putBytes(reinterpret_cast<const uint8_t*>(&addr.s_addr), 4).put16(seed.port);
        }
        conn.send(w.bytes());
    }

    void TrackerServer::handleUpdate_(Connection& conn){
        uint16_t port = conn.readU16();
        int32_t count = conn.readI32();
        if (count < 0) throw ProtocolFault("negative file count in update");
        std::set<int32_t> ids;
        for (int32_t i = 0; i < count; ++i) ids.insert(conn.readI32());

        Endpoint seed{conn.remote().host, port};
        auto now = Clock::now();
        {
            std::lock_guard<std::mutex> lk(mtx_);
            // The announced set replaces whatever this seed announced before.
            for (int32_t id : ids) {
                if (files_.count(id)) seeds_[id][seed] = now;
            }
            for (auto it = seeds_.begin(); it != seeds_.end(); ) {
                auto& entries = it->second;
                if (!ids.count(it->first)) entries.erase(seed);
                for (auto e = entries.begin(); e != entries.end(); ) {
                    if (now - e->second > seedTtl_) e = entries.erase(e);
                    else ++e;
                }
                if (entries.empty()) it = seeds_.erase(it);
                else ++it;
            }
        }
        conn.send(ByteWriter().putBool(true).bytes());
        logger_.debug("Update from " + seed.str() + " with " + std::to_string(ids.size()) + " files.");
    }

    std::vector<Endpoint> TrackerServer::liveSeeds_(int32_t fileId) const {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<Endpoint> out;
        auto it = seeds_.find(fileId);
        if (it == seeds_.end()) return out;
        auto now = Clock::now();
        for (const auto& kv : it->second) {
            if (now - kv.second <= seedTtl_) out.push_back(kv.first);
        }
        return out;
    }

    std::vector<FileInfo> TrackerServer::files() const {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<FileInfo> out;
        for (const auto& kv : files_) out.push_back(kv.second);
        return out;
    }

    std::vector<Endpoint> TrackerServer::seedsOf(int32_t fileId) const {
        return liveSeeds_(fileId);
    }

    size_t TrackerServer::storedSeedEntries() const {
        std::lock_guard<std::mutex> lk(mtx_);
        size_t n = 0;
        for (const auto& kv : seeds_) n += kv.second.size();
        return n;
    }

} // namespace pshare
