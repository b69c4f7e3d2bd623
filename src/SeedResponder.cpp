#include "pshare/SeedResponder.hpp"

#include "pshare/Protocol.hpp"

namespace pshare {

    void SeedResponder::serve(Connection& conn){
        uint8_t tag = 0;
        while (conn.tryReadU8(tag)) {
            switch (static_cast<PeerRequest>(tag)) {
                case PeerRequest::STAT: handleStat_(conn); break;
                case PeerRequest::GET:  handleGet_(conn);  break;
                default:
                    throw ProtocolFault("unknown request tag " + std::to_string(tag));
            }
        }
    }

    std::shared_ptr<TorrentFile> SeedResponder::lookup_(int32_t fileId) const {
        auto file = catalog_.find(fileId);
        if (!file) throw ProtocolFault("unknown file id " + std::to_string(fileId));
        return file;
    }

    void SeedResponder::handleStat_(Connection& conn){
        int32_t id = conn.readI32();
        auto file = lookup_(id);
        auto parts = file->ownedParts();

        ByteWriter w;
        w.put32(static_cast<uint32_t>(parts.size()));
        for (int32_t p : parts) w.put32(static_cast<uint32_t>(p));
        conn.send(w.bytes());
        logger_.debug("Stat for file " + std::to_string(id) + " from " + conn.remote().str() +
                      ": " + std::to_string(parts.size()) + " parts.");
    }

    void SeedResponder::handleGet_(Connection& conn){
        int32_t id = conn.readI32();
        int32_t part = conn.readI32();
        auto file = lookup_(id);

        // Ownership may have changed since the peer's Stat.
        if (part < 0 || static_cast<size_t>(part) >= file->totalParts()) {
            throw ProtocolFault("part " + std::to_string(part) + " out of range for file " + std::to_string(id));
        }
        if (!file->containsPart(static_cast<size_t>(part))) {
            throw ProtocolFault("part " + std::to_string(part) + " of file " + std::to_string(id) + " is not owned");
        }

        files_.readPart(*file, static_cast<size_t>(part), conn);
        logger_.debug("Sent part " + std::to_string(part) + " of file " + std::to_string(id) +
                      " to " + conn.remote().str() + ".");
    }

} // namespace pshare
