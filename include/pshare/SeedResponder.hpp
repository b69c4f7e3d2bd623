#ifndef PSHARE_SEED_RESPONDER_HPP
#define PSHARE_SEED_RESPONDER_HPP

#include "FileStore.hpp"
#include "Logger.hpp"
#include "Net.hpp"
#include "PartStore.hpp"

namespace pshare {

    // Serves Stat and Get requests on one inbound peer connection until the peer closes it.
    // Throws ProtocolFault for a request that cannot be served; the caller closes the connection.
    class SeedResponder {
    public:
        SeedResponder(const Catalog& catalog, FileStore& files, Logger& logger)
        : catalog_(catalog), files_(files), logger_(logger) {}

        void serve(Connection& conn);

    private:
        const Catalog& catalog_;
        FileStore& files_;
        Logger& logger_;

        void handleStat_(Connection& conn);
        void handleGet_(Connection& conn);
        std::shared_ptr<TorrentFile> lookup_(int32_t fileId) const;
    };

} // namespace pshare

#endif // PSHARE_SEED_RESPONDER_HPP
