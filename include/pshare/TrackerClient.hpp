#ifndef PSHARE_TRACKER_CLIENT_HPP
#define PSHARE_TRACKER_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "Net.hpp"

namespace pshare {

    struct FileInfo {
        int32_t id = 0;
        std::string name;
        long long size = 0;

        bool operator==(const FileInfo& o) const { return id == o.id && name == o.name && size == o.size; }
    };

    // One request/response exchange per call over a fresh connection to the tracker.
    // Transport failures surface as NetError; nothing is retried here.
    class TrackerClient {
    public:
        // localPort is the port this node listens on; it is announced in heartbeats
        // and used to drop this node from source lists.
        TrackerClient(Endpoint tracker, uint16_t localPort, int ioTimeoutSec = 0);

        void setLocalPort(uint16_t port) { localPort_.store(port); }
        uint16_t localPort() const { return localPort_.load(); }
        const Endpoint& tracker() const { return tracker_; }

        // Returns the tracker's acknowledgement flag.
        bool heartbeat(const std::vector<int32_t>& fileIds) const;
        int32_t registerFile(const std::string& name, long long size) const;
        std::vector<FileInfo> listFiles() const;
        std::vector<Endpoint> locateSources(int32_t fileId) const;

        // Opens a connection, runs fn on it and closes it.
        template<class F>
        auto exchange(F&& fn) const {
            Connection conn = Connection::connect(tracker_, ioTimeoutSec_);
            return std::forward<F>(fn)(conn);
        }

    private:
        Endpoint tracker_;
        std::atomic<uint16_t> localPort_;
        int ioTimeoutSec_;
    };

} // namespace pshare

#endif // PSHARE_TRACKER_CLIENT_HPP
