#include "pshare/TrackerClient.hpp"

#include <arpa/inet.h>

#include "pshare/Protocol.hpp"

namespace pshare {

    TrackerClient::TrackerClient(Endpoint tracker, uint16_t localPort, int ioTimeoutSec)
    : tracker_(std::move(tracker)), localPort_(localPort), ioTimeoutSec_(ioTimeoutSec) {}

    bool TrackerClient::heartbeat(const std::vector<int32_t>& fileIds) const {
        return exchange([&](Connection& conn){
            conn.send(msg::update(localPort(), fileIds));
            return conn.readBool();
        });
    }

    int32_t TrackerClient::registerFile(const std::string& name, long long size) const {
        return exchange([&](Connection& conn){
            conn.send(msg::upload(name, size));
            return conn.readI32();
        });
    }

    std::vector<FileInfo> TrackerClient::listFiles() const {
        return exchange([](Connection& conn){
            conn.send(msg::listFiles());
            int32_t count = conn.readI32();
            if (count < 0) throw NetError("Negative file count from tracker", 0);
            std::vector<FileInfo> result;
            result.reserve(static_cast<size_t>(count));
            for (int32_t i = 0; i < count; ++i) {
                FileInfo info;
                info.id = conn.readI32();
                info.name = conn.readText();
                info.size = conn.readI64();
                result.push_back(std::move(info));
            }
            return result;
        });
    }

    std::vector<Endpoint> TrackerClient::locateSources(int32_t fileId) const {
        return exchange([&](Connection& conn){
            conn.send(msg::sources(fileId));
            int32_t count = conn.readI32();
            if (count < 0) throw NetError("Negative seed count from tracker", 0);
            const uint16_t self = localPort();
            std::vector<Endpoint> seeds;
            for (int32_t i = 0; i < count; ++i) {
                uint8_t addr[4];
                conn.recvAll(addr, sizeof(addr));
                uint16_t port = conn.readU16();

                char host[INET_ADDRSTRLEN] = {0};
                inet_ntop(AF_INET, addr, host, sizeof(host));
                Endpoint seed{host, port};

                // Only same-host, same-port entries are this node.
                if (seed.isLoopback() && seed.port == self) continue;
                seeds.push_back(std::move(seed));
            }
            return seeds;
        });
    }

} // namespace pshare
