#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "TestUtil.hpp"
#include "pshare/Net.hpp"
#include "pshare/Protocol.hpp"
#include "pshare/TrackerClient.hpp"
#include "pshare/TrackerServer.hpp"
#include "pshare/WorkerPool.hpp"

using namespace pshare;

namespace {

    // Answers tracker requests with canned replies and records what it was sent.
    struct FakeTracker {
        std::mutex mtx;
        uint16_t announcedPort = 0;
        std::vector<int32_t> announcedIds;
        std::string registeredName;
        long long registeredSize = -1;
        bool ack = false;
        std::vector<Endpoint> seeds;

        void serve(Connection& conn) {
            uint8_t tag = 0;
            while (conn.tryReadU8(tag)) {
                switch (static_cast<TrackerRequest>(tag)) {
                    case TrackerRequest::UPDATE: {
                        uint16_t port = conn.readU16();
                        int32_t n = conn.readI32();
                        std::vector<int32_t> ids;
                        for (int32_t i = 0; i < n; ++i) ids.push_back(conn.readI32());
                        bool reply;
                        {
                            std::lock_guard<std::mutex> lk(mtx);
                            announcedPort = port;
                            announcedIds = ids;
                            reply = ack;
                        }
                        conn.send(ByteWriter().putBool(reply).bytes());
                        break;
                    }
                    case TrackerRequest::UPLOAD: {
                        std::string name = conn.readText();
                        int64_t size = conn.readI64();
                        {
                            std::lock_guard<std::mutex> lk(mtx);
                            registeredName = name;
                            registeredSize = size;
                        }
                        conn.send(ByteWriter().put32(7).bytes());
                        break;
                    }
                    case TrackerRequest::LIST: {
                        std::lock_guard<std::mutex> lk(mtx);
                        ByteWriter w;
                        w.put32(1).put32(7).putText(registeredName).put64(static_cast<uint64_t>(registeredSize));
                        conn.send(w.bytes());
                        break;
                    }
                    case TrackerRequest::SOURCES: {
                        (void)conn.readI32();
                        std::lock_guard<std::mutex> lk(mtx);
                        ByteWriter w;
                        w.put32(static_cast<uint32_t>(seeds.size()));
                        for (const auto& s : seeds) {
                            in_addr addr{};
                            inet_pton(AF_INET, s.host.c_str(), &addr);
                            w.putBytes(reinterpret_cast<const uint8_t*>(&addr.s_addr), 4).put16(s.port);
                        }
                        conn.send(w.bytes());
                        break;
                    }
                    default:
                        throw ProtocolFault("unexpected tag");
                }
            }
        }
    };

} // namespace

int main() {
    Logger logger("", LogLevel::ERROR);
    WorkerPool pool(4, 16);
    FakeTracker fake;
    TcpServer server(logger, 0, pool, [&fake](Connection& conn){ fake.serve(conn); }, 5);
    server.start();

    TrackerClient client(Endpoint{"127.0.0.1", server.port()}, 6001, 5);

    // Heartbeat announces the port and exactly the given ids; a false ack is not an error
    {
        CHECK(!client.heartbeat({0, 3, 5}));
        {
            std::lock_guard<std::mutex> lk(fake.mtx);
            CHECK(fake.announcedPort == 6001);
            CHECK((fake.announcedIds == std::vector<int32_t>{0, 3, 5}));
            fake.ack = true;
        }
        CHECK(client.heartbeat({}));
        std::lock_guard<std::mutex> lk(fake.mtx);
        CHECK(fake.announcedIds.empty());
    }

    // Register then list
    {
        CHECK(client.registerFile("a.txt", 100) == 7);
        auto files = client.listFiles();
        CHECK(files.size() == 1);
        CHECK((files[0] == FileInfo{7, "a.txt", 100}));
    }

    // Only loopback entries on our own port are dropped
    {
        {
            std::lock_guard<std::mutex> lk(fake.mtx);
            fake.seeds = {
                Endpoint{"127.0.0.1", 6001},
                Endpoint{"127.0.0.1", 6002},
                Endpoint{"10.0.0.5", 6001},
            };
        }
        auto seeds = client.locateSources(7);
        CHECK(seeds.size() == 2);
        CHECK((seeds[0] == Endpoint{"127.0.0.1", 6002}));
        CHECK((seeds[1] == Endpoint{"10.0.0.5", 6001}));

        client.setLocalPort(6002);
        seeds = client.locateSources(7);
        CHECK(seeds.size() == 2);
        CHECK((seeds[0] == Endpoint{"127.0.0.1", 6001}));
    }

    // Seeds whose heartbeat is older than the TTL are dropped from memory on the next update
    {
        TrackerServer tracker(logger, pool, 0, 1, 5);
        tracker.start();
        const Endpoint ep{"127.0.0.1", tracker.port()};
        int32_t id = TrackerClient(ep, 0, 5).registerFile("b.bin", 10);
        int32_t other = TrackerClient(ep, 0, 5).registerFile("c.bin", 10);

        CHECK(TrackerClient(ep, 7001, 5).heartbeat({id, other}));
        CHECK(TrackerClient(ep, 7002, 5).heartbeat({id}));
        CHECK(tracker.storedSeedEntries() == 3);

        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        CHECK(tracker.seedsOf(id).empty());
        CHECK(tracker.storedSeedEntries() == 3);

        CHECK(TrackerClient(ep, 7002, 5).heartbeat({id}));
        CHECK(tracker.storedSeedEntries() == 1);
        auto live = tracker.seedsOf(id);
        CHECK(live.size() == 1);
        CHECK((live[0] == Endpoint{"127.0.0.1", 7002}));
        CHECK(tracker.seedsOf(other).empty());

        tracker.stop();
    }

    server.stop();
    pool.shutdown();

    // Nobody listening any more
    {
        TrackerClient gone(Endpoint{"127.0.0.1", client.tracker().port}, 6001, 2);
        CHECK_THROWS(gone.listFiles(), ConnectionRefused);
        CHECK_THROWS(gone.heartbeat({1}), NetError);
    }

    return 0;
}
