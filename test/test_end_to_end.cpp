#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include "TestUtil.hpp"
#include "pshare/Node.hpp"
#include "pshare/TrackerServer.hpp"

using namespace pshare;
using testutil::TempDir;

namespace {

    NodeConfig nodeConfig(const TempDir& home, uint16_t trackerPort) {
        NodeConfig cfg;
        cfg.trackerHost = "127.0.0.1";
        cfg.trackerPort = trackerPort;
        cfg.listenPort = 0;
        cfg.homeDir = home.path.string();
        cfg.partSizeBytes = 1024;
        cfg.heartbeatIntervalSec = 3600;
        cfg.workerThreads = 4;
        cfg.maxQueuedTasks = 16;
        cfg.ioTimeoutSec = 5;
        return cfg;
    }

    bool listsPort(const std::vector<Endpoint>& seeds, uint16_t port) {
        return std::any_of(seeds.begin(), seeds.end(), [port](const Endpoint& e){ return e.port == port; });
    }

} // namespace

int main() {
    Logger logger("", LogLevel::ERROR);
    WorkerPool trackerPool(8, 32);
    TrackerServer tracker(logger, trackerPool, 0, 600, 5);
    tracker.start();

    TempDir homeA("nodeA");
    TempDir homeB("nodeB");
    const std::string movie = testutil::randomBytes(10 * 1024 - 300, 21);
    testutil::writeFile(homeA.path / "movie.mp4", movie);

    int32_t id = -1;
    {
        Node a(nodeConfig(homeA, tracker.port()), logger);
        a.start();

        CHECK(!a.addFile("missing.mp4"));
        auto added = a.addFile("movie.mp4");
        CHECK(added);
        id = *added;
        CHECK(a.catalog().find(id) && a.catalog().find(id)->isFull());
        CHECK(a.catalog().find(id)->totalParts() == 10);
        CHECK(listsPort(tracker.seedsOf(id), a.port()));

        {
            Node b(nodeConfig(homeB, tracker.port()), logger);
            b.start();

            auto listed = b.listFiles();
            CHECK(listed.size() == 1);
            CHECK((listed[0] == FileInfo{id, "movie.mp4", static_cast<long long>(movie.size())}));

            CHECK(!b.getFile(id + 100));
            CHECK(b.getFile(id));
            auto file = b.catalog().find(id);
            CHECK(file);
            CHECK((file->ownedParts() == std::vector<int32_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
            CHECK(file->isFull());
            CHECK(testutil::readFile(homeB.path / "movie.mp4") == movie);

            // B is now a source for everyone but itself
            CHECK(b.update());
            TrackerClient outsider(Endpoint{"127.0.0.1", tracker.port()}, 0, 5);
            auto seeds = outsider.locateSources(id);
            CHECK(listsPort(seeds, a.port()));
            CHECK(listsPort(seeds, b.port()));

            TrackerClient self(Endpoint{"127.0.0.1", tracker.port()}, b.port(), 5);
            CHECK(!listsPort(self.locateSources(id), b.port()));

            // Listed names that would leave B's home directory are refused
            TempDir outside("outside");
            const auto planted = outside.path / "planted.bin";
            int32_t absolute = outsider.registerFile(planted.string(), 10);
            int32_t climbing = outsider.registerFile("../" + outside.path.filename().string() + "/planted.bin", 10);
            CHECK(!b.getFile(absolute));
            CHECK(!b.getFile(climbing));
            CHECK(!b.catalog().find(absolute));
            CHECK(!b.catalog().find(climbing));
            CHECK(!std::filesystem::exists(planted));
            CHECK(!b.addFile("../" + homeA.path.filename().string() + "/movie.mp4"));

            b.stop();
            CHECK_THROWS(b.start(), std::runtime_error);
        }

        // Restarting from the same home directory restores what B owned
        {
            Node again(nodeConfig(homeB, tracker.port()), logger);
            again.start();
            auto file = again.catalog().find(id);
            CHECK(file);
            CHECK(file->isFull());
            CHECK(file->name() == "movie.mp4");
            again.stop();
        }

        a.stop();
    }

    tracker.stop();
    trackerPool.shutdown();
    return 0;
}
