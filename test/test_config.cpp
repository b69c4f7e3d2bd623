#include <stdexcept>

#include "TestUtil.hpp"
#include "pshare/Config.hpp"

using namespace pshare;
using testutil::TempDir;
using testutil::writeFile;

int main() {
    TempDir dir("config");

    // Defaults when the file sets nothing
    {
        auto path = dir.path / "empty.cfg";
        writeFile(path, "\n# nothing here\n");
        NodeConfig c = NodeConfig::fromFile(path.string());
        CHECK(c.trackerHost == "127.0.0.1");
        CHECK(c.trackerPort == 8081);
        CHECK(c.listenPort == 0);
        CHECK(c.partSizeBytes == DEFAULT_PART_SIZE);
        CHECK(c.heartbeatIntervalSec == 300);
        CHECK(c.logFile.empty());
        CHECK(c.logLevel == LogLevel::INFO);
    }

    // Every key overridden; values may contain spaces
    {
        auto path = dir.path / "node.cfg";
        writeFile(path,
            "TrackerHost 10.0.0.7\n"
            "TrackerPort 9000\n"
            "ListenPort 6881\n"
            "HomeDir /srv/shared files\n"
            "PartSize 4096\n"
            "HeartbeatIntervalSec 5\n"
            "WorkerThreads 3\n"
            "MaxQueuedTasks 7\n"
            "IoTimeoutSec 0\n"
            "LogFile node.log\n"
            "LogLevel DEBUG\n"
            "SomethingElse 1\n");
        NodeConfig c = NodeConfig::fromFile(path.string());
        CHECK(c.trackerHost == "10.0.0.7");
        CHECK(c.trackerPort == 9000);
        CHECK(c.listenPort == 6881);
        CHECK(c.homeDir == "/srv/shared files");
        CHECK(c.partSizeBytes == 4096);
        CHECK(c.heartbeatIntervalSec == 5);
        CHECK(c.workerThreads == 3);
        CHECK(c.maxQueuedTasks == 7);
        CHECK(c.ioTimeoutSec == 0);
        CHECK(c.logFile == "node.log");
        CHECK(c.logLevel == LogLevel::DEBUG);
    }

    // Validation
    {
        auto path = dir.path / "bad_part.cfg";
        writeFile(path, "PartSize 0\n");
        CHECK_THROWS(NodeConfig::fromFile(path.string()), std::runtime_error);

        path = dir.path / "bad_port.cfg";
        writeFile(path, "TrackerPort 70000\n");
        CHECK_THROWS(NodeConfig::fromFile(path.string()), std::runtime_error);

        path = dir.path / "bad_level.cfg";
        writeFile(path, "LogLevel LOUD\n");
        CHECK_THROWS(NodeConfig::fromFile(path.string()), std::runtime_error);

        CHECK_THROWS(NodeConfig::fromFile((dir.path / "missing.cfg").string()), std::runtime_error);
    }

    // Tracker config
    {
        auto path = dir.path / "tracker.cfg";
        writeFile(path, "Port 7000\nSeedTtlSec 30\nWorkerThreads 2\n");
        TrackerConfig t = TrackerConfig::fromFile(path.string());
        CHECK(t.port == 7000);
        CHECK(t.seedTtlSec == 30);
        CHECK(t.workerThreads == 2);
        CHECK(t.maxQueuedTasks == 64);

        path = dir.path / "tracker_bad.cfg";
        writeFile(path, "SeedTtlSec -1\n");
        CHECK_THROWS(TrackerConfig::fromFile(path.string()), std::runtime_error);
    }

    return 0;
}
