#ifndef PSHARE_DOWNLOADER_HPP
#define PSHARE_DOWNLOADER_HPP

#include <functional>
#include <memory>
#include <string>

#include "FileStore.hpp"
#include "Logger.hpp"
#include "Net.hpp"
#include "PartStore.hpp"
#include "TrackerClient.hpp"
#include "WorkerPool.hpp"

namespace pshare {

    enum class TaskState {
        CONNECTING, INVENTORYING, TRANSFERRING, COMMITTED, ANNOUNCING, DONE, FAILED
    };

    const char* toString(TaskState state);

    enum class TaskOutcome { DONE, REFUSED };

    // Fetches every part one seed has and nobody else owns or claimed, for one file.
    // A refused connection ends the task quietly; any other transport error is rethrown.
    class PartDownloadTask {
    public:
        using StateListener = std::function<void(TaskState, int32_t part)>;

        PartDownloadTask(std::shared_ptr<TorrentFile> file, Endpoint seed,
                         FileStore& files, const TrackerClient& tracker, const Catalog& catalog,
                         Logger& logger, int ioTimeoutSec = 0);

        TaskOutcome run();

        void setStateListener(StateListener listener) { listener_ = std::move(listener); }
        TaskState state() const { return state_; }
        size_t partsFetched() const { return fetched_; }

    private:
        std::shared_ptr<TorrentFile> file_;
        Endpoint seed_;
        FileStore& files_;
        const TrackerClient& tracker_;
        const Catalog& catalog_;
        Logger& logger_;
        int ioTimeoutSec_;

        TaskState state_ = TaskState::CONNECTING;
        size_t fetched_ = 0;
        StateListener listener_;

        void enter_(TaskState next, int32_t part = -1);
        std::vector<int32_t> collectParts_(Connection& conn);
        void loadPart_(Connection& conn, int32_t part);
    };

    struct DownloadReport {
        size_t seeds = 0;      // sources returned by the tracker
        size_t submitted = 0;  // tasks accepted by the pool
        size_t rejected = 0;   // tasks the pool refused
        size_t refused = 0;    // seeds that refused the connection
        size_t failed = 0;     // tasks that ended with an error
        bool complete = false; // the file is full afterwards
    };

    // Drives one file towards completion using every seed the tracker knows.
    class DownloadCoordinator {
    public:
        DownloadCoordinator(const TrackerClient& tracker, WorkerPool& pool, FileStore& files,
                            const Catalog& catalog, Logger& logger, int ioTimeoutSec = 0)
        : tracker_(tracker), pool_(pool), files_(files), catalog_(catalog),
          logger_(logger), ioTimeoutSec_(ioTimeoutSec) {}

        // Blocks until every submitted task has finished. Failed tasks are logged, not retried.
        // Throws NetError if the tracker cannot be asked for sources.
        DownloadReport download(const std::shared_ptr<TorrentFile>& file);

    private:
        const TrackerClient& tracker_;
        WorkerPool& pool_;
        FileStore& files_;
        const Catalog& catalog_;
        Logger& logger_;
        int ioTimeoutSec_;
    };

} // namespace pshare

#endif // PSHARE_DOWNLOADER_HPP
