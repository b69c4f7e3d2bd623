#include "pshare/Downloader.hpp"

#include <atomic>
#include <future>
#include <vector>

#include "pshare/Protocol.hpp"

namespace pshare {

    const char* toString(TaskState state){
        switch (state) {
            case TaskState::CONNECTING:   return "Connecting";
            case TaskState::INVENTORYING: return "Inventorying";
            case TaskState::TRANSFERRING: return "Transferring";
            case TaskState::COMMITTED:    return "Committed";
            case TaskState::ANNOUNCING:   return "Announcing";
            case TaskState::DONE:         return "Done";
            case TaskState::FAILED:       return "Failed";
        }
        return "Unknown";
    }

    PartDownloadTask::PartDownloadTask(std::shared_ptr<TorrentFile> file, Endpoint seed,
                                       FileStore& files, const TrackerClient& tracker,
                                       const Catalog& catalog, Logger& logger, int ioTimeoutSec)
    : file_(std::move(file)),
      seed_(std::move(seed)),
      files_(files),
      tracker_(tracker),
      catalog_(catalog),
      logger_(logger),
      ioTimeoutSec_(ioTimeoutSec) {}

    void PartDownloadTask::enter_(TaskState next, int32_t part){
        state_ = next;
        if (listener_) listener_(next, part);
    }

    TaskOutcome PartDownloadTask::run(){
        enter_(TaskState::CONNECTING);
        Connection conn(-1);
        try {
            conn = Connection::connect(seed_, ioTimeoutSec_);
        } catch (const ConnectionRefused&) {
            enter_(TaskState::FAILED);
            logger_.onSeedRefused(file_->id(), seed_.str());
            return TaskOutcome::REFUSED;
        } catch (...) {
            enter_(TaskState::FAILED);
            throw;
        }

        try {
            enter_(TaskState::INVENTORYING);
            std::vector<int32_t> parts = collectParts_(conn);

            for (int32_t part : parts) {
                if (part < 0 || static_cast<size_t>(part) >= file_->totalParts()) {
                    throw NetError("Seed " + seed_.str() + " reported part " + std::to_string(part) +
                                   " outside file " + std::to_string(file_->id()), 0);
                }
                // Claim and check happen in one locked step.
                if (!file_->tryClaim(static_cast<size_t>(part))) continue;
                loadPart_(conn, part);
            }
            conn.close();

            enter_(TaskState::ANNOUNCING);
            if (!tracker_.heartbeat(catalog_.ids())) {
                logger_.onHeartbeatRejected();
            }
            enter_(TaskState::DONE);
            return TaskOutcome::DONE;
        } catch (...) {
            enter_(TaskState::FAILED);
            throw;
        }
    }

    std::vector<int32_t> PartDownloadTask::collectParts_(Connection& conn){
        conn.send(msg::stat(file_->id()));
        int32_t numParts = conn.readI32();
        if (numParts < 0) throw NetError("Negative part count from " + seed_.str(), 0);
        std::vector<int32_t> parts(static_cast<size_t>(numParts));
        for (auto& p : parts) p = conn.readI32();
        return parts;
    }

    void PartDownloadTask::loadPart_(Connection& conn, int32_t part){
        // Released on any failure below, so a later run can fetch the part again.
        PartClaim claim(*file_, static_cast<size_t>(part));

        enter_(TaskState::TRANSFERRING, part);
        conn.send(msg::get(file_->id(), part));
        files_.writePart(*file_, static_cast<size_t>(part), conn);

        claim.commit();
        ++fetched_;
        enter_(TaskState::COMMITTED, part);
        logger_.onDownloadedPart(file_->id(), part, seed_.str(), file_->ownedCount(), file_->totalParts());
    }

    DownloadReport DownloadCoordinator::download(const std::shared_ptr<TorrentFile>& file){
        DownloadReport report;
        std::vector<Endpoint> seeds = tracker_.locateSources(file->id());
        report.seeds = seeds.size();
        if (seeds.empty()) {
            logger_.onNoSources(file->id());
            report.complete = file->isFull();
            return report;
        }

        struct Pending {
            Endpoint seed;
            std::shared_ptr<PartDownloadTask> task;
            std::future<void> done;
        };
        std::vector<Pending> pending;
        auto refused = std::make_shared<std::atomic<size_t>>(0);

        for (const auto& seed : seeds) {
            auto task = std::make_shared<PartDownloadTask>(file, seed, files_, tracker_, catalog_,
                                                           logger_, ioTimeoutSec_);
            task->setStateListener([this, id = file->id(), s = seed.str()](TaskState st, int32_t part){
                logger_.debug("Task for file " + std::to_string(id) + " from " + s + ": " +
                              toString(st) + (part >= 0 ? " part " + std::to_string(part) : std::string()));
            });
            try {
                auto fut = pool_.submit([task, refused]{
                    if (task->run() == TaskOutcome::REFUSED) ++*refused;
                });
                pending.push_back(Pending{seed, task, std::move(fut)});
            } catch (const PoolRejected& e) {
                ++report.rejected;
                logger_.onSeedRejected(file->id(), seed.str(), e.what());
            }
        }
        report.submitted = pending.size();

        for (auto& p : pending) {
            try {
                p.done.get();
            } catch (const std::exception& e) {
                ++report.failed;
                logger_.onTaskFailed(file->id(), p.seed.str(), e.what());
            }
        }
        report.refused = refused->load();
        report.complete = file->isFull();

        if (report.complete) {
            logger_.onDownloadComplete(file->id(), files_.pathOf(*file).string());
        } else {
            logger_.onDownloadPartial(file->id(), file->ownedCount(), file->totalParts());
        }
        return report;
    }

} // namespace pshare
