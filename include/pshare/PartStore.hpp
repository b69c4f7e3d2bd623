#ifndef PSHARE_PART_STORE_HPP
#define PSHARE_PART_STORE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "Config.hpp"

namespace pshare {

    enum class PartState { MISSING, CLAIMED, OWNED };

    // Ownership state of one shared file.
    // ownedParts holds parts that are durably on disk; claimedParts holds parts
    // some task is fetching right now. The two sets never intersect.
    class TorrentFile {
    public:
        TorrentFile(int32_t id, std::string name, long long sizeBytes, long long partSizeBytes = DEFAULT_PART_SIZE);

        static std::shared_ptr<TorrentFile> createFull(int32_t id, const std::string& name,
                                                       long long sizeBytes, long long partSizeBytes = DEFAULT_PART_SIZE);
        static std::shared_ptr<TorrentFile> createEmpty(int32_t id, const std::string& name,
                                                        long long sizeBytes, long long partSizeBytes = DEFAULT_PART_SIZE);

        int32_t id() const { return id_; }
        const std::string& name() const { return name_; }
        long long size() const { return sizeBytes_; }
        long long partSize() const { return partSizeBytes_; }
        size_t totalParts() const { return totalParts_; }

        // Byte length of one part; the last part may be shorter.
        long long partLength(size_t index) const;

        bool containsPart(size_t index) const;
        bool isPartLoading(size_t index) const;
        PartState state(size_t index) const;
        bool isFull() const;

        // Snapshot of the owned parts in ascending order.
        std::vector<int32_t> ownedParts() const;
        size_t ownedCount() const;
        std::vector<int32_t> claimedParts() const;

        // Atomically claims a part that is neither owned nor claimed.
        // Returns false when someone else got there first.
        bool tryClaim(size_t index);

        // Moves a claimed part to owned. Call only after the bytes are on disk.
        void commit(size_t index);

        // Drops a claim without owning the part.
        void release(size_t index);

        // Marks a part owned without a claim; used when restoring saved state.
        void markOwned(size_t index);

    private:
        const int32_t id_;
        const std::string name_;
        const long long sizeBytes_;
        const long long partSizeBytes_;
        size_t totalParts_ = 0;

        std::set<int32_t> owned_;
        std::set<int32_t> claimed_;
        mutable std::mutex mtx_;

        void checkIndex_(size_t index) const;
    };

    // Holds a claim on one part and releases it on scope exit unless committed.
    class PartClaim {
    public:
        PartClaim(TorrentFile& file, size_t index) : file_(&file), index_(index) {}
        ~PartClaim() { if (file_) file_->release(index_); }

        void commit() { file_->commit(index_); file_ = nullptr; }

        PartClaim(const PartClaim&) = delete;
        PartClaim& operator=(const PartClaim&) = delete;

    private:
        TorrentFile* file_;
        size_t index_;
    };

    // id -> file. Entries are built before insertion, so readers never see a half-built one.
    class Catalog {
    public:
        // Inserts the file; returns the existing entry instead if the id is taken.
        std::shared_ptr<TorrentFile> add(std::shared_ptr<TorrentFile> file);
        void put(std::shared_ptr<TorrentFile> file);
        std::shared_ptr<TorrentFile> find(int32_t id) const;
        bool remove(int32_t id);

        std::vector<int32_t> ids() const;
        std::vector<std::shared_ptr<TorrentFile>> files() const;
        size_t size() const;

    private:
        std::map<int32_t, std::shared_ptr<TorrentFile>> files_;
        mutable std::shared_mutex mtx_;
    };

} // namespace pshare

#endif // PSHARE_PART_STORE_HPP
