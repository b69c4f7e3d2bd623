#include "pshare/PartStore.hpp"

#include <algorithm>
#include <stdexcept>

namespace pshare {

TorrentFile::TorrentFile(int32_t id, std::string name, long long sizeBytes, long long partSizeBytes)
    : id_(id),
      name_(std::move(name)),
      sizeBytes_(sizeBytes),
      partSizeBytes_(partSizeBytes) {

    if (sizeBytes_ < 0 || partSizeBytes_ <= 0) {
        throw std::invalid_argument("Invalid file or part size");
    }
    // ceil(size / partSize)
    totalParts_ = static_cast<size_t>((sizeBytes_ + partSizeBytes_ - 1) / partSizeBytes_);
}

std::shared_ptr<TorrentFile> TorrentFile::createFull(int32_t id, const std::string& name,
                                                     long long sizeBytes, long long partSizeBytes) {
    auto file = std::make_shared<TorrentFile>(id, name, sizeBytes, partSizeBytes);
    for (size_t i = 0; i < file->totalParts_; ++i) {
        file->owned_.insert(static_cast<int32_t>(i));
    }
    return file;
}

std::shared_ptr<TorrentFile> TorrentFile::createEmpty(int32_t id, const std::string& name,
                                                      long long sizeBytes, long long partSizeBytes) {
    return std::make_shared<TorrentFile>(id, name, sizeBytes, partSizeBytes);
}

void TorrentFile::checkIndex_(size_t index) const {
    if (index >= totalParts_) {
        throw std::out_of_range("Part index " + std::to_string(index) +
                                " out of range for file " + std::to_string(id_));
    }
}

long long TorrentFile::partLength(size_t index) const {
    checkIndex_(index);
    long long offset = static_cast<long long>(index) * partSizeBytes_;
    return std::min<long long>(partSizeBytes_, sizeBytes_ - offset);
}

bool TorrentFile::containsPart(size_t index) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return owned_.count(static_cast<int32_t>(index)) > 0;
}

bool TorrentFile::isPartLoading(size_t index) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return claimed_.count(static_cast<int32_t>(index)) > 0;
}

PartState TorrentFile::state(size_t index) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto i = static_cast<int32_t>(index);
    if (owned_.count(i)) return PartState::OWNED;
    if (claimed_.count(i)) return PartState::CLAIMED;
    return PartState::MISSING;
}

bool TorrentFile::isFull() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return owned_.size() == totalParts_;
}

std::vector<int32_t> TorrentFile::ownedParts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return {owned_.begin(), owned_.end()};
}

size_t TorrentFile::ownedCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return owned_.size();
}

std::vector<int32_t> TorrentFile::claimedParts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return {claimed_.begin(), claimed_.end()};
}

bool TorrentFile::tryClaim(size_t index) {
    checkIndex_(index);
    auto i = static_cast<int32_t>(index);
    std::lock_guard<std::mutex> lk(mtx_);
    if (owned_.count(i) || claimed_.count(i)) {
        return false;
    }
    claimed_.insert(i);
    return true;
}

void TorrentFile::commit(size_t index) {
    checkIndex_(index);
    auto i = static_cast<int32_t>(index);
    std::lock_guard<std::mutex> lk(mtx_);
    claimed_.erase(i);
    owned_.insert(i);
}

void TorrentFile::release(size_t index) {
    std::lock_guard<std::mutex> lk(mtx_);
    claimed_.erase(static_cast<int32_t>(index));
}

void TorrentFile::markOwned(size_t index) {
    checkIndex_(index);
    std::lock_guard<std::mutex> lk(mtx_);
    owned_.insert(static_cast<int32_t>(index));
}

std::shared_ptr<TorrentFile> Catalog::add(std::shared_ptr<TorrentFile> file) {
    std::unique_lock<std::shared_mutex> lk(mtx_);
    return files_.emplace(file->id(), file).first->second;
}

void Catalog::put(std::shared_ptr<TorrentFile> file) {
    std::unique_lock<std::shared_mutex> lk(mtx_);
    files_[file->id()] = std::move(file);
}

std::shared_ptr<TorrentFile> Catalog::find(int32_t id) const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    auto it = files_.find(id);
    return it == files_.end() ? nullptr : it->second;
}

bool Catalog::remove(int32_t id) {
    std::unique_lock<std::shared_mutex> lk(mtx_);
    return files_.erase(id) > 0;
}

std::vector<int32_t> Catalog::ids() const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    std::vector<int32_t> out;
    out.reserve(files_.size());
    for (const auto& kv : files_) out.push_back(kv.first);
    return out;
}

std::vector<std::shared_ptr<TorrentFile>> Catalog::files() const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    std::vector<std::shared_ptr<TorrentFile>> out;
    out.reserve(files_.size());
    for (const auto& kv : files_) out.push_back(kv.second);
    return out;
}

size_t Catalog::size() const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    return files_.size();
}

} // namespace pshare
