#include "pshare/FileStore.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace pshare {

FileStore::FileStore(fs::path homeDir) : homeDir_(std::move(homeDir)) {}

bool FileStore::isLocalName(const std::string& name) {
    if (name.empty()) return false;
    fs::path p = fs::path(name).lexically_normal();
    if (p.has_root_name() || p.has_root_directory()) return false;
    if (p == "." || p.empty()) return false;
    return *p.begin() != "..";
}

fs::path FileStore::pathOf(const TorrentFile& file) const {
    if (!isLocalName(file.name())) {
        throw std::runtime_error("File name leaves the home directory: " + file.name());
    }
    return homeDir_ / file.name();
}

bool FileStore::exists(const std::string& name) const {
    if (!isLocalName(name)) return false;
    std::error_code ec;
    return fs::is_regular_file(homeDir_ / name, ec);
}

long long FileStore::fileSize(const std::string& name) const {
    if (!isLocalName(name)) throw std::runtime_error("File name leaves the home directory: " + name);
    std::error_code ec;
    auto size = fs::file_size(homeDir_ / name, ec);
    if (ec) throw std::runtime_error("Cannot stat " + (homeDir_ / name).string() + ": " + ec.message());
    return static_cast<long long>(size);
}

std::pair<long long, long long> FileStore::partRange(const TorrentFile& file, size_t index) const {
    long long length = file.partLength(index);
    return {static_cast<long long>(index) * file.partSize(), length};
}

void FileStore::prepare(const TorrentFile& file) {
    std::lock_guard<std::mutex> lk(createMtx_);
    fs::path path = pathOf(file);
    if (fs::exists(path)) return;
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    {
        // app mode creates without truncating what another writer may have put there
        std::ofstream create(path, std::ios::binary | std::ios::app);
        if (!create) throw std::runtime_error("Failed to create file: " + path.string());
    }
    fs::resize_file(path, static_cast<std::uintmax_t>(file.size()));
}

void FileStore::readPart(const TorrentFile& file, size_t index, Connection& out) {
    auto [offset, size] = partRange(file, index);
    fs::path path = pathOf(file);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    in.seekg(offset);

    std::vector<uint8_t> buf(std::min<long long>(CHUNK, std::max<long long>(size, 1)));
    long long left = size;
    while (left > 0) {
        auto n = static_cast<size_t>(std::min<long long>(left, static_cast<long long>(buf.size())));
        in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
        if (!in) {
            throw std::runtime_error("Failed to read part " + std::to_string(index) + " of " + path.string());
        }
        out.sendAll(buf.data(), n);
        left -= static_cast<long long>(n);
    }
}

void FileStore::writePart(const TorrentFile& file, size_t index, Connection& in) {
    auto [offset, size] = partRange(file, index);
    prepare(file);
    fs::path path = pathOf(file);

    std::fstream out(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    out.seekp(offset);

    std::vector<uint8_t> buf(std::min<long long>(CHUNK, std::max<long long>(size, 1)));
    long long left = size;
    while (left > 0) {
        auto n = static_cast<size_t>(std::min<long long>(left, static_cast<long long>(buf.size())));
        in.recvAll(buf.data(), n);
        out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(n));
        if (!out) {
            throw std::runtime_error("Failed to write part " + std::to_string(index) + " of " + path.string());
        }
        left -= static_cast<long long>(n);
    }

    out.flush();
    out.close();
    if (out.fail()) {
        throw std::runtime_error("Failed to flush part " + std::to_string(index) + " of " + path.string());
    }
}

} // namespace pshare
