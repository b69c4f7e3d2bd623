#ifndef PSHARE_FILE_STORE_HPP
#define PSHARE_FILE_STORE_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include <utility>

#include "Net.hpp"
#include "PartStore.hpp"

namespace pshare {

    // Reads and writes single parts of files stored under the home directory.
    class FileStore {
    public:
        explicit FileStore(std::filesystem::path homeDir);
        virtual ~FileStore() = default;

        // True for a relative name that stays under the home directory once normalized.
        static bool isLocalName(const std::string& name);

        // Throws std::runtime_error when the file's name is not local.
        std::filesystem::path pathOf(const TorrentFile& file) const;

        bool exists(const std::string& name) const;
        long long fileSize(const std::string& name) const;

        // (offset, length) of a part. Throws std::out_of_range for bad indices.
        std::pair<long long, long long> partRange(const TorrentFile& file, size_t index) const;

        // Creates the file (and parent directories) at its full size if it is missing.
        void prepare(const TorrentFile& file);

        // Streams exactly one part's bytes onto the connection.
        virtual void readPart(const TorrentFile& file, size_t index, Connection& out);

        // Consumes exactly one part's bytes from the connection and writes them at the
        // part's offset. The data is flushed and the file closed before returning.
        virtual void writePart(const TorrentFile& file, size_t index, Connection& in);

        FileStore(const FileStore&) = delete;
        FileStore& operator=(const FileStore&) = delete;

    private:
        std::filesystem::path homeDir_;
        std::mutex createMtx_;

        static constexpr size_t CHUNK = 64 * 1024;
    };

} // namespace pshare

#endif // PSHARE_FILE_STORE_HPP
