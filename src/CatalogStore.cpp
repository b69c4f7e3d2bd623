#include "pshare/CatalogStore.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "pshare/FileStore.hpp"

namespace fs = std::filesystem;

namespace pshare {

    CatalogStore::CatalogStore(fs::path homeDir, long long partSizeBytes)
    : statePath_(homeDir / ".pshare" / "catalog.state"),
      partSizeBytes_(partSizeBytes) {
        if (partSizeBytes_ <= 0) throw std::invalid_argument("Part size must be positive");
    }

    // Line format: id size count idx... name
    void CatalogStore::load(Catalog& catalog) const {
        std::ifstream in(statePath_);
        if (!in) return;

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            if (line.empty() || line[0]=='#') continue;

            std::istringstream iss(line);
            int32_t id; long long size; long long count;
            if (!(iss >> id >> size >> count)) {
                throw std::runtime_error("Malformed catalog line " + std::to_string(lineNo) + " in " + statePath_.string());
            }

            if (size < 0) {
                throw std::runtime_error("Negative size on catalog line " + std::to_string(lineNo));
            }
            const long long totalParts = (size + partSizeBytes_ - 1) / partSizeBytes_;
            if (count < 0 || count > totalParts) {
                throw std::runtime_error("Bad part count on catalog line " + std::to_string(lineNo));
            }

            std::vector<int32_t> parts(static_cast<size_t>(count));
            for (auto& p : parts) {
                if (!(iss >> p)) {
                    throw std::runtime_error("Malformed part list on catalog line " + std::to_string(lineNo));
                }
            }
            std::string name;
            iss >> std::ws;
            std::getline(iss, name);
            if (!FileStore::isLocalName(name)) {
                throw std::runtime_error("Missing or non-local file name on catalog line " + std::to_string(lineNo));
            }

            std::shared_ptr<TorrentFile> file;
            try {
                file = TorrentFile::createEmpty(id, name, size, partSizeBytes_);
                for (int32_t p : parts) file->markOwned(static_cast<size_t>(p));
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error("Bad entry on catalog line " + std::to_string(lineNo) + ": " + e.what());
            } catch (const std::out_of_range&) {
                throw std::runtime_error("Part index out of range on catalog line " + std::to_string(lineNo));
            }
            catalog.put(std::move(file));
        }
    }

    void CatalogStore::save(const Catalog& catalog) const {
        fs::create_directories(statePath_.parent_path());
        fs::path tmp = statePath_;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) throw std::runtime_error("Failed to open " + tmp.string() + " for writing");
            out << "# id size count parts... name\n";
            for (const auto& file : catalog.files()) {
                auto parts = file->ownedParts();
                out << file->id() << ' ' << file->size() << ' ' << parts.size();
                for (int32_t p : parts) out << ' ' << p;
                out << ' ' << file->name() << '\n';
            }
            out.flush();
            if (!out) throw std::runtime_error("Failed to write " + tmp.string());
        }
        fs::rename(tmp, statePath_);
    }

} // namespace pshare
