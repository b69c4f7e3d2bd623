#ifndef PSHARE_CATALOG_STORE_HPP
#define PSHARE_CATALOG_STORE_HPP

#include <filesystem>

#include "PartStore.hpp"

namespace pshare {

    // Saves and restores the catalog under <homeDir>/.pshare/catalog.state.
    // Only owned parts are written; claims never survive a restart.
    class CatalogStore {
    public:
        CatalogStore(std::filesystem::path homeDir, long long partSizeBytes);

        const std::filesystem::path& statePath() const { return statePath_; }

        // A missing state file yields an empty catalog. Throws std::runtime_error on a malformed line.
        void load(Catalog& catalog) const;
        void save(const Catalog& catalog) const;

    private:
        std::filesystem::path statePath_;
        long long partSizeBytes_;
    };

} // namespace pshare

#endif // PSHARE_CATALOG_STORE_HPP
