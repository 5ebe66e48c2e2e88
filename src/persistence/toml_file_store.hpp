/**
 * @file toml_file_store.hpp
 * @brief Directory of TOML documents, one per snapshot locator.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "persistence/durable_store.hpp"

#include <filesystem>
#include <mutex>

namespace inventory_cache {

/**
 * @brief File-backed IDurableStore.
 *
 * Each locator maps to `<dir>/<provider>__<scope>__<level>__<hash>.toml`.
 * Writes go to a temp file first and are renamed into place, so a crash
 * mid-write leaves the previous document intact.
 */
class TomlFileStore : public IDurableStore {
public:
    explicit TomlFileStore(std::filesystem::path directory);

    Result<void> save(const SnapshotLocator& locator, const SnapshotPayload& payload) override;
    Result<std::optional<SnapshotPayload>> load(const SnapshotLocator& locator) override;

    [[nodiscard]] std::filesystem::path path_for(const SnapshotLocator& locator) const;
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
    std::mutex io_mutex_;
};

}  // namespace inventory_cache
