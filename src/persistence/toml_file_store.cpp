/**
 * @file toml_file_store.cpp
 * @brief TomlFileStore implementation.
 * @author Dimitris Kafetzis
 */

#include "persistence/toml_file_store.hpp"

#include "persistence/snapshot_codec.hpp"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>

namespace inventory_cache {

namespace {

std::string sanitize(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        auto uc = static_cast<unsigned char>(c);
        out += (std::isalnum(uc) || c == '-' || c == '.') ? c : '_';
    }
    return out;
}

}  // namespace

TomlFileStore::TomlFileStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path TomlFileStore::path_for(const SnapshotLocator& locator) const {
    char hash[17];
    std::snprintf(hash, sizeof(hash), "%016zx", std::hash<std::string>{}(locator.to_string()));
    auto name = sanitize(locator.provider) + "__" + std::string{to_string(locator.scope)}
                + "__" + sanitize(locator.level) + "__" + hash + ".toml";
    return directory_ / name;
}

Result<void> TomlFileStore::save(const SnapshotLocator& locator, const SnapshotPayload& payload) {
    auto text = snapshot_to_toml(payload);
    auto target = path_for(locator);
    auto temp = target;
    temp += ".tmp";

    std::lock_guard lock(io_mutex_);
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Error{"cannot create " + directory_.string() + ": " + ec.message(), ErrorCode::Io};
    }

    {
        std::ofstream ofs(temp, std::ios::trunc);
        if (!ofs) return Error{"cannot open " + temp.string() + " for writing", ErrorCode::Io};
        ofs << "# " << locator.to_string() << '\n' << text;
        ofs.flush();
        if (!ofs) return Error{"write failed for " + temp.string(), ErrorCode::Io};
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return Error{"cannot move " + temp.string() + " into place: " + ec.message(), ErrorCode::Io};
    }
    return Result<void>{};
}

Result<std::optional<SnapshotPayload>> TomlFileStore::load(const SnapshotLocator& locator) {
    auto target = path_for(locator);

    std::lock_guard lock(io_mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        if (ec) return Error{"cannot stat " + target.string() + ": " + ec.message(), ErrorCode::Io};
        return std::optional<SnapshotPayload>{};
    }

    std::ifstream ifs(target);
    if (!ifs) return Error{"cannot open " + target.string(), ErrorCode::Io};
    std::ostringstream buffer;
    buffer << ifs.rdbuf();

    auto decoded = snapshot_from_toml(buffer.str());
    if (!decoded) {
        return Error{target.string() + ": " + decoded.error().message, ErrorCode::Parse};
    }
    return std::optional<SnapshotPayload>{std::move(*decoded)};
}

}  // namespace inventory_cache
