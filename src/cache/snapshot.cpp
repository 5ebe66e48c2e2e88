/**
 * @file snapshot.cpp
 * @brief SnapshotPayload views.
 * @author Dimitris Kafetzis
 */

#include "cache/snapshot.hpp"

namespace inventory_cache {

const RecordList* SnapshotPayload::records_for(std::string_view host) const {
    auto id = normalize_host(host);
    for (const auto& entry : data) {
        if (normalize_host(entry.host) == id) return &entry.records;
    }
    return nullptr;
}

std::map<HostId, RecordList> SnapshotPayload::data_by_host() const {
    std::map<HostId, RecordList> out;
    for (const auto& entry : data) {
        out[entry.host] = entry.records;
    }
    return out;
}

RecordList SnapshotPayload::data_list() const {
    RecordList out;
    for (const auto& entry : data) {
        out.insert(out.end(), entry.records.begin(), entry.records.end());
    }
    return out;
}

size_t SnapshotPayload::record_count() const noexcept {
    size_t count = 0;
    for (const auto& entry : data) count += entry.records.size();
    return count;
}

}  // namespace inventory_cache
