/**
 * @file snapshot_codec.cpp
 * @brief TOML encoding of snapshots.
 * @author Dimitris Kafetzis
 */

#include "persistence/snapshot_codec.hpp"

#include <sstream>
#include <type_traits>

namespace inventory_cache {

namespace {

void put_time(toml::table& tbl, const char* key, const std::optional<Timestamp>& ts) {
    if (ts) tbl.insert_or_assign(key, to_epoch_ms(*ts));
}

void put_text(toml::table& tbl, const char* key, const std::optional<std::string>& text) {
    if (text) tbl.insert_or_assign(key, *text);
}

std::optional<Timestamp> get_time(const toml::table& tbl, const char* key) {
    if (auto ms = tbl[key].value<int64_t>()) return from_epoch_ms(*ms);
    return std::nullopt;
}

std::optional<std::string> get_text(const toml::table& tbl, const char* key) {
    return tbl[key].value<std::string>();
}

toml::table encode_record(const Record& record) {
    toml::table out;
    for (const auto& [field, value] : record) {
        std::visit([&out, &field](const auto& v) { out.insert_or_assign(field, v); }, value);
    }
    return out;
}

Result<Record> decode_record(const toml::table& tbl) {
    Record record;
    for (auto&& [key, node] : tbl) {
        std::string field{key.str()};
        if (auto b = node.as_boolean()) {
            record.emplace(field, FieldValue{b->get()});
        } else if (auto i = node.as_integer()) {
            record.emplace(field, FieldValue{i->get()});
        } else if (auto d = node.as_floating_point()) {
            record.emplace(field, FieldValue{d->get()});
        } else if (auto s = node.as_string()) {
            record.emplace(field, FieldValue{s->get()});
        } else {
            return Error{"record field '" + field + "' has an unsupported type", ErrorCode::Parse};
        }
    }
    return record;
}

toml::table encode_host_status(const SnapshotHostStatus& status) {
    toml::table out;
    out.insert_or_assign("state", std::string{to_string(status.state)});
    put_time(out, "last_success_at_ms", status.last_success_at);
    put_time(out, "last_error_at_ms", status.last_error_at);
    put_time(out, "cooldown_until_ms", status.cooldown_until);
    put_text(out, "last_job_id", status.last_job_id);
    put_text(out, "last_error_type", status.last_error_type);
    put_text(out, "last_error_message", status.last_error_message);
    return out;
}

Result<SnapshotHostStatus> decode_host_status(const toml::table& tbl) {
    auto raw_state = tbl["state"].value<std::string>();
    if (!raw_state) return Error{"host status without state", ErrorCode::Parse};
    auto state = parse_snapshot_host_state(*raw_state);
    if (!state) return Error{"unknown host state '" + *raw_state + "'", ErrorCode::Parse};

    return SnapshotHostStatus{
        .state = *state,
        .last_success_at = get_time(tbl, "last_success_at_ms"),
        .last_error_at = get_time(tbl, "last_error_at_ms"),
        .cooldown_until = get_time(tbl, "cooldown_until_ms"),
        .last_job_id = get_text(tbl, "last_job_id"),
        .last_error_type = get_text(tbl, "last_error_type"),
        .last_error_message = get_text(tbl, "last_error_message"),
    };
}

}  // namespace

toml::table encode_snapshot(const SnapshotPayload& payload) {
    toml::table tbl;
    const auto& key = payload.scope_key;

    tbl.insert_or_assign("scope", std::string{to_string(key.scope())});
    toml::array hosts;
    for (const auto& host : key.hosts()) hosts.push_back(host);
    tbl.insert_or_assign("hosts", std::move(hosts));
    tbl.insert_or_assign("level", key.level());

    tbl.insert_or_assign("generated_at_ms", to_epoch_ms(payload.generated_at));
    tbl.insert_or_assign("source", payload.source);
    put_time(tbl, "expires_at_ms", payload.expires_at);
    tbl.insert_or_assign("stale", payload.stale);
    put_text(tbl, "stale_reason", payload.stale_reason);
    tbl.insert_or_assign("total_hosts", static_cast<int64_t>(payload.total_hosts));

    toml::table summary;
    for (const auto& [state, count] : payload.summary) summary.insert_or_assign(state, count);
    tbl.insert_or_assign("summary", std::move(summary));

    toml::table statuses;
    for (const auto& [host, status] : payload.hosts_status) {
        statuses.insert_or_assign(host, encode_host_status(status));
    }
    tbl.insert_or_assign("hosts_status", std::move(statuses));

    toml::array data;
    for (const auto& entry : payload.data) {
        toml::array records;
        for (const auto& record : entry.records) records.push_back(encode_record(record));
        toml::table host_entry;
        host_entry.insert_or_assign("host", entry.host);
        host_entry.insert_or_assign("records", std::move(records));
        data.push_back(std::move(host_entry));
    }
    tbl.insert_or_assign("data", std::move(data));
    return tbl;
}

Result<SnapshotPayload> decode_snapshot(const toml::table& tbl) {
    auto raw_scope = tbl["scope"].value<std::string>();
    auto scope = raw_scope ? parse_scope_name(*raw_scope) : std::nullopt;
    if (!scope) return Error{"snapshot has no valid scope", ErrorCode::Parse};

    std::vector<std::string> hosts;
    if (auto* arr = tbl["hosts"].as_array()) {
        for (const auto& node : *arr) {
            if (auto host = node.value<std::string>()) hosts.push_back(*host);
        }
    }

    SnapshotPayload payload;
    payload.scope_key = ScopeKey::derive(*scope, hosts,
                                         tbl["level"].value_or(std::string{kDefaultLevel}));

    auto generated = get_time(tbl, "generated_at_ms");
    if (!generated) return Error{"snapshot has no generated_at_ms", ErrorCode::Parse};
    payload.generated_at = *generated;
    payload.source = tbl["source"].value_or(std::string{});
    payload.expires_at = get_time(tbl, "expires_at_ms");
    payload.stale = tbl["stale"].value_or(false);
    payload.stale_reason = get_text(tbl, "stale_reason");
    payload.total_hosts = static_cast<size_t>(tbl["total_hosts"].value_or(int64_t{0}));

    if (auto* summary = tbl["summary"].as_table()) {
        for (auto&& [state, node] : *summary) {
            payload.summary[std::string{state.str()}] = node.value_or(int64_t{0});
        }
    }

    if (auto* statuses = tbl["hosts_status"].as_table()) {
        for (auto&& [host, node] : *statuses) {
            auto* status_tbl = node.as_table();
            if (!status_tbl) {
                return Error{"hosts_status entry is not a table", ErrorCode::Parse};
            }
            auto status = decode_host_status(*status_tbl);
            if (!status) return status.error();
            payload.hosts_status[std::string{host.str()}] = *status;
        }
    }

    if (auto* data = tbl["data"].as_array()) {
        for (const auto& node : *data) {
            const auto* entry_tbl = node.as_table();
            if (!entry_tbl) return Error{"data entry is not a table", ErrorCode::Parse};

            HostRecords entry{.host = (*entry_tbl)["host"].value_or(std::string{})};
            if (const auto* records = (*entry_tbl)["records"].as_array()) {
                for (const auto& record_node : *records) {
                    const auto* record_tbl = record_node.as_table();
                    if (!record_tbl) return Error{"record is not a table", ErrorCode::Parse};
                    auto record = decode_record(*record_tbl);
                    if (!record) return record.error();
                    entry.records.push_back(std::move(*record));
                }
            }
            payload.data.push_back(std::move(entry));
        }
    }
    return payload;
}

std::string snapshot_to_toml(const SnapshotPayload& payload) {
    std::ostringstream oss;
    oss << encode_snapshot(payload);
    return oss.str();
}

Result<SnapshotPayload> snapshot_from_toml(std::string_view text) {
    try {
        auto tbl = toml::parse(text);
        return decode_snapshot(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorCode::Parse};
    }
}

}  // namespace inventory_cache
