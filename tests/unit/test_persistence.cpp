/**
 * @file test_persistence.cpp
 * @brief Unit tests for the snapshot codec and durable stores.
 */

#include "persistence/durable_store.hpp"
#include "persistence/snapshot_codec.hpp"
#include "persistence/toml_file_store.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace inventory_cache;

namespace {

SnapshotPayload sample_payload() {
    auto key = ScopeKey::derive(ScopeName::Vms, {"P-HYP-01", "p-hyp-02"}, "detail");
    SnapshotPayload payload{
        .scope_key = key,
        .generated_at = from_epoch_ms(1'700'000'123'456),
        .source = "memory",
        .expires_at = from_epoch_ms(1'700'000'999'000),
        .stale = true,
        .stale_reason = "all hosts failed",
        .total_hosts = 2,
    };
    payload.hosts_status["p-hyp-01"] = SnapshotHostStatus{
        .state = SnapshotHostState::Ok,
        .last_success_at = from_epoch_ms(1'700'000'100'000),
        .last_job_id = "0123456789abcdef0123456789abcdef",
    };
    payload.hosts_status["p-hyp-02"] = SnapshotHostStatus{
        .state = SnapshotHostState::Timeout,
        .last_error_at = from_epoch_ms(1'700'000'110'000),
        .cooldown_until = from_epoch_ms(1'700'000'710'000),
        .last_error_type = "timeout",
        .last_error_message = "host \"p-hyp-02\" did not answer",
    };
    payload.summary = {{"ok", 1}, {"timeout", 1}};
    payload.data.push_back(HostRecords{
        .host = "P-HYP-01",
        .records = {
            Record{{"name", std::string{"vm-a"}}, {"cpu_count", int64_t{4}},
                   {"memory_gb", 7.5}, {"template", false}},
            Record{{"name", std::string{"vm-b"}}, {"cpu_count", int64_t{-1}}},
        },
    });
    return payload;
}

}  // namespace

TEST(SnapshotCodecTest, RoundTripPreservesPayload) {
    auto original = sample_payload();
    auto decoded = snapshot_from_toml(snapshot_to_toml(original));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(*decoded, original);
    EXPECT_EQ(decoded->scope_key.level(), "detail");
    EXPECT_EQ(decoded->data.front().host, "P-HYP-01");
}

TEST(SnapshotCodecTest, FieldTypesSurvive) {
    auto decoded = snapshot_from_toml(snapshot_to_toml(sample_payload()));
    ASSERT_TRUE(decoded.has_value());
    const auto& vm = decoded->data.front().records.front();
    EXPECT_TRUE(std::holds_alternative<int64_t>(vm.at("cpu_count")));
    EXPECT_TRUE(std::holds_alternative<double>(vm.at("memory_gb")));
    EXPECT_TRUE(std::holds_alternative<bool>(vm.at("template")));
    EXPECT_EQ(std::get<std::string>(vm.at("name")), "vm-a");
}

TEST(SnapshotCodecTest, MalformedTextIsParseError) {
    auto decoded = snapshot_from_toml("scope = [unterminated");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::Parse);
}

TEST(SnapshotCodecTest, MissingScopeIsParseError) {
    auto decoded = snapshot_from_toml("generated_at_ms = 5\n");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::Parse);
}

TEST(SnapshotCodecTest, UnknownHostStateIsParseError) {
    auto decoded = snapshot_from_toml(
        "scope = \"vms\"\n"
        "hosts = [\"a\"]\n"
        "generated_at_ms = 5\n"
        "[hosts_status.a]\n"
        "state = \"melted\"\n");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::Parse);
    EXPECT_NE(decoded.error().message.find("melted"), std::string::npos);
}

TEST(SnapshotLocatorTest, ToStringJoinsParts) {
    auto key = ScopeKey::derive(ScopeName::Hosts, {"b", "A"});
    auto locator = SnapshotLocator::for_key("vmware", key);
    EXPECT_EQ(locator.to_string(), "vmware/hosts/a,b/summary");
}

TEST(InMemoryDurableStoreTest, SaveLoadAndFailure) {
    InMemoryDurableStore store;
    auto payload = sample_payload();
    auto locator = SnapshotLocator::for_key("vmware", payload.scope_key);

    auto empty = store.load(locator);
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->has_value());

    ASSERT_TRUE(store.save(locator, payload).has_value());
    auto loaded = store.load(locator);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded->has_value());
    EXPECT_EQ(**loaded, payload);
    EXPECT_EQ(store.save_count(), 1u);

    store.set_failing(true);
    auto failed = store.save(locator, payload);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::Io);
    EXPECT_FALSE(store.load(locator).has_value());
    EXPECT_EQ(store.save_count(), 1u);
}

class TomlFileStoreTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ic_test_toml_store";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(TomlFileStoreTest, SaveCreatesDirectoryAndLoadsBack) {
    TomlFileStore store(temp_dir_ / "snapshots");
    auto payload = sample_payload();
    auto locator = SnapshotLocator::for_key("vmware", payload.scope_key);

    ASSERT_TRUE(store.save(locator, payload).has_value());
    EXPECT_TRUE(std::filesystem::exists(store.path_for(locator)));

    auto loaded = store.load(locator);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    ASSERT_TRUE(loaded->has_value());
    EXPECT_EQ(**loaded, payload);
}

TEST_F(TomlFileStoreTest, MissingFileIsNullopt) {
    TomlFileStore store(temp_dir_);
    auto key = ScopeKey::derive(ScopeName::Vms, {"nobody"});
    auto loaded = store.load(SnapshotLocator::for_key("vmware", key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->has_value());
}

TEST_F(TomlFileStoreTest, DistinctKeysUseDistinctFiles) {
    TomlFileStore store(temp_dir_);
    auto a = SnapshotLocator::for_key("vmware", ScopeKey::derive(ScopeName::Vms, {"a"}));
    auto b = SnapshotLocator::for_key("vmware", ScopeKey::derive(ScopeName::Vms, {"b"}));
    auto c = SnapshotLocator::for_key("vmware", ScopeKey::derive(ScopeName::Hosts, {"a"}));
    EXPECT_NE(store.path_for(a), store.path_for(b));
    EXPECT_NE(store.path_for(a), store.path_for(c));
}

TEST_F(TomlFileStoreTest, CorruptFileIsParseError) {
    TomlFileStore store(temp_dir_);
    auto payload = sample_payload();
    auto locator = SnapshotLocator::for_key("vmware", payload.scope_key);
    ASSERT_TRUE(store.save(locator, payload).has_value());

    {
        std::ofstream ofs(store.path_for(locator), std::ios::trunc);
        ofs << "this is = = not toml";
    }
    auto loaded = store.load(locator);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::Parse);
}
