#include <gtest/gtest.h>
#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/key/vault_keys.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <strongbox/testing/common.hpp>

#include <cstdint>
#include <string>

namespace {

using storage_t =
    strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>;

storage_t open_storage(const std::string& path) {
  return strongbox::storage::make_storage<
      strongbox::storage::rocksdb_storage_tag>(path);
}

}  // namespace

TEST(storage, missing_key_reads_as_nullopt) {
  auto db = strongbox::testing::make_db_path("strongbox_storage_missing");
  {
    auto storage = open_storage(db);
    auto encoder = strongbox::testing::scale_encoder_t{};
    auto key = strongbox::schema::key::make_vault_state_key();
    EXPECT_FALSE(storage.get<uint64_t>(encoder, key).has_value());

    storage.put(encoder, strongbox::schema::bytes_view_t{key}, uint64_t{99});
    auto loaded = storage.get<uint64_t>(encoder, key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 99u);
  }
  strongbox::testing::remove_path(db);
}

TEST(storage, commit_applies_puts_and_deletes_together) {
  auto db = strongbox::testing::make_db_path("strongbox_storage_commit");
  {
    auto storage = open_storage(db);
    auto encoder = strongbox::testing::scale_encoder_t{};
    auto first = strongbox::schema::key::make_operator_key(
        strongbox::testing::make_address(1));
    auto second = strongbox::schema::key::make_operator_key(
        strongbox::testing::make_address(2));

    auto batch = strongbox::storage::write_batch{};
    EXPECT_TRUE(batch.empty());
    batch.puts.emplace_back(first, encoder.encode(true));
    batch.puts.emplace_back(second, encoder.encode(true));
    storage.commit(batch);

    auto removal = strongbox::storage::write_batch{};
    removal.deletes.push_back(first);
    storage.commit(removal);

    auto rows = storage.list_by_prefix(strongbox::schema::make_bytes_view(
        strongbox::schema::key::kOperatorKeyPrefix));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows.front().first, second);
  }
  strongbox::testing::remove_path(db);
}

TEST(storage, prefix_scan_returns_events_in_sequence_order) {
  auto db = strongbox::testing::make_db_path("strongbox_storage_prefix");
  {
    auto storage = open_storage(db);
    auto encoder = strongbox::testing::scale_encoder_t{};
    auto batch = strongbox::storage::write_batch{};
    for (const auto sequence : {uint64_t{300}, uint64_t{2}, uint64_t{17}}) {
      batch.puts.emplace_back(strongbox::schema::key::make_event_key(sequence),
                              encoder.encode(sequence));
    }
    batch.puts.emplace_back(strongbox::schema::key::make_vault_state_key(),
                            encoder.encode(uint64_t{0}));
    storage.commit(batch);

    auto rows = storage.list_by_prefix(strongbox::schema::make_bytes_view(
        strongbox::schema::key::kEventPrefix));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(encoder.decode<uint64_t>(
                  strongbox::schema::bytes_view_t{rows[0].second}),
              2u);
    EXPECT_EQ(encoder.decode<uint64_t>(
                  strongbox::schema::bytes_view_t{rows[1].second}),
              17u);
    EXPECT_EQ(encoder.decode<uint64_t>(
                  strongbox::schema::bytes_view_t{rows[2].second}),
              300u);
  }
  strongbox::testing::remove_path(db);
}

TEST(storage, range_scan_and_newest_row_by_prefix) {
  auto db = strongbox::testing::make_db_path("strongbox_storage_range");
  {
    auto storage = open_storage(db);
    auto encoder = strongbox::testing::scale_encoder_t{};
    auto events = strongbox::schema::make_bytes_view(
        strongbox::schema::key::kEventPrefix);
    EXPECT_FALSE(storage.last_by_prefix(events).has_value());

    auto batch = strongbox::storage::write_batch{};
    for (auto sequence = uint64_t{1}; sequence <= 5; ++sequence) {
      batch.puts.emplace_back(strongbox::schema::key::make_event_key(sequence),
                              encoder.encode(sequence));
    }
    batch.puts.emplace_back(strongbox::schema::key::make_vault_state_key(),
                            encoder.encode(uint64_t{0}));
    storage.commit(batch);

    auto begin = strongbox::schema::key::make_event_key(2);
    auto end = strongbox::schema::key::make_event_key(4);
    auto rows = storage.list_range(strongbox::schema::bytes_view_t{begin},
                                   strongbox::schema::bytes_view_t{end});
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, begin);
    EXPECT_EQ(encoder.decode<uint64_t>(
                  strongbox::schema::bytes_view_t{rows[1].second}),
              3u);

    // The vault row sorts after every event key and must not be picked up.
    auto newest = storage.last_by_prefix(events);
    ASSERT_TRUE(newest.has_value());
    EXPECT_EQ(newest->first, strongbox::schema::key::make_event_key(5));
  }
  strongbox::testing::remove_path(db);
}

TEST(storage, data_survives_reopen) {
  auto db = strongbox::testing::make_db_path("strongbox_storage_reopen");
  auto encoder = strongbox::testing::scale_encoder_t{};
  auto key = strongbox::schema::key::make_last_withdrawal_key(
      strongbox::testing::make_address(5));
  {
    auto storage = open_storage(db);
    auto batch = strongbox::storage::write_batch{};
    batch.puts.emplace_back(key, encoder.encode(uint64_t{87401}));
    storage.commit(batch);
  }
  {
    auto storage = open_storage(db);
    auto loaded = storage.get<uint64_t>(encoder, key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 87401u);
  }
  strongbox::testing::remove_path(db);
}
