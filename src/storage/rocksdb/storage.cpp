#include <strongbox/common/critical.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>

namespace {

// Smallest key greater than every key starting with `prefix`; empty when no
// such key exists.
std::string prefix_upper_bound(std::string prefix) {
  while (!prefix.empty() && static_cast<uint8_t>(prefix.back()) == 0xFF) {
    prefix.pop_back();
  }
  if (!prefix.empty()) {
    prefix.back() = static_cast<char>(static_cast<uint8_t>(prefix.back()) + 1);
  }
  return prefix;
}

void check_iterator(const ROCKSDB_NAMESPACE::Iterator& iterator) {
  if (!iterator.status().ok()) {
    spdlog::error("RocksDB scan failed: {}", iterator.status().ToString());
    strongbox::common::critical("RocksDB scan failed");
  }
}

}  // namespace

namespace strongbox::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    strongbox::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const strongbox::schema::bytes_view_t& prefix) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  check_iterator(*iterator);
  return entries;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const strongbox::schema::bytes_view_t& begin,
    const strongbox::schema::bytes_view_t& end) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto upper = detail::to_slice(end);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.iterate_upper_bound = &upper;

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(begin)); iterator->Valid();
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  check_iterator(*iterator);
  return entries;
}

std::optional<key_value_entry_t> storage<rocksdb_storage_tag>::last_by_prefix(
    const strongbox::schema::bytes_view_t& prefix) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto bound = prefix_upper_bound(prefix_string);
  auto upper = ROCKSDB_NAMESPACE::Slice{bound};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  if (!bound.empty()) {
    read_options.iterate_upper_bound = &upper;
  }

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->SeekToLast();
  check_iterator(*iterator);
  if (!iterator->Valid()) {
    return std::nullopt;
  }
  auto key_view =
      std::string_view{iterator->key().data(), iterator->key().size()};
  if (!key_view.starts_with(prefix_string)) {
    return std::nullopt;
  }
  return key_value_entry_t{detail::to_bytes(iterator->key()),
                           detail::to_bytes(iterator->value())};
}

void storage<rocksdb_storage_tag>::commit(const write_batch& batch) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto delete_status = rocks_batch.Delete(
        detail::to_slice(strongbox::schema::bytes_view_t{key}));
    if (!delete_status.ok()) {
      strongbox::common::critical("failed staging delete in write batch");
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto put_status =
        rocks_batch.Put(detail::to_slice(strongbox::schema::bytes_view_t{key}),
                        detail::to_slice(strongbox::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      strongbox::common::critical("failed staging put in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}",
                  write_status.ToString());
    strongbox::common::critical("failed to commit write batch");
  }
}

}  // namespace strongbox::storage
