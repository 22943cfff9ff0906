#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace strongbox::storage {

using key_value_entry_t =
    std::pair<strongbox::schema::bytes_t, strongbox::schema::bytes_t>;

/// Writes applied atomically by `commit`: either every entry lands or none.
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<strongbox::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const strongbox::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const strongbox::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const strongbox::schema::bytes_view_t& prefix) const;

  /// Return key-value pairs with keys in [begin, end), in key order.
  std::vector<key_value_entry_t> list_range(
      const strongbox::schema::bytes_view_t& begin,
      const strongbox::schema::bytes_view_t& end) const;

  /// Return the entry with the greatest key under the prefix, if any.
  std::optional<key_value_entry_t> last_by_prefix(
      const strongbox::schema::bytes_view_t& prefix) const;

  /// Atomically apply every put and delete in the batch.
  void commit(const write_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace strongbox::storage
