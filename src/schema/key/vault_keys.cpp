#include <strongbox/schema/key/vault_keys.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <iterator>

namespace strongbox::schema::key {

strongbox::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const strongbox::schema::bytes_view_t& id) {
  auto key = strongbox::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

strongbox::schema::bytes_t make_vault_state_key() {
  return strongbox::schema::make_bytes(kVaultStateKey);
}

strongbox::schema::bytes_t make_operator_key(
    const strongbox::schema::address_t& account) {
  return make_prefixed_key(kOperatorKeyPrefix,
                           strongbox::schema::bytes_view_t{account});
}

strongbox::schema::bytes_t make_last_withdrawal_key(
    const strongbox::schema::address_t& depositor) {
  return make_prefixed_key(kLastWithdrawalKeyPrefix,
                           strongbox::schema::bytes_view_t{depositor});
}

strongbox::schema::bytes_t make_event_key(const uint64_t sequence) {
  const auto big_endian = boost::endian::native_to_big(sequence);
  const auto* raw = reinterpret_cast<const uint8_t*>(&big_endian);
  return make_prefixed_key(
      kEventPrefix, strongbox::schema::bytes_view_t{raw, sizeof(big_endian)});
}

std::optional<strongbox::schema::address_t> parse_address_suffix(
    std::string_view prefix,
    const strongbox::schema::bytes_view_t& key) {
  auto address = strongbox::schema::address_t{};
  if (key.size() != prefix.size() + address.size()) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  std::copy(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
            std::end(key), std::begin(address));
  return address;
}

}  // namespace strongbox::schema::key
