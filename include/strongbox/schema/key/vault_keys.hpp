#pragma once

#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: vault keys.
// Custody workflow: Canonical RocksDB keyspaces for the vault row, operator
// membership, per-depositor withdrawal timestamps and the event log.
namespace strongbox::schema::key {

inline constexpr std::string_view kVaultStateKey{"SYS|STATE|VAULT"};
inline constexpr std::string_view kOperatorKeyPrefix{"SYS|STATE|OPERATOR|"};
inline constexpr std::string_view kLastWithdrawalKeyPrefix{
    "SYS|STATE|LAST_WITHDRAWAL|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

strongbox::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const strongbox::schema::bytes_view_t& id);

strongbox::schema::bytes_t make_vault_state_key();
strongbox::schema::bytes_t make_operator_key(
    const strongbox::schema::address_t& account);
strongbox::schema::bytes_t make_last_withdrawal_key(
    const strongbox::schema::address_t& depositor);

/// Event keys carry the sequence big-endian so prefix scans run in order.
strongbox::schema::bytes_t make_event_key(uint64_t sequence);

/// Recover the address suffix of an operator or last-withdrawal key.
std::optional<strongbox::schema::address_t> parse_address_suffix(
    std::string_view prefix,
    const strongbox::schema::bytes_view_t& key);

}  // namespace strongbox::schema::key
