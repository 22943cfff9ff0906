#pragma once

#include <strongbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: vault error code.
// Custody workflow: Failure taxonomy reported in operation results. Zero is
// reserved for success.
namespace strongbox::schema {

enum class vault_error_code_t : uint32_t {
  invalid_amount = 1,
  invalid_address = 2,
  fee_exceeds_maximum = 3,
  withdrawal_limit_exceeded = 4,
  withdrawal_too_soon = 5,
  insufficient_balance = 6,
  unauthorized = 7,
  already_operator = 8,
  not_operator = 9,
  cannot_remove_owner = 10,
  paused = 11,
  reentrant_call = 12,
  token_transfer_failed = 13,
};

inline constexpr auto kVaultErrorCodeMappings = std::array{
    std::pair<std::string_view, vault_error_code_t>{
        "invalid_amount", vault_error_code_t::invalid_amount},
    std::pair<std::string_view, vault_error_code_t>{
        "invalid_address", vault_error_code_t::invalid_address},
    std::pair<std::string_view, vault_error_code_t>{
        "fee_exceeds_maximum", vault_error_code_t::fee_exceeds_maximum},
    std::pair<std::string_view, vault_error_code_t>{
        "withdrawal_limit_exceeded",
        vault_error_code_t::withdrawal_limit_exceeded},
    std::pair<std::string_view, vault_error_code_t>{
        "withdrawal_too_soon", vault_error_code_t::withdrawal_too_soon},
    std::pair<std::string_view, vault_error_code_t>{
        "insufficient_balance", vault_error_code_t::insufficient_balance},
    std::pair<std::string_view, vault_error_code_t>{
        "unauthorized", vault_error_code_t::unauthorized},
    std::pair<std::string_view, vault_error_code_t>{
        "already_operator", vault_error_code_t::already_operator},
    std::pair<std::string_view, vault_error_code_t>{
        "not_operator", vault_error_code_t::not_operator},
    std::pair<std::string_view, vault_error_code_t>{
        "cannot_remove_owner", vault_error_code_t::cannot_remove_owner},
    std::pair<std::string_view, vault_error_code_t>{
        "paused", vault_error_code_t::paused},
    std::pair<std::string_view, vault_error_code_t>{
        "reentrant_call", vault_error_code_t::reentrant_call},
    std::pair<std::string_view, vault_error_code_t>{
        "token_transfer_failed", vault_error_code_t::token_transfer_failed},
};

template <>
inline std::optional<vault_error_code_t> try_from_string<vault_error_code_t>(
    const std::string_view value) {
  return from_string(value, kVaultErrorCodeMappings);
}

inline constexpr std::string_view to_string(const vault_error_code_t value) {
  return to_string(value, kVaultErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const vault_error_code_t value) {
  return static_cast<uint32_t>(value);
}

}  // namespace strongbox::schema
