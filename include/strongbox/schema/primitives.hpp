#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strongbox::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using basis_points_t = uint16_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

hash32_t make_zero_hash();

/// Parse a 32-byte address from hex (optionally `0x`-prefixed).
std::optional<address_t> try_make_address(std::string_view hex);
address_t make_zero_address();
bool is_zero_address(const address_t& address);

/// Render an address as `0x` + 64 hex digits.
std::string to_string(const address_t& address);

/// Parse a base-10 amount; rejects empty input, signs and non-digits.
std::optional<amount_t> try_make_amount(std::string_view decimal);
std::string to_string(const amount_t& amount);

}  // namespace strongbox::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
