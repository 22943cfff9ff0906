#pragma once

#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace strongbox::testing {

using scale_encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;

inline strongbox::schema::address_t make_address(const uint8_t seed) {
  auto out = strongbox::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// `whole` tokens with 18 decimals.
inline strongbox::schema::amount_t tokens(const uint64_t whole) {
  return strongbox::schema::amount_t{whole} *
         strongbox::schema::amount_t{1'000'000'000'000'000'000ULL};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace strongbox::testing
