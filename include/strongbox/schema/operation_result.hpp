#pragma once

#include <strongbox/schema/event_record.hpp>
#include <strongbox/schema/vault_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Custody workflow: Outcome envelope of a vault call; `code` is zero on
// success, otherwise a vault_error_code_t value. `events` holds the records
// committed by the call.
namespace strongbox::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<event_record_t> events;
};

using operation_result_t = operation_result<1>;

inline bool succeeded(const operation_result_t& result) {
  return result.code == 0;
}

inline std::optional<vault_error_code_t> error_of(
    const operation_result_t& result) {
  if (result.code == 0) {
    return std::nullopt;
  }
  return static_cast<vault_error_code_t>(result.code);
}

}  // namespace strongbox::schema
