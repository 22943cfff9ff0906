#pragma once

#include <strongbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: pause state.
// Custody workflow: Circuit breaker position; paused blocks deposit and
// withdraw only.
namespace strongbox::schema {

enum class pause_state_t : uint8_t { active = 0, paused = 1 };

inline constexpr auto kPauseStateMappings = std::array{
    std::pair<std::string_view, pause_state_t>{"active", pause_state_t::active},
    std::pair<std::string_view, pause_state_t>{"paused", pause_state_t::paused},
};

template <>
inline std::optional<pause_state_t> try_from_string<pause_state_t>(
    const std::string_view value) {
  return from_string(value, kPauseStateMappings);
}

inline constexpr std::string_view to_string(const pause_state_t value) {
  return to_string(value, kPauseStateMappings).value_or("unknown");
}

}  // namespace strongbox::schema
