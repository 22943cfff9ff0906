#pragma once

#include <strongbox/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace strongbox::execution {

/// Wall clock used for timelocks and event timestamps, in whole seconds.
using time_source_t = std::function<strongbox::schema::timestamp_seconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    return static_cast<strongbox::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace strongbox::execution
