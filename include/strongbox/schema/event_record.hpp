#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_event.hpp>
#include <cstdint>

// Schema type: event record.
// Custody workflow: Append-only audit row. `digest` chains each record to its
// predecessor so an exported log can be checked offline.
namespace strongbox::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_seconds_t recorded_at{};
  vault_event_t event;
  hash32_t previous_digest{};
  hash32_t digest{};
};

using event_record_t = event_record<1>;

}  // namespace strongbox::schema
