#pragma once

#include <strongbox/schema/event_record.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/vault_event.hpp>
#include <cstdint>
#include <vector>

namespace strongbox::execution {

/// Head of the append-only, hash-chained record of committed vault events.
///
/// Sequences start at 1. Each record's digest covers the previous digest
/// plus the SCALE encoding of (sequence, recorded_at, event); the first
/// record chains from the zero hash. Only the newest sequence and digest are
/// held here; the records themselves live in storage.
class event_log final {
 public:
  event_log() = default;

  /// Build the records a batch of events would get if appended now. The log
  /// is unchanged until `append` is called with the result.
  std::vector<strongbox::schema::event_record_t> prepare(
      const std::vector<strongbox::schema::vault_event_t>& events,
      strongbox::schema::timestamp_seconds_t recorded_at) const;

  /// Advance the head past records produced by `prepare`. Out of order
  /// records are fatal.
  void append(const std::vector<strongbox::schema::event_record_t>& records);

  /// Resume from the newest persisted record. Returns false, leaving the log
  /// empty, when the record's own digest does not recompute.
  bool restore(const strongbox::schema::event_record_t& head);

  uint64_t size() const { return size_; }
  const strongbox::schema::hash32_t& head_digest() const { return head_; }

  static strongbox::schema::hash32_t compute_digest(
      const strongbox::schema::hash32_t& previous_digest,
      uint64_t sequence,
      strongbox::schema::timestamp_seconds_t recorded_at,
      const strongbox::schema::vault_event_t& event);

  /// Check sequence continuity and every digest link of an exported log.
  static bool verify_chain(
      const std::vector<strongbox::schema::event_record_t>& records);

 private:
  uint64_t size_{0};
  strongbox::schema::hash32_t head_{};
};

}  // namespace strongbox::execution
