#include <spdlog/spdlog.h>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/common/critical.hpp>
#include <strongbox/execution/event_log.hpp>
#include <strongbox/schema/encoding/scale/encoder.hpp>

#include <tuple>
#include <utility>

using namespace strongbox::schema;

namespace {

using encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;

}  // namespace

namespace strongbox::execution {

std::vector<event_record_t> event_log::prepare(
    const std::vector<vault_event_t>& events,
    const timestamp_seconds_t recorded_at) const {
  auto prepared = std::vector<event_record_t>{};
  prepared.reserve(events.size());

  auto previous = head_;
  auto sequence = size_;
  for (const auto& event : events) {
    ++sequence;
    auto record = event_record_t{};
    record.sequence = sequence;
    record.recorded_at = recorded_at;
    record.event = event;
    record.previous_digest = previous;
    record.digest = compute_digest(previous, sequence, recorded_at, event);
    previous = record.digest;
    prepared.push_back(std::move(record));
  }
  return prepared;
}

void event_log::append(const std::vector<event_record_t>& records) {
  for (const auto& record : records) {
    if (record.sequence != size_ + 1 || record.previous_digest != head_) {
      spdlog::error("Event {} does not extend log of {} record(s)",
                    record.sequence, size_);
      strongbox::common::critical("event log append out of order");
    }
    size_ = record.sequence;
    head_ = record.digest;
  }
}

bool event_log::restore(const event_record_t& head) {
  auto digest = compute_digest(head.previous_digest, head.sequence,
                               head.recorded_at, head.event);
  if (head.sequence == 0 || digest != head.digest) {
    spdlog::warn("Event {} digest mismatch", head.sequence);
    size_ = 0;
    head_ = make_zero_hash();
    return false;
  }
  size_ = head.sequence;
  head_ = head.digest;
  spdlog::debug("Resumed event log at sequence {}", size_);
  return true;
}

hash32_t event_log::compute_digest(const hash32_t& previous_digest,
                                   const uint64_t sequence,
                                   const timestamp_seconds_t recorded_at,
                                   const vault_event_t& event) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{sequence, recorded_at, event});
  auto hasher = strongbox::blake3::hasher{};
  hasher.update(bytes_view_t{previous_digest})
      .update(bytes_view_t{encoded.data(), encoded.size()});
  return hasher.finalize();
}

bool event_log::verify_chain(const std::vector<event_record_t>& records) {
  auto previous = make_zero_hash();
  auto expected_sequence = uint64_t{1};
  for (const auto& record : records) {
    if (record.sequence != expected_sequence) {
      spdlog::warn("Event log gap: expected sequence {}, found {}",
                   expected_sequence, record.sequence);
      return false;
    }
    if (record.previous_digest != previous) {
      spdlog::warn("Event {} does not link to its predecessor",
                   record.sequence);
      return false;
    }
    auto digest = compute_digest(previous, record.sequence, record.recorded_at,
                                 record.event);
    if (digest != record.digest) {
      spdlog::warn("Event {} digest mismatch", record.sequence);
      return false;
    }
    previous = record.digest;
    ++expected_sequence;
  }
  return true;
}

}  // namespace strongbox::execution
