#pragma once
#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace strongbox::blake3 {

strongbox::schema::hash32_t hash(const std::string_view& str);
strongbox::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Incremental BLAKE3 over several inputs.
class hasher final {
 public:
  hasher();
  ~hasher();

  hasher(const hasher&) = delete;
  hasher& operator=(const hasher&) = delete;

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);
  strongbox::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

}  // namespace strongbox::blake3
