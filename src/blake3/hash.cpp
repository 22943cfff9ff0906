#include <blake3.h>
#include <strongbox/blake3/hash.hpp>

namespace strongbox::blake3 {

struct hasher::state {
  blake3_hasher context{};
};

hasher::hasher() : state_{std::make_unique<state>()} {
  blake3_hasher_init(&state_->context);
}

hasher::~hasher() = default;

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_->context, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_->context, bytes.data(), bytes.size());
  return *this;
}

strongbox::schema::hash32_t hasher::finalize() const {
  auto output = strongbox::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<decltype(output)>);
  blake3_hasher_finalize(&state_->context, output.data(), output.size());
  return output;
}

strongbox::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

strongbox::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace strongbox::blake3
