#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <span>

namespace strongbox::schema::encoding {

// Codec seam. The library is picked at build time by tag, the same way the
// storage backend is; hot swapping is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  strongbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, strongbox::schema::bytes_t& out);

  template <typename T>
  T decode(const strongbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strongbox::schema::bytes_view_t& bytes);
};

}  // namespace strongbox::schema::encoding
