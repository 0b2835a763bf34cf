#pragma once
#include <covenant/schema/primitives.hpp>
#include <optional>

namespace covenant::schema::encoding {

// The codec is a build time choice: components are written against
// encoder<Library> and the kernel pins Library once. Hot swapping is not a
// goal.
template <typename Library>
struct encoder {
  template <typename T>
  covenant::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const covenant::schema::bytes_view_t& bytes);
};

}  // namespace covenant::schema::encoding
