#include <blake3.h>
#include <covenant/blake3/hash.hpp>

namespace covenant::blake3 {

namespace {

struct hasher final {
  blake3_hasher state{};

  hasher() { blake3_hasher_init(&state); }

  void update(const void* data, const size_t size) {
    blake3_hasher_update(&state, data, size);
  }

  covenant::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == sizeof(covenant::schema::hash32_t));
    auto output = covenant::schema::hash32_t{};
    blake3_hasher_finalize(&state, output.data(), output.size());
    return output;
  }
};

}  // namespace

covenant::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

covenant::schema::hash32_t hash(const covenant::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

covenant::schema::hash32_t hash(
    std::initializer_list<covenant::schema::bytes_view_t> parts) {
  auto h = hasher{};
  for (const auto& part : parts) {
    h.update(part.data(), part.size());
  }
  return h.finalize();
}

}  // namespace covenant::blake3
