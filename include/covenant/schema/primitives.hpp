#pragma once
#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace covenant::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using agent_id_t = std::string;
using request_id_t = hash32_t;
using task_id_t = hash32_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// Actor recorded on ledger events emitted by the kernel itself.
inline constexpr std::string_view kSystemActor{"SYSTEM"};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::optional<bytes_t> try_from_hex(const std::string_view& hex);
hash32_t make_zero_hash();

/// Fixed-size copy of bytes, or std::nullopt when the length is not N.
template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_array(const bytes_view_t& bytes) {
  if (bytes.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy_n(std::begin(bytes), N, std::begin(out));
  return out;
}

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// Raw signer key bytes prefixed with the key type tag (0 ed25519,
/// 1 secp256k1).
bytes_t signer_bytes(const signer_id_t& signer);
std::optional<signer_id_t> try_make_signer(const bytes_view_t& bytes);

/// Raw signature bytes prefixed with the signature type tag.
bytes_t signature_bytes(const signature_t& signature);
std::optional<signature_t> try_make_signature(const bytes_view_t& bytes);

}  // namespace covenant::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
