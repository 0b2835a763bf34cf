#include <covenant/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace covenant::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::optional<bytes_t> try_from_hex(const std::string_view& input) {
  auto hex = normalize_hex(input);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

bytes_t signer_bytes(const signer_id_t& signer) {
  auto out = bytes_t{};
  std::visit(overloaded{[&](const ed25519_signer_id& value) {
                          out.push_back(0);
                          out.insert(std::end(out),
                                     std::begin(value.public_key),
                                     std::end(value.public_key));
                        },
                        [&](const secp256k1_signer_id& value) {
                          out.push_back(1);
                          out.insert(std::end(out),
                                     std::begin(value.public_key),
                                     std::end(value.public_key));
                        }},
             signer);
  return out;
}

std::optional<signer_id_t> try_make_signer(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  auto key = bytes.subspan(1);
  switch (bytes[0]) {
    case 0:
      if (auto raw = try_make_array<32>(key)) {
        return signer_id_t{ed25519_signer_id{.public_key = *raw}};
      }
      return std::nullopt;
    case 1:
      if (auto raw = try_make_array<33>(key)) {
        return signer_id_t{secp256k1_signer_id{.public_key = *raw}};
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

bytes_t signature_bytes(const signature_t& signature) {
  auto out = bytes_t{};
  std::visit(overloaded{[&](const ed25519_signature_t& value) {
                          out.push_back(0);
                          out.insert(std::end(out), std::begin(value),
                                     std::end(value));
                        },
                        [&](const secp256k1_signature_t& value) {
                          out.push_back(1);
                          out.insert(std::end(out), std::begin(value),
                                     std::end(value));
                        }},
             signature);
  return out;
}

std::optional<signature_t> try_make_signature(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  auto raw = bytes.subspan(1);
  switch (bytes[0]) {
    case 0:
      if (auto value = try_make_array<64>(raw)) {
        return signature_t{*value};
      }
      return std::nullopt;
    case 1:
      if (auto value = try_make_array<65>(raw)) {
        return signature_t{*value};
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace covenant::schema
