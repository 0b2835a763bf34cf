#include <covenant/kernel/config.hpp>

#include <algorithm>
#include <array>
#include <iterator>

using namespace covenant::schema;

namespace covenant::kernel {

namespace {

std::vector<std::string_view> split(std::string_view text, const char separator) {
  auto parts = std::vector<std::string_view>{};
  while (true) {
    auto position = text.find(separator);
    parts.push_back(text.substr(0, position));
    if (position == std::string_view::npos) {
      break;
    }
    text.remove_prefix(position + 1);
  }
  return parts;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> from_hex(const std::string_view hex) {
  auto bytes = try_from_hex(hex);
  if (!bytes) {
    return std::nullopt;
  }
  return try_make_array<N>(make_bytes_view(*bytes));
}

}  // namespace

std::optional<bootstrap_agent> try_parse_bootstrap_agent(
    const std::string_view text,
    std::string& error) {
  auto fields = split(text, ':');
  if (fields.size() < 4 || fields.size() > 5) {
    error = "expected id:scheme:public_key:signature[:capabilities]";
    return std::nullopt;
  }
  auto agent = bootstrap_agent{.agent_id = std::string{fields[0]}};
  if (agent.agent_id.empty()) {
    error = "empty agent id";
    return std::nullopt;
  }

  if (fields[1] == "ed25519") {
    auto key = from_hex<32>(fields[2]);
    auto signature = from_hex<64>(fields[3]);
    if (!key || !signature) {
      error = "ed25519 key must be 32 bytes and signature 64 bytes of hex";
      return std::nullopt;
    }
    agent.public_key = ed25519_signer_id{.public_key = *key};
    agent.oath_signature = *signature;
  } else if (fields[1] == "secp256k1") {
    auto key = from_hex<33>(fields[2]);
    auto signature = from_hex<65>(fields[3]);
    if (!key || !signature) {
      error = "secp256k1 key must be 33 bytes and signature 65 bytes of hex";
      return std::nullopt;
    }
    agent.public_key = secp256k1_signer_id{.public_key = *key};
    agent.oath_signature = *signature;
  } else {
    error = "unknown signature scheme '" + std::string{fields[1]} + "'";
    return std::nullopt;
  }

  if (fields.size() == 5 && !fields[4].empty()) {
    for (auto capability : split(fields[4], ',')) {
      if (!capability.empty()) {
        agent.capabilities.emplace_back(capability);
      }
    }
  }
  return agent;
}

}  // namespace covenant::kernel
