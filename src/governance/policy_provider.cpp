#include <covenant/governance/policy_provider.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace covenant::governance {

policy_provider_t make_file_policy_provider(std::filesystem::path path) {
  return [path = std::move(path)]() {
    auto error = std::error_code{};
    if (!std::filesystem::exists(path, error)) {
      spdlog::warn("Policy document '{}' not found; using genesis policy",
                   path.string());
      return covenant::schema::make_bytes(kGenesisPolicy);
    }
    auto input = std::ifstream{path, std::ios::binary};
    if (!input.good()) {
      spdlog::warn("Policy document '{}' unreadable; using genesis policy",
                   path.string());
      return covenant::schema::make_bytes(kGenesisPolicy);
    }
    return covenant::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                     std::istreambuf_iterator<char>{}};
  };
}

policy_provider_t make_static_policy_provider(covenant::schema::bytes_t policy) {
  return [policy = std::move(policy)]() { return policy; };
}

}  // namespace covenant::governance
