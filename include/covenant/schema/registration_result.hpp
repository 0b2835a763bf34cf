#pragma once

#include <covenant/schema/agent_record.hpp>
#include <covenant/schema/governance_error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct registration_result;

template <>
struct registration_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<agent_record_t> agent;
};

using registration_result_t = registration_result<1>;

template <uint16_t Version>
struct verification_result;

template <>
struct verification_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  agent_id_t agent_id;
  hash32_t current_policy_hash{};
  std::optional<hash32_t> oath_policy_hash;
};

using verification_result_t = verification_result<1>;

}  // namespace covenant::schema
