#include <spdlog/spdlog.h>
#include <covenant/blake3/hash.hpp>
#include <covenant/common/critical.hpp>
#include <covenant/governance/gate.hpp>
#include <covenant/schema/encoding/scale/event_payloads.hpp>
#include <covenant/schema/encoding/scale/rows.hpp>
#include <covenant/schema/key/kernel_keys.hpp>

#include <algorithm>
#include <mutex>
#include <utility>

using namespace covenant::schema;

namespace covenant::governance {

namespace {

template <typename Result>
Result make_error(const governance_error_code code, std::string reason) {
  auto result = Result{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(reason);
  result.codespace = std::string{kGovernanceCodespace};
  return result;
}

std::vector<std::string> normalize_capabilities(
    std::vector<std::string> capabilities) {
  std::ranges::sort(capabilities);
  auto duplicates = std::ranges::unique(capabilities);
  capabilities.erase(std::begin(duplicates), std::end(duplicates));
  return capabilities;
}

}  // namespace

gate::gate(covenant::storage::rocksdb_storage_t& storage,
           covenant::ledger::ledger& ledger,
           policy_provider_t policy_provider,
           signature_verifier_t signature_verifier,
           covenant::common::clock_t clock)
    : storage_{storage},
      ledger_{ledger},
      policy_provider_{std::move(policy_provider)},
      signature_verifier_{std::move(signature_verifier)},
      clock_{std::move(clock)} {}

std::size_t gate::load() {
  auto lock = std::unique_lock{mutex_};
  agents_.clear();
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(key::make_prefix(key::kAgentPrefix))) {
    auto agent = encoding::scale::try_decode_agent_record(row_value);
    if (!agent) {
      covenant::common::critical("undecodable agent row at key {}",
                                 to_hex(row_key));
    }
    auto agent_id = agent->agent_id;
    agents_.insert_or_assign(std::move(agent_id), std::move(*agent));
  }
  spdlog::info("Loaded {} agent(s) from storage", agents_.size());
  return agents_.size();
}

hash32_t gate::current_policy_hash() const {
  return covenant::blake3::hash(bytes_view_t{policy_provider_()});
}

registration_result_t gate::reject(const agent_id_t& agent_id,
                                   const hash32_t& policy_hash,
                                   const governance_error_code code,
                                   std::string reason) {
  spdlog::warn("Oath rejected for agent '{}': {}", agent_id, reason);
  auto appended = ledger_.append(
      ledger_event_type_t::oath_rejected,
      encoding::scale::make_oath_rejected_payload(agent_id, policy_hash,
                                                  reason),
      agent_id.empty() ? kSystemActor : std::string_view{agent_id});
  if (appended.code != 0) {
    return make_error<registration_result_t>(
        governance_error_code::ledger_unavailable,
        fmt::format("{} (rejection not recorded: {})", reason, appended.log));
  }
  return make_error<registration_result_t>(code, std::move(reason));
}

registration_result_t gate::register_agent(
    const agent_id_t& agent_id,
    const signer_id_t& public_key,
    std::vector<std::string> capabilities,
    const signature_t& oath_signature) {
  auto lock = std::unique_lock{mutex_};
  if (ledger_.halted()) {
    return make_error<registration_result_t>(
        governance_error_code::ledger_unavailable,
        "ledger halted: " + ledger_.halt_reason());
  }

  auto policy_hash = current_policy_hash();
  if (agent_id.empty()) {
    return reject(agent_id, policy_hash,
                  governance_error_code::invalid_request,
                  "agent id must not be empty");
  }
  auto existing = agents_.find(agent_id);
  if (existing != std::end(agents_) &&
      existing->second.oath_status == oath_status_t::sworn) {
    return reject(agent_id, policy_hash,
                  governance_error_code::already_registered,
                  "agent is already registered and sworn");
  }
  if (!signature_verifier_(bytes_view_t{policy_hash}, public_key,
                           oath_signature)) {
    return reject(agent_id, policy_hash,
                  governance_error_code::invalid_signature,
                  "oath signature does not verify against the current policy");
  }

  auto now = clock_();
  auto agent = agent_record_t{
      .agent_id = agent_id,
      .public_key = public_key,
      .capabilities = normalize_capabilities(std::move(capabilities)),
      .oath_status = oath_status_t::sworn,
      .policy_hash = policy_hash,
      .registered_at = now};
  auto oath = oath_record_t{.agent_id = agent_id,
                            .policy_hash = policy_hash,
                            .signature = oath_signature,
                            .sworn_at = now};

  auto appended = ledger_.append(
      ledger_event_type_t::oath_sworn,
      encoding::scale::make_oath_sworn_payload(agent_id, policy_hash,
                                               public_key, agent.capabilities),
      agent_id, [&](const uint64_t sequence_number) {
        agent.oath_event_id = sequence_number;
        auto batch = covenant::storage::write_batch{};
        batch.put(key::make_agent_key(agent_id),
                  encoding::scale::encode_row(agent));
        batch.put(key::make_oath_key(agent_id, policy_hash),
                  encoding::scale::encode_row(oath));
        return batch;
      });
  if (appended.code != 0) {
    return make_error<registration_result_t>(
        governance_error_code::ledger_unavailable, appended.log);
  }

  agents_.insert_or_assign(agent_id, agent);
  spdlog::info("Agent '{}' sworn under policy {} (event {})", agent_id,
               to_hex(policy_hash), appended.sequence_number);
  return registration_result_t{.agent = std::move(agent)};
}

verification_result_t gate::verify(const agent_id_t& agent_id) {
  auto lock = std::unique_lock{mutex_};
  auto found = agents_.find(agent_id);
  if (found == std::end(agents_)) {
    auto result = make_error<verification_result_t>(
        governance_error_code::not_registered, "agent is not registered");
    result.agent_id = agent_id;
    return result;
  }

  auto& agent = found->second;
  auto current = current_policy_hash();
  auto result = verification_result_t{.agent_id = agent_id,
                                      .current_policy_hash = current,
                                      .oath_policy_hash = agent.policy_hash};
  if (agent.oath_status != oath_status_t::sworn) {
    result.code = static_cast<uint32_t>(governance_error_code::oath_stale);
    result.log = "oath invalidated; re-registration required";
    result.codespace = std::string{kGovernanceCodespace};
    return result;
  }
  if (agent.policy_hash == current) {
    return result;
  }

  // Invalidate in memory first so the agent stops receiving work even if
  // the event cannot be recorded.
  agent.oath_status = oath_status_t::invalidated;
  auto appended = ledger_.append(
      ledger_event_type_t::oath_invalidated,
      encoding::scale::make_oath_invalidated_payload(agent_id,
                                                     agent.policy_hash, current),
      kSystemActor, [&](uint64_t) {
        auto batch = covenant::storage::write_batch{};
        batch.put(key::make_agent_key(agent_id),
                  encoding::scale::encode_row(agent));
        return batch;
      });
  if (appended.code != 0) {
    spdlog::error("Could not record invalidation of agent '{}': {}", agent_id,
                  appended.log);
  }
  spdlog::warn("Oath of agent '{}' is stale (sworn {}, current {})", agent_id,
               to_hex(agent.policy_hash), to_hex(current));

  result.code = static_cast<uint32_t>(governance_error_code::oath_stale);
  result.log = "policy changed since the oath was sworn";
  result.codespace = std::string{kGovernanceCodespace};
  return result;
}

std::optional<agent_record_t> gate::find_agent(
    const std::string_view agent_id) const {
  auto lock = std::shared_lock{mutex_};
  auto found = agents_.find(agent_id);
  if (found == std::end(agents_)) {
    return std::nullopt;
  }
  return found->second;
}

std::vector<oath_record_t> gate::find_oaths(
    const std::string_view agent_id) const {
  auto current = current_policy_hash();
  auto oaths = std::vector<oath_record_t>{};
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(key::make_oath_prefix(agent_id))) {
    auto oath = encoding::scale::try_decode_oath_record(row_value);
    if (!oath) {
      covenant::common::critical("undecodable oath row at key {}",
                                 to_hex(row_key));
    }
    oath->valid = oath->policy_hash == current;
    oaths.push_back(std::move(*oath));
  }
  std::ranges::sort(oaths, {}, &oath_record_t::sworn_at);
  return oaths;
}

bool gate::is_sworn(const std::string_view agent_id) const {
  auto lock = std::shared_lock{mutex_};
  auto found = agents_.find(agent_id);
  return found != std::end(agents_) &&
         found->second.oath_status == oath_status_t::sworn;
}

std::vector<agent_record_t> gate::agents() const {
  auto lock = std::shared_lock{mutex_};
  auto out = std::vector<agent_record_t>{};
  out.reserve(agents_.size());
  for (const auto& [agent_id, agent] : agents_) {
    out.push_back(agent);
  }
  return out;
}

}  // namespace covenant::governance
