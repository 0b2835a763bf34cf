#pragma once

#include <covenant/common/clock.hpp>
#include <covenant/governance/policy_provider.hpp>
#include <covenant/governance/signature_verifier.hpp>
#include <covenant/ledger/ledger.hpp>
#include <covenant/schema/agent_record.hpp>
#include <covenant/schema/oath_record.hpp>
#include <covenant/schema/registration_result.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace covenant::governance {

/// Owner of agent identities and their oaths.
///
/// An oath is a signature over BLAKE3(policy document). Registration and
/// explicit verification are the only places the oath is checked; every
/// other component asks is_sworn().
class gate final {
 public:
  gate(covenant::storage::rocksdb_storage_t& storage,
       covenant::ledger::ledger& ledger,
       policy_provider_t policy_provider,
       signature_verifier_t signature_verifier,
       covenant::common::clock_t clock);

  /// Load persisted agents into the registry. Returns the count loaded.
  std::size_t load();

  covenant::schema::registration_result_t register_agent(
      const covenant::schema::agent_id_t& agent_id,
      const covenant::schema::signer_id_t& public_key,
      std::vector<std::string> capabilities,
      const covenant::schema::signature_t& oath_signature);

  covenant::schema::verification_result_t verify(
      const covenant::schema::agent_id_t& agent_id);

  std::optional<covenant::schema::agent_record_t> find_agent(
      std::string_view agent_id) const;

  /// Every oath the agent has sworn, valid recomputed against the current
  /// policy.
  std::vector<covenant::schema::oath_record_t> find_oaths(
      std::string_view agent_id) const;

  bool is_sworn(std::string_view agent_id) const;
  std::vector<covenant::schema::agent_record_t> agents() const;
  covenant::schema::hash32_t current_policy_hash() const;

 private:
  covenant::schema::registration_result_t reject(
      const covenant::schema::agent_id_t& agent_id,
      const covenant::schema::hash32_t& policy_hash,
      covenant::schema::governance_error_code code,
      std::string reason);

  mutable std::shared_mutex mutex_;
  covenant::storage::rocksdb_storage_t& storage_;
  covenant::ledger::ledger& ledger_;
  policy_provider_t policy_provider_;
  signature_verifier_t signature_verifier_;
  covenant::common::clock_t clock_;
  std::map<std::string, covenant::schema::agent_record_t, std::less<>> agents_;
};

}  // namespace covenant::governance
