#pragma once

#include <covenant/admission/router.hpp>
#include <covenant/ledger/ledger.hpp>
#include <covenant/scheduler/scheduler.hpp>
#include <covenant/schema/primitives.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace covenant::kernel {

/// Agent registered during boot, before any request is admitted.
struct bootstrap_agent final {
  covenant::schema::agent_id_t agent_id;
  covenant::schema::signer_id_t public_key;
  std::vector<std::string> capabilities;
  covenant::schema::signature_t oath_signature;
};

struct kernel_config final {
  std::filesystem::path database_path{"covenant.db"};
  /// Empty means the genesis policy.
  std::filesystem::path policy_path;
  std::size_t lazy_queue_capacity{100};
  /// 0 disables the reaper thread; reap_expired() can still be driven by hand.
  covenant::schema::duration_milliseconds_t reaper_interval{1000};
  covenant::ledger::ledger_options ledger;
  covenant::scheduler::scheduler_options scheduler;
  covenant::admission::router_options router;
  std::vector<bootstrap_agent> bootstrap_agents;
};

/// Parse "id:scheme:public_key_hex:signature_hex[:cap,cap...]" where scheme
/// is ed25519 or secp256k1. On failure error names the bad field.
std::optional<bootstrap_agent> try_parse_bootstrap_agent(std::string_view text,
                                                         std::string& error);

}  // namespace covenant::kernel
