#pragma once

#include <covenant/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Storage key layout.
// Every component owns one prefix; scans never cross prefixes.
namespace covenant::schema::key {

inline constexpr auto kLedgerEventPrefix = std::string_view{"LEDGER|E|"};
inline constexpr auto kLedgerHeadKey = std::string_view{"LEDGER|HEAD"};
inline constexpr auto kAgentPrefix = std::string_view{"AGENT|"};
inline constexpr auto kOathPrefix = std::string_view{"OATH|"};
inline constexpr auto kTaskPrefix = std::string_view{"TASK|"};
inline constexpr auto kLazyQueuePrefix = std::string_view{"LAZY|"};
inline constexpr auto kRoutePrefix = std::string_view{"ROUTE|"};

bytes_t make_prefix(std::string_view prefix);

bytes_t make_ledger_event_key(uint64_t sequence_number);
std::optional<uint64_t> try_parse_ledger_event_key(const bytes_view_t& key);
bytes_t make_ledger_head_key();

bytes_t make_agent_key(std::string_view agent_id);

/// OATH|<agent_id>|<policy_hash>; the agent's oaths share the prefix
/// returned by make_oath_prefix.
bytes_t make_oath_key(std::string_view agent_id, const hash32_t& policy_hash);
bytes_t make_oath_prefix(std::string_view agent_id);

bytes_t make_task_key(const task_id_t& task_id);
bytes_t make_lazy_queue_key(const task_id_t& task_id);

/// ROUTE|<BLAKE3(raw input)>
bytes_t make_route_key(const hash32_t& input_hash);

}  // namespace covenant::schema::key
