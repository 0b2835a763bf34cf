#include <boost/endian/conversion.hpp>
#include <covenant/schema/key/builder.hpp>
#include <covenant/schema/key/kernel_keys.hpp>

#include <algorithm>
#include <cstring>

namespace covenant::schema::key {

bytes_t make_prefix(const std::string_view prefix) {
  return builder{}.write(prefix).data;
}

bytes_t make_ledger_event_key(const uint64_t sequence_number) {
  return builder{}.write(kLedgerEventPrefix).write(sequence_number).data;
}

std::optional<uint64_t> try_parse_ledger_event_key(const bytes_view_t& key) {
  if (key.size() != kLedgerEventPrefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(kLedgerEventPrefix), std::end(kLedgerEventPrefix),
                  std::begin(key))) {
    return std::nullopt;
  }
  auto raw = uint64_t{};
  std::memcpy(&raw, key.data() + kLedgerEventPrefix.size(), sizeof(raw));
  return boost::endian::big_to_native(raw);
}

bytes_t make_ledger_head_key() {
  return make_prefix(kLedgerHeadKey);
}

bytes_t make_agent_key(const std::string_view agent_id) {
  return builder{}.write(kAgentPrefix).write(agent_id).data;
}

bytes_t make_oath_prefix(const std::string_view agent_id) {
  // Length prefix keeps "a" from matching the oaths of "ab".
  return builder{}
      .write(kOathPrefix)
      .write(static_cast<uint32_t>(agent_id.size()))
      .write(agent_id)
      .write(std::string_view{"|"})
      .data;
}

bytes_t make_oath_key(const std::string_view agent_id,
                      const hash32_t& policy_hash) {
  auto out = builder{.data = make_oath_prefix(agent_id)};
  return out.write(policy_hash).data;
}

bytes_t make_task_key(const task_id_t& task_id) {
  return builder{}.write(kTaskPrefix).write(task_id).data;
}

bytes_t make_lazy_queue_key(const task_id_t& task_id) {
  return builder{}.write(kLazyQueuePrefix).write(task_id).data;
}

bytes_t make_route_key(const hash32_t& input_hash) {
  return builder{}.write(kRoutePrefix).write(input_hash).data;
}

}  // namespace covenant::schema::key
