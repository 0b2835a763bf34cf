#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/encoding/scale/rows.hpp>

#include <string>
#include <tuple>
#include <vector>

using namespace covenant::schema;

namespace covenant::schema::encoding::scale {

namespace {

using agent_row_t = std::tuple<uint16_t,
                               std::string,
                               bytes_t,
                               std::vector<std::string>,
                               uint8_t,
                               uint64_t,
                               hash32_t,
                               uint64_t>;

using oath_row_t = std::tuple<uint16_t, std::string, hash32_t, bytes_t, uint64_t>;

using routing_row_t = std::tuple<uint16_t,
                                 hash32_t,
                                 uint8_t,
                                 std::string,
                                 std::optional<uint8_t>,
                                 std::optional<hash32_t>,
                                 std::vector<std::string>,
                                 std::string,
                                 uint64_t>;

using task_row_t = std::tuple<uint16_t,
                              hash32_t,
                              hash32_t,
                              std::optional<std::string>,
                              std::optional<std::string>,
                              bytes_t,
                              uint8_t,
                              bytes_t,
                              int32_t,
                              uint8_t,
                              uint32_t,
                              uint32_t,
                              uint64_t,
                              std::optional<uint64_t>,
                              std::optional<uint64_t>,
                              std::optional<uint64_t>,
                              bytes_t,
                              std::string>;

using event_row_t = std::tuple<uint16_t,
                               uint64_t,
                               hash32_t,
                               hash32_t,
                               uint8_t,
                               bytes_t,
                               uint64_t,
                               std::string>;

using head_row_t = std::tuple<uint64_t, hash32_t, uint64_t>;

template <typename Enum>
std::optional<Enum> try_make_enum(const uint8_t raw, const Enum last) {
  if (raw > static_cast<uint8_t>(last)) {
    return std::nullopt;
  }
  return static_cast<Enum>(raw);
}

template <typename Row>
std::optional<Row> try_decode_row(const bytes_view_t& bytes) {
  auto encoder = scale_encoder_t{};
  return encoder.try_decode<Row>(bytes);
}

template <typename Row>
bytes_t encode_tuple(const Row& row) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(row);
}

}  // namespace

bytes_t encode_row(const agent_record_t& value) {
  return encode_tuple(agent_row_t{
      value.version, value.agent_id, signer_bytes(value.public_key),
      value.capabilities, static_cast<uint8_t>(value.oath_status),
      value.oath_event_id, value.policy_hash, value.registered_at});
}

std::optional<agent_record_t> try_decode_agent_record(
    const bytes_view_t& bytes) {
  auto row = try_decode_row<agent_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, agent_id, signer, capabilities, status, oath_event_id,
         policy_hash, registered_at] = *row;
  auto public_key = try_make_signer(signer);
  auto oath_status = try_make_enum(status, oath_status_t::invalidated);
  if (version != 1 || !public_key || !oath_status) {
    return std::nullopt;
  }
  return agent_record_t{.agent_id = std::move(agent_id),
                        .public_key = *public_key,
                        .capabilities = std::move(capabilities),
                        .oath_status = *oath_status,
                        .oath_event_id = oath_event_id,
                        .policy_hash = policy_hash,
                        .registered_at = registered_at};
}

bytes_t encode_row(const oath_record_t& value) {
  return encode_tuple(oath_row_t{value.version, value.agent_id,
                                 value.policy_hash,
                                 signature_bytes(value.signature),
                                 value.sworn_at});
}

std::optional<oath_record_t> try_decode_oath_record(const bytes_view_t& bytes) {
  auto row = try_decode_row<oath_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, agent_id, policy_hash, raw_signature, sworn_at] = *row;
  auto signature = try_make_signature(raw_signature);
  if (version != 1 || !signature) {
    return std::nullopt;
  }
  return oath_record_t{.agent_id = std::move(agent_id),
                       .policy_hash = policy_hash,
                       .signature = *signature,
                       .sworn_at = sworn_at};
}

bytes_t encode_row(const routing_decision_t& value) {
  auto rejection = std::optional<uint8_t>{};
  if (value.rejection) {
    rejection = static_cast<uint8_t>(*value.rejection);
  }
  return encode_tuple(routing_row_t{
      value.version, value.request_id, static_cast<uint8_t>(value.tier),
      value.reason, rejection, value.created_task_id, value.concepts,
      value.source_agent_id, value.arrived_at});
}

std::optional<routing_decision_t> try_decode_routing_decision(
    const bytes_view_t& bytes) {
  auto row = try_decode_row<routing_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, request_id, raw_tier, reason, raw_rejection,
         created_task_id, concepts, source_agent_id, arrived_at] = *row;
  auto tier = try_make_enum(raw_tier, routing_tier_t::high);
  if (version != 1 || !tier) {
    return std::nullopt;
  }
  auto decision = routing_decision_t{.request_id = request_id,
                                     .tier = *tier,
                                     .reason = std::move(reason),
                                     .created_task_id = created_task_id,
                                     .concepts = std::move(concepts),
                                     .source_agent_id =
                                         std::move(source_agent_id),
                                     .arrived_at = arrived_at};
  if (raw_rejection) {
    if (*raw_rejection <
            static_cast<uint8_t>(security_rejection_t::malicious_input) ||
        *raw_rejection >
            static_cast<uint8_t>(security_rejection_t::queue_saturated)) {
      return std::nullopt;
    }
    decision.rejection = static_cast<security_rejection_t>(*raw_rejection);
  }
  return decision;
}

bytes_t encode_row(const task_t& value) {
  return encode_tuple(task_row_t{
      value.version, value.task_id, value.request_id, value.agent_id,
      value.target_agent_id, value.payload,
      static_cast<uint8_t>(value.routing_tier), value.placement_rank,
      value.user_priority, static_cast<uint8_t>(value.status),
      value.attempt_count, value.max_retries, value.created_at,
      value.claimed_at, value.started_at, value.completed_at,
      value.result_payload, value.last_error});
}

std::optional<task_t> try_decode_task(const bytes_view_t& bytes) {
  auto row = try_decode_row<task_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, task_id, request_id, agent_id, target_agent_id, payload,
         raw_tier, placement_rank, user_priority, raw_status, attempt_count,
         max_retries, created_at, claimed_at, started_at, completed_at,
         result_payload, last_error] = *row;
  auto tier = try_make_enum(raw_tier, routing_tier_t::high);
  auto status = try_make_enum(raw_status, task_status_t::dead);
  if (version != 1 || !tier || !status) {
    return std::nullopt;
  }
  return task_t{.task_id = task_id,
                .request_id = request_id,
                .agent_id = std::move(agent_id),
                .target_agent_id = std::move(target_agent_id),
                .payload = std::move(payload),
                .routing_tier = *tier,
                .placement_rank = std::move(placement_rank),
                .user_priority = user_priority,
                .status = *status,
                .attempt_count = attempt_count,
                .max_retries = max_retries,
                .created_at = created_at,
                .claimed_at = claimed_at,
                .started_at = started_at,
                .completed_at = completed_at,
                .result_payload = std::move(result_payload),
                .last_error = std::move(last_error)};
}

bytes_t encode_row(const ledger_event_t& value) {
  return encode_tuple(event_row_t{
      value.version, value.sequence_number, value.prev_hash, value.hash,
      static_cast<uint8_t>(value.event_type), value.payload, value.timestamp,
      value.actor});
}

std::optional<ledger_event_t> try_decode_ledger_event(
    const bytes_view_t& bytes) {
  auto row = try_decode_row<event_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  auto& [version, sequence_number, prev_hash, hash, raw_type, payload,
         timestamp, actor] = *row;
  auto event_type =
      try_make_enum(raw_type, ledger_event_type_t::oath_invalidated);
  if (version != 1 || !event_type) {
    return std::nullopt;
  }
  return ledger_event_t{.sequence_number = sequence_number,
                        .prev_hash = prev_hash,
                        .hash = hash,
                        .event_type = *event_type,
                        .payload = std::move(payload),
                        .timestamp = timestamp,
                        .actor = std::move(actor)};
}

bytes_t encode_row(const ledger_head& value) {
  return encode_tuple(head_row_t{value.sequence_number, value.hash,
                                 value.count});
}

std::optional<ledger_head> try_decode_ledger_head(const bytes_view_t& bytes) {
  auto row = try_decode_row<head_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  return ledger_head{.sequence_number = std::get<0>(*row),
                     .hash = std::get<1>(*row),
                     .count = std::get<2>(*row)};
}

bytes_t canonical_bytes(const ledger_event_t& value) {
  return encode_tuple(std::tuple{value.sequence_number,
                                 static_cast<uint8_t>(value.event_type),
                                 value.payload, value.timestamp,
                                 value.actor});
}

}  // namespace covenant::schema::encoding::scale
