#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/encoding/scale/event_payloads.hpp>

#include <tuple>

using namespace covenant::schema;

namespace covenant::schema::encoding::scale {

namespace {

using transition_row_t = std::tuple<hash32_t, std::string, uint32_t, std::string>;

}  // namespace

bytes_t make_oath_sworn_payload(const agent_id_t& agent_id,
                                const hash32_t& policy_hash,
                                const signer_id_t& signer,
                                const std::vector<std::string>& capabilities) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(std::tuple{agent_id, policy_hash, signer_bytes(signer),
                                   capabilities});
}

bytes_t make_oath_rejected_payload(const agent_id_t& agent_id,
                                   const hash32_t& policy_hash,
                                   const std::string_view reason) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(
      std::tuple{agent_id, policy_hash, std::string{reason}});
}

bytes_t make_oath_invalidated_payload(const agent_id_t& agent_id,
                                      const hash32_t& oath_policy_hash,
                                      const hash32_t& current_policy_hash) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(
      std::tuple{agent_id, oath_policy_hash, current_policy_hash});
}

bytes_t make_request_payload(const routing_decision_t& decision) {
  auto rejection = std::optional<uint8_t>{};
  if (decision.rejection) {
    rejection = static_cast<uint8_t>(*decision.rejection);
  }
  auto encoder = scale_encoder_t{};
  return encoder.encode(std::tuple{
      decision.request_id, static_cast<uint8_t>(decision.tier),
      decision.reason, rejection, decision.source_agent_id,
      decision.created_task_id});
}

bytes_t make_task_created_payload(const task_t& task) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(std::tuple{
      task.task_id, task.request_id, static_cast<uint8_t>(task.routing_tier),
      task.placement_rank, task.user_priority, task.max_retries,
      task.target_agent_id});
}

bytes_t make_task_transition_payload(const task_t& task,
                                     const std::string_view detail) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(transition_row_t{task.task_id,
                                         task.agent_id.value_or(""),
                                         task.attempt_count,
                                         std::string{detail}});
}

std::optional<task_transition_payload> try_decode_task_transition_payload(
    const bytes_view_t& bytes) {
  auto encoder = scale_encoder_t{};
  auto row = encoder.try_decode<transition_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  return task_transition_payload{.task_id = std::get<0>(*row),
                                 .agent_id = std::move(std::get<1>(*row)),
                                 .attempt_count = std::get<2>(*row),
                                 .detail = std::move(std::get<3>(*row))};
}

}  // namespace covenant::schema::encoding::scale
