#include <spdlog/spdlog.h>
#include <covenant/rpc/server.hpp>

#include <array>
#include <exception>
#include <iterator>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace covenant::rpc;
using namespace covenant::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  spdlog::debug("Rejected malformed request: {}", message);
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> from_wire(const std::string& value) {
  return try_make_array<N>(make_bytes_view(value));
}

std::string to_wire(const hash32_t& hash) {
  return std::string(std::begin(hash), std::end(hash));
}

covenant::v1::RoutingTier map_tier(const routing_tier_t tier) {
  switch (tier) {
    case routing_tier_t::high:
      return covenant::v1::ROUTING_TIER_HIGH;
    case routing_tier_t::medium:
      return covenant::v1::ROUTING_TIER_MEDIUM;
    case routing_tier_t::low:
      return covenant::v1::ROUTING_TIER_LOW;
    case routing_tier_t::blocked:
    default:
      return covenant::v1::ROUTING_TIER_BLOCKED;
  }
}

covenant::v1::TaskStatus map_status(const task_status_t status) {
  switch (status) {
    case task_status_t::claimed:
      return covenant::v1::TASK_STATUS_CLAIMED;
    case task_status_t::in_progress:
      return covenant::v1::TASK_STATUS_IN_PROGRESS;
    case task_status_t::completed:
      return covenant::v1::TASK_STATUS_COMPLETED;
    case task_status_t::failed:
      return covenant::v1::TASK_STATUS_FAILED;
    case task_status_t::dead:
      return covenant::v1::TASK_STATUS_DEAD;
    case task_status_t::pending:
    default:
      return covenant::v1::TASK_STATUS_PENDING;
  }
}

void populate_agent(const agent_record_t& source,
                    covenant::v1::Agent* destination) {
  destination->set_agent_id(source.agent_id);
  std::visit(overloaded{[&](const ed25519_signer_id& signer) {
                          destination->set_scheme(
                              covenant::v1::SIGNATURE_SCHEME_ED25519);
                          destination->set_public_key(
                              std::string(std::begin(signer.public_key),
                                          std::end(signer.public_key)));
                        },
                        [&](const secp256k1_signer_id& signer) {
                          destination->set_scheme(
                              covenant::v1::SIGNATURE_SCHEME_SECP256K1);
                          destination->set_public_key(
                              std::string(std::begin(signer.public_key),
                                          std::end(signer.public_key)));
                        }},
             source.public_key);
  for (const auto& capability : source.capabilities) {
    destination->add_capabilities(capability);
  }
  destination->set_oath_status(std::string{to_string(source.oath_status)});
  destination->set_oath_event_id(source.oath_event_id);
  destination->set_policy_hash(to_wire(source.policy_hash));
  destination->set_registered_at(source.registered_at);
}

void populate_task(const task_t& source, covenant::v1::Task* destination) {
  destination->set_task_id(to_wire(source.task_id));
  destination->set_request_id(to_wire(source.request_id));
  destination->set_agent_id(source.agent_id.value_or(""));
  destination->set_target_agent_id(source.target_agent_id.value_or(""));
  destination->set_payload(make_string(source.payload));
  destination->set_routing_tier(map_tier(source.routing_tier));
  destination->set_placement_rank(make_string(source.placement_rank));
  destination->set_user_priority(source.user_priority);
  destination->set_status(map_status(source.status));
  destination->set_attempt_count(source.attempt_count);
  destination->set_max_retries(source.max_retries);
  destination->set_created_at(source.created_at);
  destination->set_claimed_at(source.claimed_at.value_or(0));
  destination->set_started_at(source.started_at.value_or(0));
  destination->set_completed_at(source.completed_at.value_or(0));
  destination->set_result_payload(make_string(source.result_payload));
  destination->set_last_error(source.last_error);
}

void populate_task_response(const scheduling_result_t& source,
                            covenant::v1::TaskResponse* destination) {
  destination->set_code(source.code);
  destination->set_log(source.log);
  destination->set_codespace(source.codespace);
  if (source.task) {
    populate_task(*source.task, destination->mutable_task());
  }
}

void populate_decision(const routing_decision_t& source,
                       covenant::v1::AdmitResponse* destination) {
  destination->set_request_id(to_wire(source.request_id));
  destination->set_tier(map_tier(source.tier));
  destination->set_reason(source.reason);
  if (source.rejection == security_rejection_t::malicious_input) {
    destination->set_rejection(
        covenant::v1::SECURITY_REJECTION_MALICIOUS_INPUT);
  } else if (source.rejection == security_rejection_t::queue_saturated) {
    destination->set_rejection(
        covenant::v1::SECURITY_REJECTION_QUEUE_SATURATED);
  }
  if (source.created_task_id) {
    destination->set_created_task_id(to_wire(*source.created_task_id));
  }
  for (const auto& concept_tag : source.concepts) {
    destination->add_concepts(concept_tag);
  }
  destination->set_arrived_at(source.arrived_at);
}

}  // namespace

listener::listener(covenant::kernel::kernel& kernel) : kernel_{kernel} {}

grpc::ServerUnaryReactor* listener::Register(
    grpc::CallbackServerContext* context,
    const covenant::v1::RegisterRequest* request,
    covenant::v1::RegisterResponse* response) {
  auto signer = std::optional<signer_id_t>{};
  auto signature = std::optional<signature_t>{};
  if (request->scheme() == covenant::v1::SIGNATURE_SCHEME_ED25519) {
    if (auto key = from_wire<32>(request->public_key())) {
      signer = ed25519_signer_id{.public_key = *key};
    }
    if (auto raw = from_wire<64>(request->oath_signature())) {
      signature = *raw;
    }
  } else if (request->scheme() == covenant::v1::SIGNATURE_SCHEME_SECP256K1) {
    if (auto key = from_wire<33>(request->public_key())) {
      signer = secp256k1_signer_id{.public_key = *key};
    }
    if (auto raw = from_wire<65>(request->oath_signature())) {
      signature = *raw;
    }
  }
  if (!signer || !signature) {
    return finish_invalid(context,
                          "public key or signature length does not match scheme");
  }

  auto capabilities = std::vector<std::string>{
      std::begin(request->capabilities()), std::end(request->capabilities())};
  auto result = kernel_.governance().register_agent(
      request->agent_id(), *signer, std::move(capabilities), *signature);
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_codespace(result.codespace);
  if (result.agent) {
    populate_agent(*result.agent, response->mutable_agent());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Verify(
    grpc::CallbackServerContext* context,
    const covenant::v1::VerifyRequest* request,
    covenant::v1::VerifyResponse* response) {
  auto result = kernel_.governance().verify(request->agent_id());
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_codespace(result.codespace);
  response->set_current_policy_hash(to_wire(result.current_policy_hash));
  if (result.oath_policy_hash) {
    response->set_oath_policy_hash(to_wire(*result.oath_policy_hash));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Admit(
    grpc::CallbackServerContext* context,
    const covenant::v1::AdmitRequest* request,
    covenant::v1::AdmitResponse* response) {
  auto* reactor = context->DefaultReactor();
  kernel_.admission().submit(
      request->raw_input(), request->source_agent_id(),
      [reactor, response](std::exception_ptr error,
                          routing_decision_t decision) {
        if (error) {
          reactor->Finish(
              grpc::Status{grpc::StatusCode::INTERNAL, "admission failed"});
          return;
        }
        populate_decision(decision, response);
        reactor->Finish(grpc::Status::OK);
      });
  return reactor;
}

grpc::ServerUnaryReactor* listener::GetNextTask(
    grpc::CallbackServerContext* context,
    const covenant::v1::GetNextTaskRequest* request,
    covenant::v1::GetNextTaskResponse* response) {
  auto result = kernel_.tasks().claim_next_task(request->agent_id());
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_codespace(result.codespace);
  if (result.task) {
    populate_task(*result.task, response->mutable_task());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::StartTask(
    grpc::CallbackServerContext* context,
    const covenant::v1::StartTaskRequest* request,
    covenant::v1::TaskResponse* response) {
  auto task_id = from_wire<32>(request->task_id());
  if (!task_id) {
    return finish_invalid(context, "task_id must be 32 bytes");
  }
  populate_task_response(
      kernel_.tasks().start_task(*task_id, request->agent_id()), response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ReportTaskResult(
    grpc::CallbackServerContext* context,
    const covenant::v1::ReportTaskResultRequest* request,
    covenant::v1::TaskResponse* response) {
  auto task_id = from_wire<32>(request->task_id());
  if (!task_id) {
    return finish_invalid(context, "task_id must be 32 bytes");
  }
  auto outcome = task_outcome_t::completed;
  switch (request->outcome()) {
    case covenant::v1::TASK_OUTCOME_COMPLETED:
      break;
    case covenant::v1::TASK_OUTCOME_FAILED:
      outcome = task_outcome_t::failed;
      break;
    default:
      return finish_invalid(context, "outcome must be COMPLETED or FAILED");
  }
  populate_task_response(
      kernel_.tasks().report_task_result(*task_id, request->agent_id(), outcome,
                                         make_bytes(request->result_payload())),
      response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::EventsSince(
    grpc::CallbackServerContext* context,
    const covenant::v1::EventsSinceRequest* request,
    covenant::v1::EventsSinceResponse* response) {
  auto cursor = kernel_.events().events_since(request->sequence_number());
  auto limit = request->limit();
  auto returned = uint32_t{};
  while (limit == 0 || returned < limit) {
    auto event = cursor.next();
    if (!event) {
      break;
    }
    auto* destination = response->add_events();
    destination->set_sequence_number(event->sequence_number);
    destination->set_prev_hash(to_wire(event->prev_hash));
    destination->set_hash(to_wire(event->hash));
    destination->set_event_type(std::string{to_string(event->event_type)});
    destination->set_payload(make_string(event->payload));
    destination->set_timestamp(event->timestamp);
    destination->set_actor(event->actor);
    ++returned;
  }
  response->set_next_sequence_number(cursor.position());
  if (cursor.corruption()) {
    response->set_corruption(*cursor.corruption());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyChain(
    grpc::CallbackServerContext* context,
    const covenant::v1::VerifyChainRequest* /*request*/,
    covenant::v1::VerifyChainResponse* response) {
  auto result = kernel_.events().verify_chain_integrity();
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_codespace(result.codespace);
  response->set_valid(result.valid);
  response->set_events_checked(result.events_checked);
  if (result.failed_sequence) {
    response->set_has_failed_sequence(true);
    response->set_failed_sequence(*result.failed_sequence);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::QueueStatus(
    grpc::CallbackServerContext* context,
    const covenant::v1::QueueStatusRequest* /*request*/,
    covenant::v1::QueueStatusResponse* response) {
  auto status = kernel_.queue_status();
  response->set_pending(status.pending);
  response->set_claimed(status.claimed);
  response->set_in_progress(status.in_progress);
  response->set_completed(status.completed);
  response->set_failed(status.failed);
  response->set_dead(status.dead);
  response->set_high(status.high);
  response->set_medium(status.medium);
  response->set_low(status.low);
  response->set_lazy_queue_depth(status.lazy_queue_depth);
  response->set_lazy_queue_capacity(status.lazy_queue_capacity);
  if (status.ledger_head_sequence) {
    response->set_has_ledger_head(true);
    response->set_ledger_head_sequence(*status.ledger_head_sequence);
  }
  response->set_degraded(status.degraded);
  response->set_degraded_reason(status.degraded_reason);
  return finish_ok(context);
}
