#include <gtest/gtest.h>
#include <covenant/schema/encoding/scale/event_payloads.hpp>
#include <covenant/schema/encoding/scale/rows.hpp>
#include <covenant/testing/common.hpp>

using namespace covenant::schema;
namespace scale_rows = covenant::schema::encoding::scale;

namespace {

task_t make_claimed_task() {
  return task_t{.task_id = covenant::testing::make_hash(1),
                .request_id = covenant::testing::make_hash(2),
                .agent_id = "worker-1",
                .payload = make_bytes(std::string_view{"summarize the log"}),
                .routing_tier = routing_tier_t::low,
                .placement_rank = bytes_t{0x00, 0x07},
                .user_priority = -4,
                .status = task_status_t::claimed,
                .attempt_count = 1,
                .max_retries = 3,
                .created_at = 1000,
                .claimed_at = 1500,
                .last_error = "deadline_exceeded"};
}

}  // namespace

TEST(encoding, task_row_keeps_optional_fields) {
  auto task = make_claimed_task();
  auto decoded = scale_rows::try_decode_task(scale_rows::encode_row(task));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->agent_id, std::optional<agent_id_t>{"worker-1"});
  EXPECT_FALSE(decoded->target_agent_id.has_value());
  EXPECT_EQ(decoded->status, task_status_t::claimed);
  EXPECT_EQ(decoded->routing_tier, routing_tier_t::low);
  EXPECT_EQ(decoded->placement_rank, task.placement_rank);
  EXPECT_EQ(decoded->user_priority, -4);
  EXPECT_EQ(decoded->claimed_at, std::optional<uint64_t>{1500});
  EXPECT_FALSE(decoded->started_at.has_value());
  EXPECT_EQ(decoded->last_error, "deadline_exceeded");
}

TEST(encoding, rows_of_an_unknown_version_are_rejected) {
  auto task = make_claimed_task();
  task.version = 2;
  EXPECT_FALSE(
      scale_rows::try_decode_task(scale_rows::encode_row(task)).has_value());
}

TEST(encoding, truncated_rows_do_not_decode) {
  auto encoded = scale_rows::encode_row(make_claimed_task());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(scale_rows::try_decode_task(encoded).has_value());
}

TEST(encoding, routing_decision_row_keeps_rejection_and_concepts) {
  auto decision =
      routing_decision_t{.request_id = covenant::testing::make_hash(9),
                         .tier = routing_tier_t::blocked,
                         .reason = "queue_saturated",
                         .rejection = security_rejection_t::queue_saturated,
                         .concepts = {"batch", "export"},
                         .source_agent_id = "planner",
                         .arrived_at = 42};
  auto decoded = scale_rows::try_decode_routing_decision(
      scale_rows::encode_row(decision));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->request_id, decision.request_id);
  EXPECT_EQ(decoded->rejection,
            std::optional<security_rejection_t>{
                security_rejection_t::queue_saturated});
  EXPECT_FALSE(decoded->created_task_id.has_value());
  EXPECT_EQ(decoded->concepts, decision.concepts);
  EXPECT_EQ(decoded->source_agent_id, "planner");
  EXPECT_EQ(decoded->arrived_at, 42u);
}

TEST(encoding, canonical_bytes_cover_every_hashed_field) {
  auto event = ledger_event_t{.sequence_number = 3,
                              .event_type = ledger_event_type_t::task_claimed,
                              .payload = bytes_t{1, 2, 3},
                              .timestamp = 77,
                              .actor = "worker-1"};
  auto base = scale_rows::canonical_bytes(event);

  auto other_actor = event;
  other_actor.actor = "worker-2";
  EXPECT_NE(scale_rows::canonical_bytes(other_actor), base);

  auto other_type = event;
  other_type.event_type = ledger_event_type_t::task_started;
  EXPECT_NE(scale_rows::canonical_bytes(other_type), base);

  // prev_hash and hash are chained separately and never part of the bytes.
  auto linked = event;
  linked.prev_hash = covenant::testing::make_hash(5);
  linked.hash = covenant::testing::make_hash(6);
  EXPECT_EQ(scale_rows::canonical_bytes(linked), base);
}

TEST(encoding, task_transition_payload_names_the_agent_and_detail) {
  auto task = make_claimed_task();
  auto payload = scale_rows::make_task_transition_payload(task, "retry 1 of 3");
  auto decoded = scale_rows::try_decode_task_transition_payload(payload);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->task_id, task.task_id);
  EXPECT_EQ(decoded->agent_id, "worker-1");
  EXPECT_EQ(decoded->attempt_count, 1u);
  EXPECT_EQ(decoded->detail, "retry 1 of 3");
}
