#include <gtest/gtest.h>
#include <covenant/admission/router.hpp>
#include <covenant/blake3/hash.hpp>
#include <covenant/schema/key/kernel_keys.hpp>
#include <covenant/testing/common.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace covenant::schema;
using covenant::admission::intent_classifier_t;
using covenant::admission::lazy_queue;
using covenant::admission::placement_ranker_t;
using covenant::admission::router;
using covenant::admission::router_options;

namespace {

class router_test : public ::testing::Test {
 protected:
  router_test() : db_{"covenant_router"} {}

  void open(intent_classifier_t classifier =
                covenant::admission::make_heuristic_classifier(),
            const std::size_t capacity = 100,
            router_options options = {},
            placement_ranker_t ranker = nullptr) {
    ledger_ = std::make_unique<covenant::ledger::ledger>(db_.storage(),
                                                         clock_.function());
    ASSERT_TRUE(ledger_->recover());
    scheduler_ = std::make_unique<covenant::scheduler::scheduler>(
        db_.storage(), *ledger_, [](std::string_view) { return true; },
        clock_.function());
    scheduler_->load();
    queue_ = std::make_unique<lazy_queue>(db_.storage(), capacity,
                                          clock_.function());
    queue_->load();
    router_ = std::make_unique<router>(db_.storage(), *ledger_, *scheduler_,
                                       *queue_, std::move(classifier),
                                       std::move(ranker), clock_.function(),
                                       options);
    router_->load();
  }

  void close() {
    router_.reset();
    queue_.reset();
    scheduler_.reset();
    ledger_.reset();
  }

  void restart() {
    close();
    db_.reopen();
    open();
  }

  std::optional<bytes_t> route_row(const std::string_view raw_input) {
    return db_.storage().get(
        key::make_route_key(covenant::blake3::hash(raw_input)));
  }

  std::size_t count_events(const ledger_event_type_t type) {
    auto count = std::size_t{};
    auto cursor = ledger_->events_since(0);
    while (auto event = cursor.next()) {
      if (event->event_type == type) {
        ++count;
      }
    }
    return count;
  }

  covenant::testing::temp_database db_;
  covenant::testing::manual_clock clock_;
  std::unique_ptr<covenant::ledger::ledger> ledger_;
  std::unique_ptr<covenant::scheduler::scheduler> scheduler_;
  std::unique_ptr<lazy_queue> queue_;
  std::unique_ptr<router> router_;
};

}  // namespace

TEST_F(router_test, medium_request_becomes_a_task) {
  open();
  auto decision = router_->admit("What is the weather in Lisbon?", "caller");
  EXPECT_EQ(decision.tier, routing_tier_t::medium);
  ASSERT_TRUE(decision.created_task_id.has_value());
  EXPECT_EQ(*decision.created_task_id,
            covenant::admission::make_task_id(decision.request_id));
  EXPECT_EQ(decision.source_agent_id, "caller");

  auto task = scheduler_->find_task(*decision.created_task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, task_status_t::pending);
  EXPECT_EQ(task->routing_tier, routing_tier_t::medium);
  EXPECT_EQ(make_string(task->payload), "What is the weather in Lisbon?");
  EXPECT_EQ(count_events(ledger_event_type_t::request_admitted), 1u);
  EXPECT_EQ(count_events(ledger_event_type_t::task_created), 1u);
  EXPECT_EQ(queue_->depth(), 0u);
}

TEST_F(router_test, low_request_takes_a_lazy_slot) {
  open();
  auto decision = router_->admit("export the audit log", "caller");
  EXPECT_EQ(decision.tier, routing_tier_t::low);
  ASSERT_TRUE(decision.created_task_id.has_value());
  EXPECT_TRUE(queue_->contains(*decision.created_task_id));
}

TEST_F(router_test, injection_is_blocked_without_a_task) {
  open();
  auto decision = router_->admit("'; DROP TABLE tasks; --", "caller");
  EXPECT_EQ(decision.tier, routing_tier_t::blocked);
  EXPECT_TRUE(decision.rejection == security_rejection_t::malicious_input);
  EXPECT_NE(decision.reason.find("injection"), std::string::npos);
  EXPECT_FALSE(decision.created_task_id.has_value());
  EXPECT_EQ(count_events(ledger_event_type_t::request_blocked), 1u);
  EXPECT_EQ(count_events(ledger_event_type_t::task_created), 0u);
  EXPECT_EQ(scheduler_->queue_status().pending, 0u);
}

TEST_F(router_test, duplicate_input_yields_the_first_decision) {
  open();
  auto first = router_->admit("Plan the next release train", "caller");
  clock_.advance(1000);
  auto second = router_->admit("Plan the next release train", "other");
  EXPECT_EQ(first.request_id, second.request_id);
  EXPECT_TRUE(first.created_task_id == second.created_task_id);
  EXPECT_EQ(second.source_agent_id, "caller");
  EXPECT_EQ(count_events(ledger_event_type_t::request_admitted), 1u);
  EXPECT_EQ(scheduler_->queue_status().pending, 1u);
}

TEST_F(router_test, concurrent_duplicates_create_one_task) {
  open();
  auto futures = std::vector<std::future<routing_decision_t>>{};
  for (auto i = 0; i < 16; ++i) {
    futures.push_back(router_->submit("Compare the two vendor offers", "c"));
  }
  auto ids = std::vector<request_id_t>{};
  for (auto& future : futures) {
    ids.push_back(future.get().request_id);
  }
  for (const auto& id : ids) {
    EXPECT_EQ(id, ids.front());
  }
  EXPECT_EQ(count_events(ledger_event_type_t::task_created), 1u);
}

TEST_F(router_test, duplicate_outside_the_window_is_new) {
  open();
  auto first = router_->admit("Plan the next release train", "caller");
  clock_.advance(router_options{}.idempotency_window + 1);
  auto second = router_->admit("Plan the next release train", "caller");
  EXPECT_NE(first.request_id, second.request_id);
  EXPECT_EQ(count_events(ledger_event_type_t::request_admitted), 2u);
}

TEST_F(router_test, idempotency_survives_restart) {
  open();
  auto first = router_->admit("Plan the next release train", "caller");
  restart();
  auto second = router_->admit("Plan the next release train", "caller");
  EXPECT_EQ(first.request_id, second.request_id);
  EXPECT_EQ(count_events(ledger_event_type_t::request_admitted), 1u);
}

TEST_F(router_test, saturated_lazy_queue_blocks_the_overflow) {
  open();
  auto futures = std::vector<std::future<routing_decision_t>>{};
  for (auto i = 0; i < 1000; ++i) {
    futures.push_back(
        router_->submit("export report " + std::to_string(i), "batcher"));
  }
  auto admitted = std::size_t{};
  auto saturated = std::size_t{};
  for (auto& future : futures) {
    auto decision = future.get();
    if (decision.tier == routing_tier_t::low) {
      ++admitted;
    } else if (decision.tier == routing_tier_t::blocked &&
               decision.rejection == security_rejection_t::queue_saturated) {
      EXPECT_EQ(decision.reason, "queue_saturated");
      EXPECT_FALSE(decision.created_task_id.has_value());
      ++saturated;
    }
  }
  EXPECT_EQ(admitted, 100u);
  EXPECT_EQ(saturated, 900u);
  EXPECT_EQ(count_events(ledger_event_type_t::request_blocked), 900u);
  EXPECT_EQ(queue_->depth(), 100u);
  EXPECT_EQ(scheduler_->queue_status().low, 100u);
}

TEST_F(router_test, classifier_timeout_falls_back_to_low) {
  auto options = router_options{};
  options.classifier_timeout = 20;
  open(
      [](std::string_view) {
        std::this_thread::sleep_for(std::chrono::milliseconds{300});
        return covenant::admission::classification_t{
            .tier = routing_tier_t::high};
      },
      100, options);
  auto decision = router_->admit("Design the storage layer", "caller");
  EXPECT_EQ(decision.tier, routing_tier_t::low);
  EXPECT_EQ(decision.reason, "classifier fallback: timeout");
  EXPECT_TRUE(decision.created_task_id.has_value());
}

TEST_F(router_test, classifier_exception_falls_back_to_low) {
  open([](std::string_view) -> covenant::admission::classification_t {
    throw std::runtime_error{"model offline"};
  });
  auto decision = router_->admit("Design the storage layer", "caller");
  EXPECT_EQ(decision.tier, routing_tier_t::low);
  EXPECT_EQ(decision.reason, "classifier fallback: classifier threw: model offline");
}

TEST_F(router_test, classifier_cannot_block) {
  open([](std::string_view) {
    return covenant::admission::classification_t{.tier = routing_tier_t::blocked};
  });
  auto decision = router_->admit("Design the storage layer", "caller");
  EXPECT_EQ(decision.tier, routing_tier_t::low);
  EXPECT_TRUE(decision.created_task_id.has_value());
}

TEST_F(router_test, halted_ledger_fails_closed_and_is_not_remembered) {
  open();
  router_->admit("What is the build status?", "caller");
  auto genesis_key = key::make_ledger_event_key(0);
  auto genesis = db_.storage().get(genesis_key);
  ASSERT_TRUE(genesis.has_value());

  auto corrupt = covenant::storage::write_batch{};
  corrupt.put(genesis_key, make_bytes(std::string_view{"x"}));
  ASSERT_TRUE(db_.storage().commit(corrupt, true).ok);
  ASSERT_FALSE(ledger_->verify_chain_integrity().valid);

  auto refused = router_->admit("Draft the incident review", "caller");
  EXPECT_EQ(refused.tier, routing_tier_t::blocked);
  EXPECT_EQ(refused.reason, "ledger_unavailable");
  EXPECT_FALSE(refused.created_task_id.has_value());

  auto repair = covenant::storage::write_batch{};
  repair.put(genesis_key, *genesis);
  ASSERT_TRUE(db_.storage().commit(repair, true).ok);
  restart();
  ASSERT_TRUE(ledger_->verify_chain_integrity().valid);

  auto retried = router_->admit("Draft the incident review", "caller");
  EXPECT_EQ(retried.tier, routing_tier_t::high);
  EXPECT_TRUE(retried.created_task_id.has_value());
}

TEST_F(router_test, submit_after_shutdown_fails_closed) {
  open();
  router_->shutdown();
  auto decision = router_->submit("What is new?", "caller").get();
  EXPECT_EQ(decision.tier, routing_tier_t::blocked);
  EXPECT_EQ(decision.reason, "ledger_unavailable");
}

TEST_F(router_test, failing_placement_ranker_falls_back_to_an_empty_rank) {
  open(covenant::admission::make_heuristic_classifier(), 100, {},
       [](const task_spec_t&) -> bytes_t {
         throw std::runtime_error{"ranker offline"};
       });
  auto decision = router_->admit("Summarize the sprint review", "caller");
  ASSERT_TRUE(decision.created_task_id.has_value());
  auto task = scheduler_->find_task(*decision.created_task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_TRUE(task->placement_rank.empty());
  EXPECT_EQ(count_events(ledger_event_type_t::request_admitted), 1u);
  EXPECT_EQ(count_events(ledger_event_type_t::task_created), 1u);
}

TEST_F(router_test, escaping_failure_is_not_remembered_and_frees_the_slot) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  open(covenant::admission::make_heuristic_classifier(), 1, {},
       [calls](const task_spec_t&) -> bytes_t {
         if (calls->fetch_add(1) == 0) {
           throw 7;
         }
         return make_bytes(std::string_view{"a"});
       });

  EXPECT_THROW(router_->admit("export report 1", "batcher"), int);
  EXPECT_EQ(queue_->depth(), 0u);
  EXPECT_EQ(count_events(ledger_event_type_t::request_admitted), 0u);
  EXPECT_FALSE(route_row("export report 1").has_value());

  auto retried = router_->admit("export report 1", "batcher");
  EXPECT_EQ(retried.tier, routing_tier_t::low);
  EXPECT_TRUE(retried.created_task_id.has_value());
  EXPECT_EQ(queue_->depth(), 1u);
}

TEST_F(router_test, submit_reports_failures_to_the_handler) {
  open(covenant::admission::make_heuristic_classifier(), 100, {},
       [](const task_spec_t&) -> bytes_t { throw 7; });
  auto done = std::promise<std::exception_ptr>{};
  router_->submit("Review the on-call rota", "caller",
                  [&done](std::exception_ptr error, routing_decision_t) {
                    done.set_value(error);
                  });
  auto error = done.get_future().get();
  ASSERT_NE(error, nullptr);
  EXPECT_THROW(std::rethrow_exception(error), int);

  // The retry decides again instead of tripping over the first attempt.
  EXPECT_THROW(router_->submit("Review the on-call rota", "caller").get(), int);
}

TEST_F(router_test, hung_classifier_neither_queues_work_nor_blocks_shutdown) {
  auto gate = std::make_shared<std::promise<void>>();
  auto released = gate->get_future().share();
  auto options = router_options{};
  options.classifier_timeout = 20;
  options.classifier_workers = 1;
  open(
      [released](std::string_view) {
        released.wait();
        return covenant::admission::classification_t{
            .tier = routing_tier_t::high};
      },
      100, options);

  auto first = router_->admit("Design the storage layer", "caller");
  EXPECT_EQ(first.reason, "classifier fallback: timeout");
  auto second = router_->admit("Design the network layer", "caller");
  EXPECT_EQ(second.reason, "classifier fallback: classifier saturated");
  EXPECT_EQ(second.tier, routing_tier_t::low);
  EXPECT_TRUE(second.created_task_id.has_value());

  router_->shutdown();
  gate->set_value();
}

TEST_F(router_test, expired_decisions_lose_their_persisted_rows) {
  open();
  router_->admit("Plan the next release train", "caller");
  router_->admit("'; DROP TABLE tasks; --", "caller");
  EXPECT_TRUE(route_row("Plan the next release train").has_value());
  EXPECT_TRUE(route_row("'; DROP TABLE tasks; --").has_value());

  clock_.advance(router_options{}.idempotency_window + 1);
  router_->admit("What is the build status?", "caller");
  EXPECT_FALSE(route_row("Plan the next release train").has_value());
  EXPECT_FALSE(route_row("'; DROP TABLE tasks; --").has_value());
  EXPECT_TRUE(route_row("What is the build status?").has_value());
}

TEST(router_identity, request_id_depends_on_arrival_time) {
  EXPECT_NE(covenant::admission::make_request_id("same", 1),
            covenant::admission::make_request_id("same", 2));
  EXPECT_EQ(covenant::admission::make_request_id("same", 1),
            covenant::admission::make_request_id("same", 1));
}
