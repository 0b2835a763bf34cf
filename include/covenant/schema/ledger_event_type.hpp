#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger event type.
// Numeric values are part of the canonical hash input; append new values,
// never renumber.
namespace covenant::schema {

enum class ledger_event_type_t : uint8_t {
  oath_sworn = 0,
  oath_rejected = 1,
  request_admitted = 2,
  request_blocked = 3,
  task_created = 4,
  task_claimed = 5,
  task_completed = 6,
  task_failed = 7,
  task_dead = 8,
  task_started = 9,
  task_requeued = 10,
  task_claim_expired = 11,
  oath_invalidated = 12,
};

inline constexpr auto kLedgerEventTypeMappings = std::array{
    enum_mapping_t<ledger_event_type_t>{"OATH_SWORN",
                                        ledger_event_type_t::oath_sworn},
    enum_mapping_t<ledger_event_type_t>{"OATH_REJECTED",
                                        ledger_event_type_t::oath_rejected},
    enum_mapping_t<ledger_event_type_t>{"REQUEST_ADMITTED",
                                        ledger_event_type_t::request_admitted},
    enum_mapping_t<ledger_event_type_t>{"REQUEST_BLOCKED",
                                        ledger_event_type_t::request_blocked},
    enum_mapping_t<ledger_event_type_t>{"TASK_CREATED",
                                        ledger_event_type_t::task_created},
    enum_mapping_t<ledger_event_type_t>{"TASK_CLAIMED",
                                        ledger_event_type_t::task_claimed},
    enum_mapping_t<ledger_event_type_t>{"TASK_COMPLETED",
                                        ledger_event_type_t::task_completed},
    enum_mapping_t<ledger_event_type_t>{"TASK_FAILED",
                                        ledger_event_type_t::task_failed},
    enum_mapping_t<ledger_event_type_t>{"TASK_DEAD",
                                        ledger_event_type_t::task_dead},
    enum_mapping_t<ledger_event_type_t>{"TASK_STARTED",
                                        ledger_event_type_t::task_started},
    enum_mapping_t<ledger_event_type_t>{"TASK_REQUEUED",
                                        ledger_event_type_t::task_requeued},
    enum_mapping_t<ledger_event_type_t>{
        "TASK_CLAIM_EXPIRED", ledger_event_type_t::task_claim_expired},
    enum_mapping_t<ledger_event_type_t>{"OATH_INVALIDATED",
                                        ledger_event_type_t::oath_invalidated}};

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return to_string(value, kLedgerEventTypeMappings).value_or("unknown");
}

}  // namespace covenant::schema
