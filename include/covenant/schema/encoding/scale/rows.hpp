#pragma once

#include <covenant/schema/agent_record.hpp>
#include <covenant/schema/ledger_event.hpp>
#include <covenant/schema/oath_record.hpp>
#include <covenant/schema/routing_decision.hpp>
#include <covenant/schema/task.hpp>

#include <optional>

// Storage rows.
// Each persisted record is flattened into a tuple of SCALE primitives
// (enums as u8, signers and signatures as tag-prefixed bytes) so the on-disk
// layout only depends on the codec's built-in tuple support.
namespace covenant::schema::encoding::scale {

bytes_t encode_row(const agent_record_t& value);
std::optional<agent_record_t> try_decode_agent_record(const bytes_view_t& bytes);

bytes_t encode_row(const oath_record_t& value);
std::optional<oath_record_t> try_decode_oath_record(const bytes_view_t& bytes);

bytes_t encode_row(const routing_decision_t& value);
std::optional<routing_decision_t> try_decode_routing_decision(
    const bytes_view_t& bytes);

bytes_t encode_row(const task_t& value);
std::optional<task_t> try_decode_task(const bytes_view_t& bytes);

bytes_t encode_row(const ledger_event_t& value);
std::optional<ledger_event_t> try_decode_ledger_event(const bytes_view_t& bytes);

bytes_t encode_row(const ledger_head& value);
std::optional<ledger_head> try_decode_ledger_head(const bytes_view_t& bytes);

/// SCALE(sequence_number, event_type, payload, timestamp, actor).
bytes_t canonical_bytes(const ledger_event_t& value);

}  // namespace covenant::schema::encoding::scale
