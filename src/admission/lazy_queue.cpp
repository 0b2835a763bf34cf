#include <spdlog/spdlog.h>
#include <covenant/admission/lazy_queue.hpp>
#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/key/kernel_keys.hpp>

#include <tuple>

using namespace covenant::schema;

namespace covenant::admission {

namespace {

using slot_row_t = std::tuple<task_id_t, request_id_t, uint64_t>;

}  // namespace

lazy_queue::lazy_queue(covenant::storage::rocksdb_storage_t& storage,
                       const std::size_t capacity,
                       covenant::common::clock_t clock)
    : storage_{storage}, capacity_{capacity}, clock_{std::move(clock)} {}

std::size_t lazy_queue::load() {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoding::scale_encoder_t{};
  slots_.clear();
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(key::make_prefix(key::kLazyQueuePrefix))) {
    auto row = encoder.try_decode<slot_row_t>(row_value);
    if (!row) {
      covenant::common::critical("undecodable lazy queue row at key {}",
                                 to_hex(row_key));
    }
    slots_.insert_or_assign(std::get<0>(*row),
                            slot{.request_id = std::get<1>(*row),
                                 .enqueued_at = std::get<2>(*row)});
  }
  if (slots_.size() > capacity_) {
    spdlog::warn("Lazy queue holds {} slot(s), above capacity {}",
                 slots_.size(), capacity_);
  }
  spdlog::info("Loaded {} lazy queue slot(s)", slots_.size());
  return slots_.size();
}

reserve_result lazy_queue::try_reserve(const task_id_t& task_id,
                                       const request_id_t& request_id) {
  auto lock = std::scoped_lock{mutex_};
  if (slots_.contains(task_id)) {
    return reserve_result::reserved;
  }
  if (slots_.size() >= capacity_) {
    return reserve_result::saturated;
  }

  auto entry = slot{.request_id = request_id, .enqueued_at = clock_()};
  auto encoder = encoding::scale_encoder_t{};
  auto batch = covenant::storage::write_batch{};
  batch.put(key::make_lazy_queue_key(task_id),
            encoder.encode(slot_row_t{task_id, entry.request_id,
                                      entry.enqueued_at}));
  auto status = storage_.commit(batch, true);
  if (!status.ok) {
    spdlog::error("Lazy queue slot not persisted: {}", status.error);
    return reserve_result::unavailable;
  }
  slots_.insert_or_assign(task_id, entry);
  return reserve_result::reserved;
}

bool lazy_queue::release(const task_id_t& task_id) {
  auto lock = std::scoped_lock{mutex_};
  if (!slots_.contains(task_id)) {
    return false;
  }
  auto batch = covenant::storage::write_batch{};
  batch.erase(key::make_lazy_queue_key(task_id));
  auto status = storage_.commit(batch, true);
  if (!status.ok) {
    // The slot stays held; reconciliation on the next boot frees it.
    spdlog::error("Lazy queue slot not released: {}", status.error);
    return false;
  }
  slots_.erase(task_id);
  return true;
}

bool lazy_queue::contains(const task_id_t& task_id) const {
  auto lock = std::scoped_lock{mutex_};
  return slots_.contains(task_id);
}

std::vector<task_id_t> lazy_queue::entries() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<task_id_t>{};
  out.reserve(slots_.size());
  for (const auto& [task_id, entry] : slots_) {
    out.push_back(task_id);
  }
  return out;
}

std::size_t lazy_queue::depth() const {
  auto lock = std::scoped_lock{mutex_};
  return slots_.size();
}

}  // namespace covenant::admission
