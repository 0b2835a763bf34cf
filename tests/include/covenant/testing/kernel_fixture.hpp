#pragma once

#include <covenant/kernel/kernel.hpp>
#include <covenant/testing/common.hpp>
#include <covenant/testing/oath_signer.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace covenant::testing {

/// Policy document tests can edit while the kernel runs.
class mutable_policy final {
 public:
  explicit mutable_policy(std::string text)
      : state_{std::make_shared<state>(std::move(text))} {}

  void set(std::string text) {
    auto lock = std::scoped_lock{state_->mutex};
    state_->text = std::move(text);
  }

  std::string text() const {
    auto lock = std::scoped_lock{state_->mutex};
    return state_->text;
  }

  covenant::governance::policy_provider_t provider() const {
    return [state = state_]() {
      auto lock = std::scoped_lock{state->mutex};
      return covenant::schema::make_bytes(state->text);
    };
  }

 private:
  struct state final {
    explicit state(std::string value) : text{std::move(value)} {}
    std::mutex mutex;
    std::string text;
  };
  std::shared_ptr<state> state_;
};

/// A kernel over a throwaway database, a manual clock and an editable policy.
/// The reaper is off; tests drive reap_expired() themselves.
class kernel_fixture final {
 public:
  explicit kernel_fixture(const std::string_view prefix,
                          covenant::kernel::kernel_config config = {},
                          covenant::kernel::collaborators collaborators = {})
      : path_{make_db_path(prefix)}, policy_{"policy v1"} {
    config.database_path = path_;
    config.reaper_interval = 0;
    config_ = std::move(config);
    collaborators_ = std::move(collaborators);
    if (!collaborators_.clock) {
      collaborators_.clock = clock_.function();
    }
    if (!collaborators_.policy_provider) {
      collaborators_.policy_provider = policy_.provider();
    }
    start();
  }

  kernel_fixture(const kernel_fixture&) = delete;
  kernel_fixture& operator=(const kernel_fixture&) = delete;

  ~kernel_fixture() {
    kernel_.reset();
    remove_path(path_);
  }

  covenant::kernel::kernel& kernel() { return *kernel_; }
  const covenant::schema::boot_result_t& boot() const { return boot_; }
  manual_clock& clock() { return clock_; }
  mutable_policy& policy() { return policy_; }
  covenant::kernel::kernel_config& config() { return config_; }
  const std::string& path() const { return path_; }

  /// Drop the kernel and boot a fresh one over the same database.
  void restart() {
    kernel_.reset();
    start();
  }

  /// Register agent_id with a fresh key sworn to the current policy.
  covenant::schema::registration_result_t swear_in(
      const std::string& agent_id) {
    auto signer = oath_signer{};
    return kernel_->governance().register_agent(
        agent_id, signer.public_key(), {"general"},
        signer.swear(policy_.text()));
  }

 private:
  void start() {
    kernel_ = std::make_unique<covenant::kernel::kernel>(config_, collaborators_);
    boot_ = kernel_->init();
  }

  std::string path_;
  manual_clock clock_;
  mutable_policy policy_;
  covenant::kernel::kernel_config config_;
  covenant::kernel::collaborators collaborators_;
  std::unique_ptr<covenant::kernel::kernel> kernel_;
  covenant::schema::boot_result_t boot_;
};

}  // namespace covenant::testing
