#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>
#include <covenant/crypto/verify.hpp>
#include <covenant/rpc/server.hpp>
#include <covenant/testing/kernel_fixture.hpp>
#include <covenant/testing/oath_signer.hpp>

#include <memory>
#include <string>
#include <variant>

using namespace covenant::schema;

namespace {

std::string to_wire(const auto& bytes) {
  return std::string(std::begin(bytes), std::end(bytes));
}

class server_test : public ::testing::Test {
 protected:
  server_test() : fixture_{"covenant_rpc"}, listener_{fixture_.kernel()} {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener_);
    server_ = builder.BuildAndStart();
    stub_ = covenant::v1::Kernel::NewStub(
        server_->InProcessChannel(grpc::ChannelArguments{}));
  }

  ~server_test() override { server_->Shutdown(); }

  void SetUp() override {
    if (!covenant::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
    }
  }

  covenant::v1::RegisterResponse register_agent(const std::string& agent_id) {
    auto request = covenant::v1::RegisterRequest{};
    request.set_agent_id(agent_id);
    request.set_scheme(covenant::v1::SIGNATURE_SCHEME_ED25519);
    request.set_public_key(to_wire(
        std::get<ed25519_signer_id>(signer_.public_key()).public_key));
    request.set_oath_signature(to_wire(std::get<ed25519_signature_t>(
        signer_.swear(fixture_.policy().text()))));
    request.add_capabilities("general");
    auto response = covenant::v1::RegisterResponse{};
    auto context = grpc::ClientContext{};
    auto status = stub_->Register(&context, request, &response);
    EXPECT_TRUE(status.ok()) << status.error_message();
    return response;
  }

  covenant::testing::kernel_fixture fixture_;
  covenant::rpc::listener listener_;
  covenant::testing::oath_signer signer_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<covenant::v1::Kernel::Stub> stub_;
};

}  // namespace

TEST_F(server_test, register_and_verify) {
  auto registered = register_agent("worker");
  EXPECT_EQ(registered.code(), 0u) << registered.log();
  EXPECT_EQ(registered.agent().agent_id(), "worker");
  EXPECT_EQ(registered.agent().oath_status(), "sworn");
  EXPECT_EQ(registered.agent().policy_hash().size(), 32u);

  auto request = covenant::v1::VerifyRequest{};
  request.set_agent_id("worker");
  auto response = covenant::v1::VerifyResponse{};
  auto context = grpc::ClientContext{};
  ASSERT_TRUE(stub_->Verify(&context, request, &response).ok());
  EXPECT_EQ(response.code(), 0u);
  EXPECT_EQ(response.current_policy_hash(), response.oath_policy_hash());
}

TEST_F(server_test, wrong_key_length_is_invalid_argument) {
  auto request = covenant::v1::RegisterRequest{};
  request.set_agent_id("worker");
  request.set_scheme(covenant::v1::SIGNATURE_SCHEME_ED25519);
  request.set_public_key(std::string(31, '\x01'));
  request.set_oath_signature(std::string(64, '\x02'));
  auto response = covenant::v1::RegisterResponse{};
  auto context = grpc::ClientContext{};
  auto status = stub_->Register(&context, request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(server_test, task_lifecycle_over_the_wire) {
  ASSERT_EQ(register_agent("worker").code(), 0u);

  auto admit = covenant::v1::AdmitRequest{};
  admit.set_raw_input("What is the deploy window?");
  admit.set_source_agent_id("caller");
  auto admitted = covenant::v1::AdmitResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(stub_->Admit(&context, admit, &admitted).ok());
  }
  EXPECT_EQ(admitted.tier(), covenant::v1::ROUTING_TIER_MEDIUM);
  EXPECT_EQ(admitted.rejection(), covenant::v1::SECURITY_REJECTION_NONE);
  ASSERT_EQ(admitted.created_task_id().size(), 32u);

  auto next = covenant::v1::GetNextTaskRequest{};
  next.set_agent_id("worker");
  auto claimed = covenant::v1::GetNextTaskResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(stub_->GetNextTask(&context, next, &claimed).ok());
  }
  ASSERT_TRUE(claimed.has_task());
  EXPECT_EQ(claimed.task().task_id(), admitted.created_task_id());
  EXPECT_EQ(claimed.task().status(), covenant::v1::TASK_STATUS_CLAIMED);

  auto report = covenant::v1::ReportTaskResultRequest{};
  report.set_task_id(admitted.created_task_id());
  report.set_agent_id("worker");
  report.set_outcome(covenant::v1::TASK_OUTCOME_COMPLETED);
  report.set_result_payload("tomorrow 09:00");
  auto reported = covenant::v1::TaskResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(stub_->ReportTaskResult(&context, report, &reported).ok());
  }
  EXPECT_EQ(reported.code(), 0u) << reported.log();
  EXPECT_EQ(reported.task().status(), covenant::v1::TASK_STATUS_COMPLETED);
  EXPECT_EQ(reported.task().result_payload(), "tomorrow 09:00");

  auto status = covenant::v1::QueueStatusResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(stub_->QueueStatus(&context, covenant::v1::QueueStatusRequest{},
                                   &status)
                    .ok());
  }
  EXPECT_EQ(status.completed(), 1u);
  EXPECT_TRUE(status.has_ledger_head());
  EXPECT_FALSE(status.degraded());
}

TEST_F(server_test, scheduler_errors_travel_in_the_envelope) {
  auto request = covenant::v1::StartTaskRequest{};
  request.set_task_id(std::string(32, '\x07'));
  request.set_agent_id("worker");
  auto response = covenant::v1::TaskResponse{};
  auto context = grpc::ClientContext{};
  ASSERT_TRUE(stub_->StartTask(&context, request, &response).ok());
  EXPECT_EQ(response.code(),
            static_cast<uint32_t>(scheduling_error_code::not_found));
  EXPECT_EQ(response.codespace(), "scheduler");
  EXPECT_FALSE(response.has_task());

  auto short_id = covenant::v1::StartTaskRequest{};
  short_id.set_task_id("abc");
  auto invalid_context = grpc::ClientContext{};
  EXPECT_EQ(stub_->StartTask(&invalid_context, short_id, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(server_test, events_since_pages_and_chain_verifies) {
  ASSERT_EQ(register_agent("worker").code(), 0u);
  {
    auto admit = covenant::v1::AdmitRequest{};
    admit.set_raw_input("'; DROP TABLE tasks; --");
    auto blocked = covenant::v1::AdmitResponse{};
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(stub_->Admit(&context, admit, &blocked).ok());
    EXPECT_EQ(blocked.tier(), covenant::v1::ROUTING_TIER_BLOCKED);
    EXPECT_EQ(blocked.rejection(),
              covenant::v1::SECURITY_REJECTION_MALICIOUS_INPUT);
    EXPECT_TRUE(blocked.created_task_id().empty());
  }

  auto request = covenant::v1::EventsSinceRequest{};
  request.set_limit(1);
  auto page = covenant::v1::EventsSinceResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(stub_->EventsSince(&context, request, &page).ok());
  }
  ASSERT_EQ(page.events_size(), 1);
  EXPECT_EQ(page.events(0).event_type(), "OATH_SWORN");
  EXPECT_EQ(page.events(0).prev_hash(), std::string(32, '\0'));
  EXPECT_EQ(page.next_sequence_number(), 1u);

  request.set_sequence_number(page.next_sequence_number());
  request.set_limit(0);
  auto rest = covenant::v1::EventsSinceResponse{};
  {
    auto context = grpc::ClientContext{};
    ASSERT_TRUE(stub_->EventsSince(&context, request, &rest).ok());
  }
  ASSERT_EQ(rest.events_size(), 1);
  EXPECT_EQ(rest.events(0).event_type(), "REQUEST_BLOCKED");
  EXPECT_EQ(rest.events(0).prev_hash(), page.events(0).hash());

  auto verified = covenant::v1::VerifyChainResponse{};
  auto context = grpc::ClientContext{};
  ASSERT_TRUE(stub_->VerifyChain(&context, covenant::v1::VerifyChainRequest{},
                                 &verified)
                  .ok());
  EXPECT_TRUE(verified.valid());
  EXPECT_EQ(verified.events_checked(), 2u);
}

TEST_F(server_test, unset_enums_are_invalid_arguments) {
  auto report = covenant::v1::ReportTaskResultRequest{};
  report.set_task_id(std::string(32, '\x07'));
  report.set_agent_id("worker");
  auto reported = covenant::v1::TaskResponse{};
  {
    auto context = grpc::ClientContext{};
    EXPECT_EQ(stub_->ReportTaskResult(&context, report, &reported).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
  }

  auto request = covenant::v1::RegisterRequest{};
  request.set_agent_id("worker");
  request.set_public_key(std::string(32, '\x01'));
  request.set_oath_signature(std::string(64, '\x02'));
  auto registered = covenant::v1::RegisterResponse{};
  auto context = grpc::ClientContext{};
  EXPECT_EQ(stub_->Register(&context, request, &registered).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_TRUE(fixture_.kernel().governance().agents().empty());
}

TEST(server_admission, failed_admission_is_an_internal_error) {
  if (!covenant::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto collaborators = covenant::kernel::collaborators{};
  collaborators.placement_ranker = [](const task_spec_t&) -> bytes_t {
    throw 7;
  };
  auto fixture = covenant::testing::kernel_fixture{"covenant_rpc_admit", {},
                                                   std::move(collaborators)};
  ASSERT_EQ(fixture.boot().code, 0u) << fixture.boot().log;
  auto listener = covenant::rpc::listener{fixture.kernel()};
  auto builder = grpc::ServerBuilder{};
  builder.RegisterService(&listener);
  auto server = builder.BuildAndStart();
  auto stub = covenant::v1::Kernel::NewStub(
      server->InProcessChannel(grpc::ChannelArguments{}));

  auto admit = covenant::v1::AdmitRequest{};
  admit.set_raw_input("What is the deploy window?");
  auto response = covenant::v1::AdmitResponse{};
  {
    auto context = grpc::ClientContext{};
    EXPECT_EQ(stub->Admit(&context, admit, &response).error_code(),
              grpc::StatusCode::INTERNAL);
  }

  // The daemon keeps serving.
  auto status = covenant::v1::QueueStatusResponse{};
  auto context = grpc::ClientContext{};
  EXPECT_TRUE(
      stub->QueueStatus(&context, covenant::v1::QueueStatusRequest{}, &status)
          .ok());
  EXPECT_EQ(status.pending(), 0u);
  server->Shutdown();
}
