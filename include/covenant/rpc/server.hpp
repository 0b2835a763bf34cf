#pragma once

#include <covenant/v1/kernel.grpc.pb.h>
#include <covenant/kernel/kernel.hpp>

namespace covenant::rpc {

/// Callback-style gRPC front end for covenant.v1.Kernel.
///
/// Handlers run the kernel call on the gRPC callback thread and finish
/// immediately, except Admit, which hands the request to the admission pool
/// and finishes from there. Kernel rejections travel in the response
/// envelope (code, log, codespace) with an OK status; malformed requests
/// (wrong hash length, unset enum) fail with INVALID_ARGUMENT.
struct listener final : public covenant::v1::Kernel::CallbackService {
  explicit listener(covenant::kernel::kernel& kernel);

  grpc::ServerUnaryReactor* Register(
      grpc::CallbackServerContext* context,
      const covenant::v1::RegisterRequest* request,
      covenant::v1::RegisterResponse* response) override final;

  grpc::ServerUnaryReactor* Verify(
      grpc::CallbackServerContext* context,
      const covenant::v1::VerifyRequest* request,
      covenant::v1::VerifyResponse* response) override final;

  grpc::ServerUnaryReactor* Admit(
      grpc::CallbackServerContext* context,
      const covenant::v1::AdmitRequest* request,
      covenant::v1::AdmitResponse* response) override final;

  /// Claims the task; an empty task with code 0 means nothing was eligible.
  grpc::ServerUnaryReactor* GetNextTask(
      grpc::CallbackServerContext* context,
      const covenant::v1::GetNextTaskRequest* request,
      covenant::v1::GetNextTaskResponse* response) override final;

  grpc::ServerUnaryReactor* StartTask(
      grpc::CallbackServerContext* context,
      const covenant::v1::StartTaskRequest* request,
      covenant::v1::TaskResponse* response) override final;

  grpc::ServerUnaryReactor* ReportTaskResult(
      grpc::CallbackServerContext* context,
      const covenant::v1::ReportTaskResultRequest* request,
      covenant::v1::TaskResponse* response) override final;

  grpc::ServerUnaryReactor* EventsSince(
      grpc::CallbackServerContext* context,
      const covenant::v1::EventsSinceRequest* request,
      covenant::v1::EventsSinceResponse* response) override final;

  grpc::ServerUnaryReactor* VerifyChain(
      grpc::CallbackServerContext* context,
      const covenant::v1::VerifyChainRequest* request,
      covenant::v1::VerifyChainResponse* response) override final;

  grpc::ServerUnaryReactor* QueueStatus(
      grpc::CallbackServerContext* context,
      const covenant::v1::QueueStatusRequest* request,
      covenant::v1::QueueStatusResponse* response) override final;

 private:
  covenant::kernel::kernel& kernel_;
};

}  // namespace covenant::rpc
