#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <covenant/kernel/kernel.hpp>
#include <covenant/rpc/server.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto config_path = std::string{};
  auto log_path = std::string{};
  auto database_path = std::string{};
  auto policy_path = std::string{};
  auto bootstrap_specs = std::vector<std::string>{};
  auto config = covenant::kernel::kernel_config{};

  namespace po = boost::program_options;
  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style file with any of the kernel options below")(
      "verbose,v", "Enable debug logging");

  auto kernel_options = po::options_description{"Kernel"};
  kernel_options.add_options()(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:50051"),
      "IP:Port for the gRPC service")(
      "log-file", po::value<std::string>(&log_path)->default_value("covenant.log"),
      "Log file path")(
      "db-path",
      po::value<std::string>(&database_path)->default_value("covenant.db"),
      "RocksDB directory")(
      "policy-path", po::value<std::string>(&policy_path),
      "Governing policy document; genesis policy when unset")(
      "lazy-queue-capacity",
      po::value<std::size_t>(&config.lazy_queue_capacity)->default_value(100),
      "Outstanding LOW tasks")(
      "reaper-interval-ms",
      po::value<uint64_t>(&config.reaper_interval)->default_value(1000),
      "Claim and deadline sweep period, 0 disables")(
      "claim-timeout-ms",
      po::value<uint64_t>(&config.scheduler.claim_timeout)->default_value(30000),
      "CLAIMED tasks older than this return to PENDING")(
      "execution-deadline-ms",
      po::value<uint64_t>(&config.scheduler.execution_deadline)
          ->default_value(0),
      "IN_PROGRESS tasks older than this fail, 0 disables")(
      "max-input-bytes",
      po::value<std::size_t>(&config.router.max_input_bytes)
          ->default_value(10000),
      "Largest admitted request")(
      "idempotency-window-ms",
      po::value<uint64_t>(&config.router.idempotency_window)
          ->default_value(300000),
      "Duplicate requests inside this window get the first decision")(
      "classifier-timeout-ms",
      po::value<uint64_t>(&config.router.classifier_timeout)->default_value(500),
      "Intent classifier budget before falling back to LOW")(
      "admission-workers",
      po::value<std::size_t>(&config.router.admission_workers)
          ->default_value(4),
      "Admission pool threads")(
      "classifier-workers",
      po::value<std::size_t>(&config.router.classifier_workers)
          ->default_value(2),
      "Classifier pool threads")(
      "max-retries",
      po::value<uint32_t>(&config.router.max_retries)->default_value(3),
      "Failures before a task is DEAD")(
      "persistence-retries",
      po::value<uint32_t>(&config.ledger.persistence_retry_attempts)
          ->default_value(5),
      "Ledger write attempts before halting")(
      "persistence-backoff-ms",
      po::value<uint64_t>(&config.ledger.persistence_backoff)->default_value(10),
      "First ledger retry delay, doubled per attempt")(
      "bootstrap-agent",
      po::value<std::vector<std::string>>(&bootstrap_specs)->composing(),
      "id:scheme:public_key_hex:signature_hex[:cap,cap], repeatable");

  auto description = po::options_description{"Covenant"};
  description.add(generic).add(kernel_options);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
    if (!config_path.empty()) {
      auto file = std::ifstream{config_path};
      if (!file.good()) {
        std::cerr << "Cannot open config file '" << config_path << "'"
                  << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(file, kernel_options), vm);
      po::notify(vm);
    }
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "covenant", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  config.database_path = database_path;
  config.policy_path = policy_path;
  for (const auto& entry : bootstrap_specs) {
    auto error = std::string{};
    auto agent = covenant::kernel::try_parse_bootstrap_agent(entry, error);
    if (!agent) {
      spdlog::error("Invalid --bootstrap-agent '{}': {}", entry, error);
      spdlog::shutdown();
      return 1;
    }
    config.bootstrap_agents.push_back(std::move(*agent));
  }

  auto kernel = covenant::kernel::kernel{std::move(config)};
  auto boot = kernel.init();
  if (boot.code != 0) {
    spdlog::critical("Boot failed in phase '{}': {}", boot.failed_phase,
                     boot.log);
    spdlog::shutdown();
    return 1;
  }

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = covenant::rpc::listener{kernel};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Could not start gRPC service on {}", grpc_address);
    kernel.shutdown();
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("gRPC service listening on {}", grpc_address);
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    auto serving = false;
    while (!shutdown_requested()) {
      auto healthy = kernel.healthy();
      if (healthy != serving) {
        if (!healthy) {
          spdlog::critical("Ledger halted, reporting NOT_SERVING: {}",
                           kernel.events().halt_reason());
        }
        grpc_server->GetHealthCheckService()->SetServingStatus(healthy);
        serving = healthy;
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  kernel.shutdown();
  spdlog::shutdown();
  return 0;
}
