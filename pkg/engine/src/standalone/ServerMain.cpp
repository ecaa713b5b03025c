// Repository: ReelPlan
// Component: reelplan_server
// Purpose: Hosts PlanService for the orchestrator.
// Copyright (c) 2026 ReelPlan

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "plan_service.h"
#include "reelplan/plan/SchemaValidator.hpp"
#include "reelplan/util/Logger.hpp"

namespace {

using reelplan::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string listen_address = "127.0.0.1:50061";
  std::string schema_path = "schemas/plan_schema.json";
  reelplan::plan::ValidationConfig validation;
  reelplan::timeline::CompositionConfig composition;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "  --listen ADDR        Listen address (default: 127.0.0.1:50061)\n"
            << "  --schema FILE        Plan JSON schema (default: schemas/plan_schema.json)\n"
            << "  --lead SEC           Default v2 lead silence (default: 1.5)\n"
            << "  --trail SEC          Default v2 trail silence (default: 2.0)\n"
            << "  --min SEC            Default v2 minimum segment (default: 6.0)\n"
            << "  --clips N            Default v1 clip count (default: 6)\n"
            << "  --clip-sec SEC       Default v1 clip duration (default: 10.0)\n"
            << "  --help               Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      bool has_value = i + 1 < argc;

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--listen" && has_value) {
        args.listen_address = argv[++i];
      } else if (arg == "--schema" && has_value) {
        args.schema_path = argv[++i];
      } else if (arg == "--lead" && has_value) {
        args.composition.lead_sec = std::stod(argv[++i]);
      } else if (arg == "--trail" && has_value) {
        args.composition.trail_sec = std::stod(argv[++i]);
      } else if (arg == "--min" && has_value) {
        args.composition.min_segment_sec = std::stod(argv[++i]);
      } else if (arg == "--clips" && has_value) {
        args.validation.fixed_clip_count = std::stoi(argv[++i]);
      } else if (arg == "--clip-sec" && has_value) {
        args.validation.fixed_clip_sec = std::stod(argv[++i]);
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric value: ") + e.what();
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  // A bad schema is reported at startup; the service still comes up and
  // answers plan RPCs with INTERNAL.
  auto schema = reelplan::plan::SchemaValidator::Load(args.schema_path);
  if (!schema.valid) {
    Logger::Error("[reelplan_server] " + schema.failure.Describe());
  }

  reelplan::service::PlanServiceImpl service(std::move(schema), args.validation,
                                             args.composition);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(args.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[reelplan_server] Failed to listen on " + args.listen_address);
    return 1;
  }
  Logger::Info("[reelplan_server] Listening on " + args.listen_address);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[reelplan_server] Shutting down");
  server->Shutdown();
  return 0;
}
