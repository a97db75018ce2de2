// Repository: ReelForge
// Component: TemplateForge Server
// Purpose: Hosts TemplateServiceImpl on a gRPC listener with a file-backed
//          template store.
// Copyright (c) 2025 ReelForge

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "TemplateService.h"
#include "reelforge/decode/FFmpegFrameDecoder.h"
#include "reelforge/store/FileTemplateStore.hpp"
#include "reelforge/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string listen = "0.0.0.0:50061";
  std::string store_dir = "./reelforge-templates";
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Serves reelforge.v1.TemplateForge.\n"
            << "\n"
            << "  --listen ADDR        Listen address (default: 0.0.0.0:50061)\n"
            << "  --store DIR          Template store directory (default: ./reelforge-templates)\n"
            << "  --help               Show this help message\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen = argv[++i];
    } else if (arg == "--store" && i + 1 < argc) {
      args.store_dir = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace reelforge;

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

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::unique_ptr<store::FileTemplateStore> template_store;
  try {
    template_store = std::make_unique<store::FileTemplateStore>(args.store_dir);
  } catch (const std::runtime_error& e) {
    util::Logger::Error(std::string("[reelforge_server] ") + e.what());
    return 1;
  }

  time::SystemTimeSource clock;
  auto factory = [&clock](const std::string& uri) -> std::unique_ptr<sampling::IFrameDecoder> {
    decode::DecoderConfig decoder_config;
    decoder_config.input_uri = uri;
    return std::make_unique<decode::FFmpegFrameDecoder>(decoder_config, clock);
  };

  service::TemplateServiceImpl service(factory, clock, pipeline::PipelineConfig(),
                                       template_store.get());

  grpc::ServerBuilder builder;
  int selected_port = 0;
  builder.AddListeningPort(args.listen, grpc::InsecureServerCredentials(), &selected_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || selected_port == 0) {
    util::Logger::Error("[reelforge_server] failed to listen on " + args.listen);
    return 1;
  }

  util::Logger::Info("[reelforge_server] listening on " + args.listen + " store=" +
                     template_store->root());

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  util::Logger::Info("[reelforge_server] shutting down");
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  server->Wait();
  return 0;
}
