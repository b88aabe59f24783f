// Repository: BatchScribe
// Component: Server entry point
// Purpose: Wires configuration, collaborators, the session engine and the
//          WebSocket listener; runs until SIGINT/SIGTERM.
// Copyright (c) 2025 BatchScribe

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "batchscribe/archive/ArchiveDispatcher.hpp"
#include "batchscribe/archive/FileObjectStore.hpp"
#include "batchscribe/archive/GrpcArchiveClient.hpp"
#include "batchscribe/audio/FfmpegTranscoder.hpp"
#include "batchscribe/server/ServerConfig.hpp"
#include "batchscribe/server/WebSocketServer.hpp"
#include "batchscribe/session/Finalizer.hpp"
#include "batchscribe/session/SessionRegistry.hpp"
#include "batchscribe/time/SystemTimeSource.hpp"
#include "batchscribe/transcription/GrpcTranscriptionClient.hpp"
#include "batchscribe/transcription/ITranscriptionOracle.hpp"
#include "batchscribe/util/Logger.hpp"

namespace {

using batchscribe::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

constexpr char kGrpcScheme[] = "grpc://";

// *grpc_client is set when the oracle is the gRPC client (for exit stats).
std::unique_ptr<batchscribe::transcription::ITranscriptionOracle> MakeOracle(
    const batchscribe::server::ServerConfig& config,
    batchscribe::transcription::GrpcTranscriptionClient** grpc_client) {
  *grpc_client = nullptr;
  if (config.transcriber_target.empty()) {
    Logger::Warn("[main] No transcriber configured; batches will report errors");
    return std::make_unique<batchscribe::transcription::UnavailableTranscriptionOracle>();
  }
  auto client = std::make_unique<batchscribe::transcription::GrpcTranscriptionClient>(
      config.transcriber_target, std::chrono::milliseconds(config.transcribe_deadline_ms));
  *grpc_client = client.get();
  return client;
}

std::shared_ptr<batchscribe::archive::IObjectStore> MakeStore(
    const batchscribe::server::ServerConfig& config,
    const batchscribe::time::ITimeSource& clock) {
  const std::string& target = config.archive_target;
  if (target.rfind(kGrpcScheme, 0) == 0) {
    return std::make_shared<batchscribe::archive::GrpcArchiveClient>(
        target.substr(sizeof(kGrpcScheme) - 1),
        std::chrono::milliseconds(config.archive_deadline_ms));
  }
  if (target.empty()) {
    Logger::Info("[main] No archive configured; recordings will not be stored");
  }
  return std::make_shared<batchscribe::archive::FileObjectStore>(target, clock);
}

}  // namespace

int main(int argc, char** argv) {
  batchscribe::server::ServerConfig config;
  try {
    config = batchscribe::server::LoadServerConfig(argc, argv, [](const char* name) {
      return std::getenv(name);
    });
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    batchscribe::server::PrintUsage(std::cerr, argv[0]);
    return 1;
  }
  if (config.show_help) {
    batchscribe::server::PrintUsage(std::cout, argv[0]);
    return 0;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  try {
    batchscribe::time::SystemTimeSource clock;
    batchscribe::audio::FfmpegTranscoder transcoder;
    batchscribe::transcription::GrpcTranscriptionClient* grpc_oracle = nullptr;
    auto oracle = MakeOracle(config, &grpc_oracle);
    batchscribe::archive::ArchiveDispatcher dispatcher(MakeStore(config, clock));

    batchscribe::session::SessionSettings settings;
    settings.policy = config.policy;
    settings.default_language = config.default_language;

    batchscribe::session::SessionCollaborators collaborators;
    collaborators.transcoder = &transcoder;
    collaborators.oracle = oracle.get();
    collaborators.clock = &clock;

    batchscribe::session::SessionRegistry registry(settings, collaborators);
    batchscribe::session::Finalizer finalizer(registry, dispatcher, clock);
    batchscribe::server::WebSocketServer server(config, registry, finalizer, clock);

    Logger::Info("[main] Batch policy min_chunks=" + std::to_string(config.policy.min_chunks) +
                 " max_chunks=" + std::to_string(config.policy.max_chunks) +
                 " window_ms=" + std::to_string(config.policy.window_ms) +
                 " language=" + config.default_language);
    server.Start();
    Logger::Info("[main] Accepting sessions on port " + std::to_string(server.BoundPort()));

    while (server.IsRunning() && !g_termination_requested.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    Logger::Info("[main] Shutdown requested");
    server.Stop();
    dispatcher.WaitIdle();

    const auto stats = transcoder.GetStats();
    Logger::Info("[main] Exit decodes_ok=" + std::to_string(stats.decodes_ok) +
                 " decodes_failed=" + std::to_string(stats.decodes_failed) +
                 " packets_skipped=" + std::to_string(stats.packets_skipped) +
                 " transcribe_failed=" +
                 (grpc_oracle ? std::to_string(grpc_oracle->CallsFailed()) : std::string("n/a")) +
                 " archived=" + std::to_string(dispatcher.JobsStored()) +
                 " archive_skipped=" + std::to_string(dispatcher.JobsSkipped()) +
                 " archive_failed=" + std::to_string(dispatcher.JobsFailed()));
  } catch (const std::exception& e) {
    Logger::Error(std::string("[main] Fatal: ") + e.what());
    return 1;
  }
  return 0;
}
