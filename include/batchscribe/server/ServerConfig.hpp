// Repository: BatchScribe
// Component: Server Configuration
// Purpose: Defaults, environment variables and command-line flags merged
//          into one validated ServerConfig.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SERVER_SERVER_CONFIG_HPP_
#define BATCHSCRIBE_SERVER_SERVER_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

#include "batchscribe/session/BatchTriggerPolicy.hpp"

namespace batchscribe::server {

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8000;
  std::string ws_path = "/ws/audio";

  session::BatchPolicyConfig policy;
  std::string default_language = "en";

  // gRPC target of the transcription service; empty disables transcription.
  std::string transcriber_target;
  int64_t transcribe_deadline_ms = 30000;

  // "grpc://host:port" for the archive service, a directory for local
  // archival, empty to skip archival.
  std::string archive_target;
  int64_t archive_deadline_ms = 60000;

  bool show_help = false;
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// Precedence: defaults < environment < flags. Throws std::invalid_argument
// for unknown flags, missing flag values, malformed numbers and any
// ValidateServerConfig() violation.
ServerConfig LoadServerConfig(int argc, const char* const* argv, const EnvLookup& env);

// "host:port" or ":port". Throws std::invalid_argument.
void ParseListenAddress(const std::string& text, std::string* host, uint16_t* port);

// min_chunks >= 1, max_chunks >= min_chunks, window_ms > 0, port != 0,
// ws_path starts with '/', deadlines > 0.
void ValidateServerConfig(const ServerConfig& config);

void PrintUsage(std::ostream& os, const char* prog);

}  // namespace batchscribe::server

#endif  // BATCHSCRIBE_SERVER_SERVER_CONFIG_HPP_
