// Repository: BatchScribe
// Component: Server Configuration implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/server/ServerConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace batchscribe::server {

namespace {

int64_t ParseInt(const std::string& name, const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument(name + ": empty value");
  }
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end != text.c_str() + text.size()) {
    throw std::invalid_argument(name + ": not an integer: " + text);
  }
  return static_cast<int64_t>(v);
}

size_t ParseCount(const std::string& name, const std::string& text) {
  int64_t v = ParseInt(name, text);
  if (v < 0) {
    throw std::invalid_argument(name + ": must not be negative");
  }
  return static_cast<size_t>(v);
}

void ApplyEnvironment(ServerConfig& config, const EnvLookup& env) {
  auto get = [&env](const char* name) -> std::string {
    const char* v = env ? env(name) : nullptr;
    return v ? std::string(v) : std::string();
  };

  std::string v;
  if (!(v = get("BATCHSCRIBE_LISTEN")).empty()) {
    ParseListenAddress(v, &config.host, &config.port);
  }
  if (!(v = get("BATCHSCRIBE_TRANSCRIBER")).empty()) config.transcriber_target = v;
  if (!(v = get("BATCHSCRIBE_ARCHIVE")).empty()) config.archive_target = v;
  if (!(v = get("BATCHSCRIBE_LANGUAGE")).empty()) config.default_language = v;
  if (!(v = get("BATCHSCRIBE_MIN_CHUNKS")).empty()) {
    config.policy.min_chunks = ParseCount("BATCHSCRIBE_MIN_CHUNKS", v);
  }
  if (!(v = get("BATCHSCRIBE_MAX_CHUNKS")).empty()) {
    config.policy.max_chunks = ParseCount("BATCHSCRIBE_MAX_CHUNKS", v);
  }
  if (!(v = get("BATCHSCRIBE_WINDOW_MS")).empty()) {
    config.policy.window_ms = ParseInt("BATCHSCRIBE_WINDOW_MS", v);
  }
  if (!(v = get("BATCHSCRIBE_TRANSCRIBE_DEADLINE_MS")).empty()) {
    config.transcribe_deadline_ms = ParseInt("BATCHSCRIBE_TRANSCRIBE_DEADLINE_MS", v);
  }
}

}  // namespace

void ParseListenAddress(const std::string& text, std::string* host, uint16_t* port) {
  const size_t colon = text.rfind(':');
  if (colon == std::string::npos) {
    throw std::invalid_argument("listen address must be host:port: " + text);
  }
  int64_t p = ParseInt("port", text.substr(colon + 1));
  if (p < 1 || p > 65535) {
    throw std::invalid_argument("port out of range: " + text.substr(colon + 1));
  }
  std::string h = text.substr(0, colon);
  *host = h.empty() ? "0.0.0.0" : h;
  *port = static_cast<uint16_t>(p);
}

void ValidateServerConfig(const ServerConfig& config) {
  if (config.policy.min_chunks < 1) {
    throw std::invalid_argument("min-chunks must be >= 1");
  }
  if (config.policy.max_chunks < config.policy.min_chunks) {
    throw std::invalid_argument("max-chunks must be >= min-chunks");
  }
  if (config.policy.window_ms <= 0) {
    throw std::invalid_argument("window-ms must be > 0");
  }
  if (config.port == 0) {
    throw std::invalid_argument("port must be in 1..65535");
  }
  if (config.ws_path.empty() || config.ws_path[0] != '/') {
    throw std::invalid_argument("path must start with '/'");
  }
  if (config.transcribe_deadline_ms <= 0 || config.archive_deadline_ms <= 0) {
    throw std::invalid_argument("deadlines must be > 0");
  }
}

ServerConfig LoadServerConfig(int argc, const char* const* argv, const EnvLookup& env) {
  ServerConfig config;
  ApplyEnvironment(config, env);

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
    } else if (arg == "--listen") {
      ParseListenAddress(value(), &config.host, &config.port);
    } else if (arg == "--path") {
      config.ws_path = value();
    } else if (arg == "--transcriber") {
      config.transcriber_target = value();
    } else if (arg == "--transcribe-deadline-ms") {
      config.transcribe_deadline_ms = ParseInt(arg, value());
    } else if (arg == "--archive") {
      config.archive_target = value();
    } else if (arg == "--language") {
      config.default_language = value();
    } else if (arg == "--min-chunks") {
      config.policy.min_chunks = ParseCount(arg, value());
    } else if (arg == "--max-chunks") {
      config.policy.max_chunks = ParseCount(arg, value());
    } else if (arg == "--window-ms") {
      config.policy.window_ms = ParseInt(arg, value());
    } else {
      throw std::invalid_argument("unknown argument: " + arg);
    }
  }

  if (!config.show_help) {
    ValidateServerConfig(config);
  }
  return config;
}

void PrintUsage(std::ostream& os, const char* prog) {
  os << "Usage: " << prog << " [options]\n"
     << "  --listen <host:port>            Listen address (default 0.0.0.0:8000)\n"
     << "  --path <path>                   WebSocket path (default /ws/audio)\n"
     << "  --transcriber <host:port>       Transcription gRPC service (default: disabled)\n"
     << "  --transcribe-deadline-ms <ms>   Per-batch transcription deadline (default 30000)\n"
     << "  --archive <dir|grpc://host:port>  Recording archive (default: disabled)\n"
     << "  --language <code>               Default language (default en)\n"
     << "  --min-chunks <n>                Batch after n chunks (default 5)\n"
     << "  --max-chunks <n>                Hard cap on chunks per batch (default 20)\n"
     << "  --window-ms <ms>                Batch at least every ms (default 5000)\n"
     << "  --help                          Show this message\n"
     << "\n"
     << "Environment: BATCHSCRIBE_LISTEN, BATCHSCRIBE_TRANSCRIBER, BATCHSCRIBE_ARCHIVE,\n"
     << "  BATCHSCRIBE_LANGUAGE, BATCHSCRIBE_MIN_CHUNKS, BATCHSCRIBE_MAX_CHUNKS,\n"
     << "  BATCHSCRIBE_WINDOW_MS, BATCHSCRIBE_TRANSCRIBE_DEADLINE_MS, BATCHSCRIBE_DEBUG\n";
}

}  // namespace batchscribe::server
