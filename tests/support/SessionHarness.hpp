#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "batchscribe/protocol/Events.hpp"
#include "batchscribe/session/AudioSession.hpp"
#include "fixtures/FakeTranscoder.h"
#include "fixtures/FakeTranscriptionOracle.h"
#include "fixtures/RecordingEventSink.h"
#include "support/DeterministicTimeSource.hpp"

namespace batchscribe::tests {

constexpr char kRawMime[] = "audio/wav";
constexpr char kStreamingMime[] = "audio/webm;codecs=opus";

// n bytes; first byte is `lead`, the rest count up from it.
inline std::vector<uint8_t> Payload(uint8_t lead, size_t n) {
  std::vector<uint8_t> out(n);
  for (size_t i = 0; i < n; ++i) {
    out[i] = static_cast<uint8_t>(lead + i);
  }
  return out;
}

inline protocol::InboundEvent Chunk(int64_t seq,
                                    std::vector<uint8_t> data,
                                    const std::string& mime = kRawMime) {
  protocol::InboundEvent e;
  e.type = protocol::InboundType::kAudioChunk;
  e.type_name = "audio_chunk";
  e.sequence_number = seq;
  e.data = std::move(data);
  e.mime_type = mime;
  e.timestamp = "2026-02-13T12:00:00.000Z";
  return e;
}

inline protocol::InboundEvent Control(protocol::InboundType type, const std::string& name) {
  protocol::InboundEvent e;
  e.type = type;
  e.type_name = name;
  return e;
}

// Collaborators for one AudioSession under test. Defaults: min 5, max 20,
// 5 s window, language "en".
struct SessionHarness {
  DeterministicTimeSource clock;
  fixtures::FakeTranscoder transcoder;
  fixtures::FakeTranscriptionOracle oracle;
  std::shared_ptr<fixtures::RecordingEventSink> sink =
      std::make_shared<fixtures::RecordingEventSink>();
  session::SessionSettings settings;

  session::SessionCollaborators Collaborators() {
    session::SessionCollaborators c;
    c.transcoder = &transcoder;
    c.oracle = &oracle;
    c.clock = &clock;
    return c;
  }

  std::unique_ptr<session::AudioSession> MakeSession(const std::string& id = "session_test") {
    return std::make_unique<session::AudioSession>(id, settings, Collaborators(), sink);
  }
};

}  // namespace batchscribe::tests
