// Repository: BatchScribe
// Component: Audio Session State Machine
// Purpose: Owns one connection's buffer, trigger policy and lifecycle;
//          driven by that connection's ordered stream of inbound events.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SESSION_AUDIO_SESSION_HPP_
#define BATCHSCRIBE_SESSION_AUDIO_SESSION_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "batchscribe/audio/ICodecTranscoder.hpp"
#include "batchscribe/protocol/Events.hpp"
#include "batchscribe/protocol/IEventSink.hpp"
#include "batchscribe/session/BatchPackager.hpp"
#include "batchscribe/session/BatchTriggerPolicy.hpp"
#include "batchscribe/session/FormatAwareBuffer.hpp"
#include "batchscribe/time/ITimeSource.hpp"
#include "batchscribe/transcription/ITranscriptionOracle.hpp"

namespace batchscribe::session {

struct ChunkMeta {
  int64_t sequence_number = 0;
  std::string timestamp;
  std::string declared_mime;
  size_t decoded_bytes = 0;  // 0 for streaming chunks (decoded per batch)
};

struct SessionSettings {
  BatchPolicyConfig policy;
  std::string default_language = "en";
};

// Long-lived collaborators shared by every session. Not owned.
struct SessionCollaborators {
  audio::ICodecTranscoder* transcoder = nullptr;
  transcription::ITranscriptionOracle* oracle = nullptr;
  const time::ITimeSource* clock = nullptr;
};

// AudioSession is the per-connection state machine.
//
//   kActive ──end_recording / disconnect──> kFinalizing ──> kClosed
//
// Events are accepted only while kActive. kClosed is terminal.
//
// Chunk and batch level failures (DecodeError, TranscriptionError) are
// reported to the client as "error" events and never leave kActive; the
// affected audio stays pending because offsets move only on success.
//
// Thread Safety: none. Every method runs on the owning connection thread.
class AudioSession {
 public:
  enum class State { kActive, kFinalizing, kClosed };

  AudioSession(std::string session_id,
               SessionSettings settings,
               SessionCollaborators collaborators,
               std::shared_ptr<protocol::IEventSink> sink);

  AudioSession(const AudioSession&) = delete;
  AudioSession& operator=(const AudioSession&) = delete;

  // --- Inbound events (kActive only) ---
  void OnAudioChunk(const protocol::InboundEvent& chunk);
  void OnStartRecording(const std::optional<std::string>& language);
  // ping -> pong, stop_recording -> recording_stopped,
  // anything else -> unknown_message.
  void OnControl(const protocol::InboundEvent& event);

  // --- Outbound notices ---
  void SendConnectionNotice();
  void SendError(const std::string& message);
  void SendRecordingComplete();
  void CloseSink();

  // Packages and transcribes whatever is pending, without consulting the
  // trigger policy.
  // Returns true when a batch_transcription was emitted.
  bool RunBatch();

  // --- Lifecycle (Finalizer) ---
  // kActive -> kFinalizing. False if the session already left kActive.
  bool BeginFinalizing();
  void MarkClosed() { state_ = State::kClosed; }
  void MarkFinalized() { finalized_ = true; }

  // Full-session recording (for archival).
  PackagedBatch BuildFullSessionWav() { return packager_.BuildFullSessionWav(buffer_); }

  // --- Accessors ---
  [[nodiscard]] const std::string& session_id() const { return session_id_; }
  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] bool finalized() const { return finalized_; }
  [[nodiscard]] const std::string& language() const { return language_; }
  [[nodiscard]] SourceFormat source_format() const { return buffer_.format(); }
  [[nodiscard]] const FormatAwareBuffer& buffer() const { return buffer_; }
  [[nodiscard]] const std::vector<ChunkMeta>& chunk_meta() const { return chunk_meta_; }
  [[nodiscard]] uint64_t total_chunk_count() const { return total_chunk_count_; }
  [[nodiscard]] int64_t start_ms() const { return start_ms_; }
  [[nodiscard]] int64_t last_batch_ms() const { return last_batch_ms_; }
  [[nodiscard]] uint64_t batches_transcribed() const { return batches_transcribed_; }

 private:
  void Emit(protocol::OutboundEvent event);
  int64_t NowMs() const;

  std::string session_id_;
  SessionSettings settings_;
  SessionCollaborators collaborators_;
  std::shared_ptr<protocol::IEventSink> sink_;
  BatchPackager packager_;

  State state_ = State::kActive;
  bool finalized_ = false;
  std::string language_;

  FormatAwareBuffer buffer_;
  std::vector<ChunkMeta> chunk_meta_;
  uint64_t total_chunk_count_ = 0;
  int64_t start_ms_ = 0;
  int64_t last_batch_ms_ = 0;
  uint64_t batches_transcribed_ = 0;
};

}  // namespace batchscribe::session

#endif  // BATCHSCRIBE_SESSION_AUDIO_SESSION_HPP_
