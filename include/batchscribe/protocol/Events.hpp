// Repository: BatchScribe
// Component: Session event types
// Purpose: Inbound client events and outbound server events exchanged over
//          the persistent connection.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_PROTOCOL_EVENTS_HPP_
#define BATCHSCRIBE_PROTOCOL_EVENTS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace batchscribe::protocol {

constexpr char kDefaultChunkMime[] = "audio/webm";

enum class InboundType {
  kAudioChunk,
  kStartRecording,
  kStopRecording,
  kEndRecording,
  kPing,
  kUnknown,
};

// InboundEvent is a flat record; only the fields of its type are meaningful.
struct InboundEvent {
  InboundType type = InboundType::kUnknown;
  std::string type_name;  // Raw "type" string (used for kUnknown acks)

  // audio_chunk
  std::vector<uint8_t> data;
  std::string timestamp;
  int64_t sequence_number = 0;
  std::string mime_type = kDefaultChunkMime;

  // start_recording
  std::optional<std::string> language;
};

enum class OutboundType {
  kConnection,
  kAudioAck,
  kBatchProcessing,
  kBatchTranscription,
  kRecordingComplete,
  kError,
  kPong,
  kRecordingStarted,
  kRecordingStopped,
  kUnknownMessage,
};

const char* OutboundTypeName(OutboundType type);

// OutboundEvent mirrors the JSON objects sent to the client. Serialization
// (EventCodec) emits only the fields belonging to the event's type.
struct OutboundEvent {
  OutboundType type = OutboundType::kError;
  std::string timestamp;
  std::string message;

  std::string session_id;       // connection
  int64_t sequence_number = 0;  // audio_ack
  uint64_t batch_size = 0;      // audio_ack
  std::string processed_at;     // audio_ack

  std::string text;             // batch_transcription
  double confidence = 0.0;
  uint64_t chunk_count = 0;
  double duration_seconds = 0.0;

  uint64_t total_chunks_processed = 0;  // recording_complete
  std::string language;                 // recording_started
};

}  // namespace batchscribe::protocol

#endif  // BATCHSCRIBE_PROTOCOL_EVENTS_HPP_
