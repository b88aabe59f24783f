// Repository: BatchScribe
// Component: Audio Session State Machine implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/session/AudioSession.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "batchscribe/audio/CanonicalFormat.hpp"
#include "batchscribe/util/Logger.hpp"
#include "batchscribe/util/Timestamp.hpp"

namespace batchscribe::session {

using batchscribe::protocol::InboundEvent;
using batchscribe::protocol::InboundType;
using batchscribe::protocol::OutboundEvent;
using batchscribe::protocol::OutboundType;
using batchscribe::util::Logger;

namespace {

audio::ICodecTranscoder& RequireTranscoder(audio::ICodecTranscoder* transcoder) {
  if (!transcoder) {
    throw std::invalid_argument("AudioSession requires a codec transcoder");
  }
  return *transcoder;
}

}  // namespace

AudioSession::AudioSession(std::string session_id,
                           SessionSettings settings,
                           SessionCollaborators collaborators,
                           std::shared_ptr<protocol::IEventSink> sink)
    : session_id_(std::move(session_id)),
      settings_(std::move(settings)),
      collaborators_(collaborators),
      sink_(std::move(sink)),
      packager_(RequireTranscoder(collaborators.transcoder)),
      language_(settings_.default_language) {
  if (!collaborators_.oracle || !collaborators_.clock) {
    throw std::invalid_argument("AudioSession requires an oracle and a clock");
  }
  start_ms_ = NowMs();
  last_batch_ms_ = start_ms_;
}

int64_t AudioSession::NowMs() const { return collaborators_.clock->NowUtcMs(); }

void AudioSession::Emit(OutboundEvent event) {
  if (!sink_ || !sink_->IsOpen()) return;
  if (event.timestamp.empty()) {
    event.timestamp = util::FormatUtcIso8601(NowMs());
  }
  if (!sink_->Send(event)) {
    Logger::Debug("[AudioSession] Send dropped session=" + session_id_ +
                  " type=" + protocol::OutboundTypeName(event.type));
  }
}

void AudioSession::SendConnectionNotice() {
  OutboundEvent e;
  e.type = OutboundType::kConnection;
  e.message = "WebSocket connected successfully";
  e.session_id = session_id_;
  Emit(std::move(e));
}

void AudioSession::SendError(const std::string& message) {
  OutboundEvent e;
  e.type = OutboundType::kError;
  e.message = message;
  Emit(std::move(e));
}

void AudioSession::SendRecordingComplete() {
  OutboundEvent e;
  e.type = OutboundType::kRecordingComplete;
  e.message = "Recording session completed";
  e.total_chunks_processed = total_chunk_count_;
  Emit(std::move(e));
}

void AudioSession::CloseSink() {
  if (sink_ && sink_->IsOpen()) sink_->Close();
}

void AudioSession::OnAudioChunk(const InboundEvent& chunk) {
  if (state_ != State::kActive) {
    Logger::Debug("[AudioSession] Chunk ignored, session not active session=" + session_id_);
    return;
  }

  const SourceFormat declared = audio::IsStreamingContainerMime(chunk.mime_type)
                                    ? SourceFormat::kStreamingContainer
                                    : SourceFormat::kRawPcmContainer;
  if (buffer_.format() == SourceFormat::kUnknown) {
    buffer_.FixFormat(declared, chunk.mime_type);
    Logger::Info("[AudioSession] Source format fixed session=" + session_id_ +
                 " format=" + SourceFormatName(declared) + " mime=" + chunk.mime_type);
  } else if (declared != buffer_.format()) {
    std::ostringstream oss;
    oss << "[AudioSession] Chunk format differs from session format, keeping "
        << SourceFormatName(buffer_.format()) << " session=" << session_id_
        << " seq=" << chunk.sequence_number << " mime=" << chunk.mime_type;
    Logger::Debug(oss.str());
  }

  ChunkMeta meta;
  meta.sequence_number = chunk.sequence_number;
  meta.timestamp = chunk.timestamp;
  meta.declared_mime = chunk.mime_type;

  if (buffer_.format() == SourceFormat::kStreamingContainer) {
    buffer_.AppendContainerBytes(chunk.data);
  } else {
    audio::DecodeResult decoded =
        audio::DecodeWithFallback(*collaborators_.transcoder, chunk.data, chunk.mime_type);
    if (!decoded.ok()) {
      std::ostringstream oss;
      oss << "[AudioSession] Chunk decode failed session=" << session_id_
          << " seq=" << chunk.sequence_number << " bytes=" << chunk.data.size()
          << " error=" << decoded.error->message << " preview=" << decoded.error->preview;
      Logger::Warn(oss.str());

      std::ostringstream msg;
      msg << "Failed to process audio chunk " << chunk.sequence_number << ": "
          << decoded.error->message;
      SendError(msg.str());
      return;
    }
    meta.decoded_bytes = decoded.pcm.size();
    buffer_.AppendPcm(decoded.pcm);
  }

  chunk_meta_.push_back(std::move(meta));
  ++total_chunk_count_;

  {
    std::ostringstream oss;
    oss << "[AudioSession] Chunk received session=" << session_id_
        << " seq=" << chunk.sequence_number << " bytes=" << chunk.data.size()
        << " pending=" << chunk_meta_.size() << " total=" << total_chunk_count_;
    Logger::Debug(oss.str());
  }

  OutboundEvent ack;
  ack.type = OutboundType::kAudioAck;
  ack.message = "Audio chunk received";
  ack.sequence_number = chunk.sequence_number;
  ack.batch_size = chunk_meta_.size();
  ack.processed_at = util::FormatUtcIso8601(NowMs());
  // Echoes the client's chunk timestamp; server time when the client sent none.
  ack.timestamp = chunk.timestamp;
  Emit(std::move(ack));

  if (ShouldTrigger(chunk_meta_.size(), NowMs(), last_batch_ms_, settings_.policy)) {
    RunBatch();
  }
}

bool AudioSession::RunBatch() {
  if (state_ == State::kClosed) return false;

  PackagedBatch batch = packager_.Package(buffer_);
  if (batch.status == PackagedBatch::Status::kNoNewAudio) {
    return false;
  }
  if (batch.status == PackagedBatch::Status::kDecodeFailed) {
    std::ostringstream oss;
    oss << "[AudioSession] Batch decode failed session=" << session_id_
        << " container_bytes=" << buffer_.container_bytes().size()
        << " error=" << batch.error->message << " preview=" << batch.error->preview;
    Logger::Warn(oss.str());
    SendError("Batch processing failed: " + batch.error->message);
    return false;
  }

  const size_t chunk_count = chunk_meta_.size();
  {
    std::ostringstream msg;
    msg << "Processing batch of " << chunk_count << " chunks (" << batch.pcm_bytes << " bytes)";
    OutboundEvent e;
    e.type = OutboundType::kBatchProcessing;
    e.message = msg.str();
    Emit(std::move(e));
  }

  transcription::TranscriptionOutcome outcome =
      collaborators_.oracle->Transcribe(batch.wav, language_);
  if (!outcome.ok()) {
    std::ostringstream oss;
    oss << "[AudioSession] Transcription failed session=" << session_id_
        << " chunks=" << chunk_count << " pcm_bytes=" << batch.pcm_bytes
        << " error=" << outcome.error.message;
    Logger::Error(oss.str());
    SendError("Batch processing failed: " + outcome.error.message);
    return false;
  }

  BatchPackager::Commit(buffer_, batch);

  OutboundEvent e;
  e.type = OutboundType::kBatchTranscription;
  e.text = outcome.result->text;
  e.confidence = outcome.result->confidence;
  e.chunk_count = chunk_count;
  e.duration_seconds = audio::PcmDurationSeconds(batch.pcm_bytes);
  Emit(std::move(e));

  chunk_meta_.clear();
  last_batch_ms_ = NowMs();
  ++batches_transcribed_;

  std::ostringstream oss;
  oss << "[AudioSession] Batch transcribed session=" << session_id_
      << " chunks=" << chunk_count << " pcm_bytes=" << batch.pcm_bytes
      << " chars=" << outcome.result->text.size();
  Logger::Info(oss.str());
  return true;
}

void AudioSession::OnStartRecording(const std::optional<std::string>& language) {
  if (state_ != State::kActive) return;
  if (language) language_ = *language;
  Logger::Info("[AudioSession] Recording started session=" + session_id_ +
               " language=" + language_);

  OutboundEvent e;
  e.type = OutboundType::kRecordingStarted;
  e.message = "Recording session started";
  e.language = language_;
  Emit(std::move(e));
}

void AudioSession::OnControl(const InboundEvent& event) {
  if (state_ != State::kActive) return;

  OutboundEvent e;
  switch (event.type) {
    case InboundType::kPing:
      e.type = OutboundType::kPong;
      break;
    case InboundType::kStopRecording:
      e.type = OutboundType::kRecordingStopped;
      e.message = "Recording session stopped";
      break;
    default:
      e.type = OutboundType::kUnknownMessage;
      e.message = "Unknown message type: " + event.type_name;
      break;
  }
  Emit(std::move(e));
}

bool AudioSession::BeginFinalizing() {
  if (state_ != State::kActive) return false;
  state_ = State::kFinalizing;
  return true;
}

}  // namespace batchscribe::session
