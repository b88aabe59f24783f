// Repository: BatchScribe
// Component: Session Finalizer implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/session/Finalizer.hpp"

#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include "batchscribe/archive/IObjectStore.hpp"
#include "batchscribe/util/Logger.hpp"
#include "batchscribe/util/Timestamp.hpp"

namespace batchscribe::session {

using batchscribe::util::Logger;

const char* FinalizeReasonName(FinalizeReason reason) {
  switch (reason) {
    case FinalizeReason::kEndOfRecording: return "end_recording";
    case FinalizeReason::kDisconnect: return "disconnect";
  }
  return "disconnect";
}

Finalizer::Finalizer(SessionRegistry& registry,
                     archive::ArchiveDispatcher& dispatcher,
                     const time::ITimeSource& clock)
    : registry_(registry), dispatcher_(dispatcher), clock_(clock) {}

void Finalizer::Finalize(AudioSession& session, FinalizeReason reason) {
  const std::string id = session.session_id();
  session.BeginFinalizing();

  // 1. Final batch
  try {
    if (!session.chunk_meta().empty()) {
      session.RunBatch();
    }
  } catch (const std::exception& e) {
    Logger::Error("[Finalizer] Final batch failed session=" + id + " err=" + e.what());
  }

  // 2. Completion notice + close
  try {
    session.SendRecordingComplete();
    session.CloseSink();
  } catch (const std::exception& e) {
    Logger::Error("[Finalizer] Completion notice failed session=" + id + " err=" + e.what());
  }

  // 3. Idempotence guard
  if (session.finalized()) {
    Logger::Debug("[Finalizer] Already finalized session=" + id);
  } else {
    // 4-5. Full recording -> archive
    try {
      SubmitArchive(session, reason);
    } catch (const std::exception& e) {
      Logger::Error("[Finalizer] Archival failed session=" + id + " err=" + e.what());
    }
    session.MarkFinalized();
  }

  // 6. Registry removal
  try {
    registry_.Remove(id);
  } catch (const std::exception& e) {
    Logger::Error("[Finalizer] Registry removal failed session=" + id + " err=" + e.what());
  }
  session.MarkClosed();
}

void Finalizer::SubmitArchive(AudioSession& session, FinalizeReason reason) {
  const std::string& id = session.session_id();
  PackagedBatch full = session.BuildFullSessionWav();
  if (full.status == PackagedBatch::Status::kDecodeFailed) {
    Logger::Error("[Finalizer] Full recording decode failed session=" + id +
                  " err=" + full.error->message + " preview=" + full.error->preview);
    return;
  }
  if (!full.ready()) {
    Logger::Info("[Finalizer] No audio recorded, archival skipped session=" + id);
    return;
  }

  archive::Metadata extra;
  extra["source_format"] = SourceFormatName(session.source_format());
  extra["declared_mime"] = session.buffer().declared_mime();
  extra["total_chunks"] = std::to_string(session.total_chunk_count());
  extra["start_time"] = util::FormatUtcIso8601(session.start_ms());
  extra["end_reason"] = FinalizeReasonName(reason);

  archive::ArchiveJob job;
  job.session_id = id;
  job.metadata = archive::NormalizeMetadata(id, session.language(),
                                            util::FormatUtcIso8601(clock_.NowUtcMs()), extra);
  job.wav = std::move(full.wav);

  std::ostringstream oss;
  oss << "[Finalizer] Archive queued session=" << id << " reason=" << FinalizeReasonName(reason)
      << " wav_bytes=" << job.wav.size() << " chunks=" << session.total_chunk_count();
  Logger::Info(oss.str());

  dispatcher_.Submit(std::move(job));
}

}  // namespace batchscribe::session
