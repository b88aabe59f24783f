// Repository: BatchScribe
// Component: Batch Packager implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/session/BatchPackager.hpp"

#include <sstream>
#include <utility>

#include "batchscribe/util/Logger.hpp"

namespace batchscribe::session {

using batchscribe::util::Logger;

namespace {

PackagedBatch Ready(const uint8_t* pcm, size_t size, size_t slice_end) {
  PackagedBatch batch;
  batch.status = PackagedBatch::Status::kReady;
  batch.wav = audio::EncodeWav(pcm, size);
  batch.pcm_bytes = size;
  batch.slice_end = slice_end;
  return batch;
}

PackagedBatch DecodeFailed(audio::DecodeError error) {
  PackagedBatch batch;
  batch.status = PackagedBatch::Status::kDecodeFailed;
  batch.error = std::move(error);
  return batch;
}

}  // namespace

BatchPackager::BatchPackager(audio::ICodecTranscoder& transcoder)
    : transcoder_(transcoder) {}

PackagedBatch BatchPackager::Package(const FormatAwareBuffer& buffer) {
  if (buffer.format() == SourceFormat::kStreamingContainer) {
    const auto& container = buffer.container_bytes();
    if (container.empty()) return PackagedBatch{};

    audio::DecodeResult decoded =
        audio::DecodeWithFallback(transcoder_, container, buffer.declared_mime());
    if (!decoded.ok()) {
      return DecodeFailed(*decoded.error);
    }
    const size_t end = decoded.pcm.size();
    const size_t offset = buffer.processed_pcm_offset();
    if (end <= offset) {
      std::ostringstream oss;
      oss << "[BatchPackager] No new PCM after re-decode"
          << " container_bytes=" << container.size()
          << " decoded=" << end << " processed=" << offset;
      Logger::Debug(oss.str());
      return PackagedBatch{};
    }
    return Ready(decoded.pcm.data() + offset, end - offset, end);
  }

  if (buffer.format() == SourceFormat::kRawPcmContainer) {
    const auto& pcm = buffer.pcm_batch_buffer();
    const size_t offset = buffer.batch_offset();
    if (pcm.size() <= offset) return PackagedBatch{};
    return Ready(pcm.data() + offset, pcm.size() - offset, pcm.size());
  }

  return PackagedBatch{};
}

void BatchPackager::Commit(FormatAwareBuffer& buffer, const PackagedBatch& batch) {
  if (!batch.ready()) return;
  if (buffer.format() == SourceFormat::kStreamingContainer) {
    buffer.AdvanceProcessedPcmOffset(batch.slice_end);
  } else if (buffer.format() == SourceFormat::kRawPcmContainer) {
    buffer.CommitPcmBatch(batch.slice_end);
  }
}

PackagedBatch BatchPackager::BuildFullSessionWav(const FormatAwareBuffer& buffer) {
  if (buffer.format() == SourceFormat::kStreamingContainer) {
    const auto& container = buffer.container_bytes();
    if (container.empty()) return PackagedBatch{};
    audio::DecodeResult decoded =
        audio::DecodeWithFallback(transcoder_, container, buffer.declared_mime());
    if (!decoded.ok()) {
      return DecodeFailed(*decoded.error);
    }
    if (decoded.pcm.empty()) return PackagedBatch{};
    return Ready(decoded.pcm.data(), decoded.pcm.size(), decoded.pcm.size());
  }

  if (buffer.format() == SourceFormat::kRawPcmContainer) {
    const auto& pcm = buffer.full_session_pcm();
    if (pcm.empty()) return PackagedBatch{};
    return Ready(pcm.data(), pcm.size(), pcm.size());
  }

  return PackagedBatch{};
}

}  // namespace batchscribe::session
