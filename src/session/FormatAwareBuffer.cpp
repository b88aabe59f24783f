// Repository: BatchScribe
// Component: Format-Aware Buffer implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/session/FormatAwareBuffer.hpp"

#include <algorithm>

namespace batchscribe::session {

const char* SourceFormatName(SourceFormat format) {
  switch (format) {
    case SourceFormat::kRawPcmContainer: return "raw_pcm_container";
    case SourceFormat::kStreamingContainer: return "streaming_container";
    case SourceFormat::kUnknown: break;
  }
  return "unknown";
}

bool FormatAwareBuffer::FixFormat(SourceFormat format, const std::string& declared_mime) {
  if (format_ != SourceFormat::kUnknown || format == SourceFormat::kUnknown) {
    return false;
  }
  format_ = format;
  declared_mime_ = declared_mime;
  return true;
}

void FormatAwareBuffer::AppendPcm(const audio::PcmBytes& pcm) {
  pcm_batch_buffer_.insert(pcm_batch_buffer_.end(), pcm.begin(), pcm.end());
  full_session_pcm_.insert(full_session_pcm_.end(), pcm.begin(), pcm.end());
}

audio::PcmBytes FormatAwareBuffer::PendingPcm() const {
  return audio::PcmBytes(pcm_batch_buffer_.begin() + static_cast<std::ptrdiff_t>(batch_offset_),
                         pcm_batch_buffer_.end());
}

void FormatAwareBuffer::CommitPcmBatch(size_t end) {
  end = std::min(end, pcm_batch_buffer_.size());
  if (end < batch_offset_) return;
  pcm_batch_buffer_.erase(pcm_batch_buffer_.begin(),
                          pcm_batch_buffer_.begin() + static_cast<std::ptrdiff_t>(end));
  compacted_bytes_ += end;
  batch_offset_ = 0;
}

void FormatAwareBuffer::AppendContainerBytes(const std::vector<uint8_t>& bytes) {
  container_bytes_.insert(container_bytes_.end(), bytes.begin(), bytes.end());
}

void FormatAwareBuffer::AdvanceProcessedPcmOffset(size_t end) {
  processed_pcm_offset_ = std::max(processed_pcm_offset_, end);
}

}  // namespace batchscribe::session
