// Repository: BatchScribe
// Component: Format-Aware Buffer
// Purpose: Per-session audio accumulation in one of two modes, fixed by the
//          first chunk of the session.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SESSION_FORMAT_AWARE_BUFFER_HPP_
#define BATCHSCRIBE_SESSION_FORMAT_AWARE_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "batchscribe/audio/CanonicalFormat.hpp"

namespace batchscribe::session {

enum class SourceFormat {
  kUnknown,
  kRawPcmContainer,     // Self-delimited chunks, decoded on arrival
  kStreamingContainer,  // Cumulative container, decoded from byte 0 per batch
};

const char* SourceFormatName(SourceFormat format);

// FormatAwareBuffer holds one session's audio.
//
// PCM-accumulator mode (kRawPcmContainer):
//   pcm_batch_buffer  decoded PCM since the last compaction
//   batch_offset      bytes of pcm_batch_buffer consumed by a prior batch
//   full_session_pcm  every decoded byte, append-only (archival)
//
// Container-accumulator mode (kStreamingContainer):
//   container_bytes       raw cumulative bytes, never compacted
//   processed_pcm_offset  bytes of the decoded stream already batched;
//                         non-decreasing, never reset
//
// Invariants:
// - format() changes at most once, from kUnknown.
// - batch_offset() <= pending size at every observation point.
//
// Thread Safety: none. Owned and mutated by one session thread.
class FormatAwareBuffer {
 public:
  FormatAwareBuffer() = default;

  // Fixes the mode on the first call; later calls are ignored and return
  // false.
  bool FixFormat(SourceFormat format, const std::string& declared_mime);

  [[nodiscard]] SourceFormat format() const { return format_; }
  [[nodiscard]] const std::string& declared_mime() const { return declared_mime_; }

  // --- PCM-accumulator mode ---
  void AppendPcm(const audio::PcmBytes& pcm);

  [[nodiscard]] const audio::PcmBytes& pcm_batch_buffer() const { return pcm_batch_buffer_; }
  [[nodiscard]] size_t batch_offset() const { return batch_offset_; }
  [[nodiscard]] const audio::PcmBytes& full_session_pcm() const { return full_session_pcm_; }

  // PCM in [batch_offset, end of buffer).
  [[nodiscard]] audio::PcmBytes PendingPcm() const;

  // Marks [batch_offset, end) as consumed and compacts: bytes [0, end) are
  // erased and batch_offset returns to 0. end is clamped to the buffer.
  void CommitPcmBatch(size_t end);

  // Total bytes removed by compaction over the session lifetime.
  [[nodiscard]] uint64_t compacted_bytes() const { return compacted_bytes_; }

  // --- Container-accumulator mode ---
  void AppendContainerBytes(const std::vector<uint8_t>& bytes);

  [[nodiscard]] const std::vector<uint8_t>& container_bytes() const { return container_bytes_; }
  [[nodiscard]] size_t processed_pcm_offset() const { return processed_pcm_offset_; }

  // Raises processed_pcm_offset to end; a smaller end is ignored.
  void AdvanceProcessedPcmOffset(size_t end);

 private:
  SourceFormat format_ = SourceFormat::kUnknown;
  std::string declared_mime_;

  audio::PcmBytes pcm_batch_buffer_;
  size_t batch_offset_ = 0;
  audio::PcmBytes full_session_pcm_;
  uint64_t compacted_bytes_ = 0;

  std::vector<uint8_t> container_bytes_;
  size_t processed_pcm_offset_ = 0;
};

}  // namespace batchscribe::session

#endif  // BATCHSCRIBE_SESSION_FORMAT_AWARE_BUFFER_HPP_
