// Repository: BatchScribe
// Component: Batch Packager
// Purpose: Produces one canonical WAV holding only the audio that arrived
//          since the last successful batch.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SESSION_BATCH_PACKAGER_HPP_
#define BATCHSCRIBE_SESSION_BATCH_PACKAGER_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "batchscribe/audio/ICodecTranscoder.hpp"
#include "batchscribe/session/FormatAwareBuffer.hpp"

namespace batchscribe::session {

struct PackagedBatch {
  enum class Status {
    kReady,        // wav holds new audio
    kNoNewAudio,   // nothing since the last batch; abort silently
    kDecodeFailed, // streaming re-decode failed; error is set
  };

  Status status = Status::kNoNewAudio;
  std::vector<uint8_t> wav;
  size_t pcm_bytes = 0;
  // High-water mark to commit once the batch has been delivered: the end of
  // the decoded stream (streaming) or of pcm_batch_buffer (raw).
  size_t slice_end = 0;
  std::optional<audio::DecodeError> error;

  bool ready() const { return status == Status::kReady; }
};

// BatchPackager slices a FormatAwareBuffer. Package() never mutates the
// buffer; offsets move only through Commit(), which the session calls after
// the transcription call succeeded. A failed batch therefore leaves the same
// audio pending for the next trigger.
class BatchPackager {
 public:
  explicit BatchPackager(audio::ICodecTranscoder& transcoder);

  // Streaming: re-decodes container_bytes from byte 0 (hinted, then probed)
  // and takes the PCM past processed_pcm_offset.
  // Raw: takes pcm_batch_buffer past batch_offset.
  PackagedBatch Package(const FormatAwareBuffer& buffer);

  // Advances processed_pcm_offset (streaming) or compacts pcm_batch_buffer
  // (raw) up to batch.slice_end. No-op unless batch.ready().
  static void Commit(FormatAwareBuffer& buffer, const PackagedBatch& batch);

  // Whole-session recording for archival: full re-decode of the container
  // (streaming) or full_session_pcm (raw). kNoNewAudio when empty.
  PackagedBatch BuildFullSessionWav(const FormatAwareBuffer& buffer);

 private:
  audio::ICodecTranscoder& transcoder_;
};

}  // namespace batchscribe::session

#endif  // BATCHSCRIBE_SESSION_BATCH_PACKAGER_HPP_
