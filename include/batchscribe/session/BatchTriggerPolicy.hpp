// Repository: BatchScribe
// Component: Batch Trigger Policy
// Purpose: Decides when pending chunks become a transcription batch.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_SESSION_BATCH_TRIGGER_POLICY_HPP_
#define BATCHSCRIBE_SESSION_BATCH_TRIGGER_POLICY_HPP_

#include <cstddef>
#include <cstdint>

namespace batchscribe::session {

struct BatchPolicyConfig {
  size_t min_chunks = 5;
  size_t max_chunks = 20;
  int64_t window_ms = 5000;
};

// Fires when any of the three thresholds holds:
//   pending_chunks >= min_chunks
//   pending_chunks >= max_chunks
//   now_ms - last_batch_ms >= window_ms
// The window check is independent of the chunk count; an empty trigger is
// filtered later by the packager (no new audio, no call).
[[nodiscard]] bool ShouldTrigger(size_t pending_chunks,
                                 int64_t now_ms,
                                 int64_t last_batch_ms,
                                 const BatchPolicyConfig& config);

}  // namespace batchscribe::session

#endif  // BATCHSCRIBE_SESSION_BATCH_TRIGGER_POLICY_HPP_
