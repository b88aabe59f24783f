// Repository: BatchScribe
// Component: Batch Trigger Policy implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/session/BatchTriggerPolicy.hpp"

namespace batchscribe::session {

bool ShouldTrigger(size_t pending_chunks,
                   int64_t now_ms,
                   int64_t last_batch_ms,
                   const BatchPolicyConfig& config) {
  if (pending_chunks >= config.min_chunks) return true;
  if (pending_chunks >= config.max_chunks) return true;
  return now_ms - last_batch_ms >= config.window_ms;
}

}  // namespace batchscribe::session
