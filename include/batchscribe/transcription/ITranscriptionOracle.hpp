// Repository: BatchScribe
// Component: Transcription Oracle Interface
// Purpose: Turns one canonical WAV container into text.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_TRANSCRIPTION_ITRANSCRIPTION_ORACLE_HPP_
#define BATCHSCRIBE_TRANSCRIPTION_ITRANSCRIPTION_ORACLE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace batchscribe::transcription {

struct TranscriptionResult {
  std::string text;
  double confidence = 0.0;
  std::string detected_language;
};

struct TranscriptionError {
  std::string message;
};

// Result of one Transcribe() call: a result or a TranscriptionError.
struct TranscriptionOutcome {
  std::optional<TranscriptionResult> result;
  TranscriptionError error;

  bool ok() const { return result.has_value(); }

  static TranscriptionOutcome Ok(TranscriptionResult r) {
    TranscriptionOutcome o;
    o.result = std::move(r);
    return o;
  }
  static TranscriptionOutcome Fail(std::string message) {
    TranscriptionOutcome o;
    o.error.message = std::move(message);
    return o;
  }
};

// ITranscriptionOracle is a long-lived collaborator shared by every session.
// Calls are synchronous; each session thread blocks only itself.
class ITranscriptionOracle {
 public:
  virtual ~ITranscriptionOracle() = default;

  virtual TranscriptionOutcome Transcribe(const std::vector<uint8_t>& wav,
                                          const std::string& language) = 0;
};

// Installed when no transcription service is configured: every batch fails
// with a TranscriptionError so its audio stays pending.
class UnavailableTranscriptionOracle : public ITranscriptionOracle {
 public:
  TranscriptionOutcome Transcribe(const std::vector<uint8_t>& /*wav*/,
                                  const std::string& /*language*/) override {
    return TranscriptionOutcome::Fail("transcription service not configured");
  }
};

}  // namespace batchscribe::transcription

#endif  // BATCHSCRIBE_TRANSCRIPTION_ITRANSCRIPTION_ORACLE_HPP_
