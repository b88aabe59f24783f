// Repository: BatchScribe
// Component: Codec Transcoder Interface
// Purpose: Turns arbitrary source bytes into canonical PCM (16 kHz mono S16LE).
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_AUDIO_ICODEC_TRANSCODER_HPP_
#define BATCHSCRIBE_AUDIO_ICODEC_TRANSCODER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "batchscribe/audio/CanonicalFormat.hpp"

namespace batchscribe::audio {

// DecodeError describes a failed decode. preview is a hex rendering of the
// leading input bytes for diagnostics.
struct DecodeError {
  std::string message;
  std::string preview;
};

// Result of one decode attempt: canonical PCM or a DecodeError.
struct DecodeResult {
  PcmBytes pcm;
  std::optional<DecodeError> error;

  bool ok() const { return !error.has_value(); }

  static DecodeResult Ok(PcmBytes pcm) {
    DecodeResult r;
    r.pcm = std::move(pcm);
    return r;
  }

  static DecodeResult Fail(std::string message, const std::vector<uint8_t>& input);
};

// ICodecTranscoder decodes a complete byte sequence (one self-delimited
// chunk, or a cumulative streaming container from byte 0) into canonical PCM.
//
// format_hint is the declared MIME type ("audio/webm;codecs=opus",
// "audio/wav", ...). An empty hint asks the implementation to probe.
//
// Thread Safety: implementations must be callable concurrently from
// different session threads.
class ICodecTranscoder {
 public:
  virtual ~ICodecTranscoder() = default;

  virtual DecodeResult Decode(const std::vector<uint8_t>& bytes,
                              const std::string& format_hint) = 0;
};

// Decodes with the declared hint first; if that fails and a hint was given,
// retries once with format auto-detection. The second failure is returned.
DecodeResult DecodeWithFallback(ICodecTranscoder& transcoder,
                                const std::vector<uint8_t>& bytes,
                                const std::string& format_hint);

// True when the declared MIME names the cumulative streaming container
// (case-insensitive substring "webm").
bool IsStreamingContainerMime(const std::string& mime);

// Hex rendering of up to max_bytes leading bytes ("1a45dfa3...").
std::string HexPreview(const std::vector<uint8_t>& bytes, size_t max_bytes = 16);

}  // namespace batchscribe::audio

#endif  // BATCHSCRIBE_AUDIO_ICODEC_TRANSCODER_HPP_
