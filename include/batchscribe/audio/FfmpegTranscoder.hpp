// Repository: BatchScribe
// Component: FFmpeg Transcoder
// Purpose: In-memory audio decoding using libavformat/libavcodec, resampled
//          to canonical PCM with libswresample.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_AUDIO_FFMPEG_TRANSCODER_HPP_
#define BATCHSCRIBE_AUDIO_FFMPEG_TRANSCODER_HPP_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "batchscribe/audio/ICodecTranscoder.hpp"

namespace batchscribe::audio {

// TranscoderStats tracks decode activity across all sessions.
struct TranscoderStats {
  uint64_t decodes_ok = 0;
  uint64_t decodes_failed = 0;
  uint64_t packets_skipped = 0;
};

// FfmpegTranscoder decodes a byte buffer held in memory.
//
// Features:
// - Custom AVIOContext over the caller's buffer (no temp files)
// - Demuxer chosen from the MIME hint, or probed when the hint is empty
// - Raw "audio/pcm" / "audio/l16" input read as s16le 16 kHz mono
// - Output resampled to 16 kHz mono S16 interleaved
//
// Thread Safety:
// - Decode() holds no shared state besides atomic counters; one instance
//   serves every session thread.
//
// Error Handling:
// - Returns DecodeResult::Fail with the libav error string
// - Corrupt packets are skipped; a truncated tail (incomplete cluster of a
//   still-growing stream) ends the decode instead of failing it
class FfmpegTranscoder : public ICodecTranscoder {
 public:
  FfmpegTranscoder();
  ~FfmpegTranscoder() override;

  FfmpegTranscoder(const FfmpegTranscoder&) = delete;
  FfmpegTranscoder& operator=(const FfmpegTranscoder&) = delete;

  DecodeResult Decode(const std::vector<uint8_t>& bytes,
                      const std::string& format_hint) override;

  TranscoderStats GetStats() const;

  // libavformat demuxer name for a MIME hint; empty for probe.
  static std::string DemuxerForMime(const std::string& mime);

 private:
  std::atomic<uint64_t> decodes_ok_{0};
  std::atomic<uint64_t> decodes_failed_{0};
  std::atomic<uint64_t> packets_skipped_{0};
};

}  // namespace batchscribe::audio

#endif  // BATCHSCRIBE_AUDIO_FFMPEG_TRANSCODER_HPP_
