// Repository: BatchScribe
// Component: Canonical Audio Format
// Purpose: House PCM format (16 kHz mono S16LE) and its WAV container wrapper.
//          Every batch handed to transcription and every archived recording
//          is produced by EncodeWav().
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_AUDIO_CANONICAL_FORMAT_HPP_
#define BATCHSCRIBE_AUDIO_CANONICAL_FORMAT_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace batchscribe::audio {

constexpr int kCanonicalSampleRate = 16000;
constexpr int kCanonicalChannels = 1;
constexpr int kCanonicalBitsPerSample = 16;
constexpr int kCanonicalBytesPerSample = kCanonicalBitsPerSample / 8;
constexpr size_t kWavHeaderBytes = 44;

using PcmBytes = std::vector<uint8_t>;

// Parsed view of a RIFF/WAVE container.
struct WavInfo {
  int sample_rate = 0;
  int channels = 0;
  int bits_per_sample = 0;
  PcmBytes pcm;
};

// Wraps canonical PCM in a 44-byte RIFF/WAVE header. A trailing odd byte is
// dropped so the data chunk always holds whole samples.
std::vector<uint8_t> EncodeWav(const PcmBytes& pcm);
std::vector<uint8_t> EncodeWav(const uint8_t* pcm, size_t size);

// Parses a RIFF/WAVE container with a PCM fmt chunk. Unknown chunks are
// skipped. Returns false on any structural problem.
bool DecodeWav(const std::vector<uint8_t>& bytes, WavInfo* out);

// Duration of canonical PCM in seconds.
double PcmDurationSeconds(size_t pcm_bytes);

}  // namespace batchscribe::audio

#endif  // BATCHSCRIBE_AUDIO_CANONICAL_FORMAT_HPP_
