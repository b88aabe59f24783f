// Repository: BatchScribe
// Component: Canonical Audio Format
// Purpose: RIFF/WAVE encode/decode for the house PCM format.
// Copyright (c) 2025 BatchScribe

#include "batchscribe/audio/CanonicalFormat.hpp"

#include <cstring>

namespace batchscribe::audio {

namespace {

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void PutTag(std::vector<uint8_t>& out, const char* tag) {
  out.insert(out.end(), tag, tag + 4);
}

uint32_t GetU32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t GetU16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

bool TagIs(const uint8_t* p, const char* tag) {
  return std::memcmp(p, tag, 4) == 0;
}

constexpr uint16_t kWaveFormatPcm = 1;

}  // namespace

std::vector<uint8_t> EncodeWav(const PcmBytes& pcm) {
  return EncodeWav(pcm.data(), pcm.size());
}

std::vector<uint8_t> EncodeWav(const uint8_t* pcm, size_t size) {
  const size_t data_bytes = size - (size % kCanonicalBytesPerSample);
  const uint32_t byte_rate =
      kCanonicalSampleRate * kCanonicalChannels * kCanonicalBytesPerSample;
  const uint16_t block_align = kCanonicalChannels * kCanonicalBytesPerSample;

  std::vector<uint8_t> out;
  out.reserve(kWavHeaderBytes + data_bytes);
  PutTag(out, "RIFF");
  PutU32(out, static_cast<uint32_t>(36 + data_bytes));
  PutTag(out, "WAVE");
  PutTag(out, "fmt ");
  PutU32(out, 16);
  PutU16(out, kWaveFormatPcm);
  PutU16(out, kCanonicalChannels);
  PutU32(out, kCanonicalSampleRate);
  PutU32(out, byte_rate);
  PutU16(out, block_align);
  PutU16(out, kCanonicalBitsPerSample);
  PutTag(out, "data");
  PutU32(out, static_cast<uint32_t>(data_bytes));
  if (data_bytes > 0) {
    out.insert(out.end(), pcm, pcm + data_bytes);
  }
  return out;
}

bool DecodeWav(const std::vector<uint8_t>& bytes, WavInfo* out) {
  if (!out || bytes.size() < 12) return false;
  const uint8_t* p = bytes.data();
  if (!TagIs(p, "RIFF") || !TagIs(p + 8, "WAVE")) return false;

  bool have_fmt = false;
  size_t pos = 12;
  while (pos + 8 <= bytes.size()) {
    const uint8_t* chunk = p + pos;
    const uint32_t chunk_size = GetU32(chunk + 4);
    const size_t body = pos + 8;
    if (TagIs(chunk, "fmt ")) {
      if (chunk_size < 16 || body + 16 > bytes.size()) return false;
      if (GetU16(p + body) != kWaveFormatPcm) return false;
      out->channels = GetU16(p + body + 2);
      out->sample_rate = static_cast<int>(GetU32(p + body + 4));
      out->bits_per_sample = GetU16(p + body + 14);
      have_fmt = true;
    } else if (TagIs(chunk, "data")) {
      if (!have_fmt) return false;
      // Streaming writers leave the size at 0 or 0xFFFFFFFF; take what exists.
      size_t available = bytes.size() - body;
      size_t take = chunk_size;
      if (chunk_size == 0 || chunk_size == 0xFFFFFFFFu || take > available) {
        take = available;
      }
      out->pcm.assign(p + body, p + body + take);
      return true;
    }
    // Chunks are word aligned.
    size_t next = body + chunk_size + (chunk_size & 1u);
    if (next <= pos) return false;
    pos = next;
  }
  return false;
}

double PcmDurationSeconds(size_t pcm_bytes) {
  return static_cast<double>(pcm_bytes) /
         static_cast<double>(kCanonicalSampleRate * kCanonicalChannels *
                             kCanonicalBytesPerSample);
}

}  // namespace batchscribe::audio
