// Repository: BatchScribe
// Component: Codec Transcoder helpers
// Purpose: Hint-then-probe decode policy and MIME classification.
// Copyright (c) 2025 BatchScribe

#include "batchscribe/audio/ICodecTranscoder.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "batchscribe/util/Logger.hpp"

namespace batchscribe::audio {

DecodeResult DecodeResult::Fail(std::string message,
                                const std::vector<uint8_t>& input) {
  DecodeResult r;
  r.error = DecodeError{std::move(message), HexPreview(input)};
  return r;
}

DecodeResult DecodeWithFallback(ICodecTranscoder& transcoder,
                                const std::vector<uint8_t>& bytes,
                                const std::string& format_hint) {
  DecodeResult first = transcoder.Decode(bytes, format_hint);
  if (first.ok() || format_hint.empty()) {
    return first;
  }
  util::Logger::Debug("[Transcoder] hinted decode failed hint=" + format_hint +
                      " err=" + first.error->message + " retrying with probe");
  return transcoder.Decode(bytes, "");
}

bool IsStreamingContainerMime(const std::string& mime) {
  std::string lower(mime.size(), '\0');
  std::transform(mime.begin(), mime.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("webm") != std::string::npos;
}

std::string HexPreview(const std::vector<uint8_t>& bytes, size_t max_bytes) {
  static const char* kHex = "0123456789abcdef";
  const size_t n = std::min(bytes.size(), max_bytes);
  std::string out;
  out.reserve(n * 2 + 3);
  for (size_t i = 0; i < n; ++i) {
    out += kHex[bytes[i] >> 4];
    out += kHex[bytes[i] & 0x0F];
  }
  if (bytes.size() > n) out += "...";
  return out;
}

}  // namespace batchscribe::audio
