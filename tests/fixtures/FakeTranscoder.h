// Repository: BatchScribe
// Component: Fake Codec Transcoder
// Purpose: Scriptable ICodecTranscoder for session engine tests.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_TESTS_FIXTURES_FAKE_TRANSCODER_H_
#define BATCHSCRIBE_TESTS_FIXTURES_FAKE_TRANSCODER_H_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "batchscribe/audio/ICodecTranscoder.hpp"

namespace batchscribe::tests::fixtures {

// FakeTranscoder "decodes" by returning the input bytes unchanged, so a
// streaming container made of concatenated chunk payloads decodes to the
// concatenation itself.
//
// Scripting:
//   FailPayloadsStartingWith(b)  inputs whose first byte is b always fail
//   SetFailWhenHinted(true)      non-empty hints fail, probing succeeds
//   SetOutputLimit(n)            only the first n bytes are "decodable"
//                                (incomplete trailing cluster)
class FakeTranscoder : public audio::ICodecTranscoder {
 public:
  struct Call {
    size_t bytes = 0;
    std::string hint;
  };

  audio::DecodeResult Decode(const std::vector<uint8_t>& bytes,
                             const std::string& format_hint) override {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(Call{bytes.size(), format_hint});
    if (bytes.empty()) {
      return audio::DecodeResult::Fail("empty input", bytes);
    }
    if (failing_markers_.count(bytes[0]) > 0) {
      return audio::DecodeResult::Fail("invalid data found when processing input", bytes);
    }
    if (fail_when_hinted_ && !format_hint.empty()) {
      return audio::DecodeResult::Fail("demuxer rejected hint " + format_hint, bytes);
    }
    const size_t n = std::min(bytes.size(), output_limit_);
    return audio::DecodeResult::Ok(audio::PcmBytes(bytes.begin(), bytes.begin() + n));
  }

  void FailPayloadsStartingWith(uint8_t marker) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_markers_.insert(marker);
  }

  void SetFailWhenHinted(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_when_hinted_ = fail;
  }

  void SetOutputLimit(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_limit_ = limit;
  }

  std::vector<Call> Calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  size_t CallCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Call> calls_;
  std::set<uint8_t> failing_markers_;
  bool fail_when_hinted_ = false;
  size_t output_limit_ = std::numeric_limits<size_t>::max();
};

}  // namespace batchscribe::tests::fixtures

#endif  // BATCHSCRIBE_TESTS_FIXTURES_FAKE_TRANSCODER_H_
