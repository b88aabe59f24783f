// Repository: BatchScribe
// Component: System Time Source
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_TIME_SYSTEM_TIME_SOURCE_HPP_
#define BATCHSCRIBE_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "batchscribe/time/ITimeSource.hpp"

namespace batchscribe::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace batchscribe::time

#endif  // BATCHSCRIBE_TIME_SYSTEM_TIME_SOURCE_HPP_
