// Repository: BatchScribe
// Component: Time Source Interface
// Purpose: Wall-clock abstraction so batch windows can be driven by tests.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_TIME_ITIME_SOURCE_HPP_
#define BATCHSCRIBE_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace batchscribe::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace batchscribe::time

#endif  // BATCHSCRIBE_TIME_ITIME_SOURCE_HPP_
