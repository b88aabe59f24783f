// Repository: BatchScribe
// Component: Timestamp Formatting
// Purpose: UTC renderings used on the wire, in session ids and archive keys.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_UTIL_TIMESTAMP_HPP_
#define BATCHSCRIBE_UTIL_TIMESTAMP_HPP_

#include <cstdint>
#include <string>

namespace batchscribe::util {

// "2026-02-13T12:00:00.000Z"; empty string if the time cannot be rendered.
std::string FormatUtcIso8601(int64_t utc_ms);

// "20260213_120000" (session ids).
std::string FormatUtcCompact(int64_t utc_ms);

// "20260213T120000123Z" (archive object keys).
std::string FormatUtcObjectStamp(int64_t utc_ms);

}  // namespace batchscribe::util

#endif  // BATCHSCRIBE_UTIL_TIMESTAMP_HPP_
