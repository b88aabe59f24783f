// Repository: BatchScribe
// Component: Timestamp Formatting
// Copyright (c) 2025 BatchScribe

#include "batchscribe/util/Timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace batchscribe::util {

namespace {

bool SplitUtc(int64_t utc_ms, struct tm* tm, int* frac_ms) {
  time_t s = static_cast<time_t>(utc_ms / 1000);
  *frac_ms = static_cast<int>(utc_ms % 1000);
  if (*frac_ms < 0) {
    *frac_ms += 1000;
    --s;
  }
  return gmtime_r(&s, tm) != nullptr;
}

}  // namespace

std::string FormatUtcIso8601(int64_t utc_ms) {
  struct tm tm;
  int frac_ms = 0;
  if (!SplitUtc(utc_ms, &tm, &frac_ms)) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

std::string FormatUtcCompact(int64_t utc_ms) {
  struct tm tm;
  int frac_ms = 0;
  if (!SplitUtc(utc_ms, &tm, &frac_ms)) return "";
  char buf[32];
  int n = snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

std::string FormatUtcObjectStamp(int64_t utc_ms) {
  struct tm tm;
  int frac_ms = 0;
  if (!SplitUtc(utc_ms, &tm, &frac_ms)) return "";
  char buf[32];
  int n = snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02d%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace batchscribe::util
