// Repository: BatchScribe
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission so threads never interleave lines.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_UTIL_LOGGER_HPP_
#define BATCHSCRIBE_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace batchscribe::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent connection threads, the acceptor and
// the archive worker never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when BATCHSCRIBE_DEBUG env is set
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (failed batches, failed archival, hard faults)
//
// Test-only: SetErrorSink / SetInfoSink install a callback invoked for every
// Error() / Info() line (in addition to the stream). Used by tests to assert
// on emitted diagnostics.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace batchscribe::util

#endif  // BATCHSCRIBE_UTIL_LOGGER_HPP_
