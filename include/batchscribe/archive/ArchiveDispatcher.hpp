// Repository: BatchScribe
// Component: Archive dispatcher
// Purpose: Runs object-store uploads on a dedicated worker thread so session
//          teardown never waits on archival I/O.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_ARCHIVE_ARCHIVE_DISPATCHER_HPP_
#define BATCHSCRIBE_ARCHIVE_ARCHIVE_DISPATCHER_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "batchscribe/archive/IObjectStore.hpp"

namespace batchscribe::archive {

struct ArchiveJob {
  std::string session_id;
  std::vector<uint8_t> wav;
  Metadata metadata;
};

// ArchiveDispatcher owns a FIFO of ArchiveJobs and one writer thread.
//
// Each job is attempted exactly once. Failures (kFailed outcome or an
// exception from the store) are logged through Logger::Error and dropped;
// they never reach the session or the client.
//
// Lifecycle:
//   1. Construct with the store (thread starts)
//   2. Submit() from any session thread; returns immediately
//   3. Destructor drains queued jobs, then joins
class ArchiveDispatcher {
 public:
  explicit ArchiveDispatcher(std::shared_ptr<IObjectStore> store);
  ~ArchiveDispatcher();

  ArchiveDispatcher(const ArchiveDispatcher&) = delete;
  ArchiveDispatcher& operator=(const ArchiveDispatcher&) = delete;

  void Submit(ArchiveJob job);

  // Blocks until the queue is empty and no job is in flight.
  void WaitIdle();

  uint64_t JobsStored() const;
  uint64_t JobsSkipped() const;
  uint64_t JobsFailed() const;

 private:
  void WorkerLoop();
  void RunJob(const ArchiveJob& job);

  std::shared_ptr<IObjectStore> store_;

  mutable std::mutex mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<ArchiveJob> queue_;
  bool in_flight_ = false;
  bool shutdown_ = false;

  uint64_t jobs_stored_ = 0;
  uint64_t jobs_skipped_ = 0;
  uint64_t jobs_failed_ = 0;

  std::thread worker_thread_;
};

}  // namespace batchscribe::archive

#endif  // BATCHSCRIBE_ARCHIVE_ARCHIVE_DISPATCHER_HPP_
