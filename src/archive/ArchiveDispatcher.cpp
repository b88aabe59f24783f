// Repository: BatchScribe
// Component: Archive dispatcher implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/archive/ArchiveDispatcher.hpp"

#include <exception>
#include <string>
#include <utility>

#include "batchscribe/util/Logger.hpp"

namespace batchscribe::archive {

ArchiveDispatcher::ArchiveDispatcher(std::shared_ptr<IObjectStore> store)
    : store_(std::move(store)) {
  worker_thread_ = std::thread(&ArchiveDispatcher::WorkerLoop, this);
}

ArchiveDispatcher::~ArchiveDispatcher() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  queue_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

void ArchiveDispatcher::Submit(ArchiveJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(job));
  }
  queue_cv_.notify_one();
}

void ArchiveDispatcher::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !in_flight_; });
}

uint64_t ArchiveDispatcher::JobsStored() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_stored_;
}

uint64_t ArchiveDispatcher::JobsSkipped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_skipped_;
}

uint64_t ArchiveDispatcher::JobsFailed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_failed_;
}

void ArchiveDispatcher::WorkerLoop() {
  while (true) {
    ArchiveJob job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queue_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      // Drain before exiting: a finished session still gets its upload.
      if (queue_.empty()) {
        break;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
      in_flight_ = true;
    }

    RunJob(job);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = false;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void ArchiveDispatcher::RunJob(const ArchiveJob& job) {
  StoreOutcome outcome;
  try {
    outcome = store_->Store(job.session_id, job.wav, job.metadata);
  } catch (const std::exception& e) {
    outcome = StoreOutcome::Failed(std::string("store threw: ") + e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  switch (outcome.status) {
    case StoreOutcome::Status::kStored:
      jobs_stored_++;
      util::Logger::Info("[ArchiveDispatcher] ARCHIVED session=" + job.session_id +
                         " handle=" + outcome.handle +
                         " bytes=" + std::to_string(job.wav.size()));
      break;
    case StoreOutcome::Status::kSkipped:
      jobs_skipped_++;
      util::Logger::Debug("[ArchiveDispatcher] archive skipped session=" + job.session_id);
      break;
    case StoreOutcome::Status::kFailed:
      jobs_failed_++;
      util::Logger::Error("[ArchiveDispatcher] ARCHIVE FAILED session=" + job.session_id +
                          " err=" + outcome.message);
      break;
  }
}

}  // namespace batchscribe::archive
