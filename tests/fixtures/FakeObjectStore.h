// Repository: BatchScribe
// Component: Fake Object Store
// Purpose: Captures archived recordings for verification.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_TESTS_FIXTURES_FAKE_OBJECT_STORE_H_
#define BATCHSCRIBE_TESTS_FIXTURES_FAKE_OBJECT_STORE_H_

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "batchscribe/archive/IObjectStore.hpp"

namespace batchscribe::tests::fixtures {

class FakeObjectStore : public archive::IObjectStore {
 public:
  struct Stored {
    std::string session_id;
    std::vector<uint8_t> wav;
    archive::Metadata metadata;
  };

  archive::StoreOutcome Store(const std::string& session_id,
                              const std::vector<uint8_t>& wav,
                              const archive::Metadata& metadata) override {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_.push_back(Stored{session_id, wav, metadata});
    if (throw_) {
      throw std::runtime_error("connection reset");
    }
    if (outcome_.status == archive::StoreOutcome::Status::kStored) {
      return archive::StoreOutcome::Stored("recordings/" + session_id + ".wav");
    }
    return outcome_;
  }

  void SetOutcome(archive::StoreOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcome_ = std::move(outcome);
  }

  void SetThrow(bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    throw_ = value;
  }

  std::vector<Stored> StoredRecordings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_;
  }

  size_t StoreCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stored_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Stored> stored_;
  archive::StoreOutcome outcome_ = archive::StoreOutcome::Stored("");
  bool throw_ = false;
};

}  // namespace batchscribe::tests::fixtures

#endif  // BATCHSCRIBE_TESTS_FIXTURES_FAKE_OBJECT_STORE_H_
