// Repository: BatchScribe
// Component: Object Store Interface
// Purpose: Persists a finished session's full recording.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_ARCHIVE_IOBJECT_STORE_HPP_
#define BATCHSCRIBE_ARCHIVE_IOBJECT_STORE_HPP_

#include <cstdint>
#include <map>
#include <utility>
#include <string>
#include <vector>

namespace batchscribe::archive {

using Metadata = std::map<std::string, std::string>;

// StoreOutcome: kStored carries the object handle; kSkipped means the store
// is not configured (not an error); kFailed carries the failure message.
struct StoreOutcome {
  enum class Status { kStored, kSkipped, kFailed };

  Status status = Status::kSkipped;
  std::string handle;
  std::string message;

  static StoreOutcome Stored(std::string handle) {
    return StoreOutcome{Status::kStored, std::move(handle), ""};
  }
  static StoreOutcome Skipped() { return StoreOutcome{Status::kSkipped, "", ""}; }
  static StoreOutcome Failed(std::string message) {
    return StoreOutcome{Status::kFailed, "", std::move(message)};
  }
};

class IObjectStore {
 public:
  virtual ~IObjectStore() = default;

  virtual StoreOutcome Store(const std::string& session_id,
                             const std::vector<uint8_t>& wav,
                             const Metadata& metadata) = 0;
};

// Archive metadata rules shared by every store: keys lowercased with
// characters outside [a-z0-9_-] replaced by '_' and cut to 1024 chars;
// values trimmed and cut to 2048 chars; empty keys dropped. session_id,
// language ("unknown" when empty) and uploaded_at are always present.
Metadata NormalizeMetadata(const std::string& session_id,
                           const std::string& language,
                           const std::string& uploaded_at,
                           const Metadata& extra);

}  // namespace batchscribe::archive

#endif  // BATCHSCRIBE_ARCHIVE_IOBJECT_STORE_HPP_
