// Repository: BatchScribe
// Component: Filesystem object store
// Purpose: Archives recordings under a local directory with a JSON sidecar.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_ARCHIVE_FILE_OBJECT_STORE_HPP_
#define BATCHSCRIBE_ARCHIVE_FILE_OBJECT_STORE_HPP_

#include <string>

#include "batchscribe/archive/IObjectStore.hpp"
#include "batchscribe/time/ITimeSource.hpp"

namespace batchscribe::archive {

// Layout: {root}/recordings/{session_id}_{UTC stamp}.wav
//         {root}/recordings/{session_id}_{UTC stamp}.json (metadata)
// Handle returned is the path relative to root ("recordings/....wav").
// An empty root means archival is not configured: Store() returns kSkipped.
class FileObjectStore : public IObjectStore {
 public:
  FileObjectStore(std::string root, const time::ITimeSource& clock);

  StoreOutcome Store(const std::string& session_id,
                     const std::vector<uint8_t>& wav,
                     const Metadata& metadata) override;

  const std::string& Root() const { return root_; }

  // Single-line JSON object of string pairs, as written to the sidecar.
  static std::string MetadataToJson(const Metadata& metadata);

 private:
  std::string root_;
  const time::ITimeSource& clock_;
};

}  // namespace batchscribe::archive

#endif  // BATCHSCRIBE_ARCHIVE_FILE_OBJECT_STORE_HPP_
