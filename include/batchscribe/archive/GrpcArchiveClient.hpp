// Repository: BatchScribe
// Component: gRPC archive client
// Purpose: IObjectStore backed by ArchiveService (archive.proto).
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_ARCHIVE_GRPC_ARCHIVE_CLIENT_HPP_
#define BATCHSCRIBE_ARCHIVE_GRPC_ARCHIVE_CLIENT_HPP_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "archive.grpc.pb.h"

#include "batchscribe/archive/IObjectStore.hpp"

namespace batchscribe::archive {

class GrpcArchiveClient : public IObjectStore {
 public:
  GrpcArchiveClient(const std::string& target_address, std::chrono::milliseconds deadline);

  GrpcArchiveClient(const GrpcArchiveClient&) = delete;
  GrpcArchiveClient& operator=(const GrpcArchiveClient&) = delete;

  StoreOutcome Store(const std::string& session_id,
                     const std::vector<uint8_t>& wav,
                     const Metadata& metadata) override;

 private:
  std::string target_address_;
  std::chrono::milliseconds deadline_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<batchscribe::archive::v1::ArchiveService::Stub> stub_;
};

}  // namespace batchscribe::archive

#endif  // BATCHSCRIBE_ARCHIVE_GRPC_ARCHIVE_CLIENT_HPP_
