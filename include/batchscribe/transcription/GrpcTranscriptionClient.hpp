// Repository: BatchScribe
// Component: gRPC transcription client
// Purpose: ITranscriptionOracle backed by TranscriptionService (transcription.proto).
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_TRANSCRIPTION_GRPC_TRANSCRIPTION_CLIENT_HPP_
#define BATCHSCRIBE_TRANSCRIPTION_GRPC_TRANSCRIPTION_CLIENT_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "transcription.grpc.pb.h"

#include "batchscribe/transcription/ITranscriptionOracle.hpp"

namespace batchscribe::transcription {

// One channel and stub for the process lifetime; gRPC channels are
// thread-safe, so all session threads share this instance.
//
// Lifecycle:
//   1. Construct with target address ("host:port") and per-call deadline
//   2. Call Transcribe() from any session thread
//   3. Destructor releases the channel
class GrpcTranscriptionClient : public ITranscriptionOracle {
 public:
  GrpcTranscriptionClient(const std::string& target_address,
                          std::chrono::milliseconds deadline);
  ~GrpcTranscriptionClient() override;

  GrpcTranscriptionClient(const GrpcTranscriptionClient&) = delete;
  GrpcTranscriptionClient& operator=(const GrpcTranscriptionClient&) = delete;

  TranscriptionOutcome Transcribe(const std::vector<uint8_t>& wav,
                                  const std::string& language) override;

  uint64_t CallsFailed() const { return calls_failed_.load(std::memory_order_relaxed); }

 private:
  std::string target_address_;
  std::chrono::milliseconds deadline_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<batchscribe::transcription::v1::TranscriptionService::Stub> stub_;
  std::atomic<uint64_t> calls_failed_{0};
};

}  // namespace batchscribe::transcription

#endif  // BATCHSCRIBE_TRANSCRIPTION_GRPC_TRANSCRIPTION_CLIENT_HPP_
