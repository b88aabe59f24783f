// Repository: BatchScribe
// Component: gRPC transcription client implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/transcription/GrpcTranscriptionClient.hpp"

#include <string>

#include "batchscribe/util/Logger.hpp"

namespace batchscribe::transcription {

namespace proto = batchscribe::transcription::v1;

GrpcTranscriptionClient::GrpcTranscriptionClient(const std::string& target_address,
                                                 std::chrono::milliseconds deadline)
    : target_address_(target_address),
      deadline_(deadline),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::TranscriptionService::NewStub(grpc_channel_)) {
  util::Logger::Info("[GrpcTranscriptionClient] target=" + target_address_ +
                     " deadline_ms=" + std::to_string(deadline_.count()));
}

GrpcTranscriptionClient::~GrpcTranscriptionClient() = default;

TranscriptionOutcome GrpcTranscriptionClient::Transcribe(const std::vector<uint8_t>& wav,
                                                         const std::string& language) {
  proto::TranscribeRequest request;
  request.set_wav(reinterpret_cast<const char*>(wav.data()), wav.size());
  request.set_language(language);

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + deadline_);

  proto::TranscribeResponse response;
  grpc::Status status = stub_->Transcribe(&context, request, &response);
  if (!status.ok()) {
    calls_failed_.fetch_add(1, std::memory_order_relaxed);
    std::string message = "Transcribe RPC failed code=" +
                          std::to_string(static_cast<int>(status.error_code())) +
                          " msg=" + status.error_message();
    util::Logger::Warn("[GrpcTranscriptionClient] " + message);
    return TranscriptionOutcome::Fail(message);
  }

  TranscriptionResult result;
  result.text = response.text();
  result.confidence = response.confidence();
  result.detected_language = response.detected_language();
  return TranscriptionOutcome::Ok(std::move(result));
}

}  // namespace batchscribe::transcription
