// Repository: BatchScribe
// Component: gRPC archive client implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/archive/GrpcArchiveClient.hpp"

#include "batchscribe/util/Logger.hpp"

namespace batchscribe::archive {

namespace proto = batchscribe::archive::v1;

GrpcArchiveClient::GrpcArchiveClient(const std::string& target_address,
                                     std::chrono::milliseconds deadline)
    : target_address_(target_address),
      deadline_(deadline),
      grpc_channel_(grpc::CreateChannel(target_address, grpc::InsecureChannelCredentials())),
      stub_(proto::ArchiveService::NewStub(grpc_channel_)) {
  util::Logger::Info("[GrpcArchiveClient] target=" + target_address_);
}

StoreOutcome GrpcArchiveClient::Store(const std::string& session_id,
                                      const std::vector<uint8_t>& wav,
                                      const Metadata& metadata) {
  proto::StoreRecordingRequest request;
  request.set_session_id(session_id);
  request.set_wav(reinterpret_cast<const char*>(wav.data()), wav.size());
  auto* fields = request.mutable_metadata();
  for (const auto& [key, value] : metadata) {
    (*fields)[key] = value;
  }

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + deadline_);

  proto::StoreRecordingResponse response;
  grpc::Status status = stub_->StoreRecording(&context, request, &response);
  if (!status.ok()) {
    return StoreOutcome::Failed("StoreRecording RPC failed code=" +
                                std::to_string(static_cast<int>(status.error_code())) +
                                " msg=" + status.error_message());
  }
  return StoreOutcome::Stored(response.handle());
}

}  // namespace batchscribe::archive
