// Repository: BatchScribe
// Component: Session finalizer unit tests

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "batchscribe/archive/ArchiveDispatcher.hpp"
#include "batchscribe/audio/CanonicalFormat.hpp"
#include "batchscribe/session/Finalizer.hpp"
#include "batchscribe/session/SessionRegistry.hpp"
#include "fixtures/FakeObjectStore.h"
#include "support/SessionHarness.hpp"

namespace batchscribe::session {
namespace {

using protocol::OutboundType;
using tests::Chunk;
using tests::Payload;
using tests::fixtures::FakeObjectStore;

constexpr size_t kChunkBytes = 1600;

class FinalizerTest : public ::testing::Test {
 protected:
  FinalizerTest()
      : store_(std::make_shared<FakeObjectStore>()),
        dispatcher_(store_),
        registry_(h_.settings, h_.Collaborators()),
        finalizer_(registry_, dispatcher_, h_.clock) {}

  std::shared_ptr<AudioSession> NewSession(const std::string& id = "session_f") {
    return registry_.Create(id, h_.sink);
  }

  tests::SessionHarness h_;
  std::shared_ptr<FakeObjectStore> store_;
  archive::ArchiveDispatcher dispatcher_;
  SessionRegistry registry_;
  Finalizer finalizer_;
};

TEST_F(FinalizerTest, RunsFinalBatchForPendingChunks) {
  auto s = NewSession();
  for (int64_t seq = 1; seq <= 3; ++seq) {
    s->OnAudioChunk(Chunk(seq, Payload(0x00, kChunkBytes)));
  }
  ASSERT_EQ(h_.oracle.CallCount(), 0u);

  finalizer_.Finalize(*s, FinalizeReason::kEndOfRecording);
  ASSERT_EQ(h_.oracle.CallCount(), 1u);
  EXPECT_EQ(h_.sink->LastOf(OutboundType::kBatchTranscription)->chunk_count, 3u);
}

TEST_F(FinalizerTest, SendsCompletionThenCloses) {
  auto s = NewSession();
  for (int64_t seq = 1; seq <= 7; ++seq) {
    s->OnAudioChunk(Chunk(seq, Payload(0x00, kChunkBytes)));
  }
  finalizer_.Finalize(*s, FinalizeReason::kEndOfRecording);

  const auto events = h_.sink->Events();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().type, OutboundType::kRecordingComplete);
  EXPECT_EQ(events.back().total_chunks_processed, 7u);
  EXPECT_FALSE(h_.sink->IsOpen());
  EXPECT_EQ(h_.sink->CloseCalls(), 1u);
}

TEST_F(FinalizerTest, ArchivesFullSessionWithMetadata) {
  auto s = NewSession();
  s->OnStartRecording(std::string("es"));
  for (int64_t seq = 1; seq <= 7; ++seq) {
    s->OnAudioChunk(Chunk(seq, Payload(static_cast<uint8_t>(seq), kChunkBytes)));
  }
  finalizer_.Finalize(*s, FinalizeReason::kEndOfRecording);
  dispatcher_.WaitIdle();

  const auto stored = store_->StoredRecordings();
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].session_id, "session_f");

  audio::WavInfo info;
  ASSERT_TRUE(audio::DecodeWav(stored[0].wav, &info));
  EXPECT_EQ(info.pcm, s->buffer().full_session_pcm());
  EXPECT_EQ(info.pcm.size(), 7 * kChunkBytes);

  const auto& md = stored[0].metadata;
  EXPECT_EQ(md.at("session_id"), "session_f");
  EXPECT_EQ(md.at("language"), "es");
  EXPECT_EQ(md.at("source_format"), "raw_pcm_container");
  EXPECT_EQ(md.at("declared_mime"), tests::kRawMime);
  EXPECT_EQ(md.at("total_chunks"), "7");
  EXPECT_EQ(md.at("start_time"), "2025-02-13T12:00:00.000Z");
  EXPECT_EQ(md.at("end_reason"), "end_recording");
  EXPECT_EQ(md.count("uploaded_at"), 1u);
}

TEST_F(FinalizerTest, TwiceStoresExactlyOnce) {
  auto s = NewSession();
  for (int64_t seq = 1; seq <= 2; ++seq) {
    s->OnAudioChunk(Chunk(seq, Payload(0x00, kChunkBytes)));
  }
  finalizer_.Finalize(*s, FinalizeReason::kEndOfRecording);
  finalizer_.Finalize(*s, FinalizeReason::kDisconnect);
  dispatcher_.WaitIdle();

  EXPECT_EQ(store_->StoreCalls(), 1u);
  EXPECT_TRUE(s->finalized());
  EXPECT_EQ(s->state(), AudioSession::State::kClosed);
  EXPECT_EQ(h_.sink->CountOf(OutboundType::kRecordingComplete), 1u);
}

TEST_F(FinalizerTest, RemovesFromRegistry) {
  auto s = NewSession();
  ASSERT_EQ(registry_.Size(), 1u);
  finalizer_.Finalize(*s, FinalizeReason::kDisconnect);
  EXPECT_EQ(registry_.Get("session_f"), nullptr);
  EXPECT_EQ(s->state(), AudioSession::State::kClosed);
}

TEST_F(FinalizerTest, EmptySessionSkipsArchival) {
  auto s = NewSession();
  finalizer_.Finalize(*s, FinalizeReason::kDisconnect);
  dispatcher_.WaitIdle();
  EXPECT_EQ(store_->StoreCalls(), 0u);
  EXPECT_TRUE(s->finalized());
  EXPECT_EQ(h_.sink->LastOf(OutboundType::kRecordingComplete)->total_chunks_processed, 0u);
}

TEST_F(FinalizerTest, StreamingSessionArchivesFullReDecode) {
  auto s = NewSession();
  for (int64_t seq = 1; seq <= 6; ++seq) {
    s->OnAudioChunk(Chunk(seq, Payload(static_cast<uint8_t>(seq), kChunkBytes),
                          tests::kStreamingMime));
  }
  finalizer_.Finalize(*s, FinalizeReason::kDisconnect);
  dispatcher_.WaitIdle();

  const auto stored = store_->StoredRecordings();
  ASSERT_EQ(stored.size(), 1u);
  audio::WavInfo info;
  ASSERT_TRUE(audio::DecodeWav(stored[0].wav, &info));
  EXPECT_EQ(info.pcm, s->buffer().container_bytes());
  EXPECT_EQ(stored[0].metadata.at("source_format"), "streaming_container");
  EXPECT_EQ(stored[0].metadata.at("end_reason"), "disconnect");
}

TEST_F(FinalizerTest, ArchivalFailureIsNotRetriedOrPropagated) {
  store_->SetThrow(true);
  auto s = NewSession();
  s->OnAudioChunk(Chunk(1, Payload(0x00, kChunkBytes)));

  EXPECT_NO_THROW(finalizer_.Finalize(*s, FinalizeReason::kEndOfRecording));
  dispatcher_.WaitIdle();
  EXPECT_NO_THROW(finalizer_.Finalize(*s, FinalizeReason::kDisconnect));
  dispatcher_.WaitIdle();

  EXPECT_EQ(store_->StoreCalls(), 1u);
  EXPECT_EQ(dispatcher_.JobsFailed(), 1u);
  EXPECT_TRUE(s->finalized());
}

TEST_F(FinalizerTest, FinalBatchFailureStillArchivesAndRemoves) {
  h_.oracle.FailNext(1);
  auto s = NewSession();
  s->OnAudioChunk(Chunk(1, Payload(0x00, kChunkBytes)));

  finalizer_.Finalize(*s, FinalizeReason::kDisconnect);
  dispatcher_.WaitIdle();

  EXPECT_EQ(h_.sink->CountOf(OutboundType::kError), 1u);
  EXPECT_EQ(store_->StoreCalls(), 1u);
  EXPECT_EQ(registry_.Size(), 0u);
}

}  // namespace
}  // namespace batchscribe::session
