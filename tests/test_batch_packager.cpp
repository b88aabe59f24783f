// Repository: BatchScribe
// Component: Batch packager unit tests

#include <gtest/gtest.h>

#include "batchscribe/audio/CanonicalFormat.hpp"
#include "batchscribe/session/BatchPackager.hpp"
#include "fixtures/FakeTranscoder.h"
#include "support/SessionHarness.hpp"

namespace batchscribe::session {
namespace {

using tests::fixtures::FakeTranscoder;

audio::PcmBytes PcmOf(const PackagedBatch& batch) {
  audio::WavInfo info;
  EXPECT_TRUE(audio::DecodeWav(batch.wav, &info));
  return info.pcm;
}

// -----------------------------------------------------------------------------
// Raw PCM branch
// -----------------------------------------------------------------------------

TEST(BatchPackagerTest, RawSlicesPendingPcm) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");
  buffer.AppendPcm(tests::Payload(0x00, 6));

  PackagedBatch batch = packager.Package(buffer);
  ASSERT_TRUE(batch.ready());
  EXPECT_EQ(batch.pcm_bytes, 6u);
  EXPECT_EQ(batch.slice_end, 6u);
  EXPECT_EQ(PcmOf(batch), tests::Payload(0x00, 6));
  EXPECT_EQ(transcoder.CallCount(), 0u) << "raw branch never re-decodes";
}

TEST(BatchPackagerTest, RawPackageDoesNotMoveOffsets) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");
  buffer.AppendPcm(tests::Payload(0x00, 6));

  packager.Package(buffer);
  EXPECT_EQ(buffer.pcm_batch_buffer().size(), 6u);

  PackagedBatch again = packager.Package(buffer);
  EXPECT_EQ(again.pcm_bytes, 6u);
}

TEST(BatchPackagerTest, RawCommitCompacts) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");
  buffer.AppendPcm(tests::Payload(0x00, 6));

  PackagedBatch batch = packager.Package(buffer);
  BatchPackager::Commit(buffer, batch);
  EXPECT_TRUE(buffer.pcm_batch_buffer().empty());
  EXPECT_EQ(buffer.batch_offset(), 0u);

  buffer.AppendPcm(tests::Payload(0x40, 4));
  PackagedBatch next = packager.Package(buffer);
  ASSERT_TRUE(next.ready());
  EXPECT_EQ(PcmOf(next), tests::Payload(0x40, 4));
}

TEST(BatchPackagerTest, RawEmptyIsNoNewAudio) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");

  EXPECT_EQ(packager.Package(buffer).status, PackagedBatch::Status::kNoNewAudio);
}

TEST(BatchPackagerTest, UnknownFormatIsNoNewAudio) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  EXPECT_EQ(packager.Package(buffer).status, PackagedBatch::Status::kNoNewAudio);
  EXPECT_EQ(packager.BuildFullSessionWav(buffer).status, PackagedBatch::Status::kNoNewAudio);
}

// -----------------------------------------------------------------------------
// Streaming container branch
// -----------------------------------------------------------------------------

TEST(BatchPackagerTest, StreamingReDecodesFromByteZero) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kStreamingContainer, tests::kStreamingMime);
  buffer.AppendContainerBytes(tests::Payload(0x1a, 8));

  PackagedBatch first = packager.Package(buffer);
  ASSERT_TRUE(first.ready());
  EXPECT_EQ(first.slice_end, 8u);
  BatchPackager::Commit(buffer, first);
  EXPECT_EQ(buffer.processed_pcm_offset(), 8u);

  buffer.AppendContainerBytes(tests::Payload(0x60, 4));
  PackagedBatch second = packager.Package(buffer);
  ASSERT_TRUE(second.ready());
  EXPECT_EQ(PcmOf(second), tests::Payload(0x60, 4));
  EXPECT_EQ(second.slice_end, 12u);

  const auto calls = transcoder.Calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].bytes, 8u);
  EXPECT_EQ(calls[1].bytes, 12u) << "whole container decoded each time";
  EXPECT_EQ(calls[1].hint, tests::kStreamingMime);
  EXPECT_EQ(buffer.container_bytes().size(), 12u) << "container is never compacted";
}

TEST(BatchPackagerTest, StreamingWithoutNetNewPcmIsNoNewAudio) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kStreamingContainer, tests::kStreamingMime);
  buffer.AppendContainerBytes(tests::Payload(0x1a, 8));
  BatchPackager::Commit(buffer, packager.Package(buffer));

  // More bytes arrive but they do not decode to anything new yet.
  transcoder.SetOutputLimit(8);
  buffer.AppendContainerBytes(tests::Payload(0x60, 4));
  PackagedBatch batch = packager.Package(buffer);
  EXPECT_EQ(batch.status, PackagedBatch::Status::kNoNewAudio);
  EXPECT_EQ(buffer.processed_pcm_offset(), 8u);
}

TEST(BatchPackagerTest, StreamingDecodeFailureCarriesError) {
  FakeTranscoder transcoder;
  transcoder.FailPayloadsStartingWith(0xEE);
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kStreamingContainer, tests::kStreamingMime);
  buffer.AppendContainerBytes(tests::Payload(0xEE, 8));

  PackagedBatch batch = packager.Package(buffer);
  ASSERT_EQ(batch.status, PackagedBatch::Status::kDecodeFailed);
  ASSERT_TRUE(batch.error.has_value());
  EXPECT_FALSE(batch.error->preview.empty());
  EXPECT_EQ(transcoder.CallCount(), 2u) << "hinted attempt plus probe";
  EXPECT_EQ(buffer.processed_pcm_offset(), 0u);
}

TEST(BatchPackagerTest, CommitIgnoresBatchesThatAreNotReady) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");
  buffer.AppendPcm(tests::Payload(0x00, 4));

  PackagedBatch not_ready;
  not_ready.slice_end = 4;
  BatchPackager::Commit(buffer, not_ready);
  EXPECT_EQ(buffer.pcm_batch_buffer().size(), 4u);
}

// -----------------------------------------------------------------------------
// Full-session recording
// -----------------------------------------------------------------------------

TEST(BatchPackagerTest, FullSessionRawUsesEverythingEverDecoded) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");
  buffer.AppendPcm(tests::Payload(0x00, 4));
  BatchPackager::Commit(buffer, packager.Package(buffer));
  buffer.AppendPcm(tests::Payload(0x10, 4));

  PackagedBatch full = packager.BuildFullSessionWav(buffer);
  ASSERT_TRUE(full.ready());
  audio::PcmBytes expected = tests::Payload(0x00, 4);
  const auto tail = tests::Payload(0x10, 4);
  expected.insert(expected.end(), tail.begin(), tail.end());
  EXPECT_EQ(PcmOf(full), expected);
}

TEST(BatchPackagerTest, FullSessionStreamingDecodesWholeContainer) {
  FakeTranscoder transcoder;
  BatchPackager packager(transcoder);
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kStreamingContainer, tests::kStreamingMime);
  buffer.AppendContainerBytes(tests::Payload(0x1a, 6));
  buffer.AppendContainerBytes(tests::Payload(0x30, 6));
  buffer.AdvanceProcessedPcmOffset(6);

  PackagedBatch full = packager.BuildFullSessionWav(buffer);
  ASSERT_TRUE(full.ready());
  EXPECT_EQ(full.pcm_bytes, 12u);
}

}  // namespace
}  // namespace batchscribe::session
