// Repository: BatchScribe
// Component: Format-aware buffer unit tests

#include <gtest/gtest.h>

#include "batchscribe/session/FormatAwareBuffer.hpp"
#include "support/SessionHarness.hpp"

namespace batchscribe::session {
namespace {

TEST(FormatAwareBufferTest, FormatIsFixedOnce) {
  FormatAwareBuffer buffer;
  EXPECT_EQ(buffer.format(), SourceFormat::kUnknown);

  EXPECT_TRUE(buffer.FixFormat(SourceFormat::kStreamingContainer, "audio/webm"));
  EXPECT_FALSE(buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav"));
  EXPECT_EQ(buffer.format(), SourceFormat::kStreamingContainer);
  EXPECT_EQ(buffer.declared_mime(), "audio/webm");
}

TEST(FormatAwareBufferTest, UnknownDoesNotFixFormat) {
  FormatAwareBuffer buffer;
  EXPECT_FALSE(buffer.FixFormat(SourceFormat::kUnknown, "x"));
  EXPECT_TRUE(buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav"));
}

TEST(FormatAwareBufferTest, PendingPcmAndCompaction) {
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");

  const auto a = tests::Payload(0x00, 4);
  const auto b = tests::Payload(0x10, 6);
  buffer.AppendPcm(a);
  buffer.AppendPcm(b);
  EXPECT_EQ(buffer.PendingPcm().size(), 10u);
  EXPECT_EQ(buffer.full_session_pcm().size(), 10u);

  buffer.CommitPcmBatch(10);
  EXPECT_TRUE(buffer.pcm_batch_buffer().empty());
  EXPECT_EQ(buffer.batch_offset(), 0u);
  EXPECT_EQ(buffer.compacted_bytes(), 10u);
  EXPECT_TRUE(buffer.PendingPcm().empty());

  // full-session copy survives compaction
  EXPECT_EQ(buffer.full_session_pcm().size(), 10u);
}

TEST(FormatAwareBufferTest, PartialCommitKeepsTail) {
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");
  buffer.AppendPcm(tests::Payload(0x00, 8));

  buffer.CommitPcmBatch(6);
  ASSERT_EQ(buffer.pcm_batch_buffer().size(), 2u);
  EXPECT_EQ(buffer.pcm_batch_buffer()[0], 0x06);
  EXPECT_EQ(buffer.batch_offset(), 0u);
  EXPECT_LE(buffer.batch_offset(), buffer.pcm_batch_buffer().size());
}

TEST(FormatAwareBufferTest, CommitIsClampedToBuffer) {
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kRawPcmContainer, "audio/wav");
  buffer.AppendPcm(tests::Payload(0x00, 4));
  buffer.CommitPcmBatch(100);
  EXPECT_TRUE(buffer.pcm_batch_buffer().empty());
  EXPECT_EQ(buffer.compacted_bytes(), 4u);
}

TEST(FormatAwareBufferTest, ContainerBytesAccumulateUncompacted) {
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kStreamingContainer, "audio/webm");
  buffer.AppendContainerBytes(tests::Payload(0x1a, 4));
  buffer.AppendContainerBytes(tests::Payload(0x40, 4));
  EXPECT_EQ(buffer.container_bytes().size(), 8u);
  EXPECT_TRUE(buffer.pcm_batch_buffer().empty());
}

TEST(FormatAwareBufferTest, ProcessedOffsetNeverDecreases) {
  FormatAwareBuffer buffer;
  buffer.FixFormat(SourceFormat::kStreamingContainer, "audio/webm");
  buffer.AdvanceProcessedPcmOffset(100);
  buffer.AdvanceProcessedPcmOffset(40);
  EXPECT_EQ(buffer.processed_pcm_offset(), 100u);
  buffer.AdvanceProcessedPcmOffset(160);
  EXPECT_EQ(buffer.processed_pcm_offset(), 160u);
}

TEST(FormatAwareBufferTest, FormatNames) {
  EXPECT_STREQ(SourceFormatName(SourceFormat::kRawPcmContainer), "raw_pcm_container");
  EXPECT_STREQ(SourceFormatName(SourceFormat::kStreamingContainer), "streaming_container");
  EXPECT_STREQ(SourceFormatName(SourceFormat::kUnknown), "unknown");
}

}  // namespace
}  // namespace batchscribe::session
