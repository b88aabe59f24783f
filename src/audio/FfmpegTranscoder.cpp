// Repository: BatchScribe
// Component: FFmpeg Transcoder
// Purpose: In-memory audio decoding using libavformat/libavcodec.
// Copyright (c) 2025 BatchScribe

#include "batchscribe/audio/FfmpegTranscoder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>

#include "batchscribe/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/mem.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace batchscribe::audio {

namespace {

constexpr int kIoBufferSize = 32 * 1024;

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

// Read cursor over the caller's buffer; opaque for the AVIOContext callbacks.
struct MemoryReader {
  const uint8_t* data = nullptr;
  size_t size = 0;
  size_t pos = 0;
};

int ReadPacket(void* opaque, uint8_t* buf, int buf_size) {
  auto* reader = static_cast<MemoryReader*>(opaque);
  const size_t remaining = reader->size - reader->pos;
  if (remaining == 0) return AVERROR_EOF;
  const size_t n = std::min(remaining, static_cast<size_t>(buf_size));
  std::memcpy(buf, reader->data + reader->pos, n);
  reader->pos += n;
  return static_cast<int>(n);
}

int64_t SeekPacket(void* opaque, int64_t offset, int whence) {
  auto* reader = static_cast<MemoryReader*>(opaque);
  if (whence == AVSEEK_SIZE) {
    return static_cast<int64_t>(reader->size);
  }
  int64_t base = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET: base = 0; break;
    case SEEK_CUR: base = static_cast<int64_t>(reader->pos); break;
    case SEEK_END: base = static_cast<int64_t>(reader->size); break;
    default: return -1;
  }
  const int64_t target = base + offset;
  if (target < 0 || target > static_cast<int64_t>(reader->size)) return -1;
  reader->pos = static_cast<size_t>(target);
  return target;
}

// Owns every libav object for one Decode() call; released in reverse order.
struct DecodeContext {
  MemoryReader reader;
  AVIOContext* io = nullptr;
  AVFormatContext* format = nullptr;
  AVCodecContext* codec = nullptr;
  SwrContext* swr = nullptr;
  AVPacket* packet = nullptr;
  AVFrame* frame = nullptr;
  int stream_index = -1;
  int swr_in_rate = 0;

  ~DecodeContext() {
    if (frame) av_frame_free(&frame);
    if (packet) av_packet_free(&packet);
    if (swr) swr_free(&swr);
    if (codec) avcodec_free_context(&codec);
    if (format) avformat_close_input(&format);
    if (io) {
      av_freep(&io->buffer);
      avio_context_free(&io);
    }
  }
};

bool InitializeResampler(DecodeContext& ctx, const AVFrame* frame, std::string* err) {
  AVChannelLayout src_ch_layout;
  std::memset(&src_ch_layout, 0, sizeof(src_ch_layout));
  if (frame->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC ||
      frame->ch_layout.nb_channels <= 0) {
    const int nb = frame->ch_layout.nb_channels > 0 ? frame->ch_layout.nb_channels : 1;
    av_channel_layout_default(&src_ch_layout, nb);
  } else if (av_channel_layout_copy(&src_ch_layout, &frame->ch_layout) < 0) {
    *err = "failed to copy source channel layout";
    return false;
  }

  AVChannelLayout dst_ch_layout;
  std::memset(&dst_ch_layout, 0, sizeof(dst_ch_layout));
  av_channel_layout_default(&dst_ch_layout, kCanonicalChannels);

  int ret = swr_alloc_set_opts2(&ctx.swr,
                                &dst_ch_layout, AV_SAMPLE_FMT_S16, kCanonicalSampleRate,
                                &src_ch_layout, static_cast<AVSampleFormat>(frame->format),
                                frame->sample_rate,
                                0, nullptr);
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);
  if (ret < 0 || !ctx.swr) {
    *err = "swr_alloc_set_opts2: " + AvErrorString(ret);
    return false;
  }
  ret = swr_init(ctx.swr);
  if (ret < 0) {
    *err = "swr_init: " + AvErrorString(ret);
    return false;
  }
  ctx.swr_in_rate = frame->sample_rate;
  return true;
}

// Appends resampled samples of frame (or the resampler tail when frame is null).
bool ConvertFrame(DecodeContext& ctx, const AVFrame* frame, PcmBytes& pcm) {
  const int in_rate = frame ? frame->sample_rate : ctx.swr_in_rate;
  const int in_samples = frame ? frame->nb_samples : 0;
  const int64_t delay = swr_get_delay(ctx.swr, in_rate);
  const int64_t out_samples = av_rescale_rnd(delay + in_samples, kCanonicalSampleRate,
                                             in_rate, AV_ROUND_UP);
  if (out_samples <= 0) return true;

  const size_t offset = pcm.size();
  pcm.resize(offset + static_cast<size_t>(out_samples) * kCanonicalBytesPerSample);
  uint8_t* out_planes[1] = {pcm.data() + offset};
  const int converted = swr_convert(
      ctx.swr, out_planes, static_cast<int>(out_samples),
      frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
      in_samples);
  if (converted < 0) {
    pcm.resize(offset);
    return false;
  }
  pcm.resize(offset + static_cast<size_t>(converted) * kCanonicalBytesPerSample);
  return true;
}

// Pulls every ready frame out of the decoder. Returns false on resampler failure.
bool DrainFrames(DecodeContext& ctx, PcmBytes& pcm, std::string* err) {
  while (true) {
    int ret = avcodec_receive_frame(ctx.codec, ctx.frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
    if (ret < 0) return true;  // Corrupt frame; keep what we have.
    if (!ctx.swr && !InitializeResampler(ctx, ctx.frame, err)) {
      av_frame_unref(ctx.frame);
      return false;
    }
    const bool ok = ConvertFrame(ctx, ctx.frame, pcm);
    av_frame_unref(ctx.frame);
    if (!ok) {
      *err = "swr_convert failed";
      return false;
    }
  }
}

std::string ToLower(const std::string& s) {
  std::string out(s.size(), '\0');
  std::transform(s.begin(), s.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

FfmpegTranscoder::FfmpegTranscoder() {
  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);
}

FfmpegTranscoder::~FfmpegTranscoder() = default;

std::string FfmpegTranscoder::DemuxerForMime(const std::string& mime) {
  // Codec parameters (";codecs=opus") do not change the container.
  std::string base = ToLower(mime.substr(0, mime.find(';')));
  if (base.find("webm") != std::string::npos) return "webm";
  if (base.find("ogg") != std::string::npos) return "ogg";
  if (base.find("wav") != std::string::npos || base.find("wave") != std::string::npos) return "wav";
  if (base.find("mpeg") != std::string::npos || base.find("mp3") != std::string::npos) return "mp3";
  if (base.find("mp4") != std::string::npos || base.find("m4a") != std::string::npos ||
      base.find("aac") != std::string::npos) {
    return "mov";
  }
  if (base.find("pcm") != std::string::npos || base.find("l16") != std::string::npos) return "s16le";
  return "";
}

TranscoderStats FfmpegTranscoder::GetStats() const {
  TranscoderStats stats;
  stats.decodes_ok = decodes_ok_.load(std::memory_order_relaxed);
  stats.decodes_failed = decodes_failed_.load(std::memory_order_relaxed);
  stats.packets_skipped = packets_skipped_.load(std::memory_order_relaxed);
  return stats;
}

DecodeResult FfmpegTranscoder::Decode(const std::vector<uint8_t>& bytes,
                                      const std::string& format_hint) {
  auto fail = [&](const std::string& message) {
    decodes_failed_.fetch_add(1, std::memory_order_relaxed);
    util::Logger::Debug("[FfmpegTranscoder] DECODE FAILED hint=" + format_hint +
                        " bytes=" + std::to_string(bytes.size()) + " err=" + message);
    return DecodeResult::Fail(message, bytes);
  };

  if (bytes.empty()) {
    return fail("empty input");
  }

  DecodeContext ctx;
  ctx.reader.data = bytes.data();
  ctx.reader.size = bytes.size();

  auto* io_buffer = static_cast<unsigned char*>(av_malloc(kIoBufferSize));
  if (!io_buffer) {
    return fail("failed to allocate io buffer");
  }
  ctx.io = avio_alloc_context(io_buffer, kIoBufferSize, 0, &ctx.reader,
                              ReadPacket, nullptr, SeekPacket);
  if (!ctx.io) {
    av_free(io_buffer);
    return fail("failed to allocate io context");
  }

  ctx.format = avformat_alloc_context();
  if (!ctx.format) {
    return fail("failed to allocate format context");
  }
  ctx.format->pb = ctx.io;
  ctx.format->flags |= AVFMT_FLAG_CUSTOM_IO;

  const AVInputFormat* input_format = nullptr;
  AVDictionary* options = nullptr;
  const std::string demuxer = DemuxerForMime(format_hint);
  if (!demuxer.empty()) {
    input_format = av_find_input_format(demuxer.c_str());
    if (demuxer == "s16le") {
      av_dict_set(&options, "sample_rate", std::to_string(kCanonicalSampleRate).c_str(), 0);
      av_dict_set(&options, "ch_layout", "mono", 0);
    }
  }

  int ret = avformat_open_input(&ctx.format, nullptr, input_format, &options);
  av_dict_free(&options);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    ctx.format = nullptr;
    return fail("avformat_open_input: " + AvErrorString(ret));
  }

  ret = avformat_find_stream_info(ctx.format, nullptr);
  if (ret < 0) {
    return fail("avformat_find_stream_info: " + AvErrorString(ret));
  }

  const AVCodec* codec = nullptr;
  ctx.stream_index = av_find_best_stream(ctx.format, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (ctx.stream_index < 0 || !codec) {
    return fail("no audio stream");
  }

  ctx.codec = avcodec_alloc_context3(codec);
  if (!ctx.codec) {
    return fail("failed to allocate codec context");
  }
  ret = avcodec_parameters_to_context(ctx.codec,
                                      ctx.format->streams[ctx.stream_index]->codecpar);
  if (ret < 0) {
    return fail("avcodec_parameters_to_context: " + AvErrorString(ret));
  }
  ret = avcodec_open2(ctx.codec, codec, nullptr);
  if (ret < 0) {
    return fail("avcodec_open2: " + AvErrorString(ret));
  }

  ctx.packet = av_packet_alloc();
  ctx.frame = av_frame_alloc();
  if (!ctx.packet || !ctx.frame) {
    return fail("failed to allocate packet/frame");
  }

  PcmBytes pcm;
  std::string err;
  int read_ret = 0;
  while ((read_ret = av_read_frame(ctx.format, ctx.packet)) >= 0) {
    if (ctx.packet->stream_index != ctx.stream_index) {
      av_packet_unref(ctx.packet);
      continue;
    }
    ret = avcodec_send_packet(ctx.codec, ctx.packet);
    av_packet_unref(ctx.packet);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      packets_skipped_.fetch_add(1, std::memory_order_relaxed);
      continue;
    }
    if (!DrainFrames(ctx, pcm, &err)) {
      return fail(err);
    }
  }
  if (read_ret != AVERROR_EOF) {
    util::Logger::Debug("[FfmpegTranscoder] read stopped early err=" +
                        AvErrorString(read_ret) + " pcm_bytes=" + std::to_string(pcm.size()));
  }

  // Flush decoder, then the resampler tail.
  if (avcodec_send_packet(ctx.codec, nullptr) >= 0 && !DrainFrames(ctx, pcm, &err)) {
    return fail(err);
  }
  if (ctx.swr && !ConvertFrame(ctx, nullptr, pcm)) {
    return fail("swr flush failed");
  }

  if (pcm.empty()) {
    if (read_ret != AVERROR_EOF) {
      return fail("av_read_frame: " + AvErrorString(read_ret));
    }
    return fail("no audio decoded");
  }

  decodes_ok_.fetch_add(1, std::memory_order_relaxed);
  return DecodeResult::Ok(std::move(pcm));
}

}  // namespace batchscribe::audio
