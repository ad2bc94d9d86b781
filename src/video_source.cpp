/**
 * @file video_source.cpp
 * @brief libav backed gray8 byte source
 */

#include "keyscan/video_source.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
#include <libavutil/pixdesc.h>
}

#include <fmt/core.h>

#include "keyscan/error.hpp"
#include "keyscan/logging.hpp"

namespace keyscan {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

[[noreturn]] void throw_av(const std::string &what, int err) {
  throw Error(ErrorKind::IO, fmt::format("{}: {}", what, av_error_string(err)));
}

/// AVIO read callback serving the mapped file.
int mem_read(void *opaque, uint8_t *buf, int buf_size) {
  auto *st = static_cast<MemReaderState *>(opaque);
  size_t bytes_left = st->size - st->pos;
  if (bytes_left == 0)
    return AVERROR_EOF;
  size_t copy = std::min(bytes_left, static_cast<size_t>(buf_size));
  std::memcpy(buf, st->ptr + st->pos, copy);
  st->pos += copy;
  return static_cast<int>(copy);
}

/// AVIO seek callback, including AVSEEK_SIZE.
int64_t mem_seek(void *opaque, int64_t offset, int whence) {
  auto *st = static_cast<MemReaderState *>(opaque);

  if (whence & AVSEEK_SIZE)
    return static_cast<int64_t>(st->size);

  int64_t new_pos = static_cast<int64_t>(st->pos);
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    new_pos = offset;
    break;
  case SEEK_CUR:
    new_pos += offset;
    break;
  case SEEK_END:
    new_pos = static_cast<int64_t>(st->size) + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  if (new_pos < 0 || new_pos > static_cast<int64_t>(st->size))
    return AVERROR(EINVAL);

  st->pos = static_cast<size_t>(new_pos);
  return new_pos;
}

/// 8-bit format whose first component is a tightly packed plane.
bool has_gray8_plane(AVPixelFormat pix_fmt) {
  const AVPixFmtDescriptor *desc = av_pix_fmt_desc_get(pix_fmt);
  if (!desc)
    return false;
  if (desc->flags &
      (AV_PIX_FMT_FLAG_RGB | AV_PIX_FMT_FLAG_PAL | AV_PIX_FMT_FLAG_BITSTREAM))
    return false;
  const AVComponentDescriptor &y = desc->comp[0];
  return y.depth == 8 && y.plane == 0 && y.step == 1 && y.offset == 0 &&
         y.shift == 0;
}

} // anonymous namespace

VideoByteSource::VideoByteSource(const std::string &path) : path_(path) {
  try {
    open_input();
    open_decoder();
  } catch (const Error &) {
    release();
    throw;
  }
}

VideoByteSource::~VideoByteSource() { release(); }

void VideoByteSource::release() noexcept {
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);

  if (fmt_ctx) {
    /// With AVFMT_FLAG_CUSTOM_IO the AVIO context stays ours
    avformat_close_input(&fmt_ctx);
  }
  if (avio_ctx) {
    /// The context may have replaced its buffer; free whatever it holds
    av_freep(&avio_ctx->buffer);
    avio_context_free(&avio_ctx);
    avio_buffer = nullptr;
  } else if (avio_buffer) {
    av_freep(&avio_buffer);
  }

  av_frame_free(&frame);
  av_packet_free(&pkt);
}

void VideoByteSource::open_input() {
  TIMER_START(open_video);

  file_ = MappedFile::open(path_);
  if (file_.size() == 0)
    throw Error(ErrorKind::IO, fmt::format("{} is empty", path_));

  frame = av_frame_alloc();
  pkt = av_packet_alloc();
  if (!frame || !pkt)
    throw Error(ErrorKind::IO, "failed to allocate AVFrame/AVPacket");

  fmt_ctx = avformat_alloc_context();
  if (!fmt_ctx)
    throw Error(ErrorKind::IO, "failed to allocate AVFormatContext");

  avio_buffer = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!avio_buffer)
    throw Error(ErrorKind::IO, "failed to allocate AVIO buffer");

  mem_state_.ptr = file_.data();
  mem_state_.size = file_.size();
  mem_state_.pos = 0;

  avio_ctx = avio_alloc_context(avio_buffer, AVIO_BUFFER_SIZE, 0, &mem_state_,
                                mem_read, nullptr, mem_seek);
  if (!avio_ctx)
    throw Error(ErrorKind::IO, "failed to allocate AVIOContext");

  fmt_ctx->pb = avio_ctx;
  fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

  /// On failure avformat_open_input frees fmt_ctx and nulls the pointer
  int ret = avformat_open_input(&fmt_ctx, path_.c_str(), nullptr, nullptr);
  if (ret < 0)
    throw_av(fmt::format("cannot open {}", path_), ret);

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0)
    throw_av(fmt::format("cannot read stream info of {}", path_), ret);

  video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0)
    throw_av(fmt::format("no video stream in {}", path_), video_stream_idx);

  /// Only the video stream is demuxed further
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(video_stream_idx))
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
  }

  AVStream *stream = fmt_ctx->streams[video_stream_idx];
  AVRational r = stream->avg_frame_rate;
  if (r.num > 0 && r.den > 0)
    fps_ = av_q2d(r);

  TIMER_END(open_video);
}

void VideoByteSource::open_decoder() {
  AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
  const AVCodec *codec = avcodec_find_decoder(param->codec_id);
  if (!codec) {
    throw Error(ErrorKind::IO,
                fmt::format("no decoder for codec {} in {}",
                            avcodec_get_name(param->codec_id), path_));
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx)
    throw Error(ErrorKind::IO, "failed to allocate decoder context");

  int ret = avcodec_parameters_to_context(dec_ctx, param);
  if (ret < 0)
    throw_av("cannot copy codec parameters", ret);

  /// Only luma is consumed; decoders that support it skip chroma work
  dec_ctx->flags |= AV_CODEC_FLAG_GRAY;

  /// Decoding is the sequential stage; let libavcodec use every core
  dec_ctx->thread_count = 0;

  ret = avcodec_open2(dec_ctx, codec, nullptr);
  if (ret < 0)
    throw_av("avcodec_open2 failed", ret);

  width_ = static_cast<size_t>(dec_ctx->width);
  height_ = static_cast<size_t>(dec_ctx->height);
  if (width_ == 0 || height_ == 0) {
    throw Error(ErrorKind::IO,
                fmt::format("{} reports no frame size", path_));
  }

  LOG_INFO("Video: {}x{} @ {:.2f} fps ({})", width_, height_, fps_,
           codec->name);
}

bool VideoByteSource::decode_next() {
  while (true) {
    int ret = avcodec_receive_frame(dec_ctx, frame);
    if (ret == 0) {
      copy_luma();
      av_frame_unref(frame);
      ++frames_decoded_;
      return true;
    }
    if (ret == AVERROR_EOF)
      return false;
    if (ret != AVERROR(EAGAIN))
      throw_av(fmt::format("decoding {} failed", path_), ret);

    /// Decoder wants input
    if (draining_)
      return false;

    ret = av_read_frame(fmt_ctx, pkt);
    if (ret == AVERROR_EOF) {
      /// Flush frames still buffered in the decoder
      draining_ = true;
      ret = avcodec_send_packet(dec_ctx, nullptr);
      if (ret < 0 && ret != AVERROR_EOF)
        throw_av("flushing decoder failed", ret);
      continue;
    }
    if (ret < 0)
      throw_av(fmt::format("demuxing {} failed", path_), ret);

    if (pkt->stream_index == video_stream_idx) {
      ret = avcodec_send_packet(dec_ctx, pkt);
      if (ret < 0 && ret != AVERROR(EAGAIN) && ret != AVERROR_INVALIDDATA) {
        av_packet_unref(pkt);
        throw_av(fmt::format("decoding {} failed", path_), ret);
      }
      if (ret == AVERROR_INVALIDDATA)
        LOG_WARN("Skipping corrupt packet in {}", path_);
    }
    av_packet_unref(pkt);
  }
}

void VideoByteSource::copy_luma() {
  auto pix_fmt = static_cast<AVPixelFormat>(frame->format);
  if (!has_gray8_plane(pix_fmt)) {
    const char *name = av_get_pix_fmt_name(pix_fmt);
    throw Error(ErrorKind::IO,
                fmt::format("unsupported pixel format {} in {}",
                            name ? name : "unknown", path_));
  }
  if (static_cast<size_t>(frame->width) != width_ ||
      static_cast<size_t>(frame->height) != height_) {
    throw Error(ErrorKind::IO,
                fmt::format("frame size changed from {}x{} to {}x{} in {}",
                            width_, height_, frame->width, frame->height,
                            path_));
  }

  pending_.resize(width_ * height_);
  pending_pos_ = 0;

  /// Drop the line padding of the decoder's plane
  const uint8_t *src = frame->data[0];
  uint8_t *dst = pending_.data();
  for (size_t y = 0; y < height_; ++y) {
    std::memcpy(dst + y * width_,
                src + static_cast<ptrdiff_t>(y) * frame->linesize[0], width_);
  }
}

size_t VideoByteSource::read(uint8_t *buf, size_t n) {
  size_t copied = 0;
  while (copied < n) {
    if (pending_pos_ == pending_.size()) {
      if (finished_)
        break;
      if (!decode_next()) {
        finished_ = true;
        LOG_DEBUG("Decoded {} frames from {}", frames_decoded_, path_);
        break;
      }
    }
    size_t chunk = std::min(n - copied, pending_.size() - pending_pos_);
    std::memcpy(buf + copied, pending_.data() + pending_pos_, chunk);
    pending_pos_ += chunk;
    copied += chunk;
  }
  return copied;
}

} // namespace keyscan
