/**
 * @file video_source.hpp
 * @brief Decoded luma planes of a video file as a gray8 byte stream
 *
 * @details VideoByteSource maps a video file into RAM, demuxes it through a
 *          custom AVIO context and decodes its best video stream. read()
 *          serves the luma plane of each decoded frame row by row without
 *          line padding, i.e. exactly width*height bytes per frame, which
 *          is what StreamingFrameReader expects.
 *
 * @attention
 * `FORMATS`:
 *
 *            - 8-bit formats whose first component is a full-resolution
 *              plane (yuv420p, yuvj420p, yuv444p, nv12, gray, ...)
 *
 *            - Anything else is Error (IO) on the first frame
 *
 * `MANAGEMENT`:
 *
 *            - Uses AVFMT_FLAG_CUSTOM_IO for proper cleanup of custom I/O
 *
 *            - Destructor handles partial initialization failures
 */

#ifndef KEYSCAN_VIDEO_SOURCE_HPP
#define KEYSCAN_VIDEO_SOURCE_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "byte_source.hpp"
#include "memory_io.hpp"
#include "types.hpp"

namespace keyscan {

/**
 * @brief Read position inside a mapped file for the AVIO callbacks.
 * @note Cache-line aligned since it is touched on every AVIO refill.
 */
struct alignas(CACHE_LINE_SIZE) MemReaderState {
  const uint8_t *ptr = nullptr; //< Buffer start
  size_t size = 0;              //< Total buffer size
  size_t pos = 0;               //< Current read position
};

class VideoByteSource : public ByteSource {
public:
  /**
   * @brief Open a video file and read its stream geometry.
   * @throw Error (IO) if the file cannot be mapped, demuxed or decoded
   */
  explicit VideoByteSource(const std::string &path);
  ~VideoByteSource() override;

  VideoByteSource(const VideoByteSource &) = delete;
  VideoByteSource &operator=(const VideoByteSource &) = delete;

  size_t read(uint8_t *buf, size_t n) override;

  size_t width() const { return width_; }
  size_t height() const { return height_; }

  /// Average frame rate of the stream (30 when the container has none).
  double fps() const { return fps_; }

  /// Size of the I/O buffer handed to libavformat.
  static constexpr int AVIO_BUFFER_SIZE = 256 * 1024;

private:
  void open_input();
  void release() noexcept;
  void open_decoder();

  /// Decode one more frame into pending_; false at end of stream.
  bool decode_next();

  /// Copy the luma plane of frame_ into pending_.
  void copy_luma();

  std::string path_;
  MappedFile file_;
  MemReaderState mem_state_;

  /// FFmpeg contexts (owned by this instance)
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  AVIOContext *avio_ctx = nullptr;
  uint8_t *avio_buffer = nullptr;
  int video_stream_idx = -1;

  size_t width_ = 0;
  size_t height_ = 0;
  double fps_ = 30.0;

  std::vector<uint8_t> pending_; //< Luma bytes not yet handed out
  size_t pending_pos_ = 0;
  size_t frames_decoded_ = 0;
  bool draining_ = false;
  bool finished_ = false;
};

} // namespace keyscan

#endif // KEYSCAN_VIDEO_SOURCE_HPP
