#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <vector>

#include "keyscan/byte_source.hpp"
#include "keyscan/error.hpp"
#include "keyscan/frame.hpp"
#include "keyscan/frame_reader.hpp"
#include "keyscan/types.hpp"

using namespace keyscan;

namespace {

std::vector<uint8_t> counting_bytes(size_t n) {
  std::vector<uint8_t> out(n);
  for (size_t i = 0; i < n; ++i)
    out[i] = static_cast<uint8_t>(i);
  return out;
}

/// Hands out at most `chunk` bytes per read
class TrickleSource : public ByteSource {
public:
  TrickleSource(const std::vector<uint8_t> &data, size_t chunk)
      : inner_(data.data(), data.size()), chunk_(chunk) {}

  size_t read(uint8_t *buf, size_t n) override {
    return inner_.read(buf, std::min(n, chunk_));
  }

private:
  MemoryByteSource inner_;
  size_t chunk_;
};

/// Serves `good` bytes, then fails
class FailingSource : public ByteSource {
public:
  explicit FailingSource(size_t good) : good_(good) {}

  size_t read(uint8_t *buf, size_t n) override {
    if (good_ == 0)
      throw Error(ErrorKind::IO, "device went away");
    size_t got = std::min(n, good_);
    std::fill(buf, buf + got, uint8_t{1});
    good_ -= got;
    return got;
  }

private:
  size_t good_;
};

} // namespace

TEST(FrameReader, ReadsWholeFramesAndDropsPartialTail) {
  auto bytes = counting_bytes(25);
  MemoryByteSource src(bytes.data(), bytes.size());
  StreamingFrameReader reader(src, 5, 2);

  auto frames = reader.read_all();
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(reader.frames_read(), 2u);
  EXPECT_TRUE(reader.finished());

  EXPECT_EQ(frames[0].index(), 0u);
  EXPECT_EQ(frames[1].index(), 1u);
  for (size_t i = 0; i < 10; ++i) {
    EXPECT_EQ(frames[0].data()[i], i);
    EXPECT_EQ(frames[1].data()[i], 10 + i);
  }
}

TEST(FrameReader, ShortReadsAreReassembled) {
  auto bytes = counting_bytes(3 * 12);
  TrickleSource src(bytes, 5);
  StreamingFrameReader reader(src, 4, 3);

  auto frames = reader.read_all();
  ASSERT_EQ(frames.size(), 3u);
  EXPECT_EQ(frames[2].data()[0], 24);
  EXPECT_EQ(frames[2].data()[11], 35);
}

TEST(FrameReader, StopsAtFrameCap) {
  auto bytes = counting_bytes(10 * 4);
  MemoryByteSource src(bytes.data(), bytes.size());
  StreamingFrameReader reader(src, 2, 2, 3);

  auto frames = reader.read_all();
  EXPECT_EQ(frames.size(), 3u);
  /// The cap stops reading, it does not drain the source
  EXPECT_EQ(src.remaining(), 7u * 4);
  EXPECT_FALSE(reader.next().has_value());
}

TEST(FrameReader, EmptySourceYieldsNothing) {
  MemoryByteSource src(nullptr, 0);
  StreamingFrameReader reader(src, 4, 4);
  EXPECT_FALSE(reader.next().has_value());
  EXPECT_TRUE(reader.finished());
  EXPECT_EQ(reader.frames_read(), 0u);
}

TEST(FrameReader, ZeroGeometryIsRejected) {
  MemoryByteSource src(nullptr, 0);
  try {
    StreamingFrameReader reader(src, 0, 10);
    FAIL() << "expected a configuration error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Configuration);
  }
  EXPECT_THROW(StreamingFrameReader(src, 10, 0), Error);
}

TEST(FrameReader, SourceFailurePropagates) {
  FailingSource src(8 * 3 + 2);
  StreamingFrameReader reader(src, 4, 2);

  ASSERT_TRUE(reader.next().has_value());
  ASSERT_TRUE(reader.next().has_value());
  ASSERT_TRUE(reader.next().has_value());
  try {
    reader.next();
    FAIL() << "expected an I/O error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IO);
  }
}

TEST(FrameBuffer, PaddingIsZeroAndAligned) {
  auto bytes = std::vector<uint8_t>(7 * 3, 0xff);
  FrameBuffer frame(4, 7, 3, bytes.data());

  EXPECT_EQ(frame.index(), 4u);
  EXPECT_EQ(frame.pixel_count(), 21u);
  EXPECT_EQ(frame.padded_size(), 32u);
  EXPECT_EQ(reinterpret_cast<uintptr_t>(frame.data()) % VECTOR_ALIGNMENT, 0u);
  for (size_t i = 0; i < frame.pixel_count(); ++i)
    EXPECT_EQ(frame.data()[i], 0xff);
  for (size_t i = frame.pixel_count(); i < frame.padded_size(); ++i)
    EXPECT_EQ(frame.data()[i], 0);
}

TEST(FrameBuffer, GeometryComparison) {
  std::vector<uint8_t> px(12, 1);
  FrameBuffer a(0, 4, 3, px.data());
  FrameBuffer b(1, 4, 3, px.data());
  FrameBuffer c(2, 3, 4, px.data());
  EXPECT_TRUE(a.same_geometry(b));
  EXPECT_FALSE(a.same_geometry(c));
}

TEST(FrameBuffer, ZeroGeometryIsRejected) {
  uint8_t px[1] = {0};
  EXPECT_THROW(FrameBuffer(0, 0, 1, px), Error);
}
