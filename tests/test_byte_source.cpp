#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

#include "keyscan/byte_source.hpp"
#include "keyscan/error.hpp"
#include "keyscan/memory_io.hpp"

using namespace keyscan;
namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string &name, const std::vector<uint8_t> &data) {
  fs::path p = fs::temp_directory_path() /
               (name + "_" + std::to_string(::getpid()));
  std::ofstream out(p, std::ios::binary);
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
  return p;
}

} // namespace

TEST(MemoryByteSource, ReadsThenSignalsEnd) {
  std::vector<uint8_t> data = {1, 2, 3, 4, 5};
  MemoryByteSource src(data.data(), data.size());

  uint8_t buf[3];
  EXPECT_EQ(src.read(buf, 3), 3u);
  EXPECT_EQ(buf[2], 3);
  EXPECT_EQ(src.remaining(), 2u);
  EXPECT_EQ(src.read(buf, 3), 2u);
  EXPECT_EQ(buf[1], 5);
  EXPECT_EQ(src.read(buf, 3), 0u);
}

TEST(MappedFileSource, ReadsFileContents) {
  std::vector<uint8_t> data(1000);
  for (size_t i = 0; i < data.size(); ++i)
    data[i] = static_cast<uint8_t>(i * 7);
  fs::path p = write_temp("keyscan_mapped", data);

  {
    MappedFileSource src(p.string());
    EXPECT_EQ(src.size(), data.size());
    std::vector<uint8_t> back(data.size());
    EXPECT_EQ(src.read(back.data(), back.size()), data.size());
    EXPECT_EQ(back, data);
    EXPECT_EQ(src.read(back.data(), 1), 0u);
  }
  fs::remove(p);
}

TEST(MappedFileSource, EmptyFileHasNoBytes) {
  fs::path p = write_temp("keyscan_empty", {});
  {
    MappedFileSource src(p.string());
    uint8_t buf[4];
    EXPECT_EQ(src.size(), 0u);
    EXPECT_EQ(src.read(buf, 4), 0u);
  }
  fs::remove(p);
}

TEST(MappedFileSource, MissingFileIsIoError) {
  try {
    MappedFileSource src("/nonexistent/keyscan/input.gray");
    FAIL() << "expected an I/O error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IO);
  }
}

TEST(FdByteSource, ReadsFromPipe) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  const uint8_t msg[] = {9, 8, 7, 6};
  ASSERT_EQ(::write(fds[1], msg, sizeof(msg)), 4);
  ::close(fds[1]);

  FdByteSource src(fds[0], true);
  uint8_t buf[8];
  size_t total = 0;
  while (size_t got = src.read(buf + total, sizeof(buf) - total))
    total += got;
  EXPECT_EQ(total, 4u);
  EXPECT_EQ(buf[3], 6);
}

TEST(FdByteSource, BadDescriptorIsIoError) {
  FdByteSource src(-1);
  uint8_t buf[4];
  try {
    src.read(buf, 4);
    FAIL() << "expected an I/O error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IO);
  }
}
