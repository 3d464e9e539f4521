/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "src/ftrace/trace_pipeline.h"

#include <string.h>
#include <unistd.h>

#include <algorithm>
#include <optional>
#include <random>
#include <string>

#include "atrace/ext/base/file_utils.h"
#include "atrace/ext/base/temp_file.h"
#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

std::string RandomBytes(size_t size, uint32_t seed) {
  std::minstd_rand0 rnd_engine(seed);
  std::string data(size, '\0');
  for (size_t i = 0; i < size; i++)
    data[i] = static_cast<char>(rnd_engine() & 0xff);
  return data;
}

base::TempFile TempFileWithContents(const std::string& contents) {
  base::TempFile file = base::TempFile::Create();
  EXPECT_EQ(base::WriteAll(file.fd(), contents.data(), contents.size()),
            static_cast<ssize_t>(contents.size()));
  EXPECT_EQ(lseek(file.fd(), 0, SEEK_SET), 0);
  return file;
}

std::string ReadBack(const base::TempFile& file) {
  std::string contents;
  EXPECT_TRUE(base::ReadFile(file.path(), &contents));
  return contents;
}

// In-memory TraceIo that can be told to fail writes.
class StringTraceIo : public TraceIo {
 public:
  explicit StringTraceIo(std::string input) : input_(std::move(input)) {}

  ssize_t Read(void* dst, size_t size) override {
    size_t len = std::min(size, input_.size() - read_offset_);
    memcpy(dst, input_.data() + read_offset_, len);
    read_offset_ += len;
    return static_cast<ssize_t>(len);
  }

  ssize_t Write(const void* src, size_t size) override {
    writes_++;
    if (fail_write_ && writes_ == *fail_write_) {
      size_t partial = size / 2;
      output_.append(static_cast<const char*>(src), partial);
      return static_cast<ssize_t>(partial);
    }
    output_.append(static_cast<const char*>(src), size);
    return static_cast<ssize_t>(size);
  }

  void FailWrite(int n) { fail_write_ = n; }
  int writes() const { return writes_; }
  const std::string& output() const { return output_; }

 private:
  std::string input_;
  size_t read_offset_ = 0;
  std::string output_;
  int writes_ = 0;
  std::optional<int> fail_write_;
};

// Forwards to a real codec and tracks how many are alive.
class CountingCodec : public StreamCodec {
 public:
  static int live_count;

  explicit CountingCodec(std::unique_ptr<StreamCodec> impl)
      : impl_(std::move(impl)) {
    live_count++;
  }
  ~CountingCodec() override { live_count--; }

  base::Status Init() override { return impl_->Init(); }
  void SetInput(const uint8_t* data, size_t size) override {
    impl_->SetInput(data, size);
  }
  size_t avail_in() const override { return impl_->avail_in(); }
  void SetOutput(uint8_t* data, size_t size) override {
    impl_->SetOutput(data, size);
  }
  size_t avail_out() const override { return impl_->avail_out(); }
  Result Process(bool finish) override { return impl_->Process(finish); }

 private:
  std::unique_ptr<StreamCodec> impl_;
};

int CountingCodec::live_count = 0;

class FailingInitCodec : public CountingCodec {
 public:
  FailingInitCodec() : CountingCodec(CreateDeflateCodec()) {}
  base::Status Init() override { return base::ErrStatus("no memory"); }
};

class CompressRoundTripTest : public ::testing::TestWithParam<size_t> {};

TEST_P(CompressRoundTripTest, DecompressReproducesInput) {
  const std::string data = RandomBytes(GetParam(), 42);
  base::TempFile in = TempFileWithContents(data);
  base::TempFile compressed = base::TempFile::Create();
  ASSERT_TRUE(DumpTrace(in.fd(), compressed.fd(), /*compress=*/true).ok());

  base::TempFile out = base::TempFile::Create();
  base::Status status = DecompressTraceFile(compressed.path(), out.fd());
  ASSERT_TRUE(status.ok()) << status.message();
  EXPECT_EQ(ReadBack(out), data);
}

INSTANTIATE_TEST_SUITE_P(ChunkBoundaries,
                         CompressRoundTripTest,
                         ::testing::Values(0u,
                                           1u,
                                           kTraceChunkSize - 1,
                                           kTraceChunkSize,
                                           kTraceChunkSize + 1,
                                           3 * kTraceChunkSize + 17));

TEST(TracePipelineTest, CompressesText) {
  std::string text;
  for (int i = 0; i < 10000; i++)
    text += "  <idle>-0     [001] d..2  1234.567890: sched_switch\n";
  base::TempFile in = TempFileWithContents(text);
  base::TempFile compressed = base::TempFile::Create();
  ASSERT_TRUE(CompressTrace(in.fd(), compressed.fd()).ok());

  std::string compressed_data = ReadBack(compressed);
  EXPECT_GT(compressed_data.size(), 0u);
  EXPECT_LT(compressed_data.size(), text.size() / 10);
}

TEST(TracePipelineTest, RawCopy) {
  const std::string data = RandomBytes(2 * kTraceChunkSize + 5, 7);
  base::TempFile in = TempFileWithContents(data);
  base::TempFile out = base::TempFile::Create();
  ASSERT_TRUE(DumpTrace(in.fd(), out.fd(), /*compress=*/false).ok());
  EXPECT_EQ(ReadBack(out), data);
}

TEST(TracePipelineTest, RawCopyOfEmptyTraceWritesNothing) {
  base::TempFile in = base::TempFile::Create();
  base::TempFile out = base::TempFile::Create();
  ASSERT_TRUE(CopyTraceRaw(in.fd(), out.fd()).ok());
  EXPECT_EQ(ReadBack(out), "");
}

TEST(TracePipelineTest, RawCopyFailsOnBadFd) {
  base::TempFile out = base::TempFile::Create();
  EXPECT_FALSE(CopyTraceRaw(-1, out.fd()).ok());
}

TEST(TracePipelineTest, ShortWriteStopsPipeline) {
  const size_t kChunk = 4096;
  StringTraceIo io(RandomBytes(16 * kChunk, 1));
  io.FailWrite(2);

  CountingCodec::live_count = 0;
  base::Status status = TransferThroughCodec(
      std::unique_ptr<StreamCodec>(new CountingCodec(CreateDeflateCodec())),
      &io, kChunk);
  EXPECT_FALSE(status.ok());
  // Nothing is written after the failing chunk.
  EXPECT_EQ(io.writes(), 2);
  EXPECT_EQ(io.output().size(), kChunk + kChunk / 2);
  EXPECT_EQ(CountingCodec::live_count, 0);
}

TEST(TracePipelineTest, ShortFinalWriteFails) {
  StringTraceIo io("tiny");
  io.FailWrite(1);
  CountingCodec::live_count = 0;
  base::Status status = TransferThroughCodec(
      std::unique_ptr<StreamCodec>(new CountingCodec(CreateDeflateCodec())),
      &io);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(io.writes(), 1);
  EXPECT_EQ(CountingCodec::live_count, 0);
}

TEST(TracePipelineTest, CodecInitFailure) {
  StringTraceIo io("data");
  CountingCodec::live_count = 0;
  base::Status status =
      TransferThroughCodec(std::unique_ptr<StreamCodec>(new FailingInitCodec()),
                           &io);
  EXPECT_FALSE(status.ok());
  EXPECT_EQ(io.writes(), 0);
  EXPECT_EQ(CountingCodec::live_count, 0);
}

TEST(TracePipelineTest, ReplayOfMissingFile) {
  base::TempFile out = base::TempFile::Create();
  EXPECT_FALSE(DecompressTraceFile("/does/not/exist", out.fd()).ok());
}

TEST(TracePipelineTest, ReplayOfEmptyFile) {
  base::TempFile in = base::TempFile::Create();
  base::TempFile out = base::TempFile::Create();
  EXPECT_FALSE(DecompressTraceFile(in.path(), out.fd()).ok());
}

TEST(TracePipelineTest, ReplayOfCorruptFile) {
  base::TempFile in = TempFileWithContents("this is not a zlib stream");
  base::TempFile out = base::TempFile::Create();
  EXPECT_FALSE(DecompressTraceFile(in.path(), out.fd()).ok());
}

TEST(TracePipelineTest, ReplayOfTruncatedFile) {
  const std::string data = RandomBytes(3 * kTraceChunkSize, 3);
  StringTraceIo compress_io(data);
  ASSERT_TRUE(
      TransferThroughCodec(CreateDeflateCodec(), &compress_io).ok());
  std::string compressed = compress_io.output();
  ASSERT_GT(compressed.size(), 100u);

  base::TempFile in =
      TempFileWithContents(compressed.substr(0, compressed.size() / 2));
  base::TempFile out = base::TempFile::Create();
  EXPECT_FALSE(DecompressTraceFile(in.path(), out.fd()).ok());
}

}  // namespace
}  // namespace atrace
