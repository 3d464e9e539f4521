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

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/sendfile.h>
#include <unistd.h>
#include <zlib.h>

#include <new>

#include "atrace/base/logging.h"
#include "atrace/ext/base/file_utils.h"
#include "atrace/ext/base/scoped_file.h"

namespace atrace {
namespace {

// Shared state of the deflating and inflating codecs. The z_stream only
// points into the caller's buffers.
class ZlibCodec : public StreamCodec {
 public:
  void SetInput(const uint8_t* data, size_t size) override {
    stream_.next_in = const_cast<uint8_t*>(data);
    stream_.avail_in = static_cast<uInt>(size);
  }
  size_t avail_in() const override { return stream_.avail_in; }

  void SetOutput(uint8_t* data, size_t size) override {
    stream_.next_out = data;
    stream_.avail_out = static_cast<uInt>(size);
  }
  size_t avail_out() const override { return stream_.avail_out; }

 protected:
  Result ToResult(int ret, bool finish) {
    switch (ret) {
      case Z_OK:
        return Result::kOk;
      case Z_STREAM_END:
        return Result::kStreamEnd;
      case Z_BUF_ERROR:
        // No progress was possible. That is fine while there is more input
        // to come or the output is full. Otherwise the stream is truncated.
        if (finish && stream_.avail_in == 0 && stream_.avail_out > 0) {
          ATRACE_ELOG("zlib: unexpected end of stream");
          return Result::kError;
        }
        return Result::kOk;
      default:
        ATRACE_ELOG("zlib error %d: %s", ret,
                    stream_.msg ? stream_.msg : "unknown");
        return Result::kError;
    }
  }

  z_stream stream_{};
  bool initialized_ = false;
};

class DeflateCodec : public ZlibCodec {
 public:
  ~DeflateCodec() override {
    if (initialized_)
      deflateEnd(&stream_);
  }

  base::Status Init() override {
    int ret = deflateInit(&stream_, Z_DEFAULT_COMPRESSION);
    if (ret != Z_OK)
      return base::ErrStatus("deflateInit() failed: %d", ret);
    initialized_ = true;
    return base::OkStatus();
  }

  Result Process(bool finish) override {
    ATRACE_DCHECK(initialized_);
    return ToResult(deflate(&stream_, finish ? Z_FINISH : Z_NO_FLUSH), finish);
  }
};

class InflateCodec : public ZlibCodec {
 public:
  ~InflateCodec() override {
    if (initialized_)
      inflateEnd(&stream_);
  }

  base::Status Init() override {
    int ret = inflateInit(&stream_);
    if (ret != Z_OK)
      return base::ErrStatus("inflateInit() failed: %d", ret);
    initialized_ = true;
    return base::OkStatus();
  }

  Result Process(bool finish) override {
    ATRACE_DCHECK(initialized_);
    return ToResult(inflate(&stream_, Z_NO_FLUSH), finish);
  }
};

bool WriteChunk(TraceIo* io, const uint8_t* data, size_t size) {
  ssize_t written = io->Write(data, size);
  if (written != static_cast<ssize_t>(size)) {
    ATRACE_ELOG("Short write: %zd of %zu bytes", written, size);
    return false;
  }
  return true;
}

}  // namespace

TraceIo::~TraceIo() = default;

FdTraceIo::FdTraceIo(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}
FdTraceIo::~FdTraceIo() = default;

ssize_t FdTraceIo::Read(void* dst, size_t size) {
  return base::Read(in_fd_, dst, size);
}

ssize_t FdTraceIo::Write(const void* src, size_t size) {
  return base::WriteAll(out_fd_, src, size);
}

StreamCodec::~StreamCodec() = default;

std::unique_ptr<StreamCodec> CreateDeflateCodec() {
  return std::unique_ptr<StreamCodec>(new DeflateCodec());
}

std::unique_ptr<StreamCodec> CreateInflateCodec() {
  return std::unique_ptr<StreamCodec>(new InflateCodec());
}

base::Status TransferThroughCodec(std::unique_ptr<StreamCodec> codec,
                                  TraceIo* io,
                                  size_t chunk_size) {
  ATRACE_CHECK(chunk_size > 0);
  base::Status status = codec->Init();
  if (!status.ok())
    return status;

  std::unique_ptr<uint8_t[]> in_buf(new (std::nothrow) uint8_t[chunk_size]);
  std::unique_ptr<uint8_t[]> out_buf(new (std::nothrow) uint8_t[chunk_size]);
  if (!in_buf || !out_buf)
    return base::ErrStatus("Failed to allocate %zu byte buffers", chunk_size);

  codec->SetOutput(out_buf.get(), chunk_size);
  bool finish = false;
  for (;;) {
    if (codec->avail_in() == 0 && !finish) {
      ssize_t rd = io->Read(in_buf.get(), chunk_size);
      if (rd < 0)
        return base::ErrStatus("Failed to read the trace: %s", strerror(errno));
      if (rd == 0) {
        finish = true;
      } else {
        codec->SetInput(in_buf.get(), static_cast<size_t>(rd));
      }
    }

    if (codec->avail_out() == 0) {
      if (!WriteChunk(io, out_buf.get(), chunk_size))
        return base::ErrStatus("Short write of the trace output");
      codec->SetOutput(out_buf.get(), chunk_size);
    }

    StreamCodec::Result res = codec->Process(finish);
    if (res == StreamCodec::Result::kError)
      return base::ErrStatus("Corrupt or truncated trace stream");
    if (res == StreamCodec::Result::kStreamEnd)
      break;
  }

  size_t pending = chunk_size - codec->avail_out();
  if (pending > 0 && !WriteChunk(io, out_buf.get(), pending))
    return base::ErrStatus("Short write of the trace output");
  return base::OkStatus();
}

base::Status CopyTraceRaw(int in_fd, int out_fd) {
  for (;;) {
    ssize_t sent =
        ATRACE_EINTR(sendfile(out_fd, in_fd, nullptr, kSendfileChunkSize));
    if (sent == 0)
      return base::OkStatus();
    if (sent < 0)
      return base::ErrStatus("sendfile() failed: %s", strerror(errno));
  }
}

base::Status CompressTrace(int in_fd, int out_fd) {
  FdTraceIo io(in_fd, out_fd);
  return TransferThroughCodec(CreateDeflateCodec(), &io);
}

base::Status DumpTrace(int trace_fd, int out_fd, bool compress) {
  if (compress)
    return CompressTrace(trace_fd, out_fd);
  return CopyTraceRaw(trace_fd, out_fd);
}

base::Status DecompressTraceFile(const std::string& path, int out_fd) {
  base::ScopedFile fd = base::OpenFile(path, O_RDONLY);
  if (!fd)
    return base::ErrStatus("Failed to open %s: %s", path.c_str(),
                           strerror(errno));
  FdTraceIo io(*fd, out_fd);
  return TransferThroughCodec(CreateInflateCodec(), &io);
}

}  // namespace atrace
