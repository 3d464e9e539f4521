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

#ifndef SRC_FTRACE_TRACE_PIPELINE_H_
#define SRC_FTRACE_TRACE_PIPELINE_H_

#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

#include <memory>
#include <string>

#include "atrace/base/status.h"

namespace atrace {

// Size of the input and output chunks of the compressing pipelines.
constexpr size_t kTraceChunkSize = 64 * 1024;

// Upper bound of a single sendfile() call of the raw pipeline.
constexpr size_t kSendfileChunkSize = 64 * 1024 * 1024;

// Byte source and sink of a pipeline.
class TraceIo {
 public:
  virtual ~TraceIo();

  // Same semantics as read(2): 0 at the end of the input, -1 on error.
  virtual ssize_t Read(void* dst, size_t size) = 0;

  // Returns the number of bytes written, which is less than |size| only if
  // the sink failed.
  virtual ssize_t Write(const void* src, size_t size) = 0;
};

class FdTraceIo : public TraceIo {
 public:
  // Doesn't take ownership of the file descriptors.
  FdTraceIo(int in_fd, int out_fd);
  ~FdTraceIo() override;

  ssize_t Read(void* dst, size_t size) override;
  ssize_t Write(const void* src, size_t size) override;

 private:
  const int in_fd_;
  const int out_fd_;
};

// A streaming transformation (compression or decompression) working on
// caller owned buffers.
class StreamCodec {
 public:
  enum class Result {
    kOk = 0,
    // Every byte of the stream has been produced.
    kStreamEnd,
    kError,
  };

  virtual ~StreamCodec();

  virtual base::Status Init() = 0;

  virtual void SetInput(const uint8_t* data, size_t size) = 0;
  virtual size_t avail_in() const = 0;
  virtual void SetOutput(uint8_t* data, size_t size) = 0;
  virtual size_t avail_out() const = 0;

  // Consumes input and produces output until one of the two buffers is
  // exhausted. |finish| tells that no more input will follow.
  virtual Result Process(bool finish) = 0;
};

std::unique_ptr<StreamCodec> CreateDeflateCodec();
std::unique_ptr<StreamCodec> CreateInflateCodec();

// Runs |codec| over everything |io| reads and writes the result back to
// |io|, |chunk_size| bytes at a time. The codec and the buffers are released
// before returning, on success and failure alike.
base::Status TransferThroughCodec(std::unique_ptr<StreamCodec> codec,
                                  TraceIo* io,
                                  size_t chunk_size = kTraceChunkSize);

// Copies |in_fd| to |out_fd| with sendfile(), without user space buffers.
base::Status CopyTraceRaw(int in_fd, int out_fd);

// Writes the zlib compressed contents of |in_fd| to |out_fd|.
base::Status CompressTrace(int in_fd, int out_fd);

// Writes the trace in |trace_fd| to |out_fd|, compressed if requested.
base::Status DumpTrace(int trace_fd, int out_fd, bool compress);

// Decompresses a trace previously written with compression to |out_fd|.
base::Status DecompressTraceFile(const std::string& path, int out_fd);

}  // namespace atrace

#endif  // SRC_FTRACE_TRACE_PIPELINE_H_
