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

#include "src/ftrace/trace_session.h"

#include <functional>
#include <string>

#include "atrace/ext/base/file_utils.h"
#include "atrace/ext/base/temp_file.h"
#include "src/ftrace/abort_signal_monitor.h"
#include "src/ftrace/test/fake_tracefs.h"
#include "src/ftrace/test/mock_tracefs.h"
#include "src/ftrace/trace_pipeline.h"
#include "src/ftrace/tracefs.h"
#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

using testing::_;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::NiceMock;
using testing::Return;

constexpr char kTraceData[] =
    "# tracer: nop\n"
    "  kworker/0:1-42    [000] d..2  1234.000001: sched_switch\n";

// Doesn't sleep, and lets the test play the kernel while the capture window
// is open.
class TestTraceSession : public TraceSession {
 public:
  using TraceSession::TraceSession;

  std::vector<uint32_t> sleeps;
  std::function<void()> on_capture_sleep;

 protected:
  void SleepSeconds(uint32_t seconds) override {
    sleeps.push_back(seconds);
    if (state() == SessionState::kCapturing && on_capture_sleep)
      on_capture_sleep();
  }
};

class TraceSessionTest : public ::testing::Test {
 protected:
  std::string Output() const {
    std::string contents;
    EXPECT_TRUE(base::ReadFile(out_.path(), &contents));
    return contents;
  }

  FakeTracefs fake_;
  Tracefs tracefs_{fake_.root()};
  AbortToken abort_token_;
  base::TempFile out_ = base::TempFile::Create();
};

TEST_F(TraceSessionTest, SynchronousSession) {
  SessionConfig config;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());
  session.on_capture_sleep = [this] {
    EXPECT_EQ(fake_.Read(KernelOption::kTracingOn), "1");
    EXPECT_EQ(fake_.Read(KernelOption::kTraceClock), "global");
    fake_.Write(KernelOption::kTrace, kTraceData);
  };

  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.transitions(),
              ElementsAre(SessionState::kConfiguring, SessionState::kArmed,
                          SessionState::kCapturing, SessionState::kStopped,
                          SessionState::kDumped, SessionState::kCleanedUp));
  EXPECT_THAT(session.sleeps, ElementsAre(5u));
  EXPECT_TRUE(session.setup_result().ok());
  EXPECT_TRUE(session.cleanup_result().ok());
  EXPECT_EQ(Output(), kTraceData);

  // The kernel is left stopped, cleared and back to its defaults.
  EXPECT_EQ(fake_.Read(KernelOption::kTracingOn), "0");
  EXPECT_EQ(fake_.Read(KernelOption::kTrace), "");
  EXPECT_EQ(fake_.Read(KernelOption::kBufferSizeKb), "1");
  EXPECT_EQ(fake_.Read(KernelOption::kOverwrite), "1");
  EXPECT_EQ(fake_.Read(KernelOption::kTraceClock), "local");
  EXPECT_EQ(fake_.Read(KernelOption::kRecordCmd), "0");
  EXPECT_EQ(fake_.Read(KernelOption::kPrintTgid), "0");

  std::string markers = fake_.Read(KernelOption::kTraceMarker);
  EXPECT_THAT(markers, HasSubstr("trace_event_clock_sync: parent_ts="));
  EXPECT_THAT(markers, HasSubstr("trace_event_clock_sync: realtime_ts="));
}

TEST_F(TraceSessionTest, SleepsBeforeConfiguring) {
  SessionConfig config;
  config.sleep_s = 2;
  config.duration_s = 10;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());
  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.sleeps, ElementsAre(2u, 10u));
}

TEST_F(TraceSessionTest, CompressedSession) {
  SessionConfig config;
  config.compress = true;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());
  session.on_capture_sleep = [this] {
    fake_.Write(KernelOption::kTrace, kTraceData);
  };
  ASSERT_EQ(session.Run(), 0);
  EXPECT_NE(Output(), kTraceData);

  base::TempFile decompressed = base::TempFile::Create();
  ASSERT_TRUE(DecompressTraceFile(out_.path(), decompressed.fd()).ok());
  std::string contents;
  ASSERT_TRUE(base::ReadFile(decompressed.path(), &contents));
  EXPECT_EQ(contents, kTraceData);
}

TEST_F(TraceSessionTest, BeginAsyncLeavesTracingOn) {
  SessionConfig config;
  config.begin_async = true;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());

  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.transitions(),
              ElementsAre(SessionState::kConfiguring, SessionState::kArmed,
                          SessionState::kCapturing));
  EXPECT_THAT(session.sleeps, IsEmpty());
  EXPECT_EQ(Output(), "");
  EXPECT_EQ(fake_.Read(KernelOption::kTracingOn), "1");
  EXPECT_EQ(fake_.Read(KernelOption::kOverwrite), "1");
  EXPECT_EQ(fake_.Read(KernelOption::kBufferSizeKb), "1024");
}

TEST_F(TraceSessionTest, StopAsyncDumpsAndCleansUp) {
  fake_.Write(KernelOption::kTracingOn, "1");
  fake_.Write(KernelOption::kTrace, kTraceData);
  fake_.Write(KernelOption::kBufferSizeKb, "4096");

  SessionConfig config;
  config.stop_async = true;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());

  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.transitions(),
              ElementsAre(SessionState::kStopped, SessionState::kDumped,
                          SessionState::kCleanedUp));
  EXPECT_THAT(session.sleeps, IsEmpty());
  EXPECT_EQ(Output(), kTraceData);
  EXPECT_EQ(fake_.Read(KernelOption::kTracingOn), "0");
  EXPECT_EQ(fake_.Read(KernelOption::kTrace), "");
  EXPECT_EQ(fake_.Read(KernelOption::kBufferSizeKb), "1");
}

TEST_F(TraceSessionTest, DumpAsyncOnlyDumps) {
  fake_.Write(KernelOption::kTracingOn, "1");
  fake_.Write(KernelOption::kTrace, kTraceData);
  fake_.Write(KernelOption::kBufferSizeKb, "4096");

  SessionConfig config;
  config.dump_async = true;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());

  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.transitions(), ElementsAre(SessionState::kDumped));
  EXPECT_EQ(Output(), kTraceData);
  EXPECT_EQ(fake_.Read(KernelOption::kTracingOn), "1");
  EXPECT_EQ(fake_.Read(KernelOption::kTrace), "");
  EXPECT_EQ(fake_.Read(KernelOption::kBufferSizeKb), "4096");
}

TEST_F(TraceSessionTest, AbortBeforeDumpSkipsDumpButCleansUp) {
  abort_token_.Abort();
  SessionConfig config;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());
  session.on_capture_sleep = [this] {
    fake_.Write(KernelOption::kTrace, kTraceData);
  };

  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.transitions(),
              ElementsAre(SessionState::kConfiguring, SessionState::kArmed,
                          SessionState::kCapturing, SessionState::kStopped,
                          SessionState::kCleanedUp));
  EXPECT_EQ(Output(), "");
  EXPECT_EQ(fake_.Read(KernelOption::kTrace), "");
  EXPECT_EQ(fake_.Read(KernelOption::kTracingOn), "0");
  EXPECT_EQ(fake_.Read(KernelOption::kBufferSizeKb), "1");
}

TEST_F(TraceSessionTest, AbortDuringCaptureStillSleepsFullDuration) {
  SessionConfig config;
  config.duration_s = 30;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());
  session.on_capture_sleep = [this] {
    fake_.Write(KernelOption::kTrace, kTraceData);
    abort_token_.Abort();
  };

  EXPECT_EQ(session.Run(), 0);
  // A single uninterrupted sleep of the whole window.
  EXPECT_THAT(session.sleeps, ElementsAre(30u));
  EXPECT_EQ(Output(), "");
  EXPECT_EQ(session.state(), SessionState::kCleanedUp);
  EXPECT_EQ(fake_.Read(KernelOption::kOverwrite), "1");
}

TEST_F(TraceSessionTest, StreamStopsWithoutDumping) {
  SessionConfig config;
  config.stream = true;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());

  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.transitions(),
              ElementsAre(SessionState::kConfiguring, SessionState::kArmed,
                          SessionState::kCapturing, SessionState::kStopped,
                          SessionState::kCleanedUp));
  EXPECT_THAT(session.sleeps, IsEmpty());
  EXPECT_EQ(Output(), "");
}

TEST_F(TraceSessionTest, DumpFailureIsReportedAndCleanupRuns) {
  fake_.Remove(KernelOption::kTrace);
  SessionConfig config;
  config.stop_async = true;
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());

  EXPECT_EQ(session.Run(), -1);
  EXPECT_THAT(session.transitions(),
              ElementsAre(SessionState::kStopped, SessionState::kCleanedUp));
  EXPECT_EQ(fake_.Read(KernelOption::kBufferSizeKb), "1");
}

TEST_F(TraceSessionTest, Replay) {
  base::TempFile raw = base::TempFile::Create();
  ASSERT_EQ(base::WriteAll(raw.fd(), kTraceData, sizeof(kTraceData) - 1),
            static_cast<ssize_t>(sizeof(kTraceData) - 1));
  base::TempFile compressed = base::TempFile::Create();
  {
    base::ScopedFile raw_fd = base::OpenFile(raw.path(), O_RDONLY);
    ASSERT_TRUE(CompressTrace(*raw_fd, compressed.fd()).ok());
  }

  SessionConfig config;
  config.uncompress_file = compressed.path();
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());
  EXPECT_EQ(session.Run(), 0);
  EXPECT_THAT(session.transitions(), ElementsAre(SessionState::kReplayOnly));
  EXPECT_EQ(Output(), kTraceData);
  // The kernel is not touched.
  EXPECT_EQ(fake_.Read(KernelOption::kTracingOn), "0\n");
  EXPECT_EQ(fake_.Read(KernelOption::kBufferSizeKb), "7 (expanded: 1408)\n");
}

TEST_F(TraceSessionTest, ReplayOfMissingFileFails) {
  SessionConfig config;
  config.uncompress_file = "/does/not/exist.z";
  TestTraceSession session(&tracefs_, config, &abort_token_, out_.fd());
  EXPECT_EQ(session.Run(), -1);
  EXPECT_EQ(session.state(), SessionState::kReplayOnly);
}

TEST(TraceSessionMockTest, OptionalEventFailureKeepsCapture) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  AbortToken abort_token;
  EXPECT_CALL(tracefs, WriteToFile("/root/events/power/cpu_idle/enable", _))
      .WillOnce(Return(false));

  SessionConfig config;
  config.begin_async = true;
  TestTraceSession session(&tracefs, config, &abort_token);
  EXPECT_EQ(session.Run(), 0);
  EXPECT_TRUE(session.setup_result().ok());
  EXPECT_EQ(session.setup_result().failures().size(), 1u);
  EXPECT_EQ(session.state(), SessionState::kCapturing);
}

TEST(TraceSessionMockTest, SetupFailureSkipsCaptureButCleansUp) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  AbortToken abort_token;
  EXPECT_CALL(tracefs, WriteToFile("/root/buffer_size_kb", "1024"))
      .WillOnce(Return(false));
  EXPECT_CALL(tracefs, WriteToFile("/root/buffer_size_kb", "1"))
      .WillOnce(Return(true));
  EXPECT_CALL(tracefs, WriteToFile("/root/tracing_on", "0"))
      .WillOnce(Return(true));
  // The ring buffer is never cleared: neither the capture nor the dump runs.
  EXPECT_CALL(tracefs, ClearFile("/root/trace")).Times(0);

  SessionConfig config;
  TestTraceSession session(&tracefs, config, &abort_token);
  EXPECT_EQ(session.Run(), 0);
  EXPECT_FALSE(session.setup_result().ok());
  EXPECT_THAT(session.transitions(),
              ElementsAre(SessionState::kConfiguring, SessionState::kStopped,
                          SessionState::kCleanedUp));
  EXPECT_THAT(session.sleeps, IsEmpty());
}

}  // namespace
}  // namespace atrace
