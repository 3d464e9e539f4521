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

#include "src/ftrace/tracefs.h"


#include <string>

#include "atrace/ext/base/file_utils.h"
#include "src/ftrace/test/fake_tracefs.h"
#include "src/ftrace/test/mock_tracefs.h"
#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

using testing::Eq;
using testing::Optional;
using testing::Return;

TEST(TracefsTest, ParseBracketedMode) {
  EXPECT_THAT(ParseBracketedMode("1024 [global] local\n"),
              Optional(Eq("global")));
  EXPECT_THAT(ParseBracketedMode("[local] global boot"), Optional(Eq("local")));
  EXPECT_THAT(ParseBracketedMode("local global [boot]\n\n"),
              Optional(Eq("boot")));
  EXPECT_THAT(ParseBracketedMode("[]"), Optional(Eq("")));
  EXPECT_FALSE(ParseBracketedMode("").has_value());
  EXPECT_FALSE(ParseBracketedMode("local global boot\n").has_value());
  EXPECT_FALSE(ParseBracketedMode("local [global boot").has_value());
  EXPECT_FALSE(ParseBracketedMode("local global] boot").has_value());
}

TEST(TracefsTest, ReadBracketedMode) {
  MockTracefs ftrace;

  EXPECT_CALL(ftrace, ReadFileIntoString("/root/trace_clock"))
      .WillOnce(Return("[local] global boot\n"));
  EXPECT_THAT(ftrace.ReadBracketedMode(KernelOption::kTraceClock),
              Optional(Eq("local")));

  // Unreadable files come back empty.
  EXPECT_CALL(ftrace, ReadFileIntoString("/root/trace_clock"))
      .WillOnce(Return(""));
  EXPECT_FALSE(ftrace.ReadBracketedMode(KernelOption::kTraceClock).has_value());
}

TEST(TracefsTest, WritesGoToOptionPaths) {
  MockTracefs ftrace;

  EXPECT_CALL(ftrace, WriteToFile("/root/options/overwrite", "1"))
      .WillOnce(Return(true));
  EXPECT_TRUE(ftrace.WriteOption(KernelOption::kOverwrite, true));

  EXPECT_CALL(ftrace, WriteToFile("/root/tracing_on", "0"))
      .WillOnce(Return(false));
  EXPECT_FALSE(ftrace.SetTracingOn(false));

  EXPECT_CALL(ftrace, WriteToFile("/root/buffer_size_kb", "2048"))
      .WillOnce(Return(true));
  EXPECT_TRUE(ftrace.WriteOption(KernelOption::kBufferSizeKb, "2048"));

  EXPECT_CALL(ftrace,
              WriteToFile("/root/events/sched/sched_wakeup/enable", "1"))
      .WillOnce(Return(true));
  EXPECT_TRUE(ftrace.SetEventEnabled(kSchedWakeupEvent, true));

  EXPECT_CALL(ftrace, AppendToFile("/root/set_ftrace_filter", "do_sys_open"))
      .WillOnce(Return(true));
  EXPECT_TRUE(ftrace.AppendOption(KernelOption::kSetFtraceFilter,
                                  "do_sys_open"));

  EXPECT_CALL(ftrace, ClearFile("/root/trace")).WillOnce(Return(true));
  EXPECT_TRUE(ftrace.ClearTrace());
}

TEST(TracefsTest, ProbesUseOptionPaths) {
  MockTracefs ftrace;
  EXPECT_CALL(ftrace, FileExists("/root/options/print-tgid"))
      .WillOnce(Return(false));
  EXPECT_FALSE(ftrace.OptionExists(KernelOption::kPrintTgid));

  EXPECT_CALL(ftrace, IsFileWritable("/root/events/power/cpu_idle/enable"))
      .WillOnce(Return(true));
  EXPECT_TRUE(ftrace.EventWritable(kCpuIdleEvent));
}

TEST(TracefsTest, CreateRequiresTraceFile) {
  FakeTracefs fake;
  EXPECT_NE(Tracefs::Create(fake.root()), nullptr);

  base::TempDir empty = base::TempDir::Create();
  EXPECT_EQ(Tracefs::Create(empty.path() + "/"), nullptr);
}

TEST(TracefsTest, WriteOptionTruncates) {
  FakeTracefs fake;
  Tracefs tracefs(fake.root());

  ASSERT_TRUE(tracefs.WriteOption(KernelOption::kBufferSizeKb, "1024"));
  EXPECT_EQ(fake.Read(KernelOption::kBufferSizeKb), "1024");

  ASSERT_TRUE(tracefs.WriteOption(KernelOption::kBufferSizeKb, "1"));
  EXPECT_EQ(fake.Read(KernelOption::kBufferSizeKb), "1");

  ASSERT_TRUE(tracefs.WriteOption(KernelOption::kRecordCmd, false));
  EXPECT_EQ(fake.Read(KernelOption::kRecordCmd), "0");
}

TEST(TracefsTest, AppendOptionKeepsExistingContents) {
  FakeTracefs fake;
  Tracefs tracefs(fake.root());

  ASSERT_TRUE(tracefs.TruncateOption(KernelOption::kSetFtraceFilter));
  ASSERT_TRUE(tracefs.AppendOption(KernelOption::kSetFtraceFilter, "foo"));
  ASSERT_TRUE(tracefs.AppendOption(KernelOption::kSetFtraceFilter, "bar"));
  EXPECT_EQ(fake.Read(KernelOption::kSetFtraceFilter), "foobar");
}

TEST(TracefsTest, WriteTraceMarkerAndClearTrace) {
  FakeTracefs fake;
  Tracefs tracefs(fake.root());

  fake.Write(KernelOption::kTrace, "some trace data\n");
  ASSERT_TRUE(tracefs.ClearTrace());
  EXPECT_EQ(fake.Read(KernelOption::kTrace), "");

  ASSERT_TRUE(tracefs.WriteTraceMarker("hello\n"));
  ASSERT_TRUE(tracefs.WriteTraceMarker("world\n"));
  EXPECT_EQ(fake.Read(KernelOption::kTraceMarker), "hello\nworld\n");
}

TEST(TracefsTest, ExistenceProbes) {
  FakeTracefs fake;
  Tracefs tracefs(fake.root());

  EXPECT_TRUE(tracefs.OptionExists(KernelOption::kPrintTgid));
  EXPECT_TRUE(tracefs.OptionWritable(KernelOption::kPrintTgid));
  fake.Remove(KernelOption::kPrintTgid);
  EXPECT_FALSE(tracefs.OptionExists(KernelOption::kPrintTgid));
  EXPECT_FALSE(tracefs.OptionWritable(KernelOption::kPrintTgid));

  EXPECT_TRUE(tracefs.EventExists(kSchedSwitchEvent));
  EXPECT_FALSE(tracefs.EventExists(FtraceEvent{"sched", "does_not_exist"}));
}

TEST(TracefsTest, WriteIntoMissingDirectoryFails) {
  FakeTracefs fake;
  Tracefs tracefs(fake.root());
  EXPECT_FALSE(tracefs.SetEventEnabled(FtraceEvent{"nope", "nope"}, true));
}

TEST(TracefsTest, OpenTraceForRead) {
  FakeTracefs fake;
  fake.Write(KernelOption::kTrace, "# tracer: nop\n");
  Tracefs tracefs(fake.root());

  base::ScopedFile fd = tracefs.OpenTraceForRead();
  ASSERT_TRUE(fd);
  std::string contents;
  ASSERT_TRUE(base::ReadFileDescriptor(*fd, &contents));
  EXPECT_EQ(contents, "# tracer: nop\n");
}

}  // namespace
}  // namespace atrace
