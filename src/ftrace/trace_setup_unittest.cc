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

#include "src/ftrace/trace_setup.h"

#include <string>

#include "src/ftrace/test/fake_tracefs.h"
#include "src/ftrace/test/mock_tracefs.h"
#include "src/ftrace/tracefs.h"
#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

using testing::_;
using testing::HasSubstr;
using testing::InSequence;
using testing::NiceMock;
using testing::Return;

TEST(SetupResultTest, OnlyRequiredFailuresCount) {
  SetupResult result;
  EXPECT_TRUE(result.ok());

  result.Add(SetupStep::kOverwrite, "options/overwrite", true);
  result.Add(SetupStep::kEvent, "events/power/cpu_idle/enable", false,
             /*required=*/false);
  EXPECT_TRUE(result.ok());
  ASSERT_EQ(result.failures().size(), 1u);
  EXPECT_EQ(result.failures()[0].step, SetupStep::kEvent);

  result.Add(SetupStep::kBufferSize, "buffer_size_kb", false);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.failures().size(), 2u);
  EXPECT_EQ(result.outcomes().size(), 3u);
}

TEST(TraceSetupTest, AppliesPolicyInOrder) {
  NiceMock<MockTracefs> tracefs;
  SessionConfig config;
  config.buffer_size_kb = 4096;

  {
    InSequence seq;
    EXPECT_CALL(tracefs, WriteToFile("/root/options/overwrite", "0"));
    EXPECT_CALL(tracefs, WriteToFile("/root/buffer_size_kb", "4096"));
    EXPECT_CALL(tracefs, WriteToFile("/root/trace_clock", "global"));
    EXPECT_CALL(tracefs, WriteToFile("/root/current_tracer", "nop"));
    EXPECT_CALL(tracefs, ClearFile("/root/set_ftrace_filter"));
    EXPECT_CALL(tracefs, WriteToFile("/root/options/print-tgid", "1"));
    EXPECT_CALL(tracefs, WriteToFile("/root/options/record-cmd", "1"));
    EXPECT_CALL(tracefs,
                WriteToFile("/root/events/sched/sched_switch/enable", "1"));
    EXPECT_CALL(tracefs,
                WriteToFile("/root/events/sched/sched_wakeup/enable", "1"));
    EXPECT_CALL(tracefs, WriteToFile("/root/events/workqueue/enable", "1"));
    EXPECT_CALL(tracefs,
                WriteToFile("/root/events/power/cpu_frequency/enable", "0"));
    EXPECT_CALL(tracefs,
                WriteToFile("/root/events/power/clock_set_rate/enable", "0"));
    EXPECT_CALL(tracefs,
                WriteToFile("/root/events/power/cpu_idle/enable", "0"));
  }

  SetupResult result =
      SetupTrace(&tracefs, config, ComputeSessionPhases(config));
  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(result.failures().empty());
}

TEST(TraceSetupTest, OptionalEventFailureKeepsSessionUsable) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;

  EXPECT_CALL(tracefs, WriteToFile("/root/events/power/cpu_idle/enable", _))
      .WillOnce(Return(false));

  SetupResult result =
      SetupTrace(&tracefs, config, ComputeSessionPhases(config));
  EXPECT_TRUE(result.ok());
  ASSERT_EQ(result.failures().size(), 1u);
  EXPECT_EQ(result.failures()[0].path, "/root/events/power/cpu_idle/enable");
  EXPECT_FALSE(result.failures()[0].required);
}

TEST(TraceSetupTest, RequiredFailureIsReportedButNothingIsSkipped) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;

  EXPECT_CALL(tracefs, WriteToFile("/root/buffer_size_kb", _))
      .WillOnce(Return(false));
  // Later steps still run.
  EXPECT_CALL(tracefs, WriteToFile("/root/options/record-cmd", "1"))
      .WillOnce(Return(true));

  SetupResult result =
      SetupTrace(&tracefs, config, ComputeSessionPhases(config));
  EXPECT_FALSE(result.ok());
  ASSERT_EQ(result.failures().size(), 1u);
  EXPECT_EQ(result.failures()[0].step, SetupStep::kBufferSize);
}

TEST(TraceSetupTest, ClockIsNotRewrittenWhenAlreadyActive) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;

  EXPECT_CALL(tracefs, ReadFileIntoString("/root/trace_clock"))
      .WillOnce(Return("local [global] boot\n"));
  EXPECT_CALL(tracefs, WriteToFile("/root/trace_clock", _)).Times(0);

  EXPECT_TRUE(
      SetupTrace(&tracefs, config, ComputeSessionPhases(config)).ok());
}

TEST(TraceSetupTest, UnreadableClockIsWritten) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;

  EXPECT_CALL(tracefs, ReadFileIntoString("/root/trace_clock"))
      .WillOnce(Return(""));
  EXPECT_CALL(tracefs, WriteToFile("/root/trace_clock", "global"))
      .WillOnce(Return(true));

  EXPECT_TRUE(
      SetupTrace(&tracefs, config, ComputeSessionPhases(config)).ok());
}

TEST(TraceSetupTest, MissingTgidOptionIsNotAnError) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;

  EXPECT_CALL(tracefs, FileExists("/root/options/print-tgid"))
      .WillOnce(Return(false));
  EXPECT_CALL(tracefs, WriteToFile("/root/options/print-tgid", _)).Times(0);

  EXPECT_TRUE(
      SetupTrace(&tracefs, config, ComputeSessionPhases(config)).ok());
}

TEST(TraceSetupTest, TgidDisabledSkipsOption) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;
  config.print_tgid = false;

  EXPECT_CALL(tracefs, WriteToFile("/root/options/print-tgid", _)).Times(0);
  EXPECT_TRUE(
      SetupTrace(&tracefs, config, ComputeSessionPhases(config)).ok());
}

TEST(TraceSetupTest, UnwritableEventsAreSkipped) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;

  EXPECT_CALL(tracefs, IsFileWritable(HasSubstr("/events/")))
      .WillRepeatedly(Return(false));
  EXPECT_CALL(tracefs, WriteToFile(HasSubstr("/events/"), _)).Times(0);

  SetupResult result =
      SetupTrace(&tracefs, config, ComputeSessionPhases(config));
  EXPECT_TRUE(result.ok());
  for (const StepOutcome& outcome : result.outcomes())
    EXPECT_NE(outcome.step, SetupStep::kEvent);
}

TEST(TraceSetupTest, BeginAsyncForcesOverwrite) {
  NiceMock<MockTracefs> tracefs;
  tracefs.AllowAnyCall();
  SessionConfig config;
  config.begin_async = true;

  EXPECT_CALL(tracefs, WriteToFile("/root/options/overwrite", "1"));
  SetupTrace(&tracefs, config, ComputeSessionPhases(config));
}

TEST(TraceSetupTest, KernelFunctionsOnFakeTracefs) {
  FakeTracefs fake;
  Tracefs tracefs(fake.root());
  fake.Write(KernelOption::kSetFtraceFilter, "stale_func");

  SessionConfig config;
  config.kernel_funcs = "do_sys_open,vfs_read";
  config.trace_sched = false;
  SetupResult result =
      SetupTrace(&tracefs, config, ComputeSessionPhases(config));
  EXPECT_TRUE(result.ok());

  EXPECT_EQ(fake.Read(KernelOption::kCurrentTracer), "function_graph");
  EXPECT_EQ(fake.Read(KernelOption::kFuncgraphAbstime), "1");
  EXPECT_EQ(fake.Read(KernelOption::kFuncgraphCpu), "1");
  EXPECT_EQ(fake.Read(KernelOption::kFuncgraphProc), "1");
  EXPECT_EQ(fake.Read(KernelOption::kFuncgraphFlat), "1");
  EXPECT_EQ(fake.Read(KernelOption::kSetFtraceFilter), "do_sys_openvfs_read");

  EXPECT_EQ(fake.Read(KernelOption::kOverwrite), "0");
  EXPECT_EQ(fake.Read(KernelOption::kBufferSizeKb), "1024");
  EXPECT_EQ(fake.Read(KernelOption::kTraceClock), "global");
  EXPECT_EQ(fake.Read(KernelOption::kPrintTgid), "1");
  EXPECT_EQ(fake.Read(KernelOption::kRecordCmd), "1");
  EXPECT_EQ(fake.Read(kSchedSwitchEvent), "0");
  EXPECT_EQ(fake.Read(kSchedWakeupEvent), "0");
  EXPECT_EQ(fake.ReadPath(GetEventGroupEnablePath(kWorkqueueEventGroup)), "1");
  EXPECT_EQ(fake.Read(kCpuIdleEvent), "0");
}

TEST(TraceSetupTest, CleanupRestoresDefaults) {
  FakeTracefs fake;
  Tracefs tracefs(fake.root());

  SessionConfig config;
  config.kernel_funcs = "do_sys_open";
  ASSERT_TRUE(
      SetupTrace(&tracefs, config, ComputeSessionPhases(config)).ok());

  SetupResult result = CleanupTrace(&tracefs);
  EXPECT_TRUE(result.ok());
  for (const FtraceEvent& event : kBuiltinEvents)
    EXPECT_EQ(fake.Read(event), "0");
  EXPECT_EQ(fake.ReadPath(GetEventGroupEnablePath(kWorkqueueEventGroup)), "0");
  EXPECT_EQ(fake.Read(KernelOption::kRecordCmd), "0");
  EXPECT_EQ(fake.Read(KernelOption::kOverwrite), "1");
  EXPECT_EQ(fake.Read(KernelOption::kBufferSizeKb), "1");
  EXPECT_EQ(fake.Read(KernelOption::kTraceClock), "local");
  EXPECT_EQ(fake.Read(KernelOption::kPrintTgid), "0");
  EXPECT_EQ(fake.Read(KernelOption::kCurrentTracer), "nop");
  EXPECT_EQ(fake.Read(KernelOption::kSetFtraceFilter), "");
}

TEST(TraceSetupTest, CleanupWithoutTgidOption) {
  FakeTracefs fake;
  fake.Remove(KernelOption::kPrintTgid);
  Tracefs tracefs(fake.root());

  EXPECT_TRUE(CleanupTrace(&tracefs).ok());
  EXPECT_FALSE(tracefs.OptionExists(KernelOption::kPrintTgid));
}

}  // namespace
}  // namespace atrace
