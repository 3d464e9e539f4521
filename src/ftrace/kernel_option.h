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

#ifndef SRC_FTRACE_KERNEL_OPTION_H_
#define SRC_FTRACE_KERNEL_OPTION_H_

#include <stddef.h>

#include <string>

namespace atrace {

// The tracefs control files touched by a session. Each value maps to exactly
// one file relative to the tracefs root.
enum class KernelOption {
  kTracingOn = 0,
  kBufferSizeKb,
  kTrace,
  kTraceClock,
  kTraceMarker,
  kCurrentTracer,
  kSetFtraceFilter,
  kOverwrite,
  kRecordCmd,
  kPrintTgid,
  kFuncgraphAbstime,
  kFuncgraphCpu,
  kFuncgraphProc,
  kFuncgraphFlat,
};

constexpr KernelOption kAllKernelOptions[] = {
    KernelOption::kTracingOn,        KernelOption::kBufferSizeKb,
    KernelOption::kTrace,            KernelOption::kTraceClock,
    KernelOption::kTraceMarker,      KernelOption::kCurrentTracer,
    KernelOption::kSetFtraceFilter,  KernelOption::kOverwrite,
    KernelOption::kRecordCmd,        KernelOption::kPrintTgid,
    KernelOption::kFuncgraphAbstime, KernelOption::kFuncgraphCpu,
    KernelOption::kFuncgraphProc,    KernelOption::kFuncgraphFlat,
};

// Returns the path of |option| relative to the tracefs root, e.g.
// "options/overwrite".
const char* GetKernelOptionPath(KernelOption option);

// A tracepoint under events/<group>/<name>/.
struct FtraceEvent {
  const char* group;
  const char* name;
};

// Returns "events/<group>/<name>/enable".
std::string GetEventEnablePath(const FtraceEvent& event);

constexpr FtraceEvent kSchedSwitchEvent{"sched", "sched_switch"};
constexpr FtraceEvent kSchedWakeupEvent{"sched", "sched_wakeup"};
constexpr FtraceEvent kCpuFrequencyEvent{"power", "cpu_frequency"};
constexpr FtraceEvent kClockSetRateEvent{"power", "clock_set_rate"};
constexpr FtraceEvent kCpuIdleEvent{"power", "cpu_idle"};

// Returns "events/<group>/enable", which toggles every event of |group|.
std::string GetEventGroupEnablePath(const char* group);

constexpr char kWorkqueueEventGroup[] = "workqueue";

// Every built-in event the session may toggle, in the order they are applied.
constexpr FtraceEvent kBuiltinEvents[] = {
    kSchedSwitchEvent, kSchedWakeupEvent, kCpuFrequencyEvent,
    kClockSetRateEvent, kCpuIdleEvent,
};

}  // namespace atrace

#endif  // SRC_FTRACE_KERNEL_OPTION_H_
