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

#include <optional>
#include <string>

#include "atrace/base/logging.h"
#include "atrace/ext/base/string_utils.h"
#include "src/ftrace/tracefs.h"

namespace atrace {
namespace {

constexpr char kGlobalClock[] = "global";
constexpr char kLocalClock[] = "local";
constexpr char kNopTracer[] = "nop";
constexpr char kFunctionGraphTracer[] = "function_graph";

constexpr KernelOption kFuncgraphOptions[] = {
    KernelOption::kFuncgraphAbstime,
    KernelOption::kFuncgraphCpu,
    KernelOption::kFuncgraphProc,
    KernelOption::kFuncgraphFlat,
};

void WriteBool(Tracefs* tracefs,
               SetupResult* result,
               SetupStep step,
               KernelOption option,
               bool enabled) {
  result->Add(step, tracefs->GetOptionPath(option),
              tracefs->WriteOption(option, enabled));
}

// The trace_clock file lists every clock with the active one in brackets.
// Writing the active clock again resets the ring buffer, so only switch when
// it actually differs.
void SetGlobalClockEnable(Tracefs* tracefs, SetupResult* result, bool enable) {
  const char* mode = enable ? kGlobalClock : kLocalClock;
  std::string path = tracefs->GetOptionPath(KernelOption::kTraceClock);
  std::optional<std::string> current =
      tracefs->ReadBracketedMode(KernelOption::kTraceClock);
  if (current && *current == mode) {
    result->Add(SetupStep::kTraceClock, path, true);
    return;
  }
  result->Add(SetupStep::kTraceClock, path,
              tracefs->WriteOption(KernelOption::kTraceClock, mode));
}

// Kernels without the tgid patch don't have options/print-tgid. That is not
// an error.
void SetPrintTgidEnableIfPresent(Tracefs* tracefs,
                                 SetupResult* result,
                                 bool enable) {
  if (!tracefs->OptionExists(KernelOption::kPrintTgid))
    return;
  WriteBool(tracefs, result, SetupStep::kPrintTgid, KernelOption::kPrintTgid,
            enable);
}

// Needs CONFIG_DYNAMIC_FTRACE. An empty |funcs| switches function tracing off.
void SetKernelTraceFuncs(Tracefs* tracefs,
                         SetupResult* result,
                         const std::string& funcs) {
  const std::string tracer_path =
      tracefs->GetOptionPath(KernelOption::kCurrentTracer);
  const std::string filter_path =
      tracefs->GetOptionPath(KernelOption::kSetFtraceFilter);

  if (funcs.empty()) {
    if (tracefs->OptionWritable(KernelOption::kCurrentTracer)) {
      result->Add(SetupStep::kKernelFuncs, tracer_path,
                  tracefs->WriteOption(KernelOption::kCurrentTracer,
                                       kNopTracer));
    }
    if (tracefs->OptionWritable(KernelOption::kSetFtraceFilter)) {
      result->Add(SetupStep::kKernelFuncs, filter_path,
                  tracefs->TruncateOption(KernelOption::kSetFtraceFilter));
    }
    return;
  }

  result->Add(SetupStep::kKernelFuncs, tracer_path,
              tracefs->WriteOption(KernelOption::kCurrentTracer,
                                   kFunctionGraphTracer));
  for (KernelOption option : kFuncgraphOptions)
    WriteBool(tracefs, result, SetupStep::kKernelFuncs, option, true);

  result->Add(SetupStep::kKernelFuncs, filter_path,
              tracefs->TruncateOption(KernelOption::kSetFtraceFilter));
  for (const std::string& func : base::SplitString(funcs, ",")) {
    std::string name = base::TrimWhitespace(func);
    if (name.empty())
      continue;
    bool ok = tracefs->AppendOption(KernelOption::kSetFtraceFilter, name);
    if (!ok)
      ATRACE_ELOG("Kernel function '%s' cannot be traced", name.c_str());
    result->Add(SetupStep::kKernelFuncs, filter_path, ok);
  }
}

void SetEventIfWritable(Tracefs* tracefs,
                        SetupResult* result,
                        const FtraceEvent& event,
                        bool enable) {
  if (!tracefs->EventWritable(event))
    return;
  result->Add(SetupStep::kEvent, tracefs->GetEventEnablePath(event),
              tracefs->SetEventEnabled(event, enable), /*required=*/false);
}

// sched_switch/sched_wakeup follow |trace_sched|. workqueue stays on so that
// thread names can be resolved. Frequency and idle events are too noisy and
// always off.
void ApplyEventPolicy(Tracefs* tracefs, SetupResult* result, bool trace_sched) {
  SetEventIfWritable(tracefs, result, kSchedSwitchEvent, trace_sched);
  SetEventIfWritable(tracefs, result, kSchedWakeupEvent, trace_sched);

  if (tracefs->EventGroupWritable(kWorkqueueEventGroup)) {
    result->Add(SetupStep::kEvent,
                tracefs->GetEventGroupEnablePath(kWorkqueueEventGroup),
                tracefs->SetEventGroupEnabled(kWorkqueueEventGroup, true),
                /*required=*/false);
  }

  SetEventIfWritable(tracefs, result, kCpuFrequencyEvent, false);
  SetEventIfWritable(tracefs, result, kClockSetRateEvent, false);
  SetEventIfWritable(tracefs, result, kCpuIdleEvent, false);
}

void DisableBuiltinEvents(Tracefs* tracefs, SetupResult* result) {
  for (const FtraceEvent& event : kBuiltinEvents)
    SetEventIfWritable(tracefs, result, event, false);
  if (tracefs->EventGroupWritable(kWorkqueueEventGroup)) {
    result->Add(SetupStep::kEvent,
                tracefs->GetEventGroupEnablePath(kWorkqueueEventGroup),
                tracefs->SetEventGroupEnabled(kWorkqueueEventGroup, false),
                /*required=*/false);
  }
}

}  // namespace

const char* SetupStepToString(SetupStep step) {
  switch (step) {
    case SetupStep::kOverwrite:
      return "overwrite";
    case SetupStep::kBufferSize:
      return "buffer size";
    case SetupStep::kTraceClock:
      return "trace clock";
    case SetupStep::kKernelFuncs:
      return "kernel functions";
    case SetupStep::kPrintTgid:
      return "print tgid";
    case SetupStep::kRecordCmd:
      return "record cmdline";
    case SetupStep::kEvent:
      return "event";
    case SetupStep::kTracingOn:
      return "tracing on";
    case SetupStep::kClearTrace:
      return "clear trace";
  }
  ATRACE_FATAL("Unknown setup step %d", static_cast<int>(step));
}

void SetupResult::Add(SetupStep step,
                      std::string path,
                      bool ok,
                      bool required) {
  outcomes_.push_back(StepOutcome{step, std::move(path), ok, required});
}

bool SetupResult::ok() const {
  for (const StepOutcome& outcome : outcomes_) {
    if (outcome.required && !outcome.ok)
      return false;
  }
  return true;
}

std::vector<StepOutcome> SetupResult::failures() const {
  std::vector<StepOutcome> failed;
  for (const StepOutcome& outcome : outcomes_) {
    if (!outcome.ok)
      failed.push_back(outcome);
  }
  return failed;
}

SetupResult SetupTrace(Tracefs* tracefs,
                       const SessionConfig& config,
                       const SessionPhases& phases) {
  SetupResult result;
  WriteBool(tracefs, &result, SetupStep::kOverwrite, KernelOption::kOverwrite,
            phases.overwrite);
  result.Add(SetupStep::kBufferSize,
             tracefs->GetOptionPath(KernelOption::kBufferSizeKb),
             tracefs->WriteOption(KernelOption::kBufferSizeKb,
                                  std::to_string(config.buffer_size_kb)));
  SetGlobalClockEnable(tracefs, &result, true);
  SetKernelTraceFuncs(tracefs, &result, config.kernel_funcs);
  if (config.print_tgid)
    SetPrintTgidEnableIfPresent(tracefs, &result, true);
  WriteBool(tracefs, &result, SetupStep::kRecordCmd, KernelOption::kRecordCmd,
            true);
  ApplyEventPolicy(tracefs, &result, config.trace_sched);

  for (const StepOutcome& failed : result.failures()) {
    ATRACE_ELOG("Failed to set %s (%s)%s", SetupStepToString(failed.step),
                failed.path.c_str(), failed.required ? "" : ", ignoring");
  }
  return result;
}

SetupResult CleanupTrace(Tracefs* tracefs) {
  SetupResult result;
  DisableBuiltinEvents(tracefs, &result);
  WriteBool(tracefs, &result, SetupStep::kRecordCmd, KernelOption::kRecordCmd,
            false);
  WriteBool(tracefs, &result, SetupStep::kOverwrite, KernelOption::kOverwrite,
            true);
  result.Add(SetupStep::kBufferSize,
             tracefs->GetOptionPath(KernelOption::kBufferSizeKb),
             tracefs->WriteOption(KernelOption::kBufferSizeKb, "1"));
  SetGlobalClockEnable(tracefs, &result, false);
  SetPrintTgidEnableIfPresent(tracefs, &result, false);
  SetKernelTraceFuncs(tracefs, &result, "");

  for (const StepOutcome& failed : result.failures()) {
    ATRACE_ELOG("Failed to restore %s (%s)", SetupStepToString(failed.step),
                failed.path.c_str());
  }
  return result;
}

}  // namespace atrace
