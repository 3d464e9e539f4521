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

#include "src/ftrace/kernel_option.h"

#include "atrace/base/logging.h"

namespace atrace {

const char* GetKernelOptionPath(KernelOption option) {
  switch (option) {
    case KernelOption::kTracingOn:
      return "tracing_on";
    case KernelOption::kBufferSizeKb:
      return "buffer_size_kb";
    case KernelOption::kTrace:
      return "trace";
    case KernelOption::kTraceClock:
      return "trace_clock";
    case KernelOption::kTraceMarker:
      return "trace_marker";
    case KernelOption::kCurrentTracer:
      return "current_tracer";
    case KernelOption::kSetFtraceFilter:
      return "set_ftrace_filter";
    case KernelOption::kOverwrite:
      return "options/overwrite";
    case KernelOption::kRecordCmd:
      return "options/record-cmd";
    case KernelOption::kPrintTgid:
      return "options/print-tgid";
    case KernelOption::kFuncgraphAbstime:
      return "options/funcgraph-abstime";
    case KernelOption::kFuncgraphCpu:
      return "options/funcgraph-cpu";
    case KernelOption::kFuncgraphProc:
      return "options/funcgraph-proc";
    case KernelOption::kFuncgraphFlat:
      return "options/funcgraph-flat";
  }
  ATRACE_FATAL("Unknown kernel option %d", static_cast<int>(option));
}

std::string GetEventEnablePath(const FtraceEvent& event) {
  return std::string("events/") + event.group + "/" + event.name + "/enable";
}

std::string GetEventGroupEnablePath(const char* group) {
  return std::string("events/") + group + "/enable";
}

}  // namespace atrace
