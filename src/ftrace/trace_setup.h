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

#ifndef SRC_FTRACE_TRACE_SETUP_H_
#define SRC_FTRACE_TRACE_SETUP_H_

#include <string>
#include <vector>

#include "src/ftrace/session_config.h"

namespace atrace {

class Tracefs;

enum class SetupStep {
  kOverwrite = 0,
  kBufferSize,
  kTraceClock,
  kKernelFuncs,
  kPrintTgid,
  kRecordCmd,
  kEvent,
  kTracingOn,
  kClearTrace,
};

const char* SetupStepToString(SetupStep step);

// The outcome of a single kernel option write. |required| outcomes decide
// whether the session may start tracing; the others are only reported.
struct StepOutcome {
  SetupStep step;
  std::string path;
  bool ok;
  bool required;
};

// Collects the outcomes of every write performed while configuring or
// cleaning up. Nothing stops early: every step is attempted.
class SetupResult {
 public:
  void Add(SetupStep step, std::string path, bool ok, bool required = true);

  // True when every required step succeeded.
  bool ok() const;

  const std::vector<StepOutcome>& outcomes() const { return outcomes_; }
  std::vector<StepOutcome> failures() const;

 private:
  std::vector<StepOutcome> outcomes_;
};

// Applies the session policy in order: overwrite, buffer size, global clock,
// kernel function filters, tgid printing, cmdline recording, built-in events.
SetupResult SetupTrace(Tracefs* tracefs,
                       const SessionConfig& config,
                       const SessionPhases& phases);

// Puts every option back to the kernel defaults.
SetupResult CleanupTrace(Tracefs* tracefs);

}  // namespace atrace

#endif  // SRC_FTRACE_TRACE_SETUP_H_
