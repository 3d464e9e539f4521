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

#ifndef SRC_FTRACE_SESSION_CONFIG_H_
#define SRC_FTRACE_SESSION_CONFIG_H_

#include <stdint.h>

#include <string>

#include "atrace/base/status.h"

namespace atrace {

// Everything a single invocation was asked to do. Built once from the command
// line and never modified afterwards.
struct SessionConfig {
  uint32_t buffer_size_kb = 1024;
  bool overwrite = false;
  uint32_t duration_s = 5;
  uint32_t sleep_s = 0;
  bool print_tgid = true;

  // Comma separated list of kernel functions to trace with function_graph.
  std::string kernel_funcs;

  bool compress = false;

  // When set, the invocation only decompresses this file to the output.
  std::string uncompress_file;

  bool begin_async = false;
  bool stop_async = false;
  bool dump_async = false;
  bool show_categories = false;
  bool stream = false;

  // Whether sched_switch and sched_wakeup are enabled while tracing.
  bool trace_sched = true;

  // Empty means guessing the mount point.
  std::string tracefs_root;
};

// The stages an invocation runs, derived from the async flags.
struct SessionPhases {
  bool begin = true;
  bool stop = true;
  bool dump = true;
  bool async = false;
  bool stream = false;
  // The overwrite policy actually applied; |begin_async| forces it on.
  bool overwrite = false;
};

SessionPhases ComputeSessionPhases(const SessionConfig& config);

// Rejects configurations that ask for more than one async stage.
base::Status ValidateSessionConfig(const SessionConfig& config);

}  // namespace atrace

#endif  // SRC_FTRACE_SESSION_CONFIG_H_
