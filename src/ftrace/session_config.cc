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

#include "src/ftrace/session_config.h"

namespace atrace {

SessionPhases ComputeSessionPhases(const SessionConfig& config) {
  SessionPhases phases;
  phases.overwrite = config.overwrite;
  phases.stream = config.stream;

  if (config.begin_async) {
    phases.async = true;
    phases.stop = false;
    phases.dump = false;
    // A detached session is dumped much later by another invocation, so the
    // ring buffer has to keep the newest events.
    phases.overwrite = true;
  } else if (config.stop_async) {
    phases.async = true;
    phases.begin = false;
  } else if (config.dump_async) {
    phases.async = true;
    phases.begin = false;
    phases.stop = false;
  }

  if (config.stream)
    phases.dump = false;
  return phases;
}

base::Status ValidateSessionConfig(const SessionConfig& config) {
  int async_flags = int{config.begin_async} + int{config.stop_async} +
                    int{config.dump_async};
  if (async_flags > 1) {
    return base::ErrStatus(
        "Only one of --BEGIN_ASYNC, --STOP_ASYNC and --DUMP_ASYNC can be "
        "passed at a time");
  }
  if (!config.uncompress_file.empty() && async_flags > 0) {
    return base::ErrStatus("--uncompress cannot be combined with async modes");
  }
  return base::OkStatus();
}

}  // namespace atrace
