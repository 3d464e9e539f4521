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

#ifndef SRC_FTRACE_ABORT_SIGNAL_MONITOR_H_
#define SRC_FTRACE_ABORT_SIGNAL_MONITOR_H_

#include <atomic>

#include "atrace/base/status.h"

namespace atrace {

// Set once when the user asks the session to stop early (SIGINT and friends).
// Written from the signal handler, read from the main flow.
class AbortToken {
 public:
  AbortToken() = default;
  AbortToken(const AbortToken&) = delete;
  AbortToken& operator=(const AbortToken&) = delete;

  void Abort() { aborted_.store(true, std::memory_order_relaxed); }
  bool IsAborted() const { return aborted_.load(std::memory_order_relaxed); }

 private:
  static_assert(std::atomic<bool>::is_always_lock_free,
                "AbortToken is written from a signal handler");
  std::atomic<bool> aborted_{false};
};

// Installs a handler for SIGHUP, SIGINT, SIGQUIT and SIGTERM that aborts
// |token|. |token| must outlive the handlers. All signals are blocked while
// the handler runs.
base::Status InstallAbortSignalHandlers(AbortToken* token);

// Restores the default dispositions.
void UninstallAbortSignalHandlers();

}  // namespace atrace

#endif  // SRC_FTRACE_ABORT_SIGNAL_MONITOR_H_
