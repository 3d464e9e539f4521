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

#include "src/ftrace/abort_signal_monitor.h"

#include <errno.h>
#include <signal.h>
#include <string.h>

#include "atrace/base/logging.h"

namespace atrace {
namespace {

constexpr int kAbortSignals[] = {SIGHUP, SIGINT, SIGQUIT, SIGTERM};

AbortToken* g_abort_token;

void AbortSignalHandler(int, siginfo_t*, void*) {
  if (g_abort_token)
    g_abort_token->Abort();
}

}  // namespace

base::Status InstallAbortSignalHandlers(AbortToken* token) {
  ATRACE_CHECK(token);
  g_abort_token = token;

  struct sigaction sa {};
// Glibc headers for sa_sigaction trigger this.
#pragma GCC diagnostic push
#if defined(__clang__)
#pragma GCC diagnostic ignored "-Wdisabled-macro-expansion"
#endif
  sa.sa_sigaction = AbortSignalHandler;
  sa.sa_flags = SA_SIGINFO;
#pragma GCC diagnostic pop
  if (sigfillset(&sa.sa_mask) != 0)
    return base::ErrStatus("sigfillset() failed: %s", strerror(errno));

  for (int sig : kAbortSignals) {
    if (sigaction(sig, &sa, nullptr) != 0) {
      return base::ErrStatus("sigaction(%s) failed: %s", strsignal(sig),
                             strerror(errno));
    }
  }
  return base::OkStatus();
}

void UninstallAbortSignalHandlers() {
  struct sigaction sa {};
  sa.sa_handler = SIG_DFL;
  sigemptyset(&sa.sa_mask);
  for (int sig : kAbortSignals) {
    if (sigaction(sig, &sa, nullptr) != 0)
      ATRACE_PLOG("sigaction(%d)", sig);
  }
  g_abort_token = nullptr;
}

}  // namespace atrace
