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

#ifndef SRC_FTRACE_TRACE_SESSION_H_
#define SRC_FTRACE_TRACE_SESSION_H_

#include <stdint.h>
#include <unistd.h>

#include <vector>

#include "src/ftrace/session_config.h"
#include "src/ftrace/trace_setup.h"

namespace atrace {

class AbortToken;
class Tracefs;

enum class SessionState {
  kIdle = 0,
  kConfiguring,
  kArmed,
  kCapturing,
  kStopped,
  kDumped,
  kCleanedUp,
  kReplayOnly,
};

const char* SessionStateToString(SessionState state);

// Drives one invocation of a trace session: configures ftrace, waits for the
// capture window, stops, dumps and restores the kernel defaults, skipping the
// stages the async flags leave to other invocations. Every piece of session
// state lives in the kernel, so a begin, stop or dump invocation can run in a
// different process than the others.
class TraceSession {
 public:
  // |tracefs| and |abort_token| must outlive the session. The trace is
  // written to |output_fd|.
  TraceSession(Tracefs* tracefs,
               const SessionConfig& config,
               const AbortToken* abort_token,
               int output_fd = STDOUT_FILENO);
  virtual ~TraceSession();

  // Returns the process exit code: 0, or -1 if the trace couldn't be written.
  int Run();

  SessionState state() const { return state_; }

  // Every state entered by Run(), in order. kIdle is not included.
  const std::vector<SessionState>& transitions() const { return transitions_; }

  const SetupResult& setup_result() const { return setup_result_; }
  const SetupResult& cleanup_result() const { return cleanup_result_; }

 protected:
  // Blocks for |seconds|, even if a signal arrives in the meantime.
  virtual void SleepSeconds(uint32_t seconds);

 private:
  TraceSession(const TraceSession&) = delete;
  TraceSession& operator=(const TraceSession&) = delete;

  int Replay();
  bool BeginCapture();
  bool DumpCapture();
  void WriteClockSyncMarker();
  void StreamTrace();
  void TransitionTo(SessionState state);

  Tracefs* const tracefs_;
  const SessionConfig config_;
  const SessionPhases phases_;
  const AbortToken* const abort_token_;
  const int output_fd_;

  SessionState state_ = SessionState::kIdle;
  std::vector<SessionState> transitions_;
  SetupResult setup_result_;
  SetupResult cleanup_result_;
};

}  // namespace atrace

#endif  // SRC_FTRACE_TRACE_SESSION_H_
