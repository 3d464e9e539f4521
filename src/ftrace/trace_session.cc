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

#include "src/ftrace/trace_session.h"

#include <inttypes.h>
#include <stdio.h>

#include "atrace/base/logging.h"
#include "atrace/base/time.h"
#include "atrace/ext/base/scoped_file.h"
#include "src/ftrace/abort_signal_monitor.h"
#include "src/ftrace/trace_pipeline.h"
#include "src/ftrace/tracefs.h"

namespace atrace {

const char* SessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kConfiguring:
      return "configuring";
    case SessionState::kArmed:
      return "armed";
    case SessionState::kCapturing:
      return "capturing";
    case SessionState::kStopped:
      return "stopped";
    case SessionState::kDumped:
      return "dumped";
    case SessionState::kCleanedUp:
      return "cleaned up";
    case SessionState::kReplayOnly:
      return "replay only";
  }
  ATRACE_FATAL("Unknown session state %d", static_cast<int>(state));
}

TraceSession::TraceSession(Tracefs* tracefs,
                           const SessionConfig& config,
                           const AbortToken* abort_token,
                           int output_fd)
    : tracefs_(tracefs),
      config_(config),
      phases_(ComputeSessionPhases(config)),
      abort_token_(abort_token),
      output_fd_(output_fd) {
  ATRACE_CHECK(abort_token_);
}

TraceSession::~TraceSession() = default;

int TraceSession::Run() {
  ATRACE_CHECK(state_ == SessionState::kIdle);
  if (!config_.uncompress_file.empty())
    return Replay();

  ATRACE_CHECK(tracefs_);
  bool setup_ok = true;
  if (phases_.begin)
    setup_ok = BeginCapture();

  // Stopping doesn't depend on this invocation having started the session:
  // tracing_on is plain kernel state.
  if (phases_.stop) {
    if (!tracefs_->SetTracingOn(false))
      ATRACE_ELOG("Failed to disable tracing");
    TransitionTo(SessionState::kStopped);
  }

  int exit_code = 0;
  if (setup_ok && phases_.dump) {
    if (!DumpCapture())
      exit_code = -1;
  } else if (!setup_ok) {
    ATRACE_ELOG(
        "unable to start tracing, please check debugfs setup correctly");
  }

  if (phases_.stop) {
    cleanup_result_ = CleanupTrace(tracefs_);
    TransitionTo(SessionState::kCleanedUp);
  }
  return exit_code;
}

int TraceSession::Replay() {
  TransitionTo(SessionState::kReplayOnly);
  base::Status status =
      DecompressTraceFile(config_.uncompress_file, output_fd_);
  if (!status.ok()) {
    ATRACE_ELOG("Failed to decompress %s: %s", config_.uncompress_file.c_str(),
                status.c_message());
    return -1;
  }
  return 0;
}

bool TraceSession::BeginCapture() {
  if (config_.sleep_s > 0)
    SleepSeconds(config_.sleep_s);

  TransitionTo(SessionState::kConfiguring);
  setup_result_ = SetupTrace(tracefs_, config_, phases_);
  bool tracing_on = tracefs_->SetTracingOn(true);
  setup_result_.Add(SetupStep::kTracingOn,
                    tracefs_->GetOptionPath(KernelOption::kTracingOn),
                    tracing_on);
  if (!setup_result_.ok())
    return false;
  TransitionTo(SessionState::kArmed);

  if (!phases_.stream)
    fflush(stdout);
  bool cleared = tracefs_->ClearTrace();
  setup_result_.Add(SetupStep::kClearTrace,
                    tracefs_->GetOptionPath(KernelOption::kTrace), cleared);
  WriteClockSyncMarker();
  if (!cleared)
    return false;
  TransitionTo(SessionState::kCapturing);

  if (phases_.stream) {
    StreamTrace();
  } else if (!phases_.async) {
    SleepSeconds(config_.duration_s);
  }
  return true;
}

// The abort token is only looked at here: an abort during the capture window
// discards the capture but lets the session tear down normally.
bool TraceSession::DumpCapture() {
  fflush(stdout);
  bool ok = true;
  if (abort_token_->IsAborted()) {
    ATRACE_LOG("Tracing aborted, discarding the trace");
  } else {
    base::ScopedFile trace_fd = tracefs_->OpenTraceForRead();
    base::Status status =
        trace_fd ? DumpTrace(*trace_fd, output_fd_, config_.compress)
                 : base::ErrStatus("Failed to open the trace");
    if (status.ok()) {
      TransitionTo(SessionState::kDumped);
    } else {
      ATRACE_ELOG("Failed to dump the trace: %s", status.c_message());
      ok = false;
    }
  }
  if (!tracefs_->ClearTrace())
    ATRACE_ELOG("Failed to clear the trace buffer");
  return ok;
}

void TraceSession::WriteClockSyncMarker() {
  char buffer[128];
  double now_in_seconds =
      static_cast<double>(base::GetMonotonicTimeNs().count()) / 1e9;
  snprintf(buffer, sizeof(buffer), "trace_event_clock_sync: parent_ts=%f\n",
           now_in_seconds);
  if (!tracefs_->WriteTraceMarker(buffer))
    ATRACE_ELOG("Failed to write the clock sync marker");

  int64_t realtime_in_ms = base::GetRealTimeMs().count();
  snprintf(buffer, sizeof(buffer),
           "trace_event_clock_sync: realtime_ts=%" PRId64 "\n",
           realtime_in_ms);
  if (!tracefs_->WriteTraceMarker(buffer))
    ATRACE_ELOG("Failed to write the clock sync marker");
}

// TODO: stream trace_pipe to the output instead of stopping straight away.
void TraceSession::StreamTrace() {
  ATRACE_ELOG("Streaming is not supported yet");
}

void TraceSession::SleepSeconds(uint32_t seconds) {
  base::SleepUninterruptible(base::TimeSeconds(seconds));
}

void TraceSession::TransitionTo(SessionState state) {
  ATRACE_DLOG("Session %s -> %s", SessionStateToString(state_),
              SessionStateToString(state));
  state_ = state;
  transitions_.push_back(state);
}

}  // namespace atrace
