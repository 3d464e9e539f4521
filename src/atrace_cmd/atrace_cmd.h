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

#ifndef SRC_ATRACE_CMD_ATRACE_CMD_H_
#define SRC_ATRACE_CMD_ATRACE_CMD_H_

#include <optional>

#include "src/ftrace/abort_signal_monitor.h"
#include "src/ftrace/session_config.h"

namespace atrace {

class AtraceCmd {
 public:
  AtraceCmd();
  ~AtraceCmd();

  int Main(int argc, char** argv);

  // Parses the command line into config(). Returns an exit code when the
  // invocation is already complete (--help, --SHOW_CATEGORY or a usage
  // error), std::nullopt when a session should run.
  std::optional<int> ParseCmdlineAndMaybeExit(int argc, char** argv);

  // Runs the session described by config().
  int RunSession();

  const SessionConfig& config() const { return config_; }

 private:
  int PrintUsage(const char* argv0);

  SessionConfig config_;
  AbortToken abort_token_;
};

int AtraceCmdMain(int argc, char** argv);

}  // namespace atrace

#endif  // SRC_ATRACE_CMD_ATRACE_CMD_H_
