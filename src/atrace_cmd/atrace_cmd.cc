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

#include "src/atrace_cmd/atrace_cmd.h"

#include <getopt.h>
#include <stdio.h>
#include <unistd.h>

#include <memory>
#include <string>

#include "atrace/base/logging.h"
#include "atrace/ext/base/status_or.h"
#include "src/atrace_cmd/config.h"
#include "src/ftrace/trace_session.h"
#include "src/ftrace/tracefs.h"

namespace atrace {

AtraceCmd::AtraceCmd() = default;
AtraceCmd::~AtraceCmd() = default;

int AtraceCmd::PrintUsage(const char* argv0) {
  ATRACE_ELOG(R"(
Usage: %s [options] [categories...]
  --buffer         -b -B N : Per-CPU buffer size N[kb,mb,gb] (default: 1024kb)
  --circle         -C      : Overwrite the oldest events when the buffer is full
  --functions      -K LIST : Comma separated kernel functions to graph
  --sleep          -S N    : Sleep N[s,m,h] before tracing (default: 0)
  --time           -T N    : Trace duration N[s,m,h] (default: 5s)
  --compress       -Z      : Compress the trace with zlib
  --uncompress     -d FILE : Decompress a -Z trace FILE to stdout and exit
  --no-tgid        -G      : Don't print the tgid of each event
  --no-sched               : Don't enable the sched_switch/sched_wakeup events
  --tracefs-root      DIR  : Use the tracefs mounted at DIR
  --help           -h
  -A LIST                  : App cmdlines to trace (not supported, ignored)
  categories               : Userspace categories (not supported, ignored)

Async sessions (only one per invocation):
  --BEGIN_ASYNC            : Start tracing and return immediately
  --STOP_ASYNC             : Stop tracing, dump and restore defaults
  --DUMP_ASYNC             : Dump the buffer while tracing continues

  --SHOW_CATEGORY          : List the supported categories
  --STREAM                 : Stream instead of dumping (not supported)
)",
              argv0);
  return 1;
}

std::optional<int> AtraceCmd::ParseCmdlineAndMaybeExit(int argc, char** argv) {
  enum LongOption {
    OPT_BEGIN_ASYNC = 1000,
    OPT_STOP_ASYNC,
    OPT_DUMP_ASYNC,
    OPT_SHOW_CATEGORY,
    OPT_STREAM,
    OPT_NO_SCHED,
    OPT_TRACEFS_ROOT,
  };
  static const struct option long_options[] = {
      {"help", no_argument, nullptr, 'h'},
      {"buffer", required_argument, nullptr, 'b'},
      {"circle", no_argument, nullptr, 'C'},
      {"functions", required_argument, nullptr, 'K'},
      {"sleep", required_argument, nullptr, 'S'},
      {"time", required_argument, nullptr, 'T'},
      {"compress", no_argument, nullptr, 'Z'},
      {"uncompress", required_argument, nullptr, 'd'},
      {"no-tgid", no_argument, nullptr, 'G'},
      {"BEGIN_ASYNC", no_argument, nullptr, OPT_BEGIN_ASYNC},
      {"STOP_ASYNC", no_argument, nullptr, OPT_STOP_ASYNC},
      {"DUMP_ASYNC", no_argument, nullptr, OPT_DUMP_ASYNC},
      {"SHOW_CATEGORY", no_argument, nullptr, OPT_SHOW_CATEGORY},
      {"STREAM", no_argument, nullptr, OPT_STREAM},
      {"no-sched", no_argument, nullptr, OPT_NO_SCHED},
      {"tracefs-root", required_argument, nullptr, OPT_TRACEFS_ROOT},
      {nullptr, 0, nullptr, 0}};

  ConfigOptions config_options;
  SessionConfig config;

  // Allows parsing more than one command line in the same process.
  optind = 0;
  for (;;) {
    int option_index = 0;
    int option = getopt_long(argc, argv, "hA:b:B:CK:S:T:Zd:G", long_options,
                             &option_index);

    if (option == -1)
      break;  // EOF.

    if (option == 'h') {
      PrintUsage(argv[0]);
      return 0;
    }

    if (option == 'A') {
      config_options.atrace_apps = optarg;
      continue;
    }

    if (option == 'b' || option == 'B') {
      config_options.buffer_size = optarg;
      continue;
    }

    if (option == 'C') {
      config.overwrite = true;
      continue;
    }

    if (option == 'K') {
      config.kernel_funcs = optarg;
      continue;
    }

    if (option == 'S') {
      config_options.sleep = optarg;
      continue;
    }

    if (option == 'T') {
      config_options.time = optarg;
      continue;
    }

    if (option == 'Z') {
      config.compress = true;
      continue;
    }

    if (option == 'd') {
      config.uncompress_file = optarg;
      continue;
    }

    if (option == 'G') {
      config.print_tgid = false;
      continue;
    }

    if (option == OPT_BEGIN_ASYNC) {
      config.begin_async = true;
      continue;
    }

    if (option == OPT_STOP_ASYNC) {
      config.stop_async = true;
      continue;
    }

    if (option == OPT_DUMP_ASYNC) {
      config.dump_async = true;
      continue;
    }

    if (option == OPT_SHOW_CATEGORY) {
      config.show_categories = true;
      continue;
    }

    if (option == OPT_STREAM) {
      config.stream = true;
      continue;
    }

    if (option == OPT_NO_SCHED) {
      config.trace_sched = false;
      continue;
    }

    if (option == OPT_TRACEFS_ROOT) {
      config.tracefs_root = optarg;
      if (config.tracefs_root.empty() || config.tracefs_root.back() != '/')
        config.tracefs_root += '/';
      continue;
    }

    return PrintUsage(argv[0]);
  }

  for (int i = optind; i < argc; i++)
    config_options.categories.push_back(argv[i]);

  if (config.show_categories) {
    printf("no support categories\n");
    return 0;
  }

  base::StatusOr<SessionConfig> parsed =
      CreateConfigFromOptions(config_options, config);
  if (!parsed.ok()) {
    ATRACE_ELOG("%s", parsed.status().c_message());
    return 1;
  }

  base::Status status = ValidateSessionConfig(*parsed);
  if (!status.ok()) {
    ATRACE_ELOG("%s", status.c_message());
    return 1;
  }

  config_ = *parsed;
  return std::nullopt;
}

int AtraceCmd::RunSession() {
  base::Status status = InstallAbortSignalHandlers(&abort_token_);
  if (!status.ok()) {
    ATRACE_ELOG("Continuing without ctrl-c handling: %s", status.c_message());
  }

  // Decompressing a trace doesn't touch the kernel.
  std::unique_ptr<Tracefs> tracefs;
  if (config_.uncompress_file.empty()) {
    tracefs = config_.tracefs_root.empty()
                  ? Tracefs::CreateGuessingMountPoint()
                  : Tracefs::Create(config_.tracefs_root);
    if (!tracefs) {
      ATRACE_ELOG("Could not find tracefs, is debugfs mounted?");
      return 1;
    }
  }

  TraceSession session(tracefs.get(), config_, &abort_token_);
  int exit_code = session.Run();
  // |abort_token_| dies with this object.
  UninstallAbortSignalHandlers();
  return exit_code;
}

int AtraceCmd::Main(int argc, char** argv) {
  std::optional<int> exit_code = ParseCmdlineAndMaybeExit(argc, argv);
  if (exit_code.has_value())
    return *exit_code;
  return RunSession();
}

int AtraceCmdMain(int argc, char** argv) {
  AtraceCmd cmd;
  return cmd.Main(argc, argv);
}

}  // namespace atrace
