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

#include "atrace/base/logging.h"

#include <stdarg.h>
#include <stdio.h>
#include <unistd.h>  // For isatty()

#include "atrace/base/build_config.h"
#include "atrace/base/time.h"

#if ATRACE_BUILDFLAG(ATRACE_OS_ANDROID)
#include <android/log.h>
#endif

namespace atrace {
namespace base {

namespace {
const char kReset[] = "\x1b[0m";
const char kDefault[] = "\x1b[39m";
const char kDim[] = "\x1b[2m";
const char kRed[] = "\x1b[31m";
const char kBoldGreen[] = "\x1b[1m\x1b[32m";
const char kLightGray[] = "\x1b[90m";

}  // namespace

void LogMessage(LogLev level,
                const char* fname,
                int line,
                const char* fmt,
                ...) {
  // Keep errno intact for the caller, the ATRACE_PLOG arguments have already
  // been evaluated but the code after the log statement may still look at it.
  int saved_errno = errno;

  va_list args;
  va_start(args, fmt);
  char log_msg[1024];
  vsnprintf(log_msg, sizeof(log_msg), fmt, args);
  va_end(args);

  const char* color = kDefault;
  switch (level) {
    case kLogDebug:
      color = kDim;
      break;
    case kLogInfo:
      color = kDefault;
      break;
    case kLogImportant:
      color = kBoldGreen;
      break;
    case kLogError:
      color = kRed;
      break;
  }

  static const bool use_colors = isatty(STDERR_FILENO);

  // Formats file.cc:line as a space-padded fixed width string. If the file name
  // |fname| is too long, truncate it on the left-hand side.
  char line_str[10];
  size_t line_len =
      static_cast<size_t>(snprintf(line_str, sizeof(line_str), "%d", line));

  // 24 will be the width of the file.cc:line column in the log event.
  char file_and_line[24];
  size_t fname_len = strlen(fname);
  size_t fname_max = sizeof(file_and_line) - line_len - 2;  // 2 = ':' + '\0'.
  size_t fname_offset = fname_len <= fname_max ? 0 : fname_len - fname_max;
  int len = snprintf(file_and_line, sizeof(file_and_line), "%s:%s",
                     fname + fname_offset, line_str);
  memset(&file_and_line[len], ' ', sizeof(file_and_line) - size_t(len));
  file_and_line[sizeof(file_and_line) - 1] = '\0';

#if ATRACE_BUILDFLAG(ATRACE_OS_ANDROID)
  // Logcat has already timestamping, don't re-emit it.
  __android_log_print(ANDROID_LOG_DEBUG + level, "atrace", "%s %s",
                      file_and_line, log_msg);
#endif

  // The wall time % 1000 is enough to correlate our own log lines with the
  // trace_marker writes of the same run.
  char timestamp[32];
  int t_ms = static_cast<int>(GetWallTimeMs().count() % 1000000);
  int t_sec = t_ms / 1000;
  t_ms -= t_sec * 1000;
  snprintf(timestamp, sizeof(timestamp), "[%03d.%03d] ", t_sec, t_ms);

  if (use_colors) {
    fprintf(stderr, "%s%s%s%s %s%s%s\n", kLightGray, timestamp, file_and_line,
            kReset, color, log_msg, kReset);
  } else {
    fprintf(stderr, "%s%s %s\n", timestamp, file_and_line, log_msg);
  }
  errno = saved_errno;
}

}  // namespace base
}  // namespace atrace
