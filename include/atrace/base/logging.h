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

#ifndef INCLUDE_ATRACE_BASE_LOGGING_H_
#define INCLUDE_ATRACE_BASE_LOGGING_H_

#include <errno.h>
#include <string.h>  // For strerror.

#if defined(NDEBUG) && !defined(DCHECK_ALWAYS_ON)
#define ATRACE_DCHECK_IS_ON() 0
#else
#define ATRACE_DCHECK_IS_ON() 1
#endif

#if !defined(ATRACE_FORCE_DLOG)
#define ATRACE_DLOG_IS_ON() ATRACE_DCHECK_IS_ON()
#else
#define ATRACE_DLOG_IS_ON() ATRACE_FORCE_DLOG
#endif

#include "atrace/base/compiler.h"

namespace atrace {
namespace base {

// Constexpr functions to extract basename(__FILE__), e.g.: ../foo/f.c -> f.c .
constexpr const char* StrEnd(const char* s) {
  return *s ? StrEnd(s + 1) : s;
}

constexpr const char* BasenameRecursive(const char* s,
                                        const char* begin,
                                        const char* end) {
  return (*s == '/' && s < end)
             ? (s + 1)
             : ((s > begin) ? BasenameRecursive(s - 1, begin, end) : s);
}

constexpr const char* Basename(const char* str) {
  return BasenameRecursive(StrEnd(str), str, StrEnd(str));
}

enum LogLev { kLogDebug = 0, kLogInfo, kLogImportant, kLogError };

// Everything goes to stderr: stdout carries the trace itself.
ATRACE_PRINTF_FORMAT(4, 5)
void LogMessage(LogLev,
                const char* fname,
                int line,
                const char* fmt,
                ...);

template <typename... T>
inline void ignore_result(const T&...) {}

}  // namespace base
}  // namespace atrace

#define ATRACE_XLOG(level, fmt, ...)                                        \
  ::atrace::base::LogMessage(::atrace::base::level,                         \
                             ::atrace::base::Basename(__FILE__), __LINE__, \
                             fmt, ##__VA_ARGS__)

#define ATRACE_IMMEDIATE_CRASH() \
  do {                           \
    __builtin_trap();            \
    __builtin_unreachable();     \
  } while (0)

#define ATRACE_LOG(fmt, ...) ATRACE_XLOG(kLogInfo, fmt, ##__VA_ARGS__)
#define ATRACE_ILOG(fmt, ...) ATRACE_XLOG(kLogImportant, fmt, ##__VA_ARGS__)
#define ATRACE_ELOG(fmt, ...) ATRACE_XLOG(kLogError, fmt, ##__VA_ARGS__)
#define ATRACE_FATAL(fmt, ...)       \
  do {                               \
    ATRACE_PLOG(fmt, ##__VA_ARGS__); \
    ATRACE_IMMEDIATE_CRASH();        \
  } while (0)

#define ATRACE_PLOG(x, ...) \
  ATRACE_ELOG(x " (errno: %d, %s)", ##__VA_ARGS__, errno, strerror(errno))

#if ATRACE_DLOG_IS_ON()

#define ATRACE_DLOG(fmt, ...) ATRACE_XLOG(kLogDebug, fmt, ##__VA_ARGS__)

#define ATRACE_DPLOG(x, ...) \
  ATRACE_DLOG(x " (errno: %d, %s)", ##__VA_ARGS__, errno, strerror(errno))

#else

#define ATRACE_DLOG(...) ::atrace::base::ignore_result(__VA_ARGS__)
#define ATRACE_DPLOG(...) ::atrace::base::ignore_result(__VA_ARGS__)

#endif  // ATRACE_DLOG_IS_ON()

#if ATRACE_DCHECK_IS_ON()

#define ATRACE_DCHECK(x)                           \
  do {                                             \
    if (ATRACE_UNLIKELY(!(x))) {                   \
      ATRACE_PLOG("%s", "ATRACE_CHECK(" #x ")");   \
      ATRACE_IMMEDIATE_CRASH();                    \
    }                                              \
  } while (0)

#else

#define ATRACE_DCHECK(x) \
  do {                   \
  } while (false && (x))

#endif  // ATRACE_DCHECK_IS_ON()

#if ATRACE_DCHECK_IS_ON()
#define ATRACE_CHECK(x) ATRACE_DCHECK(x)
#else
#define ATRACE_CHECK(x)                            \
  do {                                             \
    if (ATRACE_UNLIKELY(!(x))) {                   \
      ATRACE_PLOG("%s", "ATRACE_CHECK(" #x ")");   \
      ATRACE_IMMEDIATE_CRASH();                    \
    }                                              \
  } while (0)

#endif  // ATRACE_DCHECK_IS_ON()

#endif  // INCLUDE_ATRACE_BASE_LOGGING_H_
