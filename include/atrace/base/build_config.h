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

#ifndef INCLUDE_ATRACE_BASE_BUILD_CONFIG_H_
#define INCLUDE_ATRACE_BASE_BUILD_CONFIG_H_

// Allows to define build flags that give a compiler error if the header that
// defined the flag is not included, instead of silently ignoring the #if block.
#define ATRACE_BUILDFLAG_CAT_INDIRECT(a, b) a##b
#define ATRACE_BUILDFLAG_CAT(a, b) ATRACE_BUILDFLAG_CAT_INDIRECT(a, b)
#define ATRACE_BUILDFLAG(flag) \
  (ATRACE_BUILDFLAG_CAT(ATRACE_BUILDFLAG_DEFINE_, flag)())

// ftrace only exists on Linux kernels, so these are the only two targets.
#if defined(__ANDROID__)
#define ATRACE_BUILDFLAG_DEFINE_ATRACE_OS_ANDROID() 1
#define ATRACE_BUILDFLAG_DEFINE_ATRACE_OS_LINUX() 0
#elif defined(__linux__)
#define ATRACE_BUILDFLAG_DEFINE_ATRACE_OS_ANDROID() 0
#define ATRACE_BUILDFLAG_DEFINE_ATRACE_OS_LINUX() 1
#else
#error OS not supported (see build_config.h)
#endif

#endif  // INCLUDE_ATRACE_BASE_BUILD_CONFIG_H_
