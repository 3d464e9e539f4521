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

#include "src/ftrace/kernel_option.h"

#include <set>
#include <string>

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

TEST(KernelOptionTest, PathsAreUnique) {
  std::set<std::string> seen;
  for (KernelOption option : kAllKernelOptions) {
    std::string path = GetKernelOptionPath(option);
    EXPECT_TRUE(seen.insert(path).second) << "duplicate path " << path;
  }
  for (const FtraceEvent& event : kBuiltinEvents) {
    std::string path = GetEventEnablePath(event);
    EXPECT_TRUE(seen.insert(path).second) << "duplicate path " << path;
  }
  std::string group_path = GetEventGroupEnablePath(kWorkqueueEventGroup);
  EXPECT_TRUE(seen.insert(group_path).second);
}

TEST(KernelOptionTest, PathsAreRelative) {
  for (KernelOption option : kAllKernelOptions) {
    std::string path = GetKernelOptionPath(option);
    ASSERT_FALSE(path.empty());
    EXPECT_NE(path.front(), '/');
    EXPECT_NE(path.back(), '/');
  }
}

TEST(KernelOptionTest, WellKnownPaths) {
  EXPECT_STREQ(GetKernelOptionPath(KernelOption::kOverwrite),
               "options/overwrite");
  EXPECT_STREQ(GetKernelOptionPath(KernelOption::kPrintTgid),
               "options/print-tgid");
  EXPECT_STREQ(GetKernelOptionPath(KernelOption::kTraceClock), "trace_clock");
  EXPECT_EQ(GetEventEnablePath(kSchedSwitchEvent),
            "events/sched/sched_switch/enable");
  EXPECT_EQ(GetEventGroupEnablePath(kWorkqueueEventGroup),
            "events/workqueue/enable");
}

}  // namespace
}  // namespace atrace
