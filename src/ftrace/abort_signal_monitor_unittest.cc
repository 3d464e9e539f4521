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

#include <signal.h>

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

TEST(AbortSignalMonitorTest, TokenStartsClear) {
  AbortToken token;
  EXPECT_FALSE(token.IsAborted());
  token.Abort();
  EXPECT_TRUE(token.IsAborted());
  token.Abort();
  EXPECT_TRUE(token.IsAborted());
}

TEST(AbortSignalMonitorTest, SignalsAbortTheToken) {
  for (int sig : {SIGHUP, SIGINT, SIGQUIT, SIGTERM}) {
    AbortToken token;
    ASSERT_TRUE(InstallAbortSignalHandlers(&token).ok());
    // raise() returns after the handler ran for a signal sent to the caller.
    ASSERT_EQ(raise(sig), 0);
    EXPECT_TRUE(token.IsAborted()) << "signal " << sig;
    UninstallAbortSignalHandlers();
  }
}

TEST(AbortSignalMonitorTest, ReinstallingSwitchesToken) {
  AbortToken first;
  AbortToken second;
  ASSERT_TRUE(InstallAbortSignalHandlers(&first).ok());
  ASSERT_TRUE(InstallAbortSignalHandlers(&second).ok());
  ASSERT_EQ(raise(SIGINT), 0);
  EXPECT_FALSE(first.IsAborted());
  EXPECT_TRUE(second.IsAborted());
  UninstallAbortSignalHandlers();
}

}  // namespace
}  // namespace atrace
