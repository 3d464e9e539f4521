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

#include "atrace/base/time.h"

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace base {
namespace {

TEST(TimeTest, Conversions) {
  struct timespec ts = {};
  ts.tv_sec = 3;
  ts.tv_nsec = 250000000;
  EXPECT_EQ(FromPosixTimespec(ts), TimeNanos(3250000000LL));

  struct timespec back = ToPosixTimespec(TimeMillis(3250));
  EXPECT_EQ(back.tv_sec, 3);
  EXPECT_EQ(back.tv_nsec, 250000000L);

  back = ToPosixTimespec(TimeMillis(0));
  EXPECT_EQ(back.tv_sec, 0);
  EXPECT_EQ(back.tv_nsec, 0);
}

TEST(TimeTest, GetTime) {
  const TimeNanos start = GetMonotonicTimeNs();
  EXPECT_GT(start.count(), 0);
  EXPECT_GT(GetRealTimeMs().count(), 0);
  EXPECT_GE(GetMonotonicTimeNs(), start);
}

TEST(TimeTest, SleepUninterruptible) {
  const TimeNanos start = GetMonotonicTimeNs();
  SleepUninterruptible(TimeMillis(20));
  EXPECT_GE(GetMonotonicTimeNs() - start, TimeMillis(20));
}

}  // namespace
}  // namespace base
}  // namespace atrace
