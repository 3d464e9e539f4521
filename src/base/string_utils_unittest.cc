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

#include "atrace/ext/base/string_utils.h"

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace base {
namespace {

using testing::ElementsAre;

TEST(StringUtilsTest, SplitString) {
  EXPECT_THAT(SplitString("", ","), ElementsAre());
  EXPECT_THAT(SplitString("a,b,c", ","), ElementsAre("a", "b", "c"));
  EXPECT_THAT(SplitString("a::b::c", "::"), ElementsAre("a", "b", "c"));
  EXPECT_THAT(SplitString(",,a,,b,", ","), ElementsAre("a", "b"));
  EXPECT_THAT(SplitString("vfs_read", ","), ElementsAre("vfs_read"));
}

TEST(StringUtilsTest, StripSuffix) {
  EXPECT_EQ(StripSuffix("abc", ""), "abc");
  EXPECT_EQ(StripSuffix("abc", "c"), "ab");
  EXPECT_EQ(StripSuffix("abc", "bc"), "a");
  EXPECT_EQ(StripSuffix("abc", "abc"), "");
  EXPECT_EQ(StripSuffix("abc", "ebcd"), "abc");
  EXPECT_EQ(StripSuffix("abc", "abd"), "abc");
  EXPECT_EQ(StripSuffix("", "/"), "");
  EXPECT_EQ(StripSuffix("/tmp/", "/"), "/tmp");
}

TEST(StringUtilsTest, TrimWhitespace) {
  EXPECT_EQ(TrimWhitespace(""), "");
  EXPECT_EQ(TrimWhitespace(" "), "");
  EXPECT_EQ(TrimWhitespace("\t\n"), "");

  EXPECT_EQ(TrimWhitespace("\tx\n\n"), "x");
  EXPECT_EQ(TrimWhitespace(" vfs_read "), "vfs_read");
  EXPECT_EQ(TrimWhitespace("\tx\nx\r\n"), "x\nx");
}

}  // namespace
}  // namespace base
}  // namespace atrace
