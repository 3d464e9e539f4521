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

#include "atrace/base/status.h"

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace base {

TEST(StatusTest, Ok) {
  base::Status status = base::OkStatus();
  ASSERT_TRUE(status.ok());
  ASSERT_EQ(status.message(), "");
  ASSERT_STREQ(status.c_message(), "");
}

TEST(StatusTest, ErrStatusFormatsMessage) {
  base::Status status = base::ErrStatus("Failed to write %s (%d)", "trace", 5);
  ASSERT_FALSE(status.ok());
  ASSERT_EQ(status.message(), "Failed to write trace (5)");
}

TEST(StatusTest, CopyAndMove) {
  base::Status status = base::ErrStatus("Error");
  base::Status copy = status;
  ASSERT_FALSE(copy.ok());
  ASSERT_EQ(copy.message(), "Error");

  base::Status moved = std::move(copy);
  ASSERT_FALSE(moved.ok());
  ASSERT_EQ(moved.message(), "Error");
}

}  // namespace base
}  // namespace atrace
