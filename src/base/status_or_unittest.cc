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

#include "atrace/ext/base/status_or.h"

#include <string>
#include <vector>

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace base {

TEST(StatusOrTest, IntOk) {
  base::StatusOr<int> int_or = 1;
  ASSERT_TRUE(int_or.ok());
  ASSERT_TRUE(int_or.status().ok());
  ASSERT_EQ(int_or.value(), 1);
  ASSERT_EQ(*int_or, 1);
}

TEST(StatusOrTest, VecOk) {
  base::StatusOr<std::vector<std::string>> vec_or(
      std::vector<std::string>{"sched", "power"});
  ASSERT_TRUE(vec_or.ok());
  ASSERT_EQ((*vec_or)[0], "sched");
  ASSERT_EQ(vec_or->at(1), "power");
  ASSERT_EQ(vec_or->size(), 2u);
}

TEST(StatusOrTest, ErrStatus) {
  base::StatusOr<std::vector<int>> err(base::ErrStatus("Bad error"));
  ASSERT_FALSE(err.ok());
  ASSERT_FALSE(err.status().ok());
  ASSERT_EQ(err.status().message(), "Bad error");
}

TEST(StatusOrTest, MutableValue) {
  base::StatusOr<std::string> str_or = std::string("abc");
  str_or->append("def");
  ASSERT_EQ(*str_or, "abcdef");
}

}  // namespace base
}  // namespace atrace
