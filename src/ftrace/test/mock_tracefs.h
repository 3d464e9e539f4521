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

#ifndef SRC_FTRACE_TEST_MOCK_TRACEFS_H_
#define SRC_FTRACE_TEST_MOCK_TRACEFS_H_

#include <string>

#include "src/ftrace/tracefs.h"
#include "test/gtest_and_gmock.h"

namespace atrace {

// A Tracefs rooted at "/root/" whose file primitives are mocked. By default
// every write succeeds, every file exists and is writable, and trace_clock
// reads "[local] global boot".
class MockTracefs : public Tracefs {
 public:
  MockTracefs() : Tracefs("/root/") {
    using testing::_;
    using testing::Return;
    ON_CALL(*this, WriteToFile(_, _)).WillByDefault(Return(true));
    ON_CALL(*this, AppendToFile(_, _)).WillByDefault(Return(true));
    ON_CALL(*this, ClearFile(_)).WillByDefault(Return(true));
    ON_CALL(*this, FileExists(_)).WillByDefault(Return(true));
    ON_CALL(*this, IsFileWritable(_)).WillByDefault(Return(true));
    ON_CALL(*this, ReadFileIntoString(_))
        .WillByDefault(Return("[local] global boot\n"));
  }

  // Lets a test add targeted expectations without failing on every other
  // call a session makes. Must be called before those expectations.
  void AllowAnyCall() {
    using testing::_;
    using testing::AnyNumber;
    EXPECT_CALL(*this, WriteToFile(_, _)).Times(AnyNumber());
    EXPECT_CALL(*this, AppendToFile(_, _)).Times(AnyNumber());
    EXPECT_CALL(*this, ClearFile(_)).Times(AnyNumber());
    EXPECT_CALL(*this, ReadFileIntoString(_)).Times(AnyNumber());
    EXPECT_CALL(*this, FileExists(_)).Times(AnyNumber());
    EXPECT_CALL(*this, IsFileWritable(_)).Times(AnyNumber());
  }

  MOCK_METHOD(bool,
              WriteToFile,
              (const std::string& path, const std::string& str),
              (override));
  MOCK_METHOD(bool,
              AppendToFile,
              (const std::string& path, const std::string& str),
              (override));
  MOCK_METHOD(bool, ClearFile, (const std::string& path), (override));
  MOCK_METHOD(std::string,
              ReadFileIntoString,
              (const std::string& path),
              (const, override));
  MOCK_METHOD(bool, FileExists, (const std::string& path), (const, override));
  MOCK_METHOD(bool,
              IsFileWritable,
              (const std::string& path),
              (const, override));
};

}  // namespace atrace

#endif  // SRC_FTRACE_TEST_MOCK_TRACEFS_H_
