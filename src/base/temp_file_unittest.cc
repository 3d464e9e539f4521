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

#include "atrace/ext/base/temp_file.h"

#include <sys/stat.h>
#include <unistd.h>

#include "atrace/ext/base/file_utils.h"
#include "test/gtest_and_gmock.h"

namespace atrace {
namespace base {
namespace {

bool PathExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

TEST(TempFileTest, Create) {
  std::string path;
  int fd;
  {
    TempFile tmp = TempFile::Create();
    path = tmp.path();
    fd = tmp.fd();
    ASSERT_EQ(*tmp, fd);
    ASSERT_TRUE(PathExists(path));
    ASSERT_EQ(WriteAll(fd, "x", 1), 1);
  }
  ASSERT_FALSE(PathExists(path));
  ASSERT_NE(0, close(fd));  // The fd is closed with the TempFile.
}

TEST(TempFileTest, UnlinkKeepsFd) {
  TempFile tmp = TempFile::Create();
  std::string path = tmp.path();
  tmp.Unlink();
  ASSERT_FALSE(PathExists(path));
  ASSERT_TRUE(tmp.path().empty());
  ASSERT_EQ(WriteAll(tmp.fd(), "x", 1), 1);
  tmp.Unlink();  // Idempotent.
}

TEST(TempFileTest, Move) {
  TempFile tmp = TempFile::Create();
  std::string path = tmp.path();
  TempFile moved = std::move(tmp);
  ASSERT_EQ(moved.path(), path);
  ASSERT_TRUE(PathExists(path));
}

TEST(TempDirTest, Create) {
  std::string path;
  {
    TempDir tmp = TempDir::Create();
    path = tmp.path();
    ASSERT_TRUE(PathExists(path));
  }
  ASSERT_FALSE(PathExists(path));
}

}  // namespace
}  // namespace base
}  // namespace atrace
