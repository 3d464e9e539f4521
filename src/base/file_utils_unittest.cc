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

#include "atrace/ext/base/file_utils.h"

#include <signal.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "atrace/ext/base/temp_file.h"
#include "test/gtest_and_gmock.h"

namespace atrace {
namespace base {
namespace {

TEST(FileUtilsTest, WriteAllThenReadFile) {
  TempFile tmp = TempFile::Create();
  const std::string data(10000, 'x');
  ASSERT_EQ(WriteAll(tmp.fd(), data.data(), data.size()),
            static_cast<ssize_t>(data.size()));

  std::string contents;
  ASSERT_TRUE(ReadFile(tmp.path(), &contents));
  EXPECT_EQ(contents, data);
}

TEST(FileUtilsTest, ReadFileDescriptorAppends) {
  TempFile tmp = TempFile::Create();
  ASSERT_EQ(WriteAll(tmp.fd(), "world", 5), 5);

  ScopedFile fd = OpenFile(tmp.path(), O_RDONLY);
  ASSERT_TRUE(fd);
  std::string contents = "hello ";
  ASSERT_TRUE(ReadFileDescriptor(*fd, &contents));
  EXPECT_EQ(contents, "hello world");
}

TEST(FileUtilsTest, ReadMissingFile) {
  std::string contents;
  EXPECT_FALSE(ReadFile("/this/path/does/not/exist", &contents));
  EXPECT_TRUE(contents.empty());
}

TEST(FileUtilsTest, ReadFromPipe) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  ScopedFile rd(fds[0]);
  ScopedFile wr(fds[1]);
  ASSERT_EQ(WriteAll(*wr, "0\n", 2), 2);
  wr.reset();

  char buf[8] = {};
  EXPECT_EQ(Read(*rd, buf, sizeof(buf)), 2);
  EXPECT_STREQ(buf, "0\n");
  EXPECT_EQ(Read(*rd, buf, sizeof(buf)), 0);
}

TEST(FileUtilsTest, WriteAllToClosedPipe) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  ScopedFile wr(fds[1]);
  CloseFile(fds[0]);

  struct sigaction old_action {};
  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  ASSERT_EQ(sigaction(SIGPIPE, &ignore, &old_action), 0);
  EXPECT_EQ(WriteAll(*wr, "data", 4), -1);
  EXPECT_EQ(errno, EPIPE);
  sigaction(SIGPIPE, &old_action, nullptr);
}

TEST(FileUtilsTest, MkdirRmdir) {
  TempDir tmp = TempDir::Create();
  const std::string dir = tmp.path() + "/events";
  EXPECT_FALSE(FileExists(dir));
  ASSERT_TRUE(Mkdir(dir));
  EXPECT_TRUE(FileExists(dir));
  EXPECT_FALSE(Mkdir(dir));
  EXPECT_TRUE(Rmdir(dir));
  EXPECT_FALSE(FileExists(dir));
  EXPECT_FALSE(Rmdir(dir));
}

TEST(FileUtilsTest, FileIsWritable) {
  TempFile tmp = TempFile::Create();
  EXPECT_TRUE(FileExists(tmp.path()));
  // Root ignores the mode bits, so only the positive case is portable.
  EXPECT_TRUE(FileIsWritable(tmp.path()));
  EXPECT_FALSE(FileIsWritable("/this/path/does/not/exist"));
}

TEST(FileUtilsTest, OpenFileCreate) {
  TempDir tmp = TempDir::Create();
  const std::string path = tmp.path() + "/trace";
  {
    ScopedFile fd = OpenFile(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    ASSERT_TRUE(fd);
    EXPECT_EQ(WriteAll(*fd, "abc", 3), 3);
  }
  std::string contents;
  ASSERT_TRUE(ReadFile(path, &contents));
  EXPECT_EQ(contents, "abc");
  ASSERT_EQ(unlink(path.c_str()), 0);
  EXPECT_FALSE(OpenFile(path, O_RDONLY));
}

}  // namespace
}  // namespace base
}  // namespace atrace
