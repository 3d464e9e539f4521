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

#include "src/atrace_cmd/atrace_cmd.h"

#include <string>
#include <vector>

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

class AtraceCmdTest : public ::testing::Test {
 protected:
  std::optional<int> Parse(std::vector<std::string> args) {
    args_ = std::move(args);
    args_.insert(args_.begin(), "atrace");
    argv_.clear();
    for (std::string& arg : args_)
      argv_.push_back(&arg[0]);
    argv_.push_back(nullptr);
    return cmd_.ParseCmdlineAndMaybeExit(static_cast<int>(args_.size()),
                                         argv_.data());
  }

  const SessionConfig& config() const { return cmd_.config(); }

 private:
  AtraceCmd cmd_;
  std::vector<std::string> args_;
  std::vector<char*> argv_;
};

TEST_F(AtraceCmdTest, NoArguments) {
  EXPECT_EQ(Parse({}), std::nullopt);
  EXPECT_EQ(config().buffer_size_kb, 1024u);
  EXPECT_EQ(config().duration_s, 5u);
  EXPECT_EQ(config().sleep_s, 0u);
  EXPECT_FALSE(config().overwrite);
  EXPECT_FALSE(config().compress);
  EXPECT_TRUE(config().print_tgid);
  EXPECT_TRUE(config().trace_sched);
  EXPECT_TRUE(config().uncompress_file.empty());
}

TEST_F(AtraceCmdTest, ShortOptions) {
  EXPECT_EQ(Parse({"-B", "4mb", "-C", "-K", "vfs_read,vfs_write", "-S", "1",
                   "-T", "2m", "-Z", "-G"}),
            std::nullopt);
  EXPECT_EQ(config().buffer_size_kb, 4096u);
  EXPECT_TRUE(config().overwrite);
  EXPECT_EQ(config().kernel_funcs, "vfs_read,vfs_write");
  EXPECT_EQ(config().sleep_s, 1u);
  EXPECT_EQ(config().duration_s, 120u);
  EXPECT_TRUE(config().compress);
  EXPECT_FALSE(config().print_tgid);
}

TEST_F(AtraceCmdTest, LongOptions) {
  EXPECT_EQ(Parse({"--buffer", "2048", "--time", "10s", "--compress",
                   "--no-sched", "--tracefs-root", "/tmp/tracing"}),
            std::nullopt);
  EXPECT_EQ(config().buffer_size_kb, 2048u);
  EXPECT_EQ(config().duration_s, 10u);
  EXPECT_TRUE(config().compress);
  EXPECT_FALSE(config().trace_sched);
  EXPECT_EQ(config().tracefs_root, "/tmp/tracing/");
}

TEST_F(AtraceCmdTest, AsyncFlags) {
  EXPECT_EQ(Parse({"--BEGIN_ASYNC"}), std::nullopt);
  EXPECT_TRUE(config().begin_async);
  EXPECT_EQ(Parse({"--STOP_ASYNC", "-Z"}), std::nullopt);
  EXPECT_TRUE(config().stop_async);
  EXPECT_EQ(Parse({"--DUMP_ASYNC"}), std::nullopt);
  EXPECT_TRUE(config().dump_async);
  EXPECT_EQ(Parse({"--STREAM"}), std::nullopt);
  EXPECT_TRUE(config().stream);
}

TEST_F(AtraceCmdTest, ConflictingAsyncFlags) {
  EXPECT_EQ(Parse({"--BEGIN_ASYNC", "--STOP_ASYNC"}), 1);
  EXPECT_EQ(Parse({"-d", "trace.z", "--DUMP_ASYNC"}), 1);
}

TEST_F(AtraceCmdTest, Uncompress) {
  EXPECT_EQ(Parse({"-d", "/data/trace.z"}), std::nullopt);
  EXPECT_EQ(config().uncompress_file, "/data/trace.z");
  EXPECT_EQ(Parse({"--uncompress", "other.z"}), std::nullopt);
  EXPECT_EQ(config().uncompress_file, "other.z");
}

TEST_F(AtraceCmdTest, CategoriesAndAppsAreIgnored) {
  EXPECT_EQ(Parse({"-A", "com.example", "gfx", "-T", "1", "view"}),
            std::nullopt);
  EXPECT_EQ(config().duration_s, 1u);
}

TEST_F(AtraceCmdTest, ShowCategoryExitsEarly) {
  EXPECT_EQ(Parse({"--SHOW_CATEGORY"}), 0);
  EXPECT_EQ(Parse({"--SHOW_CATEGORY", "-T", "bogus"}), 0);
}

TEST_F(AtraceCmdTest, Help) {
  EXPECT_EQ(Parse({"-h"}), 0);
  EXPECT_EQ(Parse({"--help"}), 0);
}

TEST_F(AtraceCmdTest, UsageErrors) {
  EXPECT_EQ(Parse({"--no-such-flag"}), 1);
  EXPECT_EQ(Parse({"-T"}), 1);
  EXPECT_EQ(Parse({"-T", "soon"}), 1);
  EXPECT_EQ(Parse({"-B", "0"}), 1);
}

TEST_F(AtraceCmdTest, ParsesRepeatedly) {
  EXPECT_EQ(Parse({"-T", "7"}), std::nullopt);
  EXPECT_EQ(config().duration_s, 7u);
  EXPECT_EQ(Parse({"-T", "9"}), std::nullopt);
  EXPECT_EQ(config().duration_s, 9u);
}

}  // namespace
}  // namespace atrace
