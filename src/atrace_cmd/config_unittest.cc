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

#include "src/atrace_cmd/config.h"

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

base::StatusOr<SessionConfig> Parse(const ConfigOptions& options) {
  return CreateConfigFromOptions(options, SessionConfig());
}

TEST(ConfigTest, Defaults) {
  auto config = Parse(ConfigOptions());
  ASSERT_TRUE(config.ok());
  EXPECT_EQ(config->duration_s, 5u);
  EXPECT_EQ(config->sleep_s, 0u);
  EXPECT_EQ(config->buffer_size_kb, 1024u);
}

TEST(ConfigTest, TimeUnits) {
  ConfigOptions options;
  options.time = "5";
  EXPECT_EQ(Parse(options)->duration_s, 5u);
  options.time = "5s";
  EXPECT_EQ(Parse(options)->duration_s, 5u);
  options.time = "2m";
  EXPECT_EQ(Parse(options)->duration_s, 120u);
  options.time = "1h";
  EXPECT_EQ(Parse(options)->duration_s, 3600u);
  options.sleep = "3m";
  EXPECT_EQ(Parse(options)->sleep_s, 180u);
}

TEST(ConfigTest, SizeUnits) {
  ConfigOptions options;
  options.buffer_size = "8192";
  EXPECT_EQ(Parse(options)->buffer_size_kb, 8192u);
  options.buffer_size = "16kb";
  EXPECT_EQ(Parse(options)->buffer_size_kb, 16u);
  options.buffer_size = "16k";
  EXPECT_EQ(Parse(options)->buffer_size_kb, 16u);
  options.buffer_size = "4mb";
  EXPECT_EQ(Parse(options)->buffer_size_kb, 4096u);
  options.buffer_size = "4m";
  EXPECT_EQ(Parse(options)->buffer_size_kb, 4096u);
  options.buffer_size = "1g";
  EXPECT_EQ(Parse(options)->buffer_size_kb, 1048576u);
}

TEST(ConfigTest, InvalidTime) {
  ConfigOptions options;
  for (const char* time : {"", "abc", "-1", "5x", "s", "5ss"}) {
    options.time = time;
    EXPECT_FALSE(Parse(options).ok()) << time;
  }
  options.time = "5s";
  options.sleep = "later";
  EXPECT_FALSE(Parse(options).ok());
}

TEST(ConfigTest, InvalidSize) {
  ConfigOptions options;
  for (const char* size : {"", "big", "-4mb", "4tb", "kb"}) {
    options.buffer_size = size;
    EXPECT_FALSE(Parse(options).ok()) << size;
  }
}

TEST(ConfigTest, Overflow) {
  ConfigOptions options;
  options.time = "4294967296";
  EXPECT_FALSE(Parse(options).ok());
  options.time = "2000000h";
  EXPECT_FALSE(Parse(options).ok());
  options.time = "5";
  options.buffer_size = "5000g";
  EXPECT_FALSE(Parse(options).ok());
  options.buffer_size = "99999999999999999999999";
  EXPECT_FALSE(Parse(options).ok());
}

TEST(ConfigTest, ZeroBufferIsRejected) {
  ConfigOptions options;
  options.buffer_size = "0";
  EXPECT_FALSE(Parse(options).ok());
  options.buffer_size = "0mb";
  EXPECT_FALSE(Parse(options).ok());
}

TEST(ConfigTest, KeepsFlagsFromBaseConfig) {
  SessionConfig base_config;
  base_config.compress = true;
  base_config.kernel_funcs = "do_sys_open";
  base_config.begin_async = true;
  ConfigOptions options;
  options.categories = {"gfx", "view"};
  options.atrace_apps = "com.example";
  auto config = CreateConfigFromOptions(options, base_config);
  ASSERT_TRUE(config.ok());
  EXPECT_TRUE(config->compress);
  EXPECT_TRUE(config->begin_async);
  EXPECT_EQ(config->kernel_funcs, "do_sys_open");
}

}  // namespace
}  // namespace atrace
