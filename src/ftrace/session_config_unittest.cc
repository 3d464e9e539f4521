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

#include "src/ftrace/session_config.h"

#include "test/gtest_and_gmock.h"

namespace atrace {
namespace {

TEST(SessionConfigTest, SynchronousRunsAllPhases) {
  SessionConfig config;
  SessionPhases phases = ComputeSessionPhases(config);
  EXPECT_TRUE(phases.begin);
  EXPECT_TRUE(phases.stop);
  EXPECT_TRUE(phases.dump);
  EXPECT_FALSE(phases.async);
  EXPECT_FALSE(phases.overwrite);

  config.overwrite = true;
  EXPECT_TRUE(ComputeSessionPhases(config).overwrite);
}

TEST(SessionConfigTest, BeginAsyncForcesOverwrite) {
  SessionConfig config;
  config.begin_async = true;
  SessionPhases phases = ComputeSessionPhases(config);
  EXPECT_TRUE(phases.begin);
  EXPECT_FALSE(phases.stop);
  EXPECT_FALSE(phases.dump);
  EXPECT_TRUE(phases.async);
  EXPECT_TRUE(phases.overwrite);
  // The config itself is left alone.
  EXPECT_FALSE(config.overwrite);
}

TEST(SessionConfigTest, StopAsync) {
  SessionConfig config;
  config.stop_async = true;
  SessionPhases phases = ComputeSessionPhases(config);
  EXPECT_FALSE(phases.begin);
  EXPECT_TRUE(phases.stop);
  EXPECT_TRUE(phases.dump);
  EXPECT_TRUE(phases.async);
  EXPECT_FALSE(phases.overwrite);
}

TEST(SessionConfigTest, DumpAsync) {
  SessionConfig config;
  config.dump_async = true;
  SessionPhases phases = ComputeSessionPhases(config);
  EXPECT_FALSE(phases.begin);
  EXPECT_FALSE(phases.stop);
  EXPECT_TRUE(phases.dump);
  EXPECT_TRUE(phases.async);
}

TEST(SessionConfigTest, StreamNeverDumps) {
  SessionConfig config;
  config.stream = true;
  SessionPhases phases = ComputeSessionPhases(config);
  EXPECT_TRUE(phases.begin);
  EXPECT_TRUE(phases.stop);
  EXPECT_FALSE(phases.dump);
  EXPECT_TRUE(phases.stream);

  config.stop_async = true;
  EXPECT_FALSE(ComputeSessionPhases(config).dump);
}

TEST(SessionConfigTest, RejectsMultipleAsyncFlags) {
  SessionConfig config;
  EXPECT_TRUE(ValidateSessionConfig(config).ok());

  config.begin_async = true;
  EXPECT_TRUE(ValidateSessionConfig(config).ok());

  config.dump_async = true;
  EXPECT_FALSE(ValidateSessionConfig(config).ok());

  config.begin_async = false;
  config.stop_async = true;
  EXPECT_FALSE(ValidateSessionConfig(config).ok());
}

TEST(SessionConfigTest, RejectsUncompressWithAsync) {
  SessionConfig config;
  config.uncompress_file = "trace.z";
  EXPECT_TRUE(ValidateSessionConfig(config).ok());
  config.stop_async = true;
  EXPECT_FALSE(ValidateSessionConfig(config).ok());
}

}  // namespace
}  // namespace atrace
