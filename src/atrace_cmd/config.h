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

#ifndef SRC_ATRACE_CMD_CONFIG_H_
#define SRC_ATRACE_CMD_CONFIG_H_

#include <string>
#include <vector>

#include "atrace/ext/base/status_or.h"
#include "src/ftrace/session_config.h"

namespace atrace {

// The raw values of the command line flags that need parsing.
struct ConfigOptions {
  std::string time = "5s";
  std::string sleep = "0";
  std::string buffer_size = "1024kb";
  std::vector<std::string> categories;
  std::string atrace_apps;
};

// Fills the numeric fields of |base_config| from |options|. Times accept
// N[s,m,h] (seconds when no unit is given) and sizes N[kb,mb,gb,k,m,g] (KB
// when no unit is given).
base::StatusOr<SessionConfig> CreateConfigFromOptions(
    const ConfigOptions& options,
    const SessionConfig& base_config);

}  // namespace atrace

#endif  // SRC_ATRACE_CMD_CONFIG_H_
