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

#include <stdint.h>
#include <stdlib.h>

#include <array>
#include <limits>
#include <string_view>
#include <utility>

#include "atrace/base/logging.h"

namespace atrace {
namespace {

using UnitMultiplier = std::pair<std::string_view, uint64_t>;

struct ValueUnit {
  uint64_t value;
  std::string_view unit;
};

[[nodiscard]] bool SplitValueAndUnit(std::string_view arg, ValueUnit& out) {
  if (arg.empty() || arg.front() < '0' || arg.front() > '9')
    return false;

  // |arg| comes from a std::string, so strtoull stops at the terminator.
  char* end;
  out.value = strtoull(arg.data(), &end, 10);
  const size_t consumed = static_cast<size_t>(end - arg.data());
  out.unit = arg.substr(consumed);
  return true;
}

template <size_t N>
[[nodiscard]] bool ConvertValue(std::string_view arg,
                                const std::array<UnitMultiplier, N>& units,
                                uint32_t& out) {
  ValueUnit value_unit{};
  if (!SplitValueAndUnit(arg, value_unit))
    return false;

  for (const auto& [unit, multiplier] : units) {
    if (value_unit.unit != unit)
      continue;
    if (value_unit.value > std::numeric_limits<uint32_t>::max() / multiplier)
      return false;
    out = static_cast<uint32_t>(value_unit.value * multiplier);
    return true;
  }
  return false;
}

[[nodiscard]] bool ConvertTimeToSeconds(std::string_view arg, uint32_t& out) {
  constexpr std::array<UnitMultiplier, 4> kTimeUnits = {{
      {"", 1},
      {"s", 1},
      {"m", 60},
      {"h", 3'600},
  }};
  return ConvertValue(arg, kTimeUnits, out);
}

[[nodiscard]] bool ConvertSizeToKb(std::string_view arg, uint32_t& out) {
  constexpr std::array<UnitMultiplier, 7> kSizeUnits = {{
      {"", 1},
      {"kb", 1},
      {"mb", 1'024},
      {"gb", 1'048'576},
      {"k", 1},
      {"m", 1'024},
      {"g", 1'048'576},
  }};
  return ConvertValue(arg, kSizeUnits, out);
}

}  // namespace

base::StatusOr<SessionConfig> CreateConfigFromOptions(
    const ConfigOptions& options,
    const SessionConfig& base_config) {
  SessionConfig config = base_config;

  if (!ConvertTimeToSeconds(options.time, config.duration_s))
    return base::ErrStatus("--time argument is invalid: %s",
                           options.time.c_str());

  if (!ConvertTimeToSeconds(options.sleep, config.sleep_s))
    return base::ErrStatus("--sleep argument is invalid: %s",
                           options.sleep.c_str());

  if (!ConvertSizeToKb(options.buffer_size, config.buffer_size_kb))
    return base::ErrStatus("--buffer argument is invalid: %s",
                           options.buffer_size.c_str());
  if (config.buffer_size_kb == 0)
    return base::ErrStatus("--buffer must be at least 1kb");

  // Userspace categories and app cmdlines need the Android atrace HAL.
  if (!options.categories.empty()) {
    ATRACE_ELOG("Categories are not supported, ignoring %zu of them",
                options.categories.size());
  }
  if (!options.atrace_apps.empty())
    ATRACE_ELOG("-A is not supported, ignoring '%s'",
                options.atrace_apps.c_str());

  return config;
}

}  // namespace atrace
