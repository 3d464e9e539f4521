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

#include "atrace/ext/base/string_utils.h"

#include <algorithm>

#include "atrace/base/logging.h"

namespace atrace {
namespace base {
namespace {

bool EndsWith(const std::string& str, const std::string& suffix) {
  if (suffix.size() > str.size())
    return false;
  return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::vector<std::string> SplitString(const std::string& text,
                                     const std::string& delimiter) {
  ATRACE_CHECK(!delimiter.empty());

  std::vector<std::string> output;
  size_t start = 0;
  size_t next;
  for (;;) {
    next = std::min(text.find(delimiter, start), text.size());
    if (next > start)
      output.emplace_back(&text[start], next - start);
    start = next + delimiter.size();
    if (start >= text.size())
      break;
  }
  return output;
}

std::string StripSuffix(const std::string& str, const std::string& suffix) {
  if (EndsWith(str, suffix))
    return str.substr(0, str.size() - suffix.size());
  return str;
}

std::string TrimWhitespace(const std::string& str) {
  static const char kWhitespace[] = " \t\n\r";
  size_t begin = str.find_first_not_of(kWhitespace);
  if (begin == std::string::npos)
    return std::string();
  size_t end = str.find_last_not_of(kWhitespace);
  return str.substr(begin, end - begin + 1);
}

}  // namespace base
}  // namespace atrace
