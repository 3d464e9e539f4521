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

#ifndef INCLUDE_ATRACE_EXT_BASE_STRING_UTILS_H_
#define INCLUDE_ATRACE_EXT_BASE_STRING_UTILS_H_

#include <string>
#include <vector>

namespace atrace {
namespace base {

// Splits |text| on |delimiter|, dropping empty tokens.
std::vector<std::string> SplitString(const std::string& text,
                                     const std::string& delimiter);
std::string StripSuffix(const std::string& str, const std::string& suffix);
std::string TrimWhitespace(const std::string& str);

}  // namespace base
}  // namespace atrace

#endif  // INCLUDE_ATRACE_EXT_BASE_STRING_UTILS_H_
