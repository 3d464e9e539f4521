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

#ifndef SRC_FTRACE_TEST_FAKE_TRACEFS_H_
#define SRC_FTRACE_TEST_FAKE_TRACEFS_H_

#include <string>
#include <vector>

#include "atrace/ext/base/temp_file.h"
#include "src/ftrace/kernel_option.h"

namespace atrace {

// A directory laid out like a tracefs mount point, populated with the control
// files a session touches. Everything under it is removed on destruction.
class FakeTracefs {
 public:
  FakeTracefs();
  ~FakeTracefs();

  // The root, with a trailing '/', suitable for Tracefs::Tracefs().
  std::string root() const { return tmp_.path() + "/"; }

  std::string Read(KernelOption option) const;
  std::string Read(const FtraceEvent& event) const;
  std::string ReadPath(const std::string& relative_path) const;

  void Write(KernelOption option, const std::string& contents);
  void WritePath(const std::string& relative_path, const std::string& contents);

  // Deletes a file, e.g. to simulate a kernel without options/print-tgid.
  void Remove(KernelOption option);

 private:
  void AddDir(const std::string& relative_path);

  base::TempDir tmp_;
  std::vector<std::string> dirs_;
};

}  // namespace atrace

#endif  // SRC_FTRACE_TEST_FAKE_TRACEFS_H_
