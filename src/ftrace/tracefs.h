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

#ifndef SRC_FTRACE_TRACEFS_H_
#define SRC_FTRACE_TRACEFS_H_

#include <memory>
#include <optional>
#include <string>

#include "atrace/ext/base/scoped_file.h"
#include "src/ftrace/kernel_option.h"

namespace atrace {

// Returns the token enclosed by the first '[' and the following ']' in a
// tracefs mode file, e.g. "local [global] boot\n" -> "global".
std::optional<std::string> ParseBracketedMode(const std::string& text);

// Reads and writes the ftrace control files under a tracefs mount point.
// Every call builds its absolute path from |root_|; nothing is cached.
class Tracefs {
 public:
  static const char* const kTracingPaths[];

  // Tries creating a |Tracefs| at the standard tracefs mount points.
  // Returns nullptr if none of them has a trace file.
  static std::unique_ptr<Tracefs> CreateGuessingMountPoint();

  // Creates a |Tracefs| at |root| if it looks like a tracefs mount point.
  // |root| must end with a '/'.
  static std::unique_ptr<Tracefs> Create(const std::string& root);

  explicit Tracefs(const std::string& root);
  virtual ~Tracefs();

  const std::string& root() const { return root_; }

  std::string GetOptionPath(KernelOption option) const;
  std::string GetEventEnablePath(const FtraceEvent& event) const;
  std::string GetEventGroupEnablePath(const char* group) const;

  // Writes "1" or "0".
  bool WriteOption(KernelOption option, bool enabled);
  bool WriteOption(KernelOption option, const std::string& value);
  bool WriteOption(KernelOption option, const char* value);

  // Appends |value| without truncating the file.
  bool AppendOption(KernelOption option, const std::string& value);

  // Returns the bracketed (currently selected) mode of |option|, or nullopt
  // when the file is unreadable or has no selection.
  std::optional<std::string> ReadBracketedMode(KernelOption option) const;

  bool OptionExists(KernelOption option) const;
  bool OptionWritable(KernelOption option) const;
  bool EventExists(const FtraceEvent& event) const;
  bool EventWritable(const FtraceEvent& event) const;
  bool EventGroupWritable(const char* group) const;

  // Opens |option| with O_TRUNC and closes it straight away.
  bool TruncateOption(KernelOption option);

  bool SetTracingOn(bool enabled);
  bool SetEventEnabled(const FtraceEvent& event, bool enabled);
  bool SetEventGroupEnabled(const char* group, bool enabled);

  // Clears the trace buffers for all CPUs.
  bool ClearTrace();

  // Writes the string |str| as an event into the trace buffer.
  bool WriteTraceMarker(const std::string& str);

  base::ScopedFile OpenTraceForRead() const;

  // Virtual for testing.
  virtual bool WriteToFile(const std::string& path, const std::string& str);
  virtual bool AppendToFile(const std::string& path, const std::string& str);
  virtual bool ClearFile(const std::string& path);
  virtual std::string ReadFileIntoString(const std::string& path) const;
  virtual bool FileExists(const std::string& path) const;
  virtual bool IsFileWritable(const std::string& path) const;

 protected:
  static bool CheckRootPath(const std::string& root);

 private:
  bool WriteToFileWithFlags(const std::string& path,
                            const std::string& str,
                            int flags);

  const std::string root_;
};

}  // namespace atrace

#endif  // SRC_FTRACE_TRACEFS_H_
