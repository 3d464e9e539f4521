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

#include "src/ftrace/tracefs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "atrace/base/logging.h"
#include "atrace/ext/base/file_utils.h"
#include "atrace/ext/base/utils.h"

namespace atrace {

// Reading /trace produces human readable trace output.
// Truncating /trace clears all trace buffers for all CPUS.

// Writing to /trace_marker file injects an event into the trace buffer.

// Reading /tracing_on returns 1/0 if tracing is enabled/disabled.
// Writing 1/0 to this file enables/disables tracing.
// Disabling tracing with this file prevents further writes but
// does not clear the buffer.

// static
const char* const Tracefs::kTracingPaths[] = {
    "/sys/kernel/debug/tracing/",
    "/sys/kernel/tracing/",
    nullptr,
};

std::optional<std::string> ParseBracketedMode(const std::string& text) {
  size_t start = text.find('[');
  if (start == std::string::npos)
    return std::nullopt;
  size_t end = text.find(']', start + 1);
  if (end == std::string::npos)
    return std::nullopt;
  return text.substr(start + 1, end - start - 1);
}

// static
std::unique_ptr<Tracefs> Tracefs::CreateGuessingMountPoint() {
  std::unique_ptr<Tracefs> tracefs;
  size_t index = 0;
  while (!tracefs && kTracingPaths[index]) {
    tracefs = Create(kTracingPaths[index++]);
  }
  return tracefs;
}

// static
std::unique_ptr<Tracefs> Tracefs::Create(const std::string& root) {
  if (!CheckRootPath(root))
    return nullptr;
  return std::unique_ptr<Tracefs>(new Tracefs(root));
}

// static
bool Tracefs::CheckRootPath(const std::string& root) {
  return base::FileExists(root + GetKernelOptionPath(KernelOption::kTrace));
}

Tracefs::Tracefs(const std::string& root) : root_(root) {
  ATRACE_DCHECK(!root_.empty() && root_.back() == '/');
}

Tracefs::~Tracefs() = default;

std::string Tracefs::GetOptionPath(KernelOption option) const {
  return root_ + GetKernelOptionPath(option);
}

std::string Tracefs::GetEventEnablePath(const FtraceEvent& event) const {
  return root_ + ::atrace::GetEventEnablePath(event);
}

std::string Tracefs::GetEventGroupEnablePath(const char* group) const {
  return root_ + ::atrace::GetEventGroupEnablePath(group);
}

bool Tracefs::WriteOption(KernelOption option, bool enabled) {
  return WriteToFile(GetOptionPath(option), enabled ? "1" : "0");
}

bool Tracefs::WriteOption(KernelOption option, const std::string& value) {
  return WriteToFile(GetOptionPath(option), value);
}

bool Tracefs::WriteOption(KernelOption option, const char* value) {
  return WriteToFile(GetOptionPath(option), value);
}

bool Tracefs::AppendOption(KernelOption option, const std::string& value) {
  return AppendToFile(GetOptionPath(option), value);
}

std::optional<std::string> Tracefs::ReadBracketedMode(
    KernelOption option) const {
  return ParseBracketedMode(ReadFileIntoString(GetOptionPath(option)));
}

bool Tracefs::OptionExists(KernelOption option) const {
  return FileExists(GetOptionPath(option));
}

bool Tracefs::OptionWritable(KernelOption option) const {
  return IsFileWritable(GetOptionPath(option));
}

bool Tracefs::EventExists(const FtraceEvent& event) const {
  return FileExists(GetEventEnablePath(event));
}

bool Tracefs::EventWritable(const FtraceEvent& event) const {
  return IsFileWritable(GetEventEnablePath(event));
}

bool Tracefs::EventGroupWritable(const char* group) const {
  return IsFileWritable(GetEventGroupEnablePath(group));
}

bool Tracefs::TruncateOption(KernelOption option) {
  return ClearFile(GetOptionPath(option));
}

bool Tracefs::SetTracingOn(bool enabled) {
  return WriteOption(KernelOption::kTracingOn, enabled);
}

bool Tracefs::SetEventEnabled(const FtraceEvent& event, bool enabled) {
  return WriteToFile(GetEventEnablePath(event), enabled ? "1" : "0");
}

bool Tracefs::SetEventGroupEnabled(const char* group, bool enabled) {
  return WriteToFile(GetEventGroupEnablePath(group), enabled ? "1" : "0");
}

bool Tracefs::ClearTrace() {
  return TruncateOption(KernelOption::kTrace);
}

bool Tracefs::WriteTraceMarker(const std::string& str) {
  return AppendOption(KernelOption::kTraceMarker, str);
}

base::ScopedFile Tracefs::OpenTraceForRead() const {
  std::string path = GetOptionPath(KernelOption::kTrace);
  base::ScopedFile fd = base::OpenFile(path, O_RDONLY);
  if (!fd)
    ATRACE_PLOG("Failed to open %s", path.c_str());
  return fd;
}

bool Tracefs::WriteToFile(const std::string& path, const std::string& str) {
  return WriteToFileWithFlags(path, str, O_WRONLY | O_CREAT | O_TRUNC);
}

bool Tracefs::AppendToFile(const std::string& path, const std::string& str) {
  return WriteToFileWithFlags(path, str, O_WRONLY | O_CREAT | O_APPEND);
}

bool Tracefs::WriteToFileWithFlags(const std::string& path,
                                   const std::string& str,
                                   int flags) {
  base::ScopedFile fd = base::OpenFile(path, flags, 0644);
  if (!fd) {
    ATRACE_PLOG("Failed to open %s", path.c_str());
    return false;
  }
  ssize_t written = ATRACE_EINTR(write(fd.get(), str.c_str(), str.length()));
  ssize_t length = static_cast<ssize_t>(str.length());
  // No retry on partial writes: the kernel either takes the value or not.
  if (written != length) {
    ATRACE_PLOG("Failed to write '%s' to %s", str.c_str(), path.c_str());
    return false;
  }
  return true;
}

bool Tracefs::ClearFile(const std::string& path) {
  base::ScopedFile fd = base::OpenFile(path, O_WRONLY | O_TRUNC);
  if (!fd) {
    ATRACE_PLOG("Failed to truncate %s", path.c_str());
    return false;
  }
  return true;
}

std::string Tracefs::ReadFileIntoString(const std::string& path) const {
  // You can't seek or stat the procfs files on Android.
  // The vast majority of control files are under 4k.
  std::string str;
  str.reserve(4096);
  if (!base::ReadFile(path, &str)) {
    ATRACE_DLOG("Could not read '%s'", path.c_str());
    return "";
  }
  return str;
}

bool Tracefs::FileExists(const std::string& path) const {
  return base::FileExists(path);
}

bool Tracefs::IsFileWritable(const std::string& path) const {
  return base::FileIsWritable(path);
}

}  // namespace atrace
