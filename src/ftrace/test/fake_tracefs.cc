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

#include "src/ftrace/test/fake_tracefs.h"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "atrace/base/logging.h"
#include "atrace/ext/base/file_utils.h"
#include "atrace/ext/base/scoped_file.h"

namespace atrace {

FakeTracefs::FakeTracefs() : tmp_(base::TempDir::Create()) {
  AddDir("options");
  AddDir("events");
  AddDir("events/sched");
  AddDir("events/workqueue");
  AddDir("events/power");
  for (const FtraceEvent& event : kBuiltinEvents) {
    AddDir(std::string("events/") + event.group + "/" + event.name);
    WritePath(GetEventEnablePath(event), "0\n");
  }
  WritePath(GetEventGroupEnablePath(kWorkqueueEventGroup), "0\n");

  Write(KernelOption::kTracingOn, "0\n");
  Write(KernelOption::kBufferSizeKb, "7 (expanded: 1408)\n");
  Write(KernelOption::kTrace, "");
  Write(KernelOption::kTraceClock, "[local] global counter uptime perf\n");
  Write(KernelOption::kTraceMarker, "");
  Write(KernelOption::kCurrentTracer, "nop\n");
  Write(KernelOption::kSetFtraceFilter, "");
  Write(KernelOption::kOverwrite, "1\n");
  Write(KernelOption::kRecordCmd, "1\n");
  Write(KernelOption::kPrintTgid, "0\n");
  Write(KernelOption::kFuncgraphAbstime, "0\n");
  Write(KernelOption::kFuncgraphCpu, "1\n");
  Write(KernelOption::kFuncgraphProc, "0\n");
  Write(KernelOption::kFuncgraphFlat, "0\n");
}

FakeTracefs::~FakeTracefs() {
  // Leaves first, so that every directory is empty by the time it is removed.
  // The root itself is removed by |tmp_|.
  std::vector<std::string> dirs(dirs_.rbegin(), dirs_.rend());
  dirs.push_back("");
  for (const std::string& rel : dirs) {
    std::string dir_path = root() + rel;
    DIR* dir = opendir(dir_path.c_str());
    ATRACE_CHECK(dir);
    while (struct dirent* entry = readdir(dir)) {
      std::string file = dir_path + "/" + entry->d_name;
      struct stat st {};
      ATRACE_CHECK(lstat(file.c_str(), &st) == 0);
      if (S_ISDIR(st.st_mode))
        continue;
      ATRACE_CHECK(unlink(file.c_str()) == 0);
    }
    closedir(dir);
    if (!rel.empty())
      ATRACE_CHECK(base::Rmdir(dir_path));
  }
}

void FakeTracefs::AddDir(const std::string& relative_path) {
  ATRACE_CHECK(base::Mkdir(root() + relative_path));
  dirs_.push_back(relative_path);
}

std::string FakeTracefs::Read(KernelOption option) const {
  return ReadPath(GetKernelOptionPath(option));
}

std::string FakeTracefs::Read(const FtraceEvent& event) const {
  return ReadPath(GetEventEnablePath(event));
}

std::string FakeTracefs::ReadPath(const std::string& relative_path) const {
  std::string contents;
  ATRACE_CHECK(base::ReadFile(root() + relative_path, &contents));
  return contents;
}

void FakeTracefs::Write(KernelOption option, const std::string& contents) {
  WritePath(GetKernelOptionPath(option), contents);
}

void FakeTracefs::WritePath(const std::string& relative_path,
                            const std::string& contents) {
  base::ScopedFile fd = base::OpenFile(root() + relative_path,
                                       O_WRONLY | O_CREAT | O_TRUNC, 0644);
  ATRACE_CHECK(fd);
  ATRACE_CHECK(base::WriteAll(*fd, contents.data(), contents.size()) ==
               static_cast<ssize_t>(contents.size()));
}

void FakeTracefs::Remove(KernelOption option) {
  std::string path = root() + GetKernelOptionPath(option);
  ATRACE_CHECK(unlink(path.c_str()) == 0);
}

}  // namespace atrace
