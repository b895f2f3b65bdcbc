// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef THESIS_ALLOC_BASE_LOG_FILE_SINK_H_
#define THESIS_ALLOC_BASE_LOG_FILE_SINK_H_

#include <cstdio>
#include <memory>

#include "absl/base/thread_annotations.h"
#include "absl/log/log_entry.h"
#include "absl/log/log_sink.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"

namespace thesis_alloc {

// A LogSink appending every record, with its prefix, to a file.
//
//   ASSIGN_OR_RETURN(std::unique_ptr<FileLogSink> sink,
//                    FileLogSink::Open("/tmp/allocate.log"));
//   absl::AddLogSink(sink.get());
//   ...
//   absl::RemoveLogSink(sink.get());
class FileLogSink : public absl::LogSink {
 public:
  // Opens `path` for appending.
  static absl::StatusOr<std::unique_ptr<FileLogSink>> Open(
      absl::string_view path);

  ~FileLogSink() override;

  FileLogSink(const FileLogSink&) = delete;
  FileLogSink& operator=(const FileLogSink&) = delete;

  void Send(const absl::LogEntry& entry) override;
  void Flush() override;

 private:
  explicit FileLogSink(FILE* file) : file_(file) {}

  absl::Mutex mutex_;
  FILE* const file_ ABSL_PT_GUARDED_BY(mutex_);
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_BASE_LOG_FILE_SINK_H_
