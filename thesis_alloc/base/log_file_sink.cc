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


#include "thesis_alloc/base/log_file_sink.h"

#include <cstdio>
#include <memory>
#include <string>

#include "absl/log/log_entry.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"

namespace thesis_alloc {

absl::StatusOr<std::unique_ptr<FileLogSink>> FileLogSink::Open(
    absl::string_view path) {
  FILE* const file = std::fopen(std::string(path).c_str(), "a");
  if (file == nullptr) {
    return absl::PermissionDeniedError(
        absl::StrCat("Could not open log file '", path, "'."));
  }
  return std::unique_ptr<FileLogSink>(new FileLogSink(file));
}

FileLogSink::~FileLogSink() { std::fclose(file_); }

void FileLogSink::Send(const absl::LogEntry& entry) {
  const absl::string_view text = entry.text_message_with_prefix_and_newline();
  absl::MutexLock lock(&mutex_);
  std::fwrite(text.data(), 1, text.size(), file_);
}

void FileLogSink::Flush() {
  absl::MutexLock lock(&mutex_);
  std::fflush(file_);
}

}  // namespace thesis_alloc
