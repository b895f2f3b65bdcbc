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

// Whole-file helpers: read or write a file in one call, and load or store a
// protocol buffer in text format.

#ifndef THESIS_ALLOC_BASE_FILE_H_
#define THESIS_ALLOC_BASE_FILE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"

namespace file {

// Returns the full contents of `path`, or an error if the file cannot be
// opened or read.
absl::StatusOr<std::string> GetContents(absl::string_view path);

// Replaces the contents of `path` with `contents`, creating it if needed.
absl::Status SetContents(absl::string_view path, absl::string_view contents);

// Parses `path` as a text-format proto, falling back to the binary encoding.
absl::Status GetTextProto(absl::string_view path,
                          google::protobuf::Message* proto);

template <typename T>
absl::StatusOr<T> GetTextProto(absl::string_view path) {
  T proto;
  absl::Status status = GetTextProto(path, &proto);
  if (!status.ok()) return status;
  return proto;
}

// Writes `proto` to `path` in text format.
absl::Status SetTextProto(absl::string_view path,
                          const google::protobuf::Message& proto);

}  // namespace file

#endif  // THESIS_ALLOC_BASE_FILE_H_
