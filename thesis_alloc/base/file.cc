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

#include "thesis_alloc/base/file.h"

#include <cstdio>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace file {

namespace {

// Owns a FILE* for the duration of a single read or write.
class ScopedCFile {
 public:
  ScopedCFile(absl::string_view path, const char* mode)
      : f_(std::fopen(std::string(path).c_str(), mode)) {}
  ~ScopedCFile() {
    if (f_ != nullptr) std::fclose(f_);
  }
  ScopedCFile(const ScopedCFile&) = delete;
  ScopedCFile& operator=(const ScopedCFile&) = delete;

  FILE* get() const { return f_; }

  // Closes the file and reports whether buffered data reached the disk.
  bool Close() {
    if (f_ == nullptr) return false;
    const bool ok = std::fclose(f_) == 0;
    f_ = nullptr;
    return ok;
  }

 private:
  FILE* f_;
};

class NoOpErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  ~NoOpErrorCollector() override = default;
  void AddError(int /*line*/, int /*column*/,
                const std::string& /*message*/) override {}
};

}  // namespace

absl::StatusOr<std::string> GetContents(absl::string_view path) {
  ScopedCFile file(path, "rb");
  if (file.get() == nullptr) {
    return absl::NotFoundError(absl::StrCat("Could not open '", path, "'."));
  }
  std::string contents;
  char buffer[1 << 16];
  size_t read;
  while ((read = std::fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
    contents.append(buffer, read);
  }
  if (std::ferror(file.get())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", path, "'."));
  }
  return contents;
}

absl::Status SetContents(absl::string_view path, absl::string_view contents) {
  ScopedCFile file(path, "wb");
  if (file.get() == nullptr) {
    return absl::PermissionDeniedError(
        absl::StrCat("Could not open '", path, "' for writing."));
  }
  if (std::fwrite(contents.data(), 1, contents.size(), file.get()) !=
          contents.size() ||
      !file.Close()) {
    return absl::DataLossError(absl::StrCat("Could not write to '", path, "'."));
  }
  return absl::OkStatus();
}

absl::Status GetTextProto(absl::string_view path,
                          google::protobuf::Message* proto) {
  const absl::StatusOr<std::string> contents = GetContents(path);
  if (!contents.ok()) {
    VLOG(1) << "Could not read '" << path << "'";
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read proto from '", path, "'."));
  }

  // Text format first: a valid text proto is very unlikely to also be a valid
  // binary encoding, the reverse is not true.
  NoOpErrorCollector error_collector;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&error_collector);
  if (parser.ParseFromString(*contents, proto)) return absl::OkStatus();
  if (proto->ParseFromString(*contents)) return absl::OkStatus();

  // Re-parse the text to log the diagnostics.
  google::protobuf::TextFormat::ParseFromString(*contents, proto);
  LOG(ERROR) << "Could not parse contents of " << path;
  return absl::InvalidArgumentError(
      absl::StrCat("Could not parse proto from '", path, "'."));
}

absl::Status SetTextProto(absl::string_view path,
                          const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not print proto for '", path, "'."));
  }
  return SetContents(path, proto_string);
}

}  // namespace file
