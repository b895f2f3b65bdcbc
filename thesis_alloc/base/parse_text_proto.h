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


// Parsing of text-format protos held in strings, mostly for tests:
//
//   const AllocationInput input = ParseTextProtoOrDie(R"pb(
//     topics { id: "A" coach_id: "C" capacity: 2 }
//   )pb");

#ifndef THESIS_ALLOC_BASE_PARSE_TEXT_PROTO_H_
#define THESIS_ALLOC_BASE_PARSE_TEXT_PROTO_H_

#include <string>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "thesis_alloc/base/status_macros.h"

namespace thesis_alloc {

template <typename T>
absl::Status ParseTextProtoInto(absl::string_view input, T* proto) {
  if (google::protobuf::TextFormat::ParseFromString(std::string(input),
                                                    proto)) {
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError("Could not parse the text proto");
}

template <typename T>
absl::StatusOr<T> ParseTextProto(absl::string_view input) {
  T msg;
  RETURN_IF_ERROR(ParseTextProtoInto(input, &msg));
  return msg;
}

namespace text_proto_internal {

class ParseProtoHelper {
 public:
  explicit ParseProtoHelper(absl::string_view input) : input_(input) {}
  template <class T>
  operator T() {  // NOLINT(runtime/explicit)
    T result;
    const bool ok =
        google::protobuf::TextFormat::ParseFromString(input_, &result);
    CHECK(ok) << "Failed to parse text proto: " << input_;
    return result;
  }

 private:
  const std::string input_;
};

}  // namespace text_proto_internal

inline text_proto_internal::ParseProtoHelper ParseTextProtoOrDie(
    absl::string_view input) {
  return text_proto_internal::ParseProtoHelper(input);
}

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_BASE_PARSE_TEXT_PROTO_H_
