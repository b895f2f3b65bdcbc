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


#ifndef THESIS_ALLOC_IO_INPUT_VALIDATOR_H_
#define THESIS_ALLOC_IO_INPUT_VALIDATOR_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "thesis_alloc/allocation/allocation.pb.h"

namespace thesis_alloc {

struct ValidationIssue {
  enum Severity { kError, kWarning };

  Severity severity = kError;
  std::string message;

  // "[ERROR] message" or "[WARNING] message".
  std::string ToString() const;
};

// Checks the consistency of `input` before any model is built.
//
// Errors: forced topic that is banned or unknown, non-positive topic or coach
// capacity, negative department minimum, duplicate ids, topics or coaches
// referring to unknown coaches or departments, topic whose department differs
// from the one of its coach.
// Warnings: planning students whose ranks, tiers or bans name unknown topics.
//
// Every issue is appended to `issues` (which may be null), errors first.
// Returns InvalidArgumentError if at least one error was found.
absl::Status ValidateAllocationInput(const AllocationInput& input,
                                     std::vector<ValidationIssue>* issues);

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_IO_INPUT_VALIDATOR_H_
