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


#ifndef THESIS_ALLOC_BASE_INIT_H_
#define THESIS_ALLOC_BASE_INIT_H_

#include <vector>

#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/strings/string_view.h"

namespace thesis_alloc {

// Initializes logging and parses the command line of a tool. Returns the
// positional arguments, argv[0] included.
inline std::vector<char*> InitProgram(absl::string_view usage, int argc,
                                      char** argv) {
  absl::InitializeLog();
  if (!usage.empty()) {
    absl::SetProgramUsageMessage(usage);
  }
  return absl::ParseCommandLine(argc, argv);
}

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_BASE_INIT_H_
