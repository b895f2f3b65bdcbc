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


// Human-readable outputs of an allocation: the assignment table as CSV and a
// plain-text summary.

#ifndef THESIS_ALLOC_IO_REPORT_WRITER_H_
#define THESIS_ALLOC_IO_REPORT_WRITER_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "thesis_alloc/allocation/allocation.pb.h"

namespace thesis_alloc {

// Maximum number of ties listed by the summary.
inline constexpr int kMaxReportedTies = 10;

// One line per assignment row, after the header
//   student,assigned_topic,assigned_coach,department_id,preference_rank,
//   effective_cost,via_topic_overflow,via_coach_overflow
// Booleans are written as True / False.
std::string AllocationToCsv(const AllocationResult& result);

absl::Status WriteAllocationCsv(absl::string_view path,
                                const AllocationResult& result);

// Solver status and objective, unassignable and unassigned students, ties,
// satisfaction per preference rank, topic and coach utilization, department
// totals. `input` provides the capacities and the order of the entities.
std::string AllocationSummary(const AllocationInput& input,
                              const AllocationResult& result);

absl::Status WriteAllocationSummary(absl::string_view path,
                                    const AllocationInput& input,
                                    const AllocationResult& result);

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_IO_REPORT_WRITER_H_
