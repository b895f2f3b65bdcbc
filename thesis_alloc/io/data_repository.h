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


// Loading of the allocation input, either from the CSV exports of the
// registration forms or from a text-format AllocationInput.
//
// students.csv, one row per student:
//   student_id, plan_thesis ("yes" to take part), pref1 .. pref5,
//   tier1, tier2, tier3 and banned as '|'-separated lists, forced_topic.
// capacities.csv, one row per topic:
//   topic_id, coach_id, department_id, maximum_students_per_topic,
//   maximum_students_per_coach, desired_minimum_by_department.
// overrides.csv (optional):
//   student_id, topic_id, cost.
//
// Headers are matched after normalization: "Maximum students per topic" and
// "maximum_students_per_topic" name the same column.

#ifndef THESIS_ALLOC_IO_DATA_REPOSITORY_H_
#define THESIS_ALLOC_IO_DATA_REPOSITORY_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "thesis_alloc/allocation/allocation.pb.h"

namespace thesis_alloc {

// A parsed CSV file. Rows may be shorter than the header.
struct CsvTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;

  // Returns the index of the column named `name` after normalization, or -1.
  int ColumnIndex(absl::string_view name) const;
};

// Parses comma-separated `contents`. Fields can be quoted with '"', a quoted
// field may contain commas, line breaks and doubled quotes. A leading UTF-8
// byte order mark is skipped, blank lines are ignored, and the header is
// normalized with NormalizeCsvHeader().
absl::StatusOr<CsvTable> ParseCsv(absl::string_view contents);

// Lower-cases `header` and replaces every run of non-alphanumeric characters
// by a single '_', without leading or trailing '_'.
std::string NormalizeCsvHeader(absl::string_view header);

// Splits a '|'-separated list, dropping the empty items.
std::vector<std::string> SplitTopicList(absl::string_view cell);

struct CsvInputFiles {
  std::string students;
  std::string capacities;
  // May be empty.
  std::string overrides;
};

// Reads the three CSV files. Topics, coaches and departments appear in the
// order of their first row in capacities.csv. A student listed twice keeps
// its last row. Returns InvalidArgumentError if a capacities row lacks one
// of its ids, or if two rows disagree on the coach or department of a topic,
// on the capacity or department of a coach, or on a department minimum.
absl::StatusOr<AllocationInput> LoadAllocationInputFromCsv(
    const CsvInputFiles& files);

// Same as above, from the contents of the files.
absl::StatusOr<AllocationInput> ParseAllocationInputCsv(
    absl::string_view students_csv, absl::string_view capacities_csv,
    absl::string_view overrides_csv);

// Reads a text-format (or binary) AllocationInput.
absl::StatusOr<AllocationInput> ReadAllocationInput(absl::string_view path);

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_IO_DATA_REPOSITORY_H_
