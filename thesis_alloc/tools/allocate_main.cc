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


// Command-line driver of the allocation engine.
//
//   allocate --students=students.csv --capacities=capacities.csv \
//     --overrides=overrides.csv --algorithm=hybrid --time_limit_sec=60 \
//     --out=allocation.csv --summary=summary.txt

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/log_severity.h"
#include "absl/flags/flag.h"
#include "absl/log/globals.h"
#include "absl/log/log.h"
#include "absl/log/log_sink_registry.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/allocator.h"
#include "thesis_alloc/allocation/parameters_validation.h"
#include "thesis_alloc/base/file.h"
#include "thesis_alloc/base/init.h"
#include "thesis_alloc/base/log_file_sink.h"
#include "thesis_alloc/base/status_macros.h"
#include "thesis_alloc/io/data_repository.h"
#include "thesis_alloc/io/input_validator.h"
#include "thesis_alloc/io/report_writer.h"

ABSL_FLAG(std::string, students, "", "CSV file with one row per student.");
ABSL_FLAG(std::string, capacities, "",
          "CSV file with one row per topic, with the coach and department "
          "capacities.");
ABSL_FLAG(std::string, overrides, "",
          "Optional CSV file of (student_id, topic_id, cost) overrides.");
ABSL_FLAG(std::string, input, "",
          "AllocationInput in text format. Replaces --students, --capacities "
          "and --overrides.");
ABSL_FLAG(std::string, out, "allocation.csv",
          "Where to write the assignments as CSV. Empty to skip.");
ABSL_FLAG(std::string, summary, "summary.txt",
          "Where to write the text summary. Empty to skip.");
ABSL_FLAG(std::string, result, "",
          "If non-empty, writes the AllocationResult there in text format.");
ABSL_FLAG(std::string, params, "",
          "AllocationParameters file, in text format or JSON (.json). The "
          "flags below override its values.");
ABSL_FLAG(std::string, save_params, "",
          "If non-empty, writes the parameters resolved from --params and the "
          "flags there, with all their default values, and exits.");
ABSL_FLAG(bool, validate_only, false,
          "Only loads and validates the input.");
ABSL_FLAG(bool, no_validate, false,
          "Skips the validation of the input. Inconsistent ids still fail.");
ABSL_FLAG(std::string, log_file, "",
          "If non-empty, every log record is also appended to this file.");
ABSL_FLAG(std::string, log_level, "info",
          "Minimum severity of the logged records: info, warning or error.");

ABSL_FLAG(std::optional<bool>, allow_unranked, std::nullopt,
          "Whether a student can receive a topic they did not list.");
ABSL_FLAG(std::optional<int64_t>, tier2_cost, std::nullopt,
          "Cost of a tier 2 topic.");
ABSL_FLAG(std::optional<int64_t>, tier3_cost, std::nullopt,
          "Cost of a tier 3 topic.");
ABSL_FLAG(std::optional<int64_t>, unranked_cost, std::nullopt,
          "Cost of a topic the student did not list.");
ABSL_FLAG(std::optional<bool>, top2_bias, std::nullopt,
          "Whether the first two ranked choices are strongly favored.");
ABSL_FLAG(std::optional<bool>, enable_topic_overflow, std::nullopt,
          "Whether topics can exceed their capacity at a penalty.");
ABSL_FLAG(std::optional<bool>, enable_coach_overflow, std::nullopt,
          "Whether coaches can exceed their capacity at a penalty.");
ABSL_FLAG(std::string, dept_min_mode, "",
          "Department minimums: 'soft' (penalized) or 'hard' (constraints).");
ABSL_FLAG(std::optional<int64_t>, dept_shortfall_penalty, std::nullopt,
          "Penalty per student missing from a department minimum.");
ABSL_FLAG(std::optional<int64_t>, topic_overflow_penalty, std::nullopt,
          "Penalty per student above the capacity of a topic.");
ABSL_FLAG(std::optional<int64_t>, coach_overflow_penalty, std::nullopt,
          "Penalty per student above the capacity of a coach.");
ABSL_FLAG(std::string, algorithm, "", "Solver: 'ilp', 'flow' or 'hybrid'.");
ABSL_FLAG(std::optional<double>, time_limit_sec, std::nullopt,
          "Time limit of the integer program, in seconds.");
ABSL_FLAG(std::optional<int32_t>, random_seed, std::nullopt,
          "Seed of the integer program search.");
ABSL_FLAG(std::optional<double>, epsilon_suboptimal, std::nullopt,
          "If set, re-solves the integer program with the objective bounded "
          "by opt + epsilon * |opt|.");
ABSL_FLAG(std::optional<bool>, log_search_progress, std::nullopt,
          "Logs the progress of the integer program search.");

static const char kUsage[] =
    "Assigns students to thesis topics.\n"
    "Either --students and --capacities (CSV) or --input (text proto) must be "
    "given.";

namespace thesis_alloc {
namespace {

template <typename T, typename Setter>
void SetIfPresent(const absl::Flag<std::optional<T>>& flag, Setter setter) {
  const std::optional<T> value = absl::GetFlag(flag);
  if (value.has_value()) setter(*value);
}

absl::StatusOr<AllocationParameters> LoadParameters() {
  AllocationParameters params;
  if (!absl::GetFlag(FLAGS_params).empty()) {
    ASSIGN_OR_RETURN(params,
                     ReadAllocationParameters(absl::GetFlag(FLAGS_params)));
  }

  PreferenceParameters* const preference = params.mutable_preference();
  SetIfPresent(FLAGS_allow_unranked,
               [&](bool v) { preference->set_allow_unranked(v); });
  SetIfPresent(FLAGS_tier2_cost,
               [&](int64_t v) { preference->set_tier2_cost(v); });
  SetIfPresent(FLAGS_tier3_cost,
               [&](int64_t v) { preference->set_tier3_cost(v); });
  SetIfPresent(FLAGS_unranked_cost,
               [&](int64_t v) { preference->set_unranked_cost(v); });
  SetIfPresent(FLAGS_top2_bias, [&](bool v) { preference->set_top2_bias(v); });

  CapacityParameters* const capacity = params.mutable_capacity();
  SetIfPresent(FLAGS_enable_topic_overflow,
               [&](bool v) { capacity->set_enable_topic_overflow(v); });
  SetIfPresent(FLAGS_enable_coach_overflow,
               [&](bool v) { capacity->set_enable_coach_overflow(v); });
  if (!absl::GetFlag(FLAGS_dept_min_mode).empty()) {
    ASSIGN_OR_RETURN(
        const CapacityParameters::DepartmentMinimumMode mode,
        ParseDepartmentMinimumMode(absl::GetFlag(FLAGS_dept_min_mode)));
    capacity->set_dept_min_mode(mode);
  }
  SetIfPresent(FLAGS_dept_shortfall_penalty,
               [&](int64_t v) { capacity->set_dept_shortfall_penalty(v); });
  SetIfPresent(FLAGS_topic_overflow_penalty,
               [&](int64_t v) { capacity->set_topic_overflow_penalty(v); });
  SetIfPresent(FLAGS_coach_overflow_penalty,
               [&](int64_t v) { capacity->set_coach_overflow_penalty(v); });

  SolverParameters* const solver = params.mutable_solver();
  if (!absl::GetFlag(FLAGS_algorithm).empty()) {
    ASSIGN_OR_RETURN(const SolverParameters::Algorithm algorithm,
                     ParseAlgorithm(absl::GetFlag(FLAGS_algorithm)));
    solver->set_algorithm(algorithm);
  }
  SetIfPresent(FLAGS_time_limit_sec,
               [&](double v) { solver->set_time_limit_sec(v); });
  SetIfPresent(FLAGS_random_seed,
               [&](int32_t v) { solver->set_random_seed(v); });
  SetIfPresent(FLAGS_epsilon_suboptimal,
               [&](double v) { solver->set_epsilon_suboptimal(v); });
  SetIfPresent(FLAGS_log_search_progress,
               [&](bool v) { solver->set_log_search_progress(v); });

  RETURN_IF_ERROR(ValidateAllocationParameters(params));
  return params;
}

absl::StatusOr<AllocationInput> LoadInput() {
  if (!absl::GetFlag(FLAGS_input).empty()) {
    return ReadAllocationInput(absl::GetFlag(FLAGS_input));
  }
  CsvInputFiles files;
  files.students = absl::GetFlag(FLAGS_students);
  files.capacities = absl::GetFlag(FLAGS_capacities);
  files.overrides = absl::GetFlag(FLAGS_overrides);
  if (files.students.empty() || files.capacities.empty()) {
    return absl::InvalidArgumentError(
        "either --input or both --students and --capacities are required");
  }
  return LoadAllocationInputFromCsv(files);
}

absl::Status ValidateInput(const AllocationInput& input) {
  std::vector<ValidationIssue> issues;
  const absl::Status status = ValidateAllocationInput(input, &issues);
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationIssue::kError) {
      LOG(ERROR) << issue.ToString();
    } else {
      LOG(WARNING) << issue.ToString();
    }
  }
  if (status.ok()) {
    LOG(INFO) << "Input is valid, " << issues.size() << " warning(s).";
  }
  return status;
}

absl::Status WriteOutputs(const AllocationInput& input,
                          const AllocationResult& result) {
  const std::string out = absl::GetFlag(FLAGS_out);
  if (!out.empty()) {
    RETURN_IF_ERROR(WriteAllocationCsv(out, result));
    LOG(INFO) << "Wrote " << result.assignments_size() << " assignments to "
              << out;
  }
  const std::string summary = absl::GetFlag(FLAGS_summary);
  if (!summary.empty()) {
    RETURN_IF_ERROR(WriteAllocationSummary(summary, input, result));
    LOG(INFO) << "Wrote the summary to " << summary;
  }
  const std::string result_path = absl::GetFlag(FLAGS_result);
  if (!result_path.empty()) {
    RETURN_IF_ERROR(file::SetTextProto(result_path, result));
    LOG(INFO) << "Wrote the result to " << result_path;
  }
  return absl::OkStatus();
}

absl::Status Run() {
  ASSIGN_OR_RETURN(AllocationParameters params, LoadParameters());
  if (!absl::GetFlag(FLAGS_save_params).empty()) {
    FillDefaultValues(&params);
    RETURN_IF_ERROR(
        file::SetTextProto(absl::GetFlag(FLAGS_save_params), params));
    LOG(INFO) << "Wrote the parameters to "
              << absl::GetFlag(FLAGS_save_params);
    return absl::OkStatus();
  }

  ASSIGN_OR_RETURN(const AllocationInput input, LoadInput());
  if (!absl::GetFlag(FLAGS_no_validate)) {
    RETURN_IF_ERROR(ValidateInput(input));
  }
  if (absl::GetFlag(FLAGS_validate_only)) return absl::OkStatus();

  ASSIGN_OR_RETURN(const AllocationInstance instance,
                   AllocationInstance::Create(input));
  ASSIGN_OR_RETURN(std::unique_ptr<Allocator> allocator,
                   CreateAllocator(instance, params));
  RETURN_IF_ERROR(allocator->Build());
  ASSIGN_OR_RETURN(const AllocationResult result, allocator->Solve());
  return WriteOutputs(input, result);
}

absl::StatusOr<absl::LogSeverityAtLeast> ParseLogLevel(
    const std::string& name) {
  const std::string lower = absl::AsciiStrToLower(name);
  if (lower == "info") return absl::LogSeverityAtLeast::kInfo;
  if (lower == "warning") return absl::LogSeverityAtLeast::kWarning;
  if (lower == "error") return absl::LogSeverityAtLeast::kError;
  return absl::InvalidArgumentError(
      absl::StrCat("unknown --log_level: '", name, "'"));
}

// Runs the tool with the logging configured by the flags. Every error is
// logged.
absl::Status RunWithLogging() {
  const absl::StatusOr<absl::LogSeverityAtLeast> level =
      ParseLogLevel(absl::GetFlag(FLAGS_log_level));
  if (!level.ok()) {
    LOG(ERROR) << level.status();
    return level.status();
  }
  absl::SetMinLogLevel(*level);

  std::unique_ptr<FileLogSink> sink;
  if (!absl::GetFlag(FLAGS_log_file).empty()) {
    absl::StatusOr<std::unique_ptr<FileLogSink>> opened =
        FileLogSink::Open(absl::GetFlag(FLAGS_log_file));
    if (!opened.ok()) {
      LOG(ERROR) << opened.status();
      return opened.status();
    }
    sink = *std::move(opened);
    absl::AddLogSink(sink.get());
  }
  const absl::Status status = Run();
  if (!status.ok()) LOG(ERROR) << status;
  if (sink != nullptr) {
    sink->Flush();
    absl::RemoveLogSink(sink.get());
  }
  return status;
}

}  // namespace
}  // namespace thesis_alloc

int main(int argc, char** argv) {
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  const std::vector<char*> positional_args =
      thesis_alloc::InitProgram(kUsage, argc, argv);
  if (positional_args.size() > 1) {
    LOG(ERROR) << "Unexpected argument: " << positional_args[1];
    return EXIT_FAILURE;
  }
  return thesis_alloc::RunWithLogging().ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}
