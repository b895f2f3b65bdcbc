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


#include "thesis_alloc/allocation/parameters_validation.h"

#include <cmath>
#include <cstdint>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "google/protobuf/util/json_util.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/base/file.h"
#include "thesis_alloc/base/status_macros.h"

namespace thesis_alloc {

using ::absl::InvalidArgumentError;
using ::absl::OkStatus;

namespace {

absl::Status CheckNonNegative(const int64_t value,
                              const absl::string_view name) {
  if (value < 0) {
    return InvalidArgumentError(absl::StrCat(name, " must be non-negative"));
  }
  return OkStatus();
}

absl::Status CheckPositive(const int64_t value, const absl::string_view name) {
  if (value <= 0) {
    return InvalidArgumentError(absl::StrCat(name, " must be positive"));
  }
  return OkStatus();
}

}  // namespace

absl::Status ValidatePreferenceParameters(const PreferenceParameters& params) {
  RETURN_IF_ERROR(CheckNonNegative(params.tier2_cost(), "tier2_cost"));
  RETURN_IF_ERROR(CheckNonNegative(params.tier3_cost(), "tier3_cost"));
  RETURN_IF_ERROR(CheckNonNegative(params.unranked_cost(), "unranked_cost"));
  return OkStatus();
}

absl::Status ValidateCapacityParameters(const CapacityParameters& params) {
  if (!CapacityParameters::DepartmentMinimumMode_IsValid(
          params.dept_min_mode())) {
    return InvalidArgumentError("invalid value for dept_min_mode");
  }
  RETURN_IF_ERROR(
      CheckPositive(params.dept_shortfall_penalty(), "dept_shortfall_penalty"));
  RETURN_IF_ERROR(
      CheckPositive(params.topic_overflow_penalty(), "topic_overflow_penalty"));
  RETURN_IF_ERROR(
      CheckPositive(params.coach_overflow_penalty(), "coach_overflow_penalty"));
  return OkStatus();
}

absl::Status ValidateSolverParameters(const SolverParameters& params) {
  if (!SolverParameters::Algorithm_IsValid(params.algorithm())) {
    return InvalidArgumentError("invalid value for algorithm");
  }
  if (params.has_time_limit_sec()) {
    if (std::isnan(params.time_limit_sec())) {
      return InvalidArgumentError("time_limit_sec is NAN");
    }
    if (params.time_limit_sec() <= 0) {
      return InvalidArgumentError("time_limit_sec must be positive");
    }
  }
  if (params.has_epsilon_suboptimal()) {
    const double epsilon = params.epsilon_suboptimal();
    if (std::isnan(epsilon)) {
      return InvalidArgumentError("epsilon_suboptimal is NAN");
    }
    if (epsilon < 0 || epsilon >= 1) {
      return InvalidArgumentError("epsilon_suboptimal must be in [0, 1)");
    }
  }
  return OkStatus();
}

absl::Status ValidateAllocationParameters(const AllocationParameters& params) {
  RETURN_IF_ERROR(ValidatePreferenceParameters(params.preference()));
  RETURN_IF_ERROR(ValidateCapacityParameters(params.capacity()));
  RETURN_IF_ERROR(ValidateSolverParameters(params.solver()));
  return OkStatus();
}

absl::StatusOr<CapacityParameters::DepartmentMinimumMode>
ParseDepartmentMinimumMode(absl::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);
  if (lower == "soft") return CapacityParameters::SOFT;
  if (lower == "hard") return CapacityParameters::HARD;
  return InvalidArgumentError(
      absl::StrCat("unknown department minimum mode: '", name,
                   "', expected 'soft' or 'hard'"));
}

absl::StatusOr<SolverParameters::Algorithm> ParseAlgorithm(
    absl::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);
  if (lower == "ilp") return SolverParameters::ILP;
  if (lower == "flow") return SolverParameters::FLOW;
  if (lower == "hybrid") return SolverParameters::HYBRID;
  return InvalidArgumentError(absl::StrCat(
      "unknown algorithm: '", name, "', expected 'ilp', 'flow' or 'hybrid'"));
}

std::string AlgorithmName(SolverParameters::Algorithm algorithm) {
  switch (algorithm) {
    case SolverParameters::ILP:
      return "ilp";
    case SolverParameters::FLOW:
      return "flow";
    case SolverParameters::HYBRID:
      return "hybrid";
  }
  return absl::StrCat("unknown algorithm ", static_cast<int>(algorithm));
}

namespace {

using ::google::protobuf::FieldDescriptor;

void FillMessageDefaults(google::protobuf::Message* message) {
  const google::protobuf::Descriptor* const descriptor =
      message->GetDescriptor();
  const google::protobuf::Reflection* const reflection =
      message->GetReflection();
  for (int i = 0; i < descriptor->field_count(); ++i) {
    const FieldDescriptor* const field = descriptor->field(i);
    if (field->is_repeated()) continue;
    if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
      FillMessageDefaults(reflection->MutableMessage(message, field));
      continue;
    }
    if (!field->has_default_value() || reflection->HasField(*message, field)) {
      continue;
    }
    switch (field->cpp_type()) {
      case FieldDescriptor::CPPTYPE_BOOL:
        reflection->SetBool(message, field, field->default_value_bool());
        break;
      case FieldDescriptor::CPPTYPE_INT32:
        reflection->SetInt32(message, field, field->default_value_int32());
        break;
      case FieldDescriptor::CPPTYPE_INT64:
        reflection->SetInt64(message, field, field->default_value_int64());
        break;
      case FieldDescriptor::CPPTYPE_DOUBLE:
        reflection->SetDouble(message, field, field->default_value_double());
        break;
      case FieldDescriptor::CPPTYPE_ENUM:
        reflection->SetEnum(message, field, field->default_value_enum());
        break;
      default:
        LOG(DFATAL) << "Unsupported default value for " << field->full_name();
    }
  }
}

}  // namespace

void FillDefaultValues(AllocationParameters* params) {
  FillMessageDefaults(params);
}

absl::StatusOr<AllocationParameters> ReadAllocationParameters(
    absl::string_view path) {
  AllocationParameters params;
  if (absl::EndsWithIgnoreCase(path, ".json")) {
    ASSIGN_OR_RETURN(const std::string contents, file::GetContents(path));
    const auto status =
        google::protobuf::util::JsonStringToMessage(contents, &params);
    if (!status.ok()) {
      return InvalidArgumentError(
          absl::StrCat("cannot parse ", path, ": ", status.ToString()));
    }
  } else {
    RETURN_IF_ERROR(file::GetTextProto(path, &params));
  }
  RETURN_IF_ERROR(ValidateAllocationParameters(params));
  return params;
}

}  // namespace thesis_alloc
