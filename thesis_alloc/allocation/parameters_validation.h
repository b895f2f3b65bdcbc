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


// Validation and parsing utilities for allocation_parameters.proto.

#ifndef THESIS_ALLOC_ALLOCATION_PARAMETERS_VALIDATION_H_
#define THESIS_ALLOC_ALLOCATION_PARAMETERS_VALIDATION_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"

namespace thesis_alloc {

// Returns `InvalidArgumentError` if the proto contains invalid values. Returns
// `OkStatus` otherwise.
absl::Status ValidatePreferenceParameters(const PreferenceParameters& params);

// Returns `InvalidArgumentError` if the proto contains invalid values. Returns
// `OkStatus` otherwise.
absl::Status ValidateCapacityParameters(const CapacityParameters& params);

// Returns `InvalidArgumentError` if the proto contains invalid values. Returns
// `OkStatus` otherwise.
absl::Status ValidateSolverParameters(const SolverParameters& params);

// Validates the three parts above.
absl::Status ValidateAllocationParameters(const AllocationParameters& params);

// Parses "soft" or "hard", case-insensitively.
absl::StatusOr<CapacityParameters::DepartmentMinimumMode>
ParseDepartmentMinimumMode(absl::string_view name);

// Parses "ilp", "flow" or "hybrid", case-insensitively.
absl::StatusOr<SolverParameters::Algorithm> ParseAlgorithm(
    absl::string_view name);

// Lowercase name of the algorithm, as accepted by ParseAlgorithm().
std::string AlgorithmName(SolverParameters::Algorithm algorithm);

// Sets every unset field that has a default value to that value, so that the
// text format of `params` lists all of them.
void FillDefaultValues(AllocationParameters* params);

// Reads parameters from `path`. Files ending in ".json" are parsed as JSON,
// anything else as a text-format proto.
absl::StatusOr<AllocationParameters> ReadAllocationParameters(
    absl::string_view path);

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_PARAMETERS_VALIDATION_H_
