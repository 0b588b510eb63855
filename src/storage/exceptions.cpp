// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.
#include "storage/exceptions.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace kestrel::storage {

namespace {

std::string DescribeValues(const std::vector<PropertyValue> &values) {
  std::string result;
  for (const auto &value : values) {
    if (!result.empty()) result += ", ";
    result += fmt::format("{}", fmt::streamed(value));
  }
  return result;
}

std::string DescribeConflicts(const ConstraintDescriptor &constraint,
                              const std::vector<IndexEntryConflict> &conflicts) {
  std::string message = fmt::format("Existing data does not satisfy {}:", constraint.ToString());
  for (const auto &conflict : conflicts) {
    message += fmt::format(" Both Node({}) and Node({}) have the values ({}).", conflict.existing_node.AsUint(),
                           conflict.added_node.AsUint(), DescribeValues(conflict.values));
  }
  return message;
}

}  // namespace

std::string_view StatusToString(const Status status) {
  switch (status) {
    case Status::CLIENT_ERROR:
      return "ClientError";
    case Status::TRANSIENT_ERROR:
      return "TransientError";
    case Status::DATABASE_ERROR:
      return "DatabaseError";
  }
  return "Unknown";
}

std::string_view OperationContextToString(const OperationContext context) {
  switch (context) {
    case OperationContext::INDEX_CREATION:
      return "Index creation";
    case OperationContext::CONSTRAINT_CREATION:
      return "Constraint creation";
    case OperationContext::INDEX_DROP:
      return "Index drop";
    case OperationContext::CONSTRAINT_DROP:
      return "Constraint drop";
  }
  return "Schema operation";
}

std::string DescribeCause(const std::exception_ptr &cause) {
  if (!cause) return "unknown cause";
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception &e) {
    return e.what();
  }
}

IndexEntryConflictException::IndexEntryConflictException(IndexEntryConflict conflict)
    : KernelException(Status::CLIENT_ERROR,
                      fmt::format("Both Node({}) and Node({}) have the values ({}).", conflict.existing_node.AsUint(),
                                  conflict.added_node.AsUint(), DescribeValues(conflict.values))),
      conflict_(std::move(conflict)) {}

UniquePropertyValueValidationException::UniquePropertyValueValidationException(
    const ConstraintDescriptor &constraint, ConstraintValidationPhase phase, std::vector<IndexEntryConflict> conflicts)
    : ConstraintValidationException(constraint, phase, DescribeConflicts(constraint, conflicts)),
      conflicts_(std::move(conflicts)) {}

UniquePropertyValueValidationException::UniquePropertyValueValidationException(
    const ConstraintDescriptor &constraint, ConstraintValidationPhase phase, std::exception_ptr cause)
    : ConstraintValidationException(
          constraint, phase, fmt::format("Unable to verify {}: {}", constraint.ToString(), DescribeCause(cause)),
          cause) {}

}  // namespace kestrel::storage
