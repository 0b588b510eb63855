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
#pragma once

/// @file
/// Defines a gflags flag together with its validator in one statement:
///
/// @code
/// DEFINE_VALIDATED_uint64(storage_index_population_threads, 2, "Threads populating new indexes.",
///                         FLAG_IN_RANGE(1, 64));
/// @endcode
///
/// Inside the validation body the new value is bound to `value` and the flag
/// name to `flagname`. The body returns true to accept the value.

#include <cstdint>
#include <iostream>
#include <string>

#include "gflags/gflags.h"

#define DEFINE_VALIDATED_FLAG(flag_type, flag_name, default_value, description, cpp_type, validation_body) \
  DEFINE_##flag_type(flag_name, default_value, description);                                               \
  namespace {                                                                                              \
  bool validate_##flag_name(const char *flagname, cpp_type value) validation_body                          \
  }                                                                                                        \
  DEFINE_validator(flag_name, &validate_##flag_name)

#define DEFINE_VALIDATED_uint64(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(uint64, flag_name, default_value, description, std::uint64_t, validation_body)

#define DEFINE_VALIDATED_string(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(string, flag_name, default_value, description, const std::string &, validation_body)

/// Accepts numeric values in [lower_bound, upper_bound].
#define FLAG_IN_RANGE(lower_bound, upper_bound)                                                       \
  {                                                                                                   \
    if (value >= (lower_bound) && value <= (upper_bound)) return true;                                \
    std::cout << "--" << flagname << " must be between " << (lower_bound) << " and " << (upper_bound) \
              << ", got " << value << std::endl;                                                      \
    return false;                                                                                     \
  }
