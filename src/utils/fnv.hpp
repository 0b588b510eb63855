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

#include <cstdint>
#include <string_view>

namespace kestrel::utils {

inline constexpr uint64_t kFnvOffset = 14695981039346656037UL;
inline constexpr uint64_t kFnvPrime = 1099511628211UL;

/// Folds one 64-bit word into a running FNV-1a style hash. Tuples of mixed
/// kinds (a label followed by property values) are hashed word by word.
constexpr uint64_t FnvCombine(uint64_t hash, const uint64_t word) {
  hash ^= word;
  hash *= kFnvPrime;
  return hash;
}

/// FNV-1a over the bytes of \p bytes.
constexpr uint64_t Fnv(const std::string_view bytes) {
  uint64_t hash = kFnvOffset;
  for (const char byte : bytes) {
    hash = FnvCombine(hash, static_cast<uint8_t>(byte));
  }
  return hash;
}

}  // namespace kestrel::utils
