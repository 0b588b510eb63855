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

#include <algorithm>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace kestrel::utils {

// Helpers for flags whose values name enumerators. A mapping is any range of
// pairs {spelling, enumerator}, usually a constexpr std::array.

enum class ValidationError : uint8_t { EmptyValue, InvalidValue };

auto GetAllowedEnumValuesString(const auto &mappings) -> std::string {
  std::vector<std::string_view> spellings;
  spellings.reserve(mappings.size());
  for (const auto &[spelling, _] : mappings) spellings.emplace_back(spelling);
  return fmt::format("{}", fmt::join(spellings, ", "));
}

auto FindEnumMapping(const auto &value, const auto &mappings) {
  return std::find_if(mappings.begin(), mappings.end(), [&](const auto &mapping) { return mapping.first == value; });
}

auto IsValidEnumValueString(const auto &value, const auto &mappings) -> std::expected<void, ValidationError> {
  if (value.empty()) return std::unexpected{ValidationError::EmptyValue};
  if (FindEnumMapping(value, mappings) == mappings.end()) return std::unexpected{ValidationError::InvalidValue};
  return {};
}

template <typename Enum>
auto StringToEnum(const auto &value, const auto &mappings) -> std::optional<Enum> {
  const auto it = FindEnumMapping(value, mappings);
  if (it == mappings.end()) return std::nullopt;
  return it->second;
}

}  // namespace kestrel::utils
