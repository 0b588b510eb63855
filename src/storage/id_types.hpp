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

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <type_traits>

namespace kestrel::storage {

#define STORAGE_DEFINE_ID_TYPE(name)                                                                              \
  class name final {                                                                                              \
   private:                                                                                                       \
    explicit name(uint64_t id) : id_(id) {}                                                                       \
                                                                                                                  \
   public:                                                                                                        \
    /* Default constructor to allow serialization or preallocation. */                                            \
    name() = default;                                                                                             \
                                                                                                                  \
    static name FromUint(uint64_t id) { return name{id}; }                                                        \
    static name FromInt(int64_t id) { return name{static_cast<uint64_t>(id)}; }                                   \
    uint64_t AsUint() const { return id_; }                                                                       \
    int64_t AsInt() const { return static_cast<int64_t>(id_); }                                                   \
                                                                                                                  \
    friend auto operator<=>(const name &, const name &) = default;                                                \
                                                                                                                  \
   private:                                                                                                       \
    uint64_t id_{0};                                                                                              \
  };                                                                                                              \
  static_assert(std::is_trivially_copyable_v<name>, "kestrel::storage::" #name " must be trivially copyable!");   \
  inline std::ostream &operator<<(std::ostream &os, const name &id) { return os << id.AsUint(); }

STORAGE_DEFINE_ID_TYPE(Gid);
STORAGE_DEFINE_ID_TYPE(LabelId);
STORAGE_DEFINE_ID_TYPE(PropertyId);
STORAGE_DEFINE_ID_TYPE(EdgeTypeId);
STORAGE_DEFINE_ID_TYPE(IndexId);
STORAGE_DEFINE_ID_TYPE(ConstraintId);

#undef STORAGE_DEFINE_ID_TYPE

}  // namespace kestrel::storage

namespace std {

template <>
struct hash<kestrel::storage::Gid> {
  size_t operator()(const kestrel::storage::Gid &id) const noexcept { return id.AsUint(); }
};

template <>
struct hash<kestrel::storage::LabelId> {
  size_t operator()(const kestrel::storage::LabelId &id) const noexcept { return id.AsUint(); }
};

template <>
struct hash<kestrel::storage::PropertyId> {
  size_t operator()(const kestrel::storage::PropertyId &id) const noexcept { return id.AsUint(); }
};

template <>
struct hash<kestrel::storage::EdgeTypeId> {
  size_t operator()(const kestrel::storage::EdgeTypeId &id) const noexcept { return id.AsUint(); }
};

template <>
struct hash<kestrel::storage::IndexId> {
  size_t operator()(const kestrel::storage::IndexId &id) const noexcept { return id.AsUint(); }
};

template <>
struct hash<kestrel::storage::ConstraintId> {
  size_t operator()(const kestrel::storage::ConstraintId &id) const noexcept { return id.AsUint(); }
};

}  // namespace std
