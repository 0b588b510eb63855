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

#include "storage/property_value.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <ostream>

#include "utils/fnv.hpp"
#include "utils/logging.hpp"

namespace kestrel::storage {

PropertyValue::PropertyValue(const PropertyValue &other) : type_(other.type_) {
  switch (other.type_) {
    case Type::Null:
      return;
    case Type::Bool:
      this->bool_v = other.bool_v;
      return;
    case Type::Int:
      this->int_v = other.int_v;
      return;
    case Type::Double:
      this->double_v = other.double_v;
      return;
    case Type::String:
      new (&string_v) std::string(other.string_v);
      return;
    case Type::List:
      new (&list_v) std::vector<PropertyValue>(other.list_v);
      return;
    case Type::TemporalData:
      this->temporal_data_v = other.temporal_data_v;
      return;
    case Type::Point2d:
      this->point2d_v = other.point2d_v;
      return;
  }
}

PropertyValue::PropertyValue(PropertyValue &&other) noexcept : type_(other.type_) {
  switch (other.type_) {
    case Type::Null:
      break;
    case Type::Bool:
      bool_v = other.bool_v;
      break;
    case Type::Int:
      int_v = other.int_v;
      break;
    case Type::Double:
      double_v = other.double_v;
      break;
    case Type::String:
      new (&string_v) std::string(std::move(other.string_v));
      break;
    case Type::List:
      new (&list_v) std::vector<PropertyValue>(std::move(other.list_v));
      break;
    case Type::TemporalData:
      temporal_data_v = other.temporal_data_v;
      break;
    case Type::Point2d:
      point2d_v = other.point2d_v;
      break;
  }

  // reset the type of other
  other.DestroyValue();
  other.type_ = Type::Null;
}

PropertyValue &PropertyValue::operator=(const PropertyValue &other) {
  if (this == &other) return *this;
  // Copy first so that assigning a list element of `this` stays valid.
  PropertyValue copy(other);
  *this = std::move(copy);
  return *this;
}

PropertyValue &PropertyValue::operator=(PropertyValue &&other) noexcept {
  if (this == &other) return *this;

  DestroyValue();
  type_ = other.type_;

  switch (other.type_) {
    case Type::Null:
      break;
    case Type::Bool:
      bool_v = other.bool_v;
      break;
    case Type::Int:
      int_v = other.int_v;
      break;
    case Type::Double:
      double_v = other.double_v;
      break;
    case Type::String:
      new (&string_v) std::string(std::move(other.string_v));
      break;
    case Type::List:
      new (&list_v) std::vector<PropertyValue>(std::move(other.list_v));
      break;
    case Type::TemporalData:
      temporal_data_v = other.temporal_data_v;
      break;
    case Type::Point2d:
      point2d_v = other.point2d_v;
      break;
  }

  // reset the type of other
  other.DestroyValue();
  other.type_ = Type::Null;

  return *this;
}

void PropertyValue::DestroyValue() noexcept {
  switch (type_) {
    // destructor for primitive types does nothing
    case Type::Null:
    case Type::Bool:
    case Type::Int:
    case Type::Double:
    case Type::TemporalData:
    case Type::Point2d:
      return;

    // destructor for non primitive types since we used placement new
    case Type::String:
      std::destroy_at(&string_v);
      return;
    case Type::List:
      std::destroy_at(&list_v);
      return;
  }
}

std::ostream &operator<<(std::ostream &os, const PropertyValue::Type type) {
  switch (type) {
    case PropertyValue::Type::Null:
      return os << "null";
    case PropertyValue::Type::Bool:
      return os << "bool";
    case PropertyValue::Type::Int:
      return os << "int";
    case PropertyValue::Type::Double:
      return os << "double";
    case PropertyValue::Type::String:
      return os << "string";
    case PropertyValue::Type::List:
      return os << "list";
    case PropertyValue::Type::TemporalData:
      return os << "temporal data";
    case PropertyValue::Type::Point2d:
      return os << "point";
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const PropertyValue &value) {
  switch (value.type()) {
    case PropertyValue::Type::Null:
      return os << "null";
    case PropertyValue::Type::Bool:
      return os << (value.ValueBool() ? "true" : "false");
    case PropertyValue::Type::Int:
      return os << value.ValueInt();
    case PropertyValue::Type::Double:
      return os << value.ValueDouble();
    case PropertyValue::Type::String:
      return os << value.ValueString();
    case PropertyValue::Type::List: {
      os << "[";
      const auto &list = value.ValueList();
      for (size_t i = 0; i < list.size(); ++i) {
        if (i != 0) os << ", ";
        os << list[i];
      }
      return os << "]";
    }
    case PropertyValue::Type::TemporalData: {
      const auto temporal = value.ValueTemporalData();
      return os << "temporal(" << static_cast<int>(temporal.type) << ", " << temporal.microseconds << ")";
    }
    case PropertyValue::Type::Point2d: {
      const auto point = value.ValuePoint2d();
      return os << "point(" << static_cast<int>(point.crs) << ", " << point.x << ", " << point.y << ")";
    }
  }
  return os;
}

namespace {

bool IsNumber(const PropertyValue &value) { return value.IsInt() || value.IsDouble(); }

// Doubles are totally ordered with every NaN equal to itself and greater than
// any other number.
int CompareDoubles(const double first, const double second) {
  const bool first_nan = std::isnan(first);
  const bool second_nan = std::isnan(second);
  if (first_nan || second_nan) return static_cast<int>(first_nan) - static_cast<int>(second_nan);
  if (first < second) return -1;
  if (second < first) return 1;
  return 0;
}

// Exact comparison of an integer with a double, without rounding the integer.
int CompareIntDouble(const int64_t first, const double second) {
  // 2^63 as a double; every finite double in [-2^63, 2^63) truncates to an int64.
  constexpr double kTwoTo63 = 9223372036854775808.0;
  if (std::isnan(second) || second >= kTwoTo63) return -1;
  if (second < -kTwoTo63) return 1;
  const double truncated = std::trunc(second);
  const auto whole = static_cast<int64_t>(truncated);
  if (first < whole) return -1;
  if (first > whole) return 1;
  if (truncated < second) return -1;
  if (truncated > second) return 1;
  return 0;
}

int CompareNumbers(const PropertyValue &first, const PropertyValue &second) {
  if (first.IsInt() && second.IsInt()) {
    if (first.ValueInt() < second.ValueInt()) return -1;
    return first.ValueInt() > second.ValueInt() ? 1 : 0;
  }
  if (first.IsInt()) return CompareIntDouble(first.ValueInt(), second.ValueDouble());
  if (second.IsInt()) return -CompareIntDouble(second.ValueInt(), first.ValueDouble());
  return CompareDoubles(first.ValueDouble(), second.ValueDouble());
}

// Bits hashed for a double: integral values in int64 range hash like the
// equal integer, -0.0 folds into 0.0 and every NaN hashes the same.
uint64_t DoubleHashBits(const double value) {
  constexpr double kTwoTo63 = 9223372036854775808.0;
  if (std::isnan(value)) return std::bit_cast<uint64_t>(std::numeric_limits<double>::quiet_NaN());
  if (value >= -kTwoTo63 && value < kTwoTo63 && std::trunc(value) == value) {
    return static_cast<uint64_t>(static_cast<int64_t>(value));
  }
  return std::bit_cast<uint64_t>(value);
}

// Rank of the value's group in the total order. Int and Double share a rank.
int OrderRank(const PropertyValue::Type type) {
  switch (type) {
    case PropertyValue::Type::Null:
      return 0;
    case PropertyValue::Type::Bool:
      return 1;
    case PropertyValue::Type::Int:
    case PropertyValue::Type::Double:
      return 2;
    case PropertyValue::Type::String:
      return 3;
    case PropertyValue::Type::List:
      return 4;
    case PropertyValue::Type::TemporalData:
      return 5;
    case PropertyValue::Type::Point2d:
      return 6;
  }
  LOG_FATAL("Unknown property value type {}", static_cast<int>(type));
}

}  // namespace

bool operator==(const PropertyValue &first, const PropertyValue &second) {
  if (IsNumber(first) && IsNumber(second)) {
    return CompareNumbers(first, second) == 0;
  }
  if (first.type() != second.type()) return false;
  switch (first.type()) {
    case PropertyValue::Type::Null:
      return true;
    case PropertyValue::Type::Bool:
      return first.ValueBool() == second.ValueBool();
    case PropertyValue::Type::String:
      return first.ValueString() == second.ValueString();
    case PropertyValue::Type::List: {
      const auto &l1 = first.ValueList();
      const auto &l2 = second.ValueList();
      if (l1.size() != l2.size()) return false;
      for (size_t i = 0; i < l1.size(); ++i) {
        if (l1[i] != l2[i]) return false;
      }
      return true;
    }
    case PropertyValue::Type::TemporalData:
      return first.ValueTemporalData() == second.ValueTemporalData();
    case PropertyValue::Type::Point2d: {
      const auto p1 = first.ValuePoint2d();
      const auto p2 = second.ValuePoint2d();
      return p1.crs == p2.crs && CompareDoubles(p1.x, p2.x) == 0 && CompareDoubles(p1.y, p2.y) == 0;
    }
    case PropertyValue::Type::Int:
    case PropertyValue::Type::Double:
      break;
  }
  LOG_FATAL("Numbers are handled before the type switch");
}

bool operator<(const PropertyValue &first, const PropertyValue &second) {
  const auto first_rank = OrderRank(first.type());
  const auto second_rank = OrderRank(second.type());
  if (first_rank != second_rank) return first_rank < second_rank;

  switch (first.type()) {
    case PropertyValue::Type::Null:
      return false;
    case PropertyValue::Type::Bool:
      return !first.ValueBool() && second.ValueBool();
    case PropertyValue::Type::Int:
    case PropertyValue::Type::Double:
      return CompareNumbers(first, second) < 0;
    case PropertyValue::Type::String:
      return first.ValueString() < second.ValueString();
    case PropertyValue::Type::List: {
      const auto &l1 = first.ValueList();
      const auto &l2 = second.ValueList();
      for (size_t i = 0; i < l1.size() && i < l2.size(); ++i) {
        if (l1[i] < l2[i]) return true;
        if (l2[i] < l1[i]) return false;
      }
      return l1.size() < l2.size();
    }
    case PropertyValue::Type::TemporalData: {
      const auto t1 = first.ValueTemporalData();
      const auto t2 = second.ValueTemporalData();
      if (t1.type != t2.type) return t1.type < t2.type;
      return t1.microseconds < t2.microseconds;
    }
    case PropertyValue::Type::Point2d: {
      const auto p1 = first.ValuePoint2d();
      const auto p2 = second.ValuePoint2d();
      if (p1.crs != p2.crs) return p1.crs < p2.crs;
      if (const auto by_x = CompareDoubles(p1.x, p2.x); by_x != 0) return by_x < 0;
      return CompareDoubles(p1.y, p2.y) < 0;
    }
  }
  return false;
}

ValueGroup GetValueGroup(const PropertyValue &value) {
  switch (value.type()) {
    case PropertyValue::Type::Null:
      return ValueGroup::NO_VALUE;
    case PropertyValue::Type::Bool:
      return ValueGroup::BOOLEAN;
    case PropertyValue::Type::Int:
    case PropertyValue::Type::Double:
      return ValueGroup::NUMBER;
    case PropertyValue::Type::String:
      return ValueGroup::TEXT;
    case PropertyValue::Type::List:
      return ValueGroup::LIST;
    case PropertyValue::Type::TemporalData:
      return ValueGroup::TEMPORAL;
    case PropertyValue::Type::Point2d:
      return ValueGroup::GEOMETRY;
  }
  return ValueGroup::NO_VALUE;
}

std::string_view ValueGroupToString(const ValueGroup group) {
  switch (group) {
    case ValueGroup::NO_VALUE:
      return "NO_VALUE";
    case ValueGroup::NUMBER:
      return "NUMBER";
    case ValueGroup::TEXT:
      return "TEXT";
    case ValueGroup::BOOLEAN:
      return "BOOLEAN";
    case ValueGroup::TEMPORAL:
      return "TEMPORAL";
    case ValueGroup::GEOMETRY:
      return "GEOMETRY";
    case ValueGroup::LIST:
      return "LIST";
  }
  return "UNKNOWN";
}

uint64_t PropertyValueHash(const PropertyValue &value) {
  uint64_t hash = utils::FnvCombine(utils::kFnvOffset, static_cast<uint64_t>(OrderRank(value.type())));
  switch (value.type()) {
    case PropertyValue::Type::Null:
      return hash;
    case PropertyValue::Type::Bool:
      return utils::FnvCombine(hash, value.ValueBool() ? 1 : 0);
    case PropertyValue::Type::Int:
      return utils::FnvCombine(hash, static_cast<uint64_t>(value.ValueInt()));
    case PropertyValue::Type::Double:
      return utils::FnvCombine(hash, DoubleHashBits(value.ValueDouble()));
    case PropertyValue::Type::String:
      return utils::FnvCombine(hash, utils::Fnv(value.ValueString()));
    case PropertyValue::Type::List:
      for (const auto &element : value.ValueList()) {
        hash = utils::FnvCombine(hash, PropertyValueHash(element));
      }
      return hash;
    case PropertyValue::Type::TemporalData: {
      const auto temporal = value.ValueTemporalData();
      hash = utils::FnvCombine(hash, static_cast<uint64_t>(temporal.type));
      return utils::FnvCombine(hash, static_cast<uint64_t>(temporal.microseconds));
    }
    case PropertyValue::Type::Point2d: {
      const auto point = value.ValuePoint2d();
      hash = utils::FnvCombine(hash, static_cast<uint64_t>(point.crs));
      hash = utils::FnvCombine(hash, DoubleHashBits(point.x));
      return utils::FnvCombine(hash, DoubleHashBits(point.y));
    }
  }
  return hash;
}

}  // namespace kestrel::storage
