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
#include <iosfwd>
#include <new>
#include <string>
#include <string_view>
#include <vector>

#include "utils/exceptions.hpp"

namespace kestrel::storage {

/// An exception raised by the PropertyValue. Typically when trying to perform
/// operations (such as addition) on PropertyValues of incompatible Types.
class PropertyValueException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(PropertyValueException)
};

enum class TemporalType : uint8_t { Date = 0, LocalTime, LocalDateTime, Duration };

/// Temporal values are kept as a kind tag plus microseconds since the epoch
/// (or the length of the duration). Their key encoding is not the concern of
/// this layer.
struct TemporalData {
  TemporalType type{TemporalType::Date};
  int64_t microseconds{0};

  friend bool operator==(const TemporalData &, const TemporalData &) = default;
};

enum class CoordinateReferenceSystem : uint8_t { WGS84_2d = 0, Cartesian_2d };

struct Point2d {
  CoordinateReferenceSystem crs{CoordinateReferenceSystem::Cartesian_2d};
  double x{0.0};
  double y{0.0};

  friend bool operator==(const Point2d &, const Point2d &) = default;
};

/// Coarse classification of values used by index capability queries.
enum class ValueGroup : uint8_t { NO_VALUE = 0, NUMBER, TEXT, BOOLEAN, TEMPORAL, GEOMETRY, LIST };

/// Encapsulation of a value and its type in a class that has no compile-time
/// info about that type.
///
/// Values can be of a number of predefined types that are enumerated in
/// PropertyValue::Type. Each such type corresponds to exactly one C++ type.
/// The Null value doubles as the "no value" sentinel returned when a property
/// is absent.
class PropertyValue {
 public:
  /// A value type, each type corresponds to exactly one C++ type.
  enum class Type : uint8_t { Null = 0, Bool, Int, Double, String, List, TemporalData, Point2d };

  // default constructor, makes Null
  PropertyValue() : type_(Type::Null) {}

  // constructors for primitive types
  explicit PropertyValue(const bool value) : bool_v(value), type_(Type::Bool) {}
  explicit PropertyValue(const int value) : int_v(value), type_(Type::Int) {}
  explicit PropertyValue(const int64_t value) : int_v(value), type_(Type::Int) {}
  explicit PropertyValue(const double value) : double_v(value), type_(Type::Double) {}
  explicit PropertyValue(const TemporalData value) : temporal_data_v(value), type_(Type::TemporalData) {}
  explicit PropertyValue(const Point2d value) : point2d_v(value), type_(Type::Point2d) {}

  // constructors for non-primitive types
  explicit PropertyValue(const char *value) : type_(Type::String) { new (&string_v) std::string(value); }
  explicit PropertyValue(std::string value) : type_(Type::String) { new (&string_v) std::string(std::move(value)); }
  explicit PropertyValue(std::vector<PropertyValue> value) : type_(Type::List) {
    new (&list_v) std::vector<PropertyValue>(std::move(value));
  }

  PropertyValue(const PropertyValue &other);
  PropertyValue(PropertyValue &&other) noexcept;
  PropertyValue &operator=(const PropertyValue &other);
  PropertyValue &operator=(PropertyValue &&other) noexcept;
  ~PropertyValue() { DestroyValue(); }

  Type type() const { return type_; }

  bool IsNull() const { return type_ == Type::Null; }
  bool IsBool() const { return type_ == Type::Bool; }
  bool IsInt() const { return type_ == Type::Int; }
  bool IsDouble() const { return type_ == Type::Double; }
  bool IsString() const { return type_ == Type::String; }
  bool IsList() const { return type_ == Type::List; }
  bool IsTemporalData() const { return type_ == Type::TemporalData; }
  bool IsPoint2d() const { return type_ == Type::Point2d; }

  // value getters for primitive types
  /// @throw PropertyValueException if value isn't of correct type.
  bool ValueBool() const {
    if (type_ != Type::Bool) [[unlikely]] {
      throw PropertyValueException("The value isn't a bool!");
    }
    return bool_v;
  }
  /// @throw PropertyValueException if value isn't of correct type.
  int64_t ValueInt() const {
    if (type_ != Type::Int) [[unlikely]] {
      throw PropertyValueException("The value isn't an int!");
    }
    return int_v;
  }
  /// @throw PropertyValueException if value isn't of correct type.
  double ValueDouble() const {
    if (type_ != Type::Double) [[unlikely]] {
      throw PropertyValueException("The value isn't a double!");
    }
    return double_v;
  }
  /// @throw PropertyValueException if value isn't of correct type.
  TemporalData ValueTemporalData() const {
    if (type_ != Type::TemporalData) [[unlikely]] {
      throw PropertyValueException("The value isn't a temporal data!");
    }
    return temporal_data_v;
  }
  /// @throw PropertyValueException if value isn't of correct type.
  Point2d ValuePoint2d() const {
    if (type_ != Type::Point2d) [[unlikely]] {
      throw PropertyValueException("The value isn't a point!");
    }
    return point2d_v;
  }

  // const value getters for non-primitive types
  /// @throw PropertyValueException if value isn't of correct type.
  const std::string &ValueString() const {
    if (type_ != Type::String) [[unlikely]] {
      throw PropertyValueException("The value isn't a string!");
    }
    return string_v;
  }
  /// @throw PropertyValueException if value isn't of correct type.
  const std::vector<PropertyValue> &ValueList() const {
    if (type_ != Type::List) [[unlikely]] {
      throw PropertyValueException("The value isn't a list!");
    }
    return list_v;
  }

 private:
  void DestroyValue() noexcept;

  union {
    bool bool_v;
    int64_t int_v;
    double double_v;
    std::string string_v;
    std::vector<PropertyValue> list_v;
    TemporalData temporal_data_v;
    Point2d point2d_v;
  };

  Type type_;
};

// stream output
std::ostream &operator<<(std::ostream &os, PropertyValue::Type type);
std::ostream &operator<<(std::ostream &os, const PropertyValue &value);

/// Value equality. Numbers compare by exact magnitude, so `Int(1) == Double(1.0)`
/// but `Int(2^53 + 1) != Double(2^53)`. NaN equals NaN.
bool operator==(const PropertyValue &first, const PropertyValue &second);
inline bool operator!=(const PropertyValue &first, const PropertyValue &second) { return !(first == second); }

/// Total ordering consistent with operator==; values of different groups are
/// ordered by group, numbers are ordered by magnitude with NaN after every
/// other number.
bool operator<(const PropertyValue &first, const PropertyValue &second);

/// Type-aware change test used when deciding whether a property write is a
/// change: values that are equal but of different representation kinds (e.g.
/// an int replaced by a double of the same magnitude) count as changed.
inline bool PropertyValueHasChanged(const PropertyValue &previous, const PropertyValue &next) {
  return previous.type() != next.type() || previous != next;
}

ValueGroup GetValueGroup(const PropertyValue &value);

/// Hash consistent with operator== (equal values hash equally).
uint64_t PropertyValueHash(const PropertyValue &value);

std::string_view ValueGroupToString(ValueGroup group);

}  // namespace kestrel::storage
