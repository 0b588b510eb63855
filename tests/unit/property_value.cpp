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
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "storage/property_value.hpp"

using namespace kestrel::storage;

namespace {

template <typename T>
std::string ToString(const T &value) {
  std::stringstream ss;
  ss << value;
  return ss.str();
}

}  // namespace

TEST(PropertyValue, Null) {
  PropertyValue pv;
  ASSERT_EQ(pv.type(), PropertyValue::Type::Null);
  ASSERT_TRUE(pv.IsNull());
  ASSERT_FALSE(pv.IsBool());
  ASSERT_FALSE(pv.IsInt());
  ASSERT_FALSE(pv.IsString());
  ASSERT_THROW(pv.ValueBool(), PropertyValueException);
  ASSERT_THROW(pv.ValueInt(), PropertyValueException);
  ASSERT_THROW(pv.ValueString(), PropertyValueException);
  ASSERT_THROW(pv.ValueList(), PropertyValueException);
  ASSERT_EQ(ToString(pv), "null");
  ASSERT_EQ(ToString(pv.type()), "null");
  ASSERT_EQ(GetValueGroup(pv), ValueGroup::NO_VALUE);
}

TEST(PropertyValue, Bool) {
  PropertyValue pv(false);
  ASSERT_TRUE(pv.IsBool());
  ASSERT_EQ(pv.ValueBool(), false);
  ASSERT_THROW(pv.ValueDouble(), PropertyValueException);
  ASSERT_EQ(ToString(pv), "false");
  ASSERT_EQ(ToString(PropertyValue(true)), "true");
  ASSERT_EQ(ToString(pv.type()), "bool");
  ASSERT_EQ(GetValueGroup(pv), ValueGroup::BOOLEAN);
}

TEST(PropertyValue, Int) {
  PropertyValue pv(123L);
  ASSERT_TRUE(pv.IsInt());
  ASSERT_EQ(pv.ValueInt(), 123);
  ASSERT_THROW(pv.ValueDouble(), PropertyValueException);
  ASSERT_EQ(ToString(pv), "123");
  ASSERT_EQ(ToString(pv.type()), "int");
  ASSERT_EQ(GetValueGroup(pv), ValueGroup::NUMBER);
}

TEST(PropertyValue, StringCopyAndMove) {
  PropertyValue pv("nandare");
  ASSERT_TRUE(pv.IsString());
  ASSERT_EQ(pv.ValueString(), "nandare");
  ASSERT_EQ(ToString(pv.type()), "string");
  ASSERT_EQ(GetValueGroup(pv), ValueGroup::TEXT);

  PropertyValue copy(pv);
  ASSERT_EQ(copy.ValueString(), "nandare");
  ASSERT_EQ(pv, copy);

  PropertyValue moved(std::move(copy));
  ASSERT_EQ(moved.ValueString(), "nandare");

  PropertyValue assigned(5);
  assigned = pv;
  ASSERT_TRUE(assigned.IsString());
  ASSERT_EQ(assigned.ValueString(), "nandare");
}

TEST(PropertyValue, List) {
  std::vector<PropertyValue> vec{PropertyValue(1), PropertyValue("two"), PropertyValue(true)};
  PropertyValue pv(vec);
  ASSERT_TRUE(pv.IsList());
  ASSERT_EQ(pv.ValueList().size(), 3);
  ASSERT_EQ(pv.ValueList()[1].ValueString(), "two");
  ASSERT_EQ(ToString(pv), "[1, two, true]");
  ASSERT_EQ(ToString(pv.type()), "list");
  ASSERT_EQ(GetValueGroup(pv), ValueGroup::LIST);
}

TEST(PropertyValue, TemporalAndPoint) {
  PropertyValue temporal(TemporalData{TemporalType::Duration, 42});
  ASSERT_TRUE(temporal.IsTemporalData());
  ASSERT_EQ(temporal.ValueTemporalData().microseconds, 42);
  ASSERT_EQ(ToString(temporal.type()), "temporal data");
  ASSERT_EQ(GetValueGroup(temporal), ValueGroup::TEMPORAL);

  PropertyValue point(Point2d{CoordinateReferenceSystem::Cartesian_2d, 1.5, -2.0});
  ASSERT_TRUE(point.IsPoint2d());
  ASSERT_EQ(point.ValuePoint2d().x, 1.5);
  ASSERT_EQ(ToString(point.type()), "point");
  ASSERT_EQ(GetValueGroup(point), ValueGroup::GEOMETRY);
}

TEST(PropertyValue, NumericEqualityAcrossKinds) {
  ASSERT_EQ(PropertyValue(1), PropertyValue(1.0));
  ASSERT_NE(PropertyValue(1), PropertyValue(1.5));
  ASSERT_NE(PropertyValue(1), PropertyValue("1"));
  ASSERT_EQ(PropertyValueHash(PropertyValue(1)), PropertyValueHash(PropertyValue(1.0)));
  ASSERT_EQ(PropertyValueHash(PropertyValue(0.0)), PropertyValueHash(PropertyValue(-0.0)));
  ASSERT_EQ(PropertyValue(std::vector<PropertyValue>{PropertyValue(2)}),
            PropertyValue(std::vector<PropertyValue>{PropertyValue(2.0)}));
}

TEST(PropertyValue, HasChangedIsTypeAware) {
  ASSERT_FALSE(PropertyValueHasChanged(PropertyValue(3), PropertyValue(3)));
  ASSERT_TRUE(PropertyValueHasChanged(PropertyValue(3), PropertyValue(3.0)));
  ASSERT_TRUE(PropertyValueHasChanged(PropertyValue(3), PropertyValue(4)));
  ASSERT_TRUE(PropertyValueHasChanged(PropertyValue(), PropertyValue(false)));
}

TEST(PropertyValue, Ordering) {
  std::vector<PropertyValue> ordered{
      PropertyValue(),
      PropertyValue(false),
      PropertyValue(true),
      PropertyValue(-1),
      PropertyValue(0.5),
      PropertyValue(2),
      PropertyValue("a"),
      PropertyValue("b"),
      PropertyValue(std::vector<PropertyValue>{PropertyValue(1)}),
      PropertyValue(TemporalData{TemporalType::Date, 10}),
      PropertyValue(Point2d{CoordinateReferenceSystem::WGS84_2d, 0.0, 0.0}),
  };
  for (size_t i = 0; i + 1 < ordered.size(); ++i) {
    EXPECT_TRUE(ordered[i] < ordered[i + 1]) << ordered[i] << " < " << ordered[i + 1];
    EXPECT_FALSE(ordered[i + 1] < ordered[i]) << ordered[i + 1] << " < " << ordered[i];
  }
  ASSERT_FALSE(PropertyValue(1) < PropertyValue(1.0));
  ASSERT_FALSE(PropertyValue(1.0) < PropertyValue(1));
}

TEST(PropertyValue, NaNIsOrderedAfterEveryNumber) {
  const PropertyValue nan(std::numeric_limits<double>::quiet_NaN());
  ASSERT_EQ(nan, PropertyValue(std::numeric_limits<double>::quiet_NaN()));
  ASSERT_EQ(PropertyValueHash(nan), PropertyValueHash(PropertyValue(-std::numeric_limits<double>::quiet_NaN())));
  ASSERT_FALSE(nan < nan);
  const std::vector<PropertyValue> numbers{PropertyValue(1), PropertyValue(-2.5),
                                           PropertyValue(std::numeric_limits<double>::infinity()),
                                           PropertyValue(std::numeric_limits<int64_t>::max())};
  for (const auto &number : numbers) {
    EXPECT_NE(nan, number) << number;
    EXPECT_TRUE(number < nan) << number;
    EXPECT_FALSE(nan < number) << number;
  }
  ASSERT_TRUE(nan < PropertyValue("a"));

  std::map<PropertyValue, int> keyed;
  keyed.emplace(PropertyValue(1), 1);
  keyed.emplace(nan, 2);
  keyed.emplace(PropertyValue(std::numeric_limits<double>::quiet_NaN()), 3);
  ASSERT_EQ(keyed.size(), 2);
  ASSERT_EQ(keyed.at(PropertyValue(1.0)), 1);
  ASSERT_EQ(keyed.at(nan), 2);
}

TEST(PropertyValue, LargeIntegersCompareExactlyWithDoubles) {
  constexpr int64_t kTwoTo53 = int64_t{1} << 53;
  const PropertyValue as_double(static_cast<double>(kTwoTo53));
  const PropertyValue exact(kTwoTo53);
  const PropertyValue next(kTwoTo53 + 1);

  ASSERT_EQ(exact, as_double);
  ASSERT_EQ(PropertyValueHash(exact), PropertyValueHash(as_double));
  ASSERT_NE(next, as_double);
  ASSERT_TRUE(as_double < next);
  ASSERT_FALSE(next < as_double);
  ASSERT_TRUE(exact < next);

  const PropertyValue int_max(std::numeric_limits<int64_t>::max());
  const PropertyValue two_to_63(9223372036854775808.0);
  ASSERT_NE(int_max, two_to_63);
  ASSERT_TRUE(int_max < two_to_63);
  ASSERT_EQ(PropertyValue(std::numeric_limits<int64_t>::min()), PropertyValue(-9223372036854775808.0));
  ASSERT_TRUE(PropertyValue(-3) < PropertyValue(-2.5));
  ASSERT_TRUE(PropertyValue(-2.5) < PropertyValue(-2));
}

TEST(PropertyValue, PointsWithNaNCoordinatesAreOrdered) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const PropertyValue with_nan(Point2d{CoordinateReferenceSystem::Cartesian_2d, nan, 0.0});
  const PropertyValue plain(Point2d{CoordinateReferenceSystem::Cartesian_2d, 1.0, 0.0});
  ASSERT_EQ(with_nan, PropertyValue(Point2d{CoordinateReferenceSystem::Cartesian_2d, nan, 0.0}));
  ASSERT_NE(with_nan, plain);
  ASSERT_TRUE(plain < with_nan);
  ASSERT_FALSE(with_nan < plain);
}
