#include <certalign/core/field_difference.hpp>
#include <certalign/core/field_spec.hpp>
#include <gtest/gtest.h>
#include <cmath>

namespace cc = certalign::core;

TEST(FieldDifference, DefaultIsNotDetected) {
  cc::FieldDifference d;
  EXPECT_FALSE(d.is_finite());
  EXPECT_TRUE(std::isinf(d.dy));
  EXPECT_TRUE(std::isinf(d.dx));
  EXPECT_TRUE(std::isinf(d.distance));
}

TEST(FieldDifference, ZeroIsFinite) {
  cc::FieldDifference d{0.0, 0.0, 0.0};
  EXPECT_TRUE(d.is_finite());
}

TEST(DetectedPosition, FoundNeedsBothCoordinates) {
  cc::DetectedPosition p;
  EXPECT_FALSE(p.found());
  p.center_y = 0.0;
  EXPECT_FALSE(p.found());
  p.center_x = 0.0;
  EXPECT_TRUE(p.found());
}

TEST(FieldSpec, UnknownFieldsListed) {
  std::vector<cc::FieldSpec> specs(2);
  specs[0].name = "name";
  specs[1].name = "event";
  cc::FieldValues values{{"name", "A"}, {"venue", "B"}, {"event", "C"}};
  auto unknown = cc::unknown_fields(values, specs);
  ASSERT_EQ(unknown.size(), 1u);
  EXPECT_EQ(unknown[0], "venue");
}
