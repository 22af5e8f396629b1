#include <certalign/vision/alignment_comparator.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace cc = certalign::core;
namespace cv_ = certalign::vision;
namespace ct = certalign::test_support;

namespace {

cc::DetectedPosition at(double x, double y) {
  cc::DetectedPosition p;
  p.center_x = x;
  p.center_y = y;
  return p;
}

cc::FieldMeasurement measurement(double distance, bool required = true) {
  cc::FieldMeasurement m;
  m.difference = {distance, 0.0, distance};
  m.required = required;
  return m;
}

}  // namespace

TEST(AlignmentComparator, EuclideanDistance) {
  auto d = cv_::compare(at(10.0, 20.0), at(13.0, 24.0));
  EXPECT_DOUBLE_EQ(d.dx, 3.0);
  EXPECT_DOUBLE_EQ(d.dy, 4.0);
  EXPECT_DOUBLE_EQ(d.distance, 5.0);
  EXPECT_TRUE(d.is_finite());
}

TEST(AlignmentComparator, IdenticalPositionsZero) {
  auto d = cv_::compare(at(5.0, 5.0), at(5.0, 5.0));
  EXPECT_DOUBLE_EQ(d.distance, 0.0);
}

TEST(AlignmentComparator, MissingSideIsInfinite) {
  auto d = cv_::compare(cc::DetectedPosition{}, at(1.0, 1.0));
  EXPECT_TRUE(std::isinf(d.dy));
  EXPECT_TRUE(std::isinf(d.dx));
  EXPECT_TRUE(std::isinf(d.distance));

  cc::DetectedPosition partial;
  partial.center_y = 1.0;
  EXPECT_FALSE(cv_::compare(at(1.0, 1.0), partial).is_finite());
}

TEST(AlignmentComparator, MeasureCoversAllSpecs) {
  cc::FieldPositions candidate{{"name", at(100.0, 60.0)}};
  cc::FieldPositions reference{{"name", at(100.0, 62.0)}, {"event", at(100.0, 150.0)}};
  auto specs = ct::small_specs();
  specs[2].required = false;

  auto fields = cv_::measure(candidate, reference, specs);
  ASSERT_EQ(fields.size(), 3u);
  EXPECT_DOUBLE_EQ(fields.at("name").difference.distance, 2.0);
  EXPECT_FALSE(fields.at("event").difference.is_finite());
  EXPECT_FALSE(fields.at("organiser").difference.is_finite());
  EXPECT_FALSE(fields.at("organiser").required);
}

TEST(AlignmentComparator, MaxDifferenceOverRequired) {
  std::map<std::string, cc::FieldMeasurement> fields{
      {"name", measurement(1.5)},
      {"event", measurement(3.0)},
      {"footer", measurement(cc::kNotDetected, false)},
  };
  EXPECT_DOUBLE_EQ(cv_::max_difference(fields), 3.0);
  EXPECT_TRUE(cv_::all_required_detected(fields));

  fields["event"] = measurement(cc::kNotDetected);
  EXPECT_TRUE(std::isinf(cv_::max_difference(fields)));
  EXPECT_FALSE(cv_::all_required_detected(fields));
}

TEST(AlignmentComparator, MaxDifferenceNoRequiredIsZero) {
  std::map<std::string, cc::FieldMeasurement> fields{{"footer", measurement(9.0, false)}};
  EXPECT_DOUBLE_EQ(cv_::max_difference(fields), 0.0);
}

TEST(ImageDifference, IdenticalImages) {
  auto a = ct::gray_image(50, 40);
  ct::fill_rect(a, 5, 5, 10, 10);
  auto b = a;
  auto diff = cv_::image_difference(a, b);
  EXPECT_DOUBLE_EQ(diff.differing_fraction, 0.0);
  EXPECT_EQ(diff.max_channel_difference, 0);
  EXPECT_FALSE(diff.size_mismatch);
}

TEST(ImageDifference, CountsPixelsBeyondTolerance) {
  auto a = ct::gray_image(10, 10);
  auto b = ct::gray_image(10, 10);
  ct::fill_rect(b, 0, 0, 5, 2, 0);      // 10 pixels, difference 255
  ct::fill_rect(b, 0, 5, 10, 1, 254);   // 10 pixels, difference 1 (within tolerance)
  auto diff = cv_::image_difference(a, b, 1);
  EXPECT_DOUBLE_EQ(diff.differing_fraction, 0.10);
  EXPECT_EQ(diff.max_channel_difference, 255);
}

TEST(ImageDifference, SizeMismatch) {
  auto diff = cv_::image_difference(ct::gray_image(10, 10), ct::gray_image(10, 11));
  EXPECT_TRUE(diff.size_mismatch);
  EXPECT_DOUBLE_EQ(diff.differing_fraction, 1.0);
}
