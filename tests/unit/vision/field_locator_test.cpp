#include <certalign/vision/field_locator.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>

namespace cc = certalign::core;
namespace cv_ = certalign::vision;
namespace ct = certalign::test_support;

namespace {

cc::FieldSpec full_window(std::uint32_t min_ink = 20) {
  return ct::spec("name", 0.0, 1.0, min_ink);
}

}  // namespace

TEST(FieldLocator, BlankImageNotFound) {
  auto img = ct::gray_image(200, 100);
  auto pos = cv_::locate(img, full_window());
  EXPECT_FALSE(pos.found());
  EXPECT_FALSE(pos.center_x.has_value());
  EXPECT_FALSE(pos.center_y.has_value());
}

TEST(FieldLocator, InvalidImageNotFound) {
  cc::Image img;
  EXPECT_FALSE(cv_::locate(img, full_window()).found());
}

TEST(FieldLocator, SingleBlockCenter) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 100, 60, 100, 10);
  auto pos = cv_::locate(img, full_window());
  ASSERT_TRUE(pos.found());
  EXPECT_DOUBLE_EQ(*pos.center_y, 64.5);
  EXPECT_DOUBLE_EQ(*pos.center_x, 149.5);
  ASSERT_TRUE(pos.bounds.has_value());
  EXPECT_EQ(pos.bounds->top, 60u);
  EXPECT_EQ(pos.bounds->bottom, 69u);
  EXPECT_EQ(pos.bounds->left, 100u);
  EXPECT_EQ(pos.bounds->right, 199u);
}

TEST(FieldLocator, TextOutsideWindowIgnored) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 20, 10, 100, 10);
  auto pos = cv_::locate(img, ct::spec("name", 0.5, 1.0));
  EXPECT_FALSE(pos.found());
}

TEST(FieldLocator, WindowBeyondImageClamped) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 20, 90, 100, 10);
  auto pos = cv_::locate(img, ct::spec("name", 0.8, 1.7));
  ASSERT_TRUE(pos.found());
  EXPECT_DOUBLE_EQ(*pos.center_y, 94.5);
}

TEST(FieldLocator, EmptyWindowNotFound) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 20, 40, 100, 10);
  EXPECT_FALSE(cv_::locate(img, ct::spec("name", 0.6, 0.6)).found());
  EXPECT_FALSE(cv_::locate(img, ct::spec("name", 0.7, 0.2)).found());
}

TEST(FieldLocator, SparseRowsBelowMinInk) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 20, 40, 10, 10);
  EXPECT_FALSE(cv_::locate(img, full_window(20)).found());
  EXPECT_TRUE(cv_::locate(img, full_window(10)).found());
}

TEST(FieldLocator, LightPixelsAreNotInk) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 20, 40, 100, 10, 220);
  EXPECT_FALSE(cv_::locate(img, full_window()).found());
}

TEST(FieldLocator, SmallGapJoinsBand) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 50, 20, 100, 5);
  ct::fill_rect(img, 50, 27, 100, 5);  // two blank rows in between
  auto pos = cv_::locate(img, full_window());
  ASSERT_TRUE(pos.found());
  EXPECT_EQ(pos.bounds->top, 20u);
  EXPECT_EQ(pos.bounds->bottom, 31u);
  EXPECT_DOUBLE_EQ(*pos.center_y, 25.5);
}

TEST(FieldLocator, HeaviestBandWins) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 50, 10, 100, 4);
  ct::fill_rect(img, 20, 50, 160, 12);
  auto pos = cv_::locate(img, full_window());
  ASSERT_TRUE(pos.found());
  EXPECT_EQ(pos.bounds->top, 50u);
  EXPECT_EQ(pos.bounds->bottom, 61u);
  EXPECT_DOUBLE_EQ(*pos.center_x, 99.5);
}

TEST(FieldLocator, EqualBandsPreferTopmost) {
  auto img = ct::gray_image(200, 100);
  ct::fill_rect(img, 50, 10, 100, 6);
  ct::fill_rect(img, 50, 60, 100, 6);
  auto pos = cv_::locate(img, full_window());
  ASSERT_TRUE(pos.found());
  EXPECT_EQ(pos.bounds->top, 10u);
}

TEST(FieldLocator, ColorImageSupported) {
  cv_::SyntheticRenderer renderer(ct::small_layout());
  auto img = renderer.render(ct::sample_fields(), {});
  ASSERT_TRUE(img.has_value());
  auto pos = cv_::locate(*img, ct::small_specs()[0]);
  ASSERT_TRUE(pos.found());
  EXPECT_NEAR(*pos.center_y, 60.0, 1.0);
  EXPECT_NEAR(*pos.center_x, 200.0, 1.0);
}

TEST(FieldLocator, LocateAllReportsEverySpec) {
  cv_::SyntheticRenderer renderer(ct::small_layout());
  auto fields = ct::sample_fields();
  fields.erase("event");
  auto img = renderer.render(fields, {});
  ASSERT_TRUE(img.has_value());
  auto positions = cv_::locate_all(*img, ct::small_specs());
  ASSERT_EQ(positions.size(), 3u);
  EXPECT_TRUE(positions.at("name").found());
  EXPECT_FALSE(positions.at("event").found());
  EXPECT_TRUE(positions.at("organiser").found());
}
