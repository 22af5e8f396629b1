#include <certalign/app/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace capp = certalign::app;
namespace cc = certalign::core;

TEST(Config, Defaults) {
  auto c = capp::default_config();
  ASSERT_EQ(c.fields.size(), 3u);
  EXPECT_EQ(c.fields[0].name, "name");
  EXPECT_EQ(c.fields[1].name, "event");
  EXPECT_EQ(c.fields[2].name, "organiser");
  EXPECT_DOUBLE_EQ(c.verifier.tolerance_px, 2.0);
  EXPECT_EQ(c.verifier.max_attempts, 10u);
  EXPECT_EQ(c.cache_ttl, std::chrono::hours(24));
  EXPECT_EQ(c.stats_capacity, 100u);
}

TEST(Config, ParsesOverrides) {
  auto c = capp::parse_config(R"(
# comment
reference_path = /data/template.png
tolerance_px = 1.5
max_attempts = 6
convergence_window = 4
step_decay = 0.25
attempt_budget_ms = 250
image_diff = yes
cache_ttl_seconds = 3600
cache_file = cache.json
stats_capacity = 20
log_level = debug
)");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->reference_path, "/data/template.png");
  EXPECT_DOUBLE_EQ(c->verifier.tolerance_px, 1.5);
  EXPECT_EQ(c->verifier.max_attempts, 6u);
  EXPECT_EQ(c->verifier.refiner.convergence_window, 4u);
  EXPECT_DOUBLE_EQ(c->verifier.refiner.step_decay, 0.25);
  EXPECT_EQ(c->verifier.attempt_budget, std::chrono::milliseconds(250));
  EXPECT_TRUE(c->verifier.compute_image_difference);
  EXPECT_EQ(c->cache_ttl, std::chrono::seconds(3600));
  EXPECT_EQ(c->cache_file, "cache.json");
  EXPECT_EQ(c->stats_capacity, 20u);
  EXPECT_EQ(c->log_level, "debug");
  EXPECT_EQ(c->fields.size(), 3u);
}

TEST(Config, FieldLinesReplaceDefaults) {
  auto c = capp::parse_config(
      "field = recipient, 0.1, 0.3\n"
      "field = course, 0.4, 0.6, 180, 30\n"
      "field = signature, 0.8, 0.95, 200, 10, optional\n");
  ASSERT_TRUE(c.has_value());
  ASSERT_EQ(c->fields.size(), 3u);
  EXPECT_EQ(c->fields[0].name, "recipient");
  EXPECT_DOUBLE_EQ(c->fields[0].search_window.y_min, 0.1);
  EXPECT_DOUBLE_EQ(c->fields[0].search_window.y_max, 0.3);
  EXPECT_TRUE(c->fields[0].required);
  EXPECT_EQ(c->fields[1].darkness_threshold, 180);
  EXPECT_EQ(c->fields[1].min_ink_pixels, 30u);
  EXPECT_FALSE(c->fields[2].required);
}

TEST(Config, UnknownKeyIgnored) {
  auto c = capp::parse_config("colour = blue\nmax_attempts = 3\n");
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->verifier.max_attempts, 3u);
}

TEST(Config, BadValuesRejected) {
  EXPECT_EQ(capp::parse_config("tolerance_px = wide").error(), cc::VerifyError::InvalidConfig);
  EXPECT_EQ(capp::parse_config("max_attempts = 0").error(), cc::VerifyError::InvalidConfig);
  EXPECT_EQ(capp::parse_config("field = name, 0.1").error(), cc::VerifyError::InvalidConfig);
  EXPECT_EQ(capp::parse_config("field = name, 0.1, 0.2, 300").error(),
            cc::VerifyError::InvalidConfig);
  EXPECT_EQ(capp::parse_config("field = name, 0.1, 0.2, 200, 5, sometimes").error(),
            cc::VerifyError::InvalidConfig);
  EXPECT_EQ(capp::parse_config("image_diff = maybe").error(), cc::VerifyError::InvalidConfig);
}

TEST(Config, LoadFromFile) {
  const auto path = (std::filesystem::temp_directory_path() / "certalign_config_test.conf").string();
  {
    std::ofstream f(path);
    f << "tolerance_px = 3\nstats_file = stats.json\n";
  }
  auto c = capp::load_config(path);
  ASSERT_TRUE(c.has_value());
  EXPECT_DOUBLE_EQ(c->verifier.tolerance_px, 3.0);
  EXPECT_EQ(c->stats_file, "stats.json");
  std::filesystem::remove(path);
}

TEST(Config, LoadMissingFile) {
  auto c = capp::load_config("/nonexistent/certalign.conf");
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error(), cc::VerifyError::LoadFailed);
}
