#include "gtest/gtest.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "core/SpeedProfileGenerator.hpp"
#include "debug/ProfileInspect.hpp"

namespace {
constexpr double kAvgSpeed = 1000.0 / 240.0; // 4 min/km
}

TEST(SpeedProfileGeneratorTest, LengthMatchesAndFloorHolds) {
  SpeedProfileGenerator gen;
  for (uint64_t seed : {1u, 7u, 42u, 1234u}) {
    for (int T : {1, 2, 5, 11, 600, 2496}) {
      RandomStream rng(seed);
      const auto profile = gen.generate(T, kAvgSpeed, 0.2, rng);
      ASSERT_EQ(profile.size(), static_cast<size_t>(T));
      for (double v : profile) {
        EXPECT_TRUE(std::isfinite(v));
        EXPECT_GE(v, 0.90 * kAvgSpeed - 1e-12);
      }
    }
  }
}

TEST(SpeedProfileGeneratorTest, ZeroDurationIsEmpty) {
  SpeedProfileGenerator gen;
  RandomStream rng(3);
  EXPECT_TRUE(gen.generate(0, kAvgSpeed, 0.2, rng).empty());
  EXPECT_THROW(gen.generate(-1, kAvgSpeed, 0.2, rng), std::invalid_argument);
}

TEST(SpeedProfileGeneratorTest, SameSeedSameProfile) {
  SpeedProfileGenerator gen;
  RandomStream a(99), b(99), c(100);
  const auto pa = gen.generate(600, kAvgSpeed, 0.2, a);
  const auto pb = gen.generate(600, kAvgSpeed, 0.2, b);
  const auto pc = gen.generate(600, kAvgSpeed, 0.2, c);
  EXPECT_EQ(pa, pb);
  EXPECT_NE(pa, pc);
}

TEST(SpeedProfileGeneratorTest, LinearDecreaseWithoutNoise) {
  SpeedProfileGenerator::Params p;
  p.fluctuation_sd = 0.0;
  p.min_speed_ratio = 0.0;
  p.start_speed_ratio = 1.0; // flat desired series
  SpeedProfileGenerator gen(p);
  RandomStream rng(5);

  const int T = 101;
  const auto profile = gen.generate(T, 4.0, 1.0, rng);
  ASSERT_EQ(profile.size(), static_cast<size_t>(T));
  EXPECT_NEAR(profile.front(), 4.0, 1e-9);
  EXPECT_NEAR(profile[50], 3.5, 1e-9);
  EXPECT_NEAR(profile.back(), 3.0, 1e-9);
}

TEST(SpeedProfileGeneratorTest, FloorClampsSlowStart) {
  SpeedProfileGenerator::Params p;
  p.fluctuation_sd = 0.0;
  SpeedProfileGenerator gen(p);
  RandomStream rng(5);

  const auto profile = gen.generate(300, kAvgSpeed, 0.0, rng);
  // the 0.2x first sample pulls the fit down at the start; the floor lifts it
  EXPECT_NEAR(profile.front(), 0.90 * kAvgSpeed, 1e-12);
  EXPECT_GT(*std::max_element(profile.begin(), profile.end()),
            0.90 * kAvgSpeed);
}

TEST(SpeedProfileGeneratorTest, PolyfitRecoversPolynomial) {
  std::vector<double> y(50);
  for (size_t i = 0; i < y.size(); ++i) {
    const double t = static_cast<double>(i);
    y[i] = 2.0 + 3.0 * t + 0.5 * t * t;
  }
  const auto fit = SpeedProfileGenerator::polyfitSmooth(y, 10);
  ASSERT_EQ(fit.size(), y.size());
  for (size_t i = 0; i < y.size(); ++i)
    EXPECT_NEAR(fit[i], y[i], 1e-6 * std::max(1.0, std::fabs(y[i])));
}

TEST(SpeedProfileGeneratorTest, PolyfitCapsDegreeForShortSeries) {
  const std::vector<double> y = {1.0, 5.0, 2.0};
  const auto fit = SpeedProfileGenerator::polyfitSmooth(y, 10);
  ASSERT_EQ(fit.size(), 3u);
  for (size_t i = 0; i < y.size(); ++i)
    EXPECT_NEAR(fit[i], y[i], 1e-9);

  EXPECT_EQ(SpeedProfileGenerator::polyfitSmooth({7.5}, 10),
            std::vector<double>{7.5});
  EXPECT_TRUE(SpeedProfileGenerator::polyfitSmooth({}, 10).empty());
}

TEST(SpeedProfileGeneratorTest, SmoothingReducesNoise) {
  SpeedProfileGenerator::Params p;
  p.min_speed_ratio = 0.0;
  SpeedProfileGenerator gen(p);
  RandomStream rng(11);
  const auto profile = gen.generate(1200, kAvgSpeed, 0.0, rng);

  // raw noise has sd 1.8; consecutive smoothed samples barely move
  double max_step = 0.0;
  for (size_t i = 1; i < profile.size(); ++i)
    max_step = std::max(max_step, std::fabs(profile[i] - profile[i - 1]));
  EXPECT_LT(max_step, 0.5);
}

TEST(SpeedProfileGeneratorTest, SeriesStatsCountsBelowFloor) {
  const std::vector<double> y = {3.0, 4.0, 5.0, NAN};
  const auto st = series_stats(y, 3.5);
  EXPECT_EQ(st.n, 4u);
  EXPECT_DOUBLE_EQ(st.min, 3.0);
  EXPECT_DOUBLE_EQ(st.max, 5.0);
  EXPECT_DOUBLE_EQ(st.mean, 4.0);
  EXPECT_EQ(st.below, 1u);

  std::ostringstream os;
  print_profile_stats("speed", y, 4.0, 3.5, os);
  EXPECT_NE(os.str().find("below_floor=1"), std::string::npos);
}

TEST(SpeedProfileGeneratorTest, StatsOfGeneratedProfileRespectFloor) {
  SpeedProfileGenerator gen;
  RandomStream rng(17);
  const auto profile = gen.generate(900, 4.0, 0.2, rng);
  const auto st = series_stats(profile, 0.9 * 4.0);
  EXPECT_EQ(st.n, 900u);
  EXPECT_EQ(st.below, 0u);
  EXPECT_GE(st.min, 0.9 * 4.0 - 1e-12);
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
