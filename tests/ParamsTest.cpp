#include "gtest/gtest.h"

#include <chrono>
#include <stdexcept>
#include <string>

#include "io/TimeFormat.hpp"
#include "models/params.hpp"

TEST(ParamsTest, DefaultsAreFourMinutePerKilometre) {
  SynthesisParams p;
  EXPECT_NEAR(p.avg_speed_mps, 4.1666667, 1e-6);
  EXPECT_DOUBLE_EQ(p.duration_factor, 1.3);
  EXPECT_EQ(p.avg_bpm, 100);
  EXPECT_EQ(p.avg_cadence, 80);
  EXPECT_FALSE(p.seed.has_value());
  EXPECT_NO_THROW(p.validate());
}

TEST(ParamsTest, PaceConversion) {
  EXPECT_NEAR(SynthesisParams::pace_to_speed(5.0), 3.3333333, 1e-6);
  EXPECT_THROW(SynthesisParams::pace_to_speed(0.0), std::invalid_argument);
  EXPECT_THROW(SynthesisParams::pace_to_speed(-2.0), std::invalid_argument);
}

TEST(ParamsTest, JsonOverlaysOnlyPresentKeys) {
  SynthesisParams base;
  base.avg_bpm = 140;
  base.track_name = "Base";

  const auto j = nlohmann::json::parse(R"({
    "avg_pace_min_per_km": 5.0,
    "avg_cadence": 170,
    "seed": 77,
    "include_cadence": false,
    "start_time": "2024-12-02T06:05:38Z"
  })");
  const auto p = SynthesisParams::from_json(j, base);
  EXPECT_NEAR(p.avg_speed_mps, 1000.0 / 300.0, 1e-9);
  EXPECT_EQ(p.avg_cadence, 170);
  EXPECT_EQ(p.avg_bpm, 140);
  EXPECT_EQ(p.track_name, "Base");
  ASSERT_TRUE(p.seed.has_value());
  EXPECT_EQ(*p.seed, 77u);
  EXPECT_FALSE(p.include_cadence);
  EXPECT_EQ(p.start_time_iso, "2024-12-02T06:05:38Z");
}

TEST(ParamsTest, NullSeedKeepsRandom) {
  const auto p =
      SynthesisParams::from_json(nlohmann::json::parse(R"({"seed": null})"));
  EXPECT_FALSE(p.seed.has_value());
}

TEST(ParamsTest, WrongTypeThrows) {
  const auto j = nlohmann::json::parse(R"({"avg_bpm": "fast"})");
  EXPECT_THROW(SynthesisParams::from_json(j), nlohmann::json::exception);
}

TEST(ParamsTest, ValidateRejectsUnusableValues) {
  SynthesisParams p;
  p.avg_speed_mps = -1.0;
  EXPECT_THROW(p.validate(), std::invalid_argument);

  p = SynthesisParams{};
  p.duration_factor = 0.0;
  EXPECT_THROW(p.validate(), std::invalid_argument);

  p = SynthesisParams{};
  p.poly_degree = -3;
  EXPECT_THROW(p.validate(), std::invalid_argument);

  p = SynthesisParams{};
  p.max_duration_s = 0;
  EXPECT_THROW(p.validate(), std::invalid_argument);

  p = SynthesisParams{};
  p.route_length_m = -10.0;
  EXPECT_THROW(p.validate(), std::invalid_argument);
}

TEST(ParamsTest, IsoTimestampRoundTrip) {
  const std::string iso = "2024-12-02T06:05:38Z";
  EXPECT_EQ(formatIsoUtc(parseIsoUtc(iso)), iso);
  EXPECT_EQ(formatIsoUtc(parseIsoUtc("2024-12-02T06:05:38")), iso);
  EXPECT_EQ(std::chrono::system_clock::to_time_t(parseIsoUtc(iso)),
            1733119538);
}

TEST(ParamsTest, BadTimestampThrows) {
  EXPECT_THROW(parseIsoUtc("yesterday"), std::runtime_error);
  EXPECT_THROW(parseIsoUtc("2024-12-02T06:05:38+01:00"), std::runtime_error);
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
