// ivlab headers
#include "calibration/Calibration.hpp"
#include "core/Errors.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <cmath>
#include <filesystem>
#include <sstream>

using namespace ivlab::calibration;
using ivlab::core::CalibrationError;
using ivlab::core::ValidationError;

namespace {
  CalibrationCurve sampleCurve() {
    return CalibrationCurve({ { 0.0, 0.0 }, { 0.01, 0.002 }, { 0.02, 0.005 }, { 0.05, 0.011 } });
  }
} // namespace

TEST(calibration, round_trip_inside_the_sampled_domain) {
  CalibrationManager cal;
  cal.install(sampleCurve());
  for (double i : { 0.0, 0.003, 0.01, 0.017, 0.049, 0.05 }) {
    const double back = cal.irradianceToCurrent(cal.currentToIrradiance(i));
    EXPECT_NEAR(back, i, 1e-9 * std::max(1.0, std::abs(i))) << "at " << i;
  }
}

TEST(calibration, irradiance_round_trip_across_the_curve) {
  CalibrationManager cal;
  cal.install(sampleCurve());
  const auto [w0, w1] = sampleCurve().irradianceRange();
  for (int k = 0; k <= 40; ++k) {
    const double w = w0 + (w1 - w0) * k / 40.0;
    const double back = cal.currentToIrradiance(cal.irradianceToCurrent(w));
    EXPECT_NEAR(back, w, 1e-9 * std::max(w1, std::abs(w))) << "at " << w;
  }
}

TEST(calibration, irradiance_round_trip_over_a_dark_plateau) {
  // no light until 1 mA: every current on the plateau maps to zero irradiance
  CalibrationManager cal;
  cal.install(CalibrationCurve({ { 0.0, 0.0 }, { 0.001, 0.0 }, { 0.002, 0.001 }, { 0.004, 0.003 } }));
  for (double w : { 0.0, 0.00025, 0.0005, 0.001, 0.002, 0.003 }) {
    const double back = cal.currentToIrradiance(cal.irradianceToCurrent(w));
    EXPECT_NEAR(back, w, 1e-12) << "at " << w;
  }
  EXPECT_DOUBLE_EQ(cal.irradianceToCurrent(0.0005), 0.0015);
  EXPECT_DOUBLE_EQ(cal.currentToIrradiance(0.0005), 0.0);
}

TEST(calibration, round_trip_inputs_outside_the_domain) {
  CalibrationManager cal(ExtrapolationPolicy::Strict);
  cal.install(sampleCurve());
  EXPECT_THROW(cal.irradianceToCurrent(0.0111), CalibrationError);
  EXPECT_THROW(cal.currentToIrradiance(-1e-6), CalibrationError);

  cal.setPolicy(ExtrapolationPolicy::Clamp);
  EXPECT_DOUBLE_EQ(cal.currentToIrradiance(cal.irradianceToCurrent(0.02)), 0.011);
  EXPECT_DOUBLE_EQ(cal.currentToIrradiance(cal.irradianceToCurrent(-0.02)), 0.0);
  EXPECT_DOUBLE_EQ(cal.irradianceToCurrent(cal.currentToIrradiance(0.5)), 0.05);
}

TEST(calibration, non_finite_inputs_are_rejected_under_every_policy) {
  for (auto policy : { ExtrapolationPolicy::Strict, ExtrapolationPolicy::Clamp }) {
    CalibrationManager cal(policy);
    cal.install(sampleCurve());
    EXPECT_THROW(cal.currentToIrradiance(std::nan("")), CalibrationError);
    EXPECT_THROW(cal.irradianceToCurrent(std::nan("")), CalibrationError);
    EXPECT_THROW(cal.irradianceToCurrent(HUGE_VAL), CalibrationError);
  }
}

TEST(calibration, interpolates_linearly_between_samples) {
  CalibrationManager cal;
  cal.install(sampleCurve());
  EXPECT_NEAR(cal.currentToIrradiance(0.015), 0.0035, 1e-15);
  EXPECT_NEAR(cal.irradianceToCurrent(0.008), 0.035, 1e-12);
}

TEST(calibration, strict_policy_rejects_out_of_range) {
  CalibrationManager cal(ExtrapolationPolicy::Strict);
  cal.install(sampleCurve());
  EXPECT_THROW(cal.currentToIrradiance(0.06), CalibrationError);
  EXPECT_THROW(cal.irradianceToCurrent(-0.001), CalibrationError);
}

TEST(calibration, clamp_policy_returns_endpoints) {
  CalibrationManager cal(ExtrapolationPolicy::Clamp);
  cal.install(sampleCurve());
  EXPECT_DOUBLE_EQ(cal.currentToIrradiance(0.06), 0.011);
  EXPECT_DOUBLE_EQ(cal.currentToIrradiance(-1.0), 0.0);
  EXPECT_DOUBLE_EQ(cal.irradianceToCurrent(1.0), 0.05);
}

TEST(calibration, plateau_resolves_to_lowest_current) {
  CalibrationManager cal;
  cal.install(CalibrationCurve({ { 0.0, 0.0 }, { 0.001, 0.0 }, { 0.002, 0.001 } }));
  EXPECT_DOUBLE_EQ(cal.irradianceToCurrent(0.0), 0.0);
}

TEST(calibration, conversions_need_a_curve) {
  CalibrationManager cal;
  EXPECT_FALSE(cal.isLoaded());
  EXPECT_THROW(cal.currentToIrradiance(0.01), CalibrationError);
  EXPECT_FALSE(cal.describe().at("loaded").get<bool>());
}

TEST(calibration_curve, parses_two_and_three_column_tables) {
  std::istringstream two("LED_Current(A)\tIrradiance(W/cm2)\n"
                         "# bench 3\n"
                         "0.02\t0.005\n"
                         "0\t0\n"
                         "0.01\t0.002\n");
  const auto a = CalibrationCurve::parse(two);
  ASSERT_EQ(a.samples().size(), 3u);
  EXPECT_DOUBLE_EQ(a.samples().front().current, 0.0); // sorted on load
  EXPECT_DOUBLE_EQ(a.irradianceRange().second, 0.005);

  std::istringstream three("current,photodiode,irradiance\n"
                           "0,1e-9,0\n"
                           "0.01,4e-4,0.002\r\n");
  const auto b = CalibrationCurve::parse(three);
  ASSERT_EQ(b.samples().size(), 2u);
  EXPECT_DOUBLE_EQ(b.samples().back().irradiance, 0.002);
}

TEST(calibration_curve, rejects_invalid_tables) {
  EXPECT_THROW(CalibrationCurve({ { 0.0, 0.0 } }), ValidationError);
  EXPECT_THROW(CalibrationCurve({ { 0.0, 0.0 }, { 0.0, 0.1 } }), ValidationError);
  EXPECT_THROW(CalibrationCurve({ { 0.0, 0.2 }, { 0.01, 0.1 } }), ValidationError);

  std::istringstream garbage("0 0\n0.01 x\n");
  EXPECT_THROW(CalibrationCurve::parse(garbage), ValidationError);
  EXPECT_THROW(CalibrationCurve::load("/nonexistent/ivlab_cal.txt"), ivlab::core::NotFoundError);
}

TEST(calibration_curve, save_then_load_file) {
  const auto path = (std::filesystem::temp_directory_path() / "ivlab_cal_test.txt").string();
  sampleCurve().save(path);

  CalibrationManager cal;
  cal.loadFile(path);
  EXPECT_EQ(cal.describe().at("source"), path);
  EXPECT_EQ(cal.describe().at("points"), 4);
  EXPECT_NEAR(cal.currentToIrradiance(0.02), 0.005, 1e-12);
  std::filesystem::remove(path);
}

TEST(calibration, policy_names) {
  EXPECT_EQ(policyFromString("clamp"), ExtrapolationPolicy::Clamp);
  EXPECT_STREQ(toString(ExtrapolationPolicy::Strict), "strict");
  EXPECT_THROW(policyFromString("extrapolate"), ValidationError);
}
