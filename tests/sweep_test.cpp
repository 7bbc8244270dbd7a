// ivlab headers
#include "core/Errors.hpp"
#include "sweep/SweepGenerator.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <cmath>

using namespace ivlab::sweep;
using ivlab::core::ValidationError;

namespace {
  SweepSpec linear(double start, double stop, std::size_t points) {
    SweepSpec s;
    s.start = start;
    s.stop = stop;
    s.points = points;
    return s;
  }
} // namespace

TEST(sweep_generator, linear_zero_to_eight_in_41_points) {
  const auto v = generate(linear(0.0, 8.0, 41));
  ASSERT_EQ(v.size(), 41u);
  EXPECT_DOUBLE_EQ(v.front(), 0.0);
  EXPECT_DOUBLE_EQ(v.back(), 8.0);
  for (std::size_t i = 1; i < v.size(); ++i)
    EXPECT_NEAR(v[i] - v[i - 1], 0.2, 1e-12);
}

TEST(sweep_generator, log_decades_have_constant_ratio) {
  auto spec = linear(1e-6, 1e-3, 4);
  spec.distribution = Distribution::Log;
  const auto v = generate(spec);
  ASSERT_EQ(v.size(), 4u);
  EXPECT_DOUBLE_EQ(v.front(), 1e-6);
  EXPECT_DOUBLE_EQ(v.back(), 1e-3);
  for (std::size_t i = 1; i < v.size(); ++i)
    EXPECT_NEAR(v[i] / v[i - 1], 10.0, 1e-9);
}

TEST(sweep_generator, negative_log_sweep_keeps_sign) {
  auto spec = linear(-1e-3, -1e-6, 4);
  spec.distribution = Distribution::Log;
  for (double x : generate(spec))
    EXPECT_LT(x, 0.0);
}

TEST(sweep_generator, descending_reverses_the_forward_leg) {
  auto spec = linear(0.0, 1.0, 3);
  spec.direction = Direction::Descending;
  EXPECT_EQ(generate(spec), (std::vector<double>{ 1.0, 0.5, 0.0 }));
}

TEST(sweep_generator, double_sweep_does_not_repeat_turning_point) {
  auto spec = linear(0.0, 1.0, 3);
  spec.doubleSweep = true;
  EXPECT_EQ(generate(spec), (std::vector<double>{ 0.0, 0.5, 1.0, 0.5, 0.0 }));
}

TEST(sweep_generator, step_count_tolerates_rounding) {
  SweepSpec s;
  s.start = 0.0;
  s.stop = 1.0;
  s.step = 0.1;
  EXPECT_EQ(pointCount(s), 11u);

  s.start = 1.0;
  s.stop = 0.0;
  const auto v = generate(s);
  ASSERT_EQ(v.size(), 11u);
  EXPECT_LT(v[1], v[0]);
}

TEST(sweep_generator, point_count_is_capped) {
  SweepSpec tiny;
  tiny.start = 0.0;
  tiny.stop = 8.0;
  tiny.step = 1e-12;
  EXPECT_THROW(pointCount(tiny), ValidationError);
  EXPECT_THROW(generate(tiny), ValidationError);

  EXPECT_THROW(generate(linear(0.0, 1.0, kMaxPoints + 1)), ValidationError);
  EXPECT_EQ(generate(linear(0.0, 1.0, kMaxPoints)).size(), kMaxPoints);

  SweepSpec atCap;
  atCap.start = 0.0;
  atCap.stop = static_cast<double>(kMaxPoints - 1);
  atCap.step = 1.0;
  EXPECT_EQ(pointCount(atCap), kMaxPoints);
  atCap.stop += 1.0;
  EXPECT_THROW(pointCount(atCap), ValidationError);
}

TEST(sweep_generator, single_point_is_start) {
  EXPECT_EQ(generate(linear(3.3, 5.0, 1)), (std::vector<double>{ 3.3 }));
}

TEST(sweep_generator, invalid_specs_are_rejected) {
  auto both = linear(0.0, 1.0, 3);
  both.step = 0.5;
  EXPECT_THROW(validate(both), ValidationError);

  SweepSpec neither;
  neither.stop = 1.0;
  EXPECT_THROW(validate(neither), ValidationError);

  auto logZero = linear(0.0, 1.0, 3);
  logZero.distribution = Distribution::Log;
  EXPECT_THROW(generate(logZero), ValidationError);

  auto logCross = linear(-1.0, 1.0, 3);
  logCross.distribution = Distribution::Log;
  EXPECT_THROW(generate(logCross), ValidationError);

  auto nan = linear(std::nan(""), 1.0, 3);
  EXPECT_THROW(generate(nan), ValidationError);
}

TEST(sweep_spec, reads_json_parameters) {
  const auto s = SweepSpec::fromJson(
      { { "start", 1e-6 }, { "stop", 1e-3 }, { "points", 4 }, { "scale", "log" }, { "double", true } });
  EXPECT_EQ(s.distribution, Distribution::Log);
  EXPECT_TRUE(s.doubleSweep);
  EXPECT_EQ(generate(s).size(), 7u);

  EXPECT_THROW(SweepSpec::fromJson({ { "start", 0 } }), ValidationError);
  EXPECT_THROW(SweepSpec::fromJson({ { "start", 0 }, { "stop", 1 }, { "points", 0 } }), ValidationError);
  EXPECT_THROW(SweepSpec::fromJson({ { "start", 0 }, { "stop", 1 }, { "points", 2 }, { "direction", "up" } }),
               ValidationError);
}
