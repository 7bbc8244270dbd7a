/* @file LedModel.cpp
 * @brief diode-law LED; voltage mode is solved by bisection on the junction voltage.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

// ivlab headers
#include "sim/LedModel.hpp"

using namespace ivlab::sim;

namespace {
  constexpr double kMaxExponent = 700.0; // exp() overflows a double just past 709
  constexpr int kBisectionSteps = 200;
} // namespace

LedParameters LedParameters::fromJson(const nlohmann::json& j) {
  LedParameters p;
  p.turnOnVoltage = j.value("turn_on_voltage", p.turnOnVoltage);
  p.turnOnCurrent = j.value("turn_on_current", p.turnOnCurrent);
  p.slopeVoltage = j.value("slope_voltage", p.slopeVoltage);
  p.seriesResistance = j.value("series_resistance", p.seriesResistance);
  p.maxCurrent = j.value("max_current", p.maxCurrent);
  p.thresholdCurrent = j.value("threshold_current", p.thresholdCurrent);
  p.slopeEfficiency = j.value("slope_efficiency", p.slopeEfficiency);
  if (p.turnOnCurrent <= 0.0 || p.slopeVoltage <= 0.0 || p.maxCurrent <= 0.0 ||
      p.seriesResistance < 0.0 || p.slopeEfficiency < 0.0)
    throw std::invalid_argument("[LedModel] non-physical LED parameters");
  return p;
}

LedModel::LedModel(LedParameters params) : params_(params) {}

double LedModel::junctionCurrent(double vd) const {
  const double e = std::min((vd - params_.turnOnVoltage) / params_.slopeVoltage, kMaxExponent);
  const double floor = std::exp(-params_.turnOnVoltage / params_.slopeVoltage);
  return params_.turnOnCurrent * (std::exp(e) - floor);
}

double LedModel::junctionVoltage(double id) const {
  const double floor = std::exp(-params_.turnOnVoltage / params_.slopeVoltage);
  const double arg = id / params_.turnOnCurrent + floor;
  if (arg <= 0.0)
    return -std::numeric_limits<double>::infinity();
  return params_.turnOnVoltage + params_.slopeVoltage * std::log(arg);
}

double LedModel::currentAtVoltage(double volts) const {
  auto terminal = [this](double vd) {
    return params_.maxCurrent * std::tanh(junctionCurrent(vd) / params_.maxCurrent);
  };

  // h(vd) = vd + R·I(vd) − V is strictly increasing; its root lies between 0 and V
  double lo = std::min(volts, 0.0);
  double hi = std::max(volts, 0.0);
  for (int i = 0; i < kBisectionSteps && hi - lo > 0.0; ++i) {
    const double mid = 0.5 * (lo + hi);
    if (mid == lo || mid == hi)
      break;
    const double h = mid + params_.seriesResistance * terminal(mid) - volts;
    if (h > 0.0)
      hi = mid;
    else
      lo = mid;
  }
  return terminal(0.5 * (lo + hi));
}

double LedModel::voltageAtCurrent(double amps) const {
  if (amps >= params_.maxCurrent)
    return std::numeric_limits<double>::infinity();
  if (amps <= -params_.maxCurrent)
    return -std::numeric_limits<double>::infinity();
  const double id = params_.maxCurrent * std::atanh(amps / params_.maxCurrent);
  const double vd = junctionVoltage(id);
  if (!std::isfinite(vd))
    return vd;
  return vd + amps * params_.seriesResistance;
}

double LedModel::opticalPowerAt(double amps) const {
  if (amps <= params_.thresholdCurrent)
    return 0.0;
  return params_.slopeEfficiency * (amps - params_.thresholdCurrent);
}

LedOperatingPoint LedModel::driveVoltage(double volts) {
  const double i = currentAtVoltage(volts);
  op_ = LedOperatingPoint{ volts, i, opticalPowerAt(i) };
  return op_;
}

LedOperatingPoint LedModel::driveCurrent(double amps) {
  const double v = voltageAtCurrent(amps);
  if (!std::isfinite(v))
    throw std::domain_error("[LedModel] " + std::to_string(amps) +
                            " A cannot flow through the LED at any voltage");
  op_ = LedOperatingPoint{ v, amps, opticalPowerAt(amps) };
  return op_;
}

void LedModel::switchOff() { op_ = LedOperatingPoint{}; }
