/* @file PhotodetectorModel.cpp
 * @brief responsivity-based photodiode coupled to an LedModel.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <stdexcept>
#include <utility>

// ivlab headers
#include "sim/LedModel.hpp"
#include "sim/PhotodetectorModel.hpp"

using namespace ivlab::sim;

PhotodetectorParameters PhotodetectorParameters::fromJson(const nlohmann::json& j) {
  PhotodetectorParameters p;
  p.responsivity = j.value("responsivity", p.responsivity);
  p.darkCurrent = j.value("dark_current", p.darkCurrent);
  p.noiseFloor = j.value("noise_floor", p.noiseFloor);
  p.areaCm2 = j.value("area_cm2", p.areaCm2);
  p.shuntConductance = j.value("shunt_conductance", p.shuntConductance);
  if (p.responsivity < 0.0 || p.noiseFloor < 0.0 || p.areaCm2 <= 0.0 || p.shuntConductance < 0.0)
    throw std::invalid_argument("[PhotodetectorModel] non-physical detector parameters");
  return p;
}

PhotodetectorModel::PhotodetectorModel(PhotodetectorParameters params,
                                       std::shared_ptr<const LedModel> led,
                                       double couplingEfficiency, std::uint32_t seed)
    : params_(params), led_(std::move(led)), efficiency_(couplingEfficiency), rng_(seed) {
  if (!led_)
    throw std::invalid_argument("[PhotodetectorModel] coupled LED is nullptr");
  if (couplingEfficiency < 0.0 || couplingEfficiency > 1.0)
    throw std::invalid_argument("[PhotodetectorModel] coupling efficiency must be in [0, 1]");
}

double PhotodetectorModel::incidentPower() const { return led_->opticalPower() * efficiency_; }

double PhotodetectorModel::irradiance() const { return incidentPower() / params_.areaCm2; }

double PhotodetectorModel::photocurrent(double biasVoltage) {
  double current = params_.responsivity * incidentPower() + params_.darkCurrent;
  current += std::abs(biasVoltage) * params_.shuntConductance;
  if (params_.noiseFloor > 0.0)
    current += params_.noiseFloor * noise_(rng_);
  return current;
}
