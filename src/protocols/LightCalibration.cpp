/* @file LightCalibration.cpp
 * @brief LED sweep against a reference photodiode → CalibrationCurve.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cmath>

// ivlab headers
#include "core/Errors.hpp"
#include "protocols/LightCalibration.hpp"
#include "sweep/SweepGenerator.hpp"

namespace ivlab::protocols {

  using core::ValidationError;
  using hal::Quantity;

  LightCalibrationRequest LightCalibrationRequest::fromJson(const nlohmann::json& p) {
    if (!p.is_object())
      throw ValidationError("[LightCalibration] params must be an object");
    LightCalibrationRequest r;
    try {
      if (p.contains("currents")) {
        r.currents = p.at("currents").get<std::vector<double>>();
      } else if (p.contains("start")) {
        r.currents = sweep::generate(sweep::SweepSpec::fromJson(p));
      } else {
        throw ValidationError("[LightCalibration] give 'currents' or 'start/stop/points'");
      }
      r.ledChannel = p.value("led_channel", r.ledChannel);
      r.detectorChannel = p.value("detector_channel", r.detectorChannel);
      r.detectorBias = p.value("bias", r.detectorBias);
      r.responsivity = p.value("responsivity", r.responsivity);
      r.areaCm2 = p.value("area_cm2", r.areaCm2);
      r.settle = p.value("settle", r.settle);
      r.ledVoltageCompliance = p.value("compliance", r.ledVoltageCompliance);
      r.detectorCurrentCompliance = p.value("detector_compliance", r.detectorCurrentCompliance);
      r.integrationTime = p.value("integration_time", r.integrationTime);
      r.savePath = p.value("save_path", r.savePath);
    } catch (const nlohmann::json::exception& e) {
      throw ValidationError(std::string("[LightCalibration] malformed params: ") + e.what());
    }

    std::sort(r.currents.begin(), r.currents.end());
    r.currents.erase(std::unique(r.currents.begin(), r.currents.end()), r.currents.end());
    r.currents.erase(std::remove_if(r.currents.begin(), r.currents.end(),
                                    [](double i) { return !(i > 0.0) || !std::isfinite(i); }),
                     r.currents.end());
    if (r.currents.empty())
      throw ValidationError("[LightCalibration] at least one positive LED current is required");
    if (!(r.responsivity > 0.0) || !(r.areaCm2 > 0.0))
      throw ValidationError("[LightCalibration] responsivity and area_cm2 must be > 0");
    if (r.ledChannel == r.detectorChannel)
      throw ValidationError("[LightCalibration] LED and detector need different channels");
    if (r.settle < 0.0)
      throw ValidationError("[LightCalibration] settle must be >= 0");
    return r;
  }

  nlohmann::json runLightCalibration(hal::SmuClient& smu, calibration::CalibrationManager& calibration,
                                     const LightCalibrationRequest& req, const core::AbortFlag& abortFlag) {
    struct Raw {
      double ledCurrent;
      double pdCurrent;
    };
    std::vector<Raw> raw;
    raw.reserve(req.currents.size() + 1);

    auto outputsOff = [&] {
      smu.setOutput(false, req.ledChannel);
      smu.setOutput(false, req.detectorChannel);
    };

    try {
      smu.setSourceMode(Quantity::Current, req.ledChannel);
      smu.configure({ req.ledVoltageCompliance, Quantity::Voltage, req.integrationTime }, req.ledChannel);
      smu.setSourceMode(Quantity::Voltage, req.detectorChannel);
      smu.configure({ req.detectorCurrentCompliance, Quantity::Current, req.integrationTime }, req.detectorChannel);
      smu.setValue(req.detectorBias, req.detectorChannel);
      smu.setOutput(true, req.detectorChannel);
      smu.setValue(0.0, req.ledChannel);
      smu.setOutput(true, req.ledChannel);

      std::vector<double> drive{ 0.0 };
      drive.insert(drive.end(), req.currents.begin(), req.currents.end());
      for (double current : drive) {
        if (abortFlag.requested())
          throw core::AbortRequested();
        smu.setValue(current, req.ledChannel);
        if (req.settle > 0.0 && !abortFlag.sleepFor(std::chrono::duration<double>(req.settle)))
          throw core::AbortRequested();
        raw.push_back(Raw{ current, smu.measure(req.detectorChannel).current });
      }
    } catch (const std::exception&) {
      try {
        outputsOff();
      } catch (const std::exception&) {
        // keep the first failure
      }
      throw;
    }
    outputsOff();

    const double dark = std::abs(raw.front().pdCurrent);
    const double scale = req.responsivity * req.areaCm2;

    std::vector<calibration::CalibrationSample> samples;
    nlohmann::json rows = nlohmann::json::array();
    double floor = 0.0;
    for (const auto& r : raw) {
      const double corrected = r.ledCurrent == 0.0 ? 0.0 : std::abs(r.pdCurrent) - dark;
      const double irradiance = std::max(floor, std::max(corrected, 0.0) / scale);
      floor = irradiance;
      samples.push_back({ r.ledCurrent, irradiance });
      rows.push_back({ { "current", r.ledCurrent }, { "photodiode_current", r.pdCurrent }, { "irradiance", irradiance } });
    }

    calibration::CalibrationCurve curve(std::move(samples));
    if (!req.savePath.empty())
      curve.save(req.savePath);
    calibration.install(curve);

    return { { "points", rows.size() },
             { "dark_current", dark },
             { "responsivity", req.responsivity },
             { "area_cm2", req.areaCm2 },
             { "saved_to", req.savePath.empty() ? nlohmann::json(nullptr) : nlohmann::json(req.savePath) },
             { "samples", std::move(rows) } };
  }

} // namespace ivlab::protocols
