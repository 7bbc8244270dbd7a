#pragma once
/** @file  LightCalibration.hpp
 *  @brief Measures an LED current → irradiance curve with a reference photodiode.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "calibration/Calibration.hpp"
#include "core/AbortFlag.hpp"
#include "hal/SmuClient.hpp"

namespace ivlab::protocols {

  struct LightCalibrationRequest {
    std::vector<double> currents;     ///< LED drive points [A], > 0; a dark point is added
    int ledChannel{ 1 };
    int detectorChannel{ 2 };
    double detectorBias{ 0.0 };       ///< V
    double responsivity{ 0.2 };       ///< A/W of the reference diode
    double areaCm2{ 1.0 };            ///< reference diode active area
    double settle{ 0.1 };             ///< s between set and measure
    double ledVoltageCompliance{ 21.0 };
    double detectorCurrentCompliance{ 0.01 };
    double integrationTime{ 0.02 };
    std::string savePath;             ///< two-column table written here when non-empty

    /** `currents:[...]` or `start, stop, points`; plus `led_channel,
     *  detector_channel, bias, responsivity, area_cm2, settle, compliance,
     *  detector_compliance, integration_time, save_path`. */
    static LightCalibrationRequest fromJson(const nlohmann::json& params);
  };

  /**
   * Dark point at 0 A first, then every requested current. Dark-corrected
   * photocurrent becomes irradiance `|I_pd - I_dark| / (R · A)`; the curve is
   * forced non-decreasing (running maximum) before it is installed, so
   * detector noise on a flat tail cannot break the curve invariant.
   *
   * Both outputs are off when this returns or throws. Throws
   * core::AbortRequested when the abort flag is seen between points.
   */
  nlohmann::json runLightCalibration(hal::SmuClient& smu, calibration::CalibrationManager& calibration,
                                     const LightCalibrationRequest& request, const core::AbortFlag& abortFlag);

} // namespace ivlab::protocols
