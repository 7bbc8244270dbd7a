#pragma once
/** @file  PhotodetectorModel.hpp
 *  @brief Simulated silicon photodiode optically coupled to one LED.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <random>

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace sim {

    class LedModel;

    struct PhotodetectorParameters {
      double responsivity{ 0.4 };     ///< A/W
      double darkCurrent{ 1e-9 };     ///< A
      double noiseFloor{ 1e-12 };     ///< 1σ of the zero-mean noise [A]
      double areaCm2{ 0.01 };         ///< active area, for irradiance readout
      double shuntConductance{ 0.0 }; ///< bias leakage [S]; 0 disables it

      static PhotodetectorParameters fromJson(const nlohmann::json& j);
    };

    /**
 * @class PhotodetectorModel
 * @brief photocurrent = responsivity × (led.opticalPower × efficiency) + dark + noise
 *
 *  * Holds no state besides the coupling reference and its noise generator.
 */
    class PhotodetectorModel {
    public:
      PhotodetectorModel(PhotodetectorParameters params, std::shared_ptr<const LedModel> led,
                         double couplingEfficiency, std::uint32_t seed = 0);

      double incidentPower() const;            ///< W
      double irradiance() const;               ///< W/cm²
      double photocurrent(double biasVoltage); ///< A, noise included

      double couplingEfficiency() const { return efficiency_; }
      const PhotodetectorParameters& parameters() const { return params_; }

    private:
      PhotodetectorParameters params_;
      std::shared_ptr<const LedModel> led_;
      double efficiency_;
      std::mt19937 rng_;
      std::normal_distribution<double> noise_{ 0.0, 1.0 };
    };

  } // namespace sim
} // namespace ivlab
