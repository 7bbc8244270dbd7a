#pragma once
/** @file  LedModel.hpp
 *  @brief Simulated LED: exponential diode with series resistance.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace sim {

    /**
 * @struct LedParameters
 * @brief Diode-law constants for a multi-junction LED stack.
 *
 *  Junction current:  Id(Vd) = I_on * (exp((Vd - V_on) / V_s) - exp(-V_on / V_s))
 *  Terminal current:  I = I_max * tanh(Id / I_max)        (soft saturation)
 *  Terminal voltage:  V = Vd + I * R_s
 */
    struct LedParameters {
      double turnOnVoltage{ 7.0 };      ///< V_on, junction voltage at which Id == I_on
      double turnOnCurrent{ 30e-6 };    ///< I_on [A]
      double slopeVoltage{ 0.0484 };    ///< V_s = n·kT/q of the whole stack [V]
      double seriesResistance{ 25.0 };  ///< R_s [Ω]
      double maxCurrent{ 0.1 };         ///< I_max [A]
      double thresholdCurrent{ 1e-6 };  ///< below this no light is emitted [A]
      double slopeEfficiency{ 0.25 };   ///< optical W per A above threshold

      static LedParameters fromJson(const nlohmann::json& j);
    };

    struct LedOperatingPoint {
      double voltage{ 0.0 };      ///< terminal voltage [V]
      double current{ 0.0 };      ///< terminal current [A]
      double opticalPower{ 0.0 }; ///< emitted optical power [W]
    };

    /**
 * @class LedModel
 * @brief Solves the same I–V relation in both source directions.
 *
 *  * `drive*()` update the operating point seen by coupled photodetectors.
 *  * `*At()` helpers are pure and leave the operating point alone.
 */
    class LedModel {
    public:
      explicit LedModel(LedParameters params = {});

      //---pure relation-------------------------------------------------
      double currentAtVoltage(double volts) const;
      /// +inf / -inf when the current cannot flow at any finite voltage.
      double voltageAtCurrent(double amps) const;
      double opticalPowerAt(double amps) const;

      //---stateful drive------------------------------------------------
      LedOperatingPoint driveVoltage(double volts);
      LedOperatingPoint driveCurrent(double amps);
      void switchOff();

      const LedOperatingPoint& operatingPoint() const { return op_; }
      double opticalPower() const { return op_.opticalPower; }
      const LedParameters& parameters() const { return params_; }

    private:
      double junctionCurrent(double vd) const;
      double junctionVoltage(double id) const;

      LedParameters params_;
      LedOperatingPoint op_{};
    };

  } // namespace sim
} // namespace ivlab
