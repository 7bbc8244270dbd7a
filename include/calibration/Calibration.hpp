#pragma once
/** @file  Calibration.hpp
 *  @brief LED drive current ↔ optical irradiance conversion.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace calibration {

    struct CalibrationSample {
      double current{ 0.0 };    ///< LED drive current [A]
      double irradiance{ 0.0 }; ///< W/cm²
    };

    /// What happens to a value outside the sampled domain.
    enum class ExtrapolationPolicy {
      Strict, ///< throw core::CalibrationError
      Clamp   ///< return the nearest endpoint
    };

    const char* toString(ExtrapolationPolicy p);
    ExtrapolationPolicy policyFromString(const std::string& text);

    /**
 * @class CalibrationCurve
 * @brief Immutable sample table: ≥ 2 points, current strictly increasing,
 *        irradiance non-decreasing.
 */
    class CalibrationCurve {
    public:
      /// Throws core::ValidationError if the invariants do not hold.
      explicit CalibrationCurve(std::vector<CalibrationSample> samples);

      const std::vector<CalibrationSample>& samples() const { return samples_; }
      std::pair<double, double> currentRange() const;
      std::pair<double, double> irradianceRange() const;

      /** Reads 2-column `(current, irradiance)` or 3-column
       *  `(current, photodiode current, irradiance)` text, tab / comma /
       *  space separated, optional header line, `#` comments. Rows are sorted
       *  by current before validation. */
      static CalibrationCurve parse(std::istream& in);
      static CalibrationCurve load(const std::string& path);

      /// Two-column table with header.
      void write(std::ostream& out) const;
      void save(const std::string& path) const;

    private:
      std::vector<CalibrationSample> samples_;
    };

    /**
 * @class CalibrationManager
 * @brief Thread-safe holder of the active curve plus the extrapolation policy.
 *
 *  * Piecewise-linear in both directions, so the two conversions are
 *    inverses on the sampled domain.
 *  * On an irradiance plateau the lowest matching current wins.
 */
    class CalibrationManager {
    public:
      explicit CalibrationManager(ExtrapolationPolicy policy = ExtrapolationPolicy::Strict);

      void install(CalibrationCurve curve);
      void loadFile(const std::string& path);
      void clear();
      bool isLoaded() const;

      ExtrapolationPolicy policy() const;
      void setPolicy(ExtrapolationPolicy policy);

      /// Throws core::CalibrationError when nothing is loaded or (strict) out of range.
      double currentToIrradiance(double current) const;
      double irradianceToCurrent(double irradiance) const;

      std::optional<CalibrationCurve> curve() const;

      /// `{loaded, policy, source, points, current_range, irradiance_range}`
      nlohmann::json describe() const;

    private:
      const CalibrationCurve& requireCurve() const;

      mutable std::mutex mtx_;
      std::optional<CalibrationCurve> curve_;
      std::string source_;
      ExtrapolationPolicy policy_;
    };

  } // namespace calibration
} // namespace ivlab
