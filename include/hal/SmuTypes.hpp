#pragma once
/** @file  SmuTypes.hpp
 *  @brief Value types shared by SMU backends, the SMU client and its callers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace hal {

    enum class BackendKind { Mock, Real };
    enum class Quantity { Voltage, Current };

    const char* toString(BackendKind k);
    const char* toString(Quantity q);
    /// "mock" | "real"
    BackendKind backendKindFromString(const std::string& text);
    /// "voltage" | "volt" | "VOLT" | "current" | "curr" | "CURR" ...
    Quantity quantityFromString(const std::string& text);

    /// Compliance is always on the quantity that is *not* sourced.
    inline Quantity complementOf(Quantity q) {
      return q == Quantity::Voltage ? Quantity::Current : Quantity::Voltage;
    }

    struct ChannelSettings {
      double compliance{ 0.1 };                      ///< limit value [A or V]
      Quantity complianceType{ Quantity::Current };  ///< which quantity is limited
      double integrationTime{ 0.02 };                ///< seconds per reading
    };

    /// One reading. `setValue` is the sourced value that produced it.
    struct Measurement {
      double setValue{ 0.0 };
      double voltage{ 0.0 };
      double current{ 0.0 };
      double timestamp{ 0.0 }; ///< seconds since the Unix epoch

      nlohmann::json toJson() const;
    };

    struct SweepResult {
      std::vector<Measurement> points;
      bool aborted{ false };
      Quantity sourceMode{ Quantity::Voltage };
      int channel{ 1 };

      /// `{points, aborted, source_mode, channel, results:[{set_value, voltage, current, timestamp}]}`
      nlohmann::json toJson() const;
    };

    /// Per-call overrides for sweep / list_sweep.
    struct SweepOptions {
      std::optional<int> channel;
      std::optional<Quantity> sourceMode;
      std::optional<double> compliance;
      double integrationTime{ 0.0 }; ///< 0 keeps the configured value
      double delay{ 0.0 };           ///< settle time between set and measure [s]
    };

    double epochSeconds(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

  } // namespace hal
} // namespace ivlab
