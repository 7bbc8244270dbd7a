#pragma once
/** @file  LabConfig.hpp
 *  @brief Typed view of the bench configuration file.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "calibration/Calibration.hpp"
#include "core/Logger.hpp"
#include "sim/MockBench.hpp"

namespace ivlab::core {

  struct LogConfig {
    std::string path;             ///< CSV event log; empty disables the file sink
    bool console{ true };
    LogLevel level{ LogLevel::Info };
    std::size_t queueCapacity{ 1024 };
  };

  struct SmuConfig {
    std::string address{ "/dev/ttyUSB0" };
    int baud{ 9600 };
    int channels{ 2 };
    std::chrono::milliseconds connectTimeout{ 5000 };
    std::chrono::milliseconds ioTimeout{ 3000 };
    double lineFrequencyHz{ 50.0 };
    double voltageCompliance{ 21.0 }; ///< used when sourcing current
  };

  struct RelayConfig {
    std::string pixelPort{ "/dev/ttyACM0" };
    std::string ledPort{ "/dev/ttyACM1" };
    int baud{ 115200 };
    std::chrono::milliseconds settle{ 50 };       ///< after every switch
    std::chrono::milliseconds resetDelay{ 2000 }; ///< Arduino reboots on open
    std::chrono::milliseconds connectTimeout{ 5000 };
  };

  struct CalibrationConfig {
    std::string path; ///< loaded at startup when non-empty
    calibration::ExtrapolationPolicy policy{ calibration::ExtrapolationPolicy::Strict };
  };

  /**
 * @struct LabConfig
 * @brief Every knob the coordinator needs, with defaults for a mock bench.
 */
  struct LabConfig {
    std::string protocolsDir{ "protocols" };
    std::string dataDir{ "data" };
    LogConfig log{};
    SmuConfig smu{};
    RelayConfig relays{};
    CalibrationConfig calibration{};
    sim::MockBenchConfig mock{};

    /// Missing keys keep their default; wrong types or ranges throw ValidationError.
    static LabConfig fromJson(const nlohmann::json& j);
  };

} // namespace ivlab::core
