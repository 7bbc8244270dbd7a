#pragma once
/** @file  StandardActions.hpp
 *  @brief The built-in action catalogue (`smu/*`, `relays/*`, `calibration/*`, `data/*`, `wait`).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

#include "calibration/Calibration.hpp"
#include "core/AbortFlag.hpp"
#include "core/Logger.hpp"
#include "hal/RelayClient.hpp"
#include "hal/SmuClient.hpp"
#include "io/ResultSink.hpp"
#include "protocols/ActionRegistry.hpp"

namespace ivlab::protocols {

  /// Everything a handler may touch. Shared with the coordinator.
  struct ActionServices {
    std::shared_ptr<hal::SmuClient> smu;
    std::shared_ptr<hal::RelayClient> relays;
    std::shared_ptr<calibration::CalibrationManager> calibration;
    std::shared_ptr<io::ResultSink> sink;
    std::shared_ptr<core::AbortFlag> abortFlag;
    std::shared_ptr<core::Logger> log;

    std::string dataDir{ "data" };
    std::string smuAddress;   ///< default for `smu/connect` on real hardware
    std::string relayAddress; ///< "pixelPort[,ledPort]"
    double lineFrequencyHz{ 50.0 };
  };

  /// Registers every catalogue entry; throws std::logic_error on a name clash.
  void registerStandardActions(ActionRegistry& registry, const ActionServices& services);

} // namespace ivlab::protocols
