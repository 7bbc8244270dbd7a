#pragma once

/** @file  LabCoordinator.hpp
 *  @brief Public API for ivlab::core::LabCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "calibration/Calibration.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/LabConfig.hpp"
#include "core/Logger.hpp"
#include "core/RunManager.hpp"
#include "hal/RelayClient.hpp"
#include "hal/SmuClient.hpp"
#include "io/ResultSink.hpp"
#include "protocols/ActionRegistry.hpp"
#include "protocols/ProtocolEngine.hpp"
#include "protocols/ProtocolLoader.hpp"
#include "protocols/ProtocolRepository.hpp"
#include "sim/MockBench.hpp"

namespace ivlab {
  namespace core {

    /**
 * @class LabCoordinator
 * @brief Builds every subsystem from a LabConfig, wires fault escalation and
 *        safe-shutdown, and answers in the JSON shapes the HTTP layer serves.
 *
 *  * Transitions answer `{success, state}` or `{success:false, message}`.
 *  * At most one background run; its result is kept until the next one.
 */
    class LabCoordinator {

    public:
      /// Collaborators a caller (usually a test) may swap in.
      struct Overrides {
        std::shared_ptr<LogSink> logSink;
        std::shared_ptr<io::ResultSink> resultSink;
        std::shared_ptr<protocols::ProtocolRepository> repository;
        hal::SmuBackendFactory smuFactory;
        hal::RelayBackendFactory relayFactory;
      };

      explicit LabCoordinator(LabConfig config);
      LabCoordinator(LabConfig config, Overrides overrides);
      ~LabCoordinator(); ///< shutdown()

      LabCoordinator(const LabCoordinator&) = delete;
      LabCoordinator& operator=(const LabCoordinator&) = delete;

      //---run lifecycle-------------------------------------------------------
      nlohmann::json status() const; ///< run status + engine progress
      nlohmann::json arm();
      nlohmann::json start(const std::string& protocol = {});
      nlohmann::json complete();
      nlohmann::json abort();  ///< emergency stop
      nlohmann::json reset();  ///< also forgets reported faults

      //---protocols-------------------------------------------------------------
      nlohmann::json listProtocols();
      nlohmann::json reloadProtocols();
      nlohmann::json runProtocol(const std::string& id,
                                 const nlohmann::json& params = nlohmann::json::object());
      nlohmann::json runInline(const nlohmann::json& document,
                               const nlohmann::json& params = nlohmann::json::object());
      /// Validates and loads synchronously, executes on a background thread.
      nlohmann::json startProtocol(const std::string& id,
                                   const nlohmann::json& params = nlohmann::json::object());
      nlohmann::json progress() const;
      nlohmann::json lastResult() const; ///< null until a background run finishes
      bool waitForBackgroundRun();       ///< joins the worker; false if none was started

      //---devices-----------------------------------------------------------------
      nlohmann::json smuStatus() const { return smu_->status(); }
      nlohmann::json relayStatus() const { return relays_->status(); }
      nlohmann::json calibrationStatus() const { return calibration_->describe(); }

      /// Stops any run, safe-disconnects devices, stops the logger. Idempotent.
      void shutdown();

      //---components----------------------------------------------------------------
      const LabConfig& config() const { return config_; }
      std::shared_ptr<RunManager> runManager() const { return runManager_; }
      std::shared_ptr<ErrorMonitor> errorMonitor() const { return errorMonitor_; }
      std::shared_ptr<Logger> logger() const { return log_; }
      std::shared_ptr<hal::SmuClient> smu() const { return smu_; }
      std::shared_ptr<hal::RelayClient> relays() const { return relays_; }
      std::shared_ptr<calibration::CalibrationManager> calibration() const { return calibration_; }
      std::shared_ptr<sim::MockBench> bench() const { return bench_; }
      std::shared_ptr<protocols::ActionRegistry> registry() const { return registry_; }
      std::shared_ptr<protocols::ProtocolLoader> loader() const { return loader_; }
      std::shared_ptr<protocols::ProtocolEngine> engine() const { return engine_; }

    private:
      void initialize(Overrides overrides); ///< build + wire subsystems
      std::shared_ptr<LogSink> makeLogSink() const;
      hal::SmuBackendFactory defaultSmuFactory();
      hal::RelayBackendFactory defaultRelayFactory();

      nlohmann::json transition(const char* name, const std::function<void()>& fn);
      nlohmann::json execute(const protocols::ProtocolDefinition& def, const nlohmann::json& params);
      void joinWorker();

      LabConfig config_;

      std::shared_ptr<Logger> log_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<RunManager> runManager_;
      std::shared_ptr<sim::MockBench> bench_;
      std::shared_ptr<hal::SmuClient> smu_;
      std::shared_ptr<hal::RelayClient> relays_;
      std::shared_ptr<calibration::CalibrationManager> calibration_;
      std::shared_ptr<io::ResultSink> resultSink_;
      std::shared_ptr<protocols::ActionRegistry> registry_;
      std::shared_ptr<protocols::ProtocolLoader> loader_;
      std::shared_ptr<protocols::ProtocolEngine> engine_;

      mutable std::mutex workerMtx_;
      std::thread worker_;
      bool workerBusy_{ false };
      std::optional<nlohmann::json> lastResult_;
      bool shutDown_{ false };
    };

  } // namespace core
} // namespace ivlab
