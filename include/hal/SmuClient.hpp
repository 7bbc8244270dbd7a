#pragma once
/** @file  SmuClient.hpp
 *  @brief Owner of the single SMU session; backend-agnostic entry point for handlers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/AbortFlag.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "hal/SmuBackend.hpp"
#include "sweep/SweepGenerator.hpp"

namespace ivlab {
  namespace hal {

    /// Builds the backend for a connect request; real backends get \p address.
    using SmuBackendFactory = std::function<std::unique_ptr<SmuBackend>(BackendKind, const std::string& address)>;

    /**
 * @class SmuClient
 * @brief At most one session; one in-flight operation per session.
 *
 *  * Every public call takes the session mutex, so a second caller blocks
 *    until the first returns (a sweep holds it for its whole duration).
 *  * `sweep` / `listSweep` look at the abort flag before each point and
 *    return the partial result with `aborted = true`.
 *  * Output is always switched off when a sweep ends, however it ends.
 *  * `connect` failures are reported to the ErrorMonitor before rethrowing.
 *  * A channel switched to current sourcing without a voltage compliance of
 *    its own gets the configured voltage limit first.
 */
    class SmuClient {
    public:
      SmuClient(SmuBackendFactory factory, std::shared_ptr<core::AbortFlag> abortFlag,
                std::shared_ptr<core::ErrorMonitor> errorMonitor, std::shared_ptr<core::Logger> log = nullptr,
                std::chrono::milliseconds defaultConnectTimeout = std::chrono::milliseconds{ 5000 });
      ~SmuClient();

      SmuClient(const SmuClient&) = delete;
      SmuClient& operator=(const SmuClient&) = delete;

      //---session-----------------------------------------------------------
      /// Safe-disconnects an existing session first.
      void connect(BackendKind kind, const std::string& address = {}, int channel = 1,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);
      void disconnect();
      /// Output off on every channel, then close. Never throws; failures are logged.
      void safeDisconnect();
      /// Output off on every channel, session stays. Never throws.
      void safeOutputOff();
      bool isConnected() const;

      /// Voltage compliance for current sourcing; unset leaves channel settings alone.
      void setCurrentSourceVoltageLimit(std::optional<double> volts);

      //---channel operations (default: the channel given to connect)-------
      void configure(const ChannelSettings& settings, std::optional<int> channel = std::nullopt);
      void setSourceMode(Quantity mode, std::optional<int> channel = std::nullopt);
      void setValue(double value, std::optional<int> channel = std::nullopt);
      void setOutput(bool enabled, std::optional<int> channel = std::nullopt);
      Measurement measure(std::optional<int> channel = std::nullopt);

      //---multi-point---------------------------------------------------------
      SweepResult sweep(const sweep::SweepSpec& spec, SweepOptions options = {});
      SweepResult listSweep(const std::vector<double>& values, const SweepOptions& options = {});

      /// `{connected, backend, address, channel, channels, identity, channel_state:[...]}`
      nlohmann::json status() const;

    private:
      struct ChannelState {
        ChannelSettings settings{};
        Quantity mode{ Quantity::Voltage };
        double value{ 0.0 };
        bool output{ false };
      };

      struct Session {
        std::unique_ptr<SmuBackend> backend;
        std::string address;
        int channel{ 1 };
        std::string identity;
        std::vector<ChannelState> channels;
      };

      Session& requireSession();
      int resolve(const Session& s, std::optional<int> channel) const;
      void outputsOffLocked(Session& s);
      void limitVoltageLocked(Session& s, int ch);
      void closeLocked();
      void log(core::LogLevel level, const std::string& message, nlohmann::json fields = nlohmann::json::object()) const;

      SmuBackendFactory factory_;
      std::shared_ptr<core::AbortFlag> abortFlag_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      std::shared_ptr<core::Logger> log_;
      std::chrono::milliseconds defaultConnectTimeout_;
      std::optional<double> voltageLimit_;

      mutable std::mutex mtx_;
      std::optional<Session> session_;
    };

  } // namespace hal
} // namespace ivlab
