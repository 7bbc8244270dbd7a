#pragma once
/** @file  RelayClient.hpp
 *  @brief Owner of the relay session: exclusive pixel / LED-channel selection.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "hal/RelayBackend.hpp"

namespace ivlab {
  namespace hal {

    using RelayBackendFactory = std::function<std::unique_ptr<RelayBackend>(BackendKind, const std::string& address)>;

    /// Current selection; nullopt means every relay of that board is open.
    struct RelaySelection {
      std::optional<int> pixel;
      std::optional<int> led;
    };

    /**
 * @class RelayClient
 * @brief At most one relay session; selecting one pixel (LED) deselects the others.
 *
 *  * One mutex per client: calls never interleave on the boards.
 */
    class RelayClient {
    public:
      static constexpr int kPixelCount = 8;
      static constexpr int kLedCount = 4;

      RelayClient(RelayBackendFactory factory, std::shared_ptr<core::ErrorMonitor> errorMonitor,
                  std::shared_ptr<core::Logger> log = nullptr,
                  std::chrono::milliseconds defaultConnectTimeout = std::chrono::milliseconds{ 5000 });
      ~RelayClient();

      RelayClient(const RelayClient&) = delete;
      RelayClient& operator=(const RelayClient&) = delete;

      void connect(BackendKind kind, const std::string& address = {},
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);
      void disconnect();
      /// All relays off, then close. Never throws; failures are logged.
      void safeDisconnect();
      bool isConnected() const;

      void selectPixel(int pixel); ///< 0..7, throws core::ValidationError otherwise
      void selectLed(int channel); ///< 0..3
      void allOff();

      RelaySelection selection() const;
      /// `{connected, backend, address, pixel, led}`
      nlohmann::json status() const;

    private:
      struct Session {
        std::unique_ptr<RelayBackend> backend;
        std::string address;
        RelaySelection selection;
      };

      Session& requireSession();
      void select(RelayBoard board, int index, int count, std::optional<int>& current);
      void allOffLocked(Session& s);
      void closeLocked();
      void log(core::LogLevel level, const std::string& message,
               nlohmann::json fields = nlohmann::json::object()) const;

      RelayBackendFactory factory_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      std::shared_ptr<core::Logger> log_;
      std::chrono::milliseconds defaultConnectTimeout_;

      mutable std::mutex mtx_;
      std::optional<Session> session_;
    };

  } // namespace hal
} // namespace ivlab
