#pragma once
/** @file  ArduinoRelayBackend.hpp
 *  @brief Two Arduino relay boards speaking the numeric line protocol.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>

#include "core/AbortFlag.hpp"
#include "hal/RelayBackend.hpp"
#include "io/InstrumentLink.hpp"

namespace ivlab {
  namespace hal {

    /**
 * @class ArduinoRelayBackend
 * @brief Relay `n` (1-based on the wire) off is "n", on is "offset+n".
 *
 *  * Pixel board offset 100, LED board offset 10.
 *  * The boards reboot when the port opens; `open()` waits `resetDelay`
 *    before the first command.
 *  * Replies are optional; anything pending is drained after the settle time.
 */
    class ArduinoRelayBackend : public RelayBackend {
    public:
      static constexpr int kPixelOffset = 100;
      static constexpr int kLedOffset = 10;

      ArduinoRelayBackend(std::unique_ptr<io::InstrumentLink> pixelLink, std::unique_ptr<io::InstrumentLink> ledLink,
                          std::chrono::milliseconds settle, std::chrono::milliseconds resetDelay);
      ~ArduinoRelayBackend() override;

      BackendKind kind() const override { return BackendKind::Real; }
      void open(std::chrono::milliseconds timeout) override;
      void close() override;
      void setRelay(RelayBoard board, int relay, bool on) override;
      bool hasBoard(RelayBoard board) const override { return board == RelayBoard::Pixel || ledLink_ != nullptr; }

      /// Wire command for one switch, e.g. (Pixel, 0, true) → "101".
      static std::string commandFor(RelayBoard board, int relay, bool on);

    private:
      io::InstrumentLink& linkFor(RelayBoard board);

      std::unique_ptr<io::InstrumentLink> pixelLink_;
      std::unique_ptr<io::InstrumentLink> ledLink_; ///< may be null: pixel board only
      std::chrono::milliseconds settle_;
      std::chrono::milliseconds resetDelay_;
    };

  } // namespace hal
} // namespace ivlab
