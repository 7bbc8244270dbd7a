#pragma once
/** @file  RelayBackend.hpp
 *  @brief Capability interface of a relay multiplexer (pixel board + LED board).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>
#include <vector>

#include "hal/SmuTypes.hpp"

namespace ivlab {
  namespace hal {

    enum class RelayBoard { Pixel, Led };

    const char* toString(RelayBoard b);

    class RelayBackend {
    public:
      virtual ~RelayBackend() = default;

      virtual BackendKind kind() const = 0;
      virtual void open(std::chrono::milliseconds timeout) = 0; ///< throws core::ConnectionError
      virtual void close() = 0;

      /// \p relay is 0-based. Not thread-safe; RelayClient serialises calls.
      virtual void setRelay(RelayBoard board, int relay, bool on) = 0;

      /// False when the board is not fitted (pixel-only setups).
      virtual bool hasBoard(RelayBoard) const { return true; }
    };

    /**
 * @class MockRelayBackend
 * @brief Records every switch so tests can check exclusivity and ordering.
 */
    class MockRelayBackend : public RelayBackend {
    public:
      struct Switch {
        RelayBoard board;
        int relay;
        bool on;
      };

      BackendKind kind() const override { return BackendKind::Mock; }
      void open(std::chrono::milliseconds) override { open_ = true; }
      void close() override { open_ = false; }
      void setRelay(RelayBoard board, int relay, bool on) override;

      bool isOpen() const { return open_; }
      const std::vector<Switch>& history() const { return history_; }

    private:
      bool open_{ false };
      std::vector<Switch> history_;
    };

  } // namespace hal
} // namespace ivlab
