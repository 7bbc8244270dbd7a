#pragma once
/** @file  InstrumentLink.hpp
 *  @brief Synchronous request/response transport to one physical instrument.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// ivlab headers
#include "core/ErrorMonitor.hpp" // links report dead transports to the error monitor
#include "io/Command.hpp"
#include "io/Response.hpp"
#include "io/SerialChannel.hpp" // SerialInstrumentLink owns a SerialChannel and requires full type knowledge

namespace ivlab {
  namespace io {

    /**
 * @class InstrumentLink
 * @brief What a real-hardware backend needs from the wire: write a line,
 *        write-then-read a line. Opaque to everything above the HAL.
 */
    class InstrumentLink {
    public:
      virtual ~InstrumentLink() = default;

      virtual void open() = 0;  ///< throws core::ConnectionError
      virtual void close() = 0;
      virtual bool isOpen() const = 0;

      virtual void send(const Command& cmd) = 0; ///< throws core::ConnectionError
      /// Throws core::ConnectionError when no line arrives within \p timeout.
      virtual Response query(const Command& cmd, std::chrono::milliseconds timeout) = 0;
      /// Reads one pending line if any shows up within \p timeout.
      virtual std::optional<Response> poll(std::chrono::milliseconds timeout) = 0;

      virtual std::string describe() const = 0;
    };

    /**
 * @class SerialInstrumentLink
 * @brief InstrumentLink over a tty (USB-serial SMU, Arduino relay board).
 */
    class SerialInstrumentLink : public InstrumentLink {
    public:
      SerialInstrumentLink(std::string device, int baud, std::shared_ptr<core::ErrorMonitor> errMonitor,
                           std::unique_ptr<SerialChannel> channel = nullptr);
      ~SerialInstrumentLink() override;

      //---public APIs------------------------------------------------------
      void open() override;
      void close() override;
      bool isOpen() const override;
      void send(const Command& cmd) override;
      Response query(const Command& cmd, std::chrono::milliseconds timeout) override;
      std::optional<Response> poll(std::chrono::milliseconds timeout) override;
      std::string describe() const override { return device_; }

    private:
      static constexpr std::size_t kMaxCommandBytes = 4096;

      [[noreturn]] void fail(const std::string& errMsg);

      std::string device_;
      int baud_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      std::unique_ptr<SerialChannel> channel_;
    };

  } // namespace io
} // namespace ivlab
