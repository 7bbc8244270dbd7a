#pragma once
/** @file  SmuBackend.hpp
 *  @brief Capability interface every SMU implementation (mock or real) conforms to.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>
#include <utility>

#include "hal/SmuTypes.hpp"

namespace ivlab {
  namespace hal {

    /**
 * @class SmuBackend
 * @brief Stateless-looking, channel-addressed instrument operations.
 *
 *  * Channels are 1-based.
 *  * Not thread-safe; SmuClient serialises every call.
 */
    class SmuBackend {
    public:
      virtual ~SmuBackend() = default;

      virtual BackendKind kind() const = 0;
      virtual int channelCount() const = 0;

      /// Throws core::ConnectionError if the instrument does not answer within \p timeout.
      virtual void open(std::chrono::milliseconds timeout) = 0;
      virtual void close() = 0;
      virtual std::string identify() = 0;

      virtual void configure(int channel, const ChannelSettings& settings) = 0;
      virtual void setSourceMode(int channel, Quantity mode) = 0;
      virtual void setValue(int channel, double value) = 0;
      virtual void setOutput(int channel, bool enabled) = 0;

      /// (voltage, current). Throws core::DeviceFault on an overload reading.
      virtual std::pair<double, double> measure(int channel) = 0;
    };

  } // namespace hal
} // namespace ivlab
