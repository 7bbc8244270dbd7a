#pragma once
/** @file  ScpiSmuBackend.hpp
 *  @brief Real SMU over SCPI (Keysight B29xx channel-suffixed command set).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>

#include "hal/SmuBackend.hpp"
#include "io/InstrumentLink.hpp"

namespace ivlab {
  namespace hal {

    /**
 * @class ScpiSmuBackend
 * @brief Translates channel operations into SCPI lines on an InstrumentLink.
 *
 *  * `SOUR{ch}:...`, `SENS{ch}:...`, `OUTP{ch}`, `MEAS:VOLT? (@ch)`.
 *  * Integration time is sent as NPLC using the mains frequency.
 */
    class ScpiSmuBackend : public SmuBackend {
    public:
      ScpiSmuBackend(std::unique_ptr<io::InstrumentLink> link, int channels, double lineFrequencyHz,
                     std::chrono::milliseconds ioTimeout);
      ~ScpiSmuBackend() override;

      BackendKind kind() const override { return BackendKind::Real; }
      int channelCount() const override { return channels_; }

      void open(std::chrono::milliseconds timeout) override;
      void close() override;
      std::string identify() override;

      void configure(int channel, const ChannelSettings& settings) override;
      void setSourceMode(int channel, Quantity mode) override;
      void setValue(int channel, double value) override;
      void setOutput(int channel, bool enabled) override;
      std::pair<double, double> measure(int channel) override;

      /// Integration time [s] → power-line cycles, clamped to the B29xx range.
      static double toNplc(double integrationTime, double lineFrequencyHz);

    private:
      void check(int channel) const;
      void send(const std::string& line);
      std::string query(const std::string& line);

      std::unique_ptr<io::InstrumentLink> link_;
      int channels_;
      double lineFrequencyHz_;
      std::chrono::milliseconds ioTimeout_;
      Quantity modes_[4]{ Quantity::Voltage, Quantity::Voltage, Quantity::Voltage, Quantity::Voltage };
      std::string idn_;
    };

  } // namespace hal
} // namespace ivlab
