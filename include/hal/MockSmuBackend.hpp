#pragma once
/** @file  MockSmuBackend.hpp
 *  @brief Two-channel simulated SMU wired to the MockBench device models.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <memory>

#include "hal/SmuBackend.hpp"
#include "sim/MockBench.hpp"

namespace ivlab {
  namespace hal {

    /**
 * @class MockSmuBackend
 * @brief Channel 1 drives the LED, channel 2 biases the photodetector.
 *
 *  * Compliance is enforced the way a real SMU does it: the limited quantity
 *    is pinned at the limit and the sourced one gives way.
 *  * LED state changes on set/output so the detector sees light without
 *    channel 1 being measured.
 *  * The detector channel only models voltage bias; in current mode it reads
 *    back the forced current at 0 V.
 */
    class MockSmuBackend : public SmuBackend {
    public:
      static constexpr int kLedChannel = 1;
      static constexpr int kDetectorChannel = 2;
      static constexpr double kVoltageRail = 21.0; ///< output limit when only current is capped

      explicit MockSmuBackend(std::shared_ptr<sim::MockBench> bench);

      BackendKind kind() const override { return BackendKind::Mock; }
      int channelCount() const override { return 2; }

      void open(std::chrono::milliseconds timeout) override;
      void close() override;
      std::string identify() override;

      void configure(int channel, const ChannelSettings& settings) override;
      void setSourceMode(int channel, Quantity mode) override;
      void setValue(int channel, double value) override;
      void setOutput(int channel, bool enabled) override;
      std::pair<double, double> measure(int channel) override;

    private:
      struct Channel {
        ChannelSettings settings{};
        Quantity mode{ Quantity::Voltage };
        double value{ 0.0 };
        bool output{ false };
      };

      Channel& at(int channel);
      std::pair<double, double> applyLed(); ///< bench lock held by caller

      std::shared_ptr<sim::MockBench> bench_;
      std::array<Channel, 2> channels_{};
      bool open_{ false };
    };

  } // namespace hal
} // namespace ivlab
