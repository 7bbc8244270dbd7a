/* @file MockSmuBackend.cpp
 * @brief simulated SMU channels on top of the LED / photodetector models.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <stdexcept>

// ivlab headers
#include "core/Errors.hpp"
#include "hal/MockSmuBackend.hpp"

using namespace ivlab::hal;
using ivlab::core::ConnectionError;
using ivlab::core::ValidationError;

MockSmuBackend::MockSmuBackend(std::shared_ptr<sim::MockBench> bench) : bench_(std::move(bench)) {
  if (!bench_)
    throw std::invalid_argument("[MockSmu] bench is nullptr");
}

void MockSmuBackend::open(std::chrono::milliseconds) {
  open_ = true;
  channels_ = {};
  auto lock = bench_->lock();
  bench_->led().switchOff();
}

void MockSmuBackend::close() {
  if (!open_)
    return;
  for (auto& ch : channels_)
    ch.output = false;
  auto lock = bench_->lock();
  bench_->led().switchOff();
  open_ = false;
}

std::string MockSmuBackend::identify() { return "ivlab,MockSMU,0,1.0"; }

MockSmuBackend::Channel& MockSmuBackend::at(int channel) {
  if (!open_)
    throw ConnectionError("[MockSmu] not open");
  if (channel < 1 || channel > channelCount())
    throw ValidationError("[MockSmu] channel " + std::to_string(channel) + " out of range 1.." +
                          std::to_string(channelCount()));
  return channels_[static_cast<std::size_t>(channel - 1)];
}

void MockSmuBackend::configure(int channel, const ChannelSettings& settings) {
  if (!(settings.compliance > 0.0))
    throw ValidationError("[MockSmu] compliance must be > 0");
  at(channel).settings = settings;
  if (channel == kLedChannel) {
    auto lock = bench_->lock();
    applyLed();
  }
}

void MockSmuBackend::setSourceMode(int channel, Quantity mode) {
  auto& ch = at(channel);
  ch.mode = mode;
  ch.value = 0.0;
  if (channel == kLedChannel) {
    auto lock = bench_->lock();
    applyLed();
  }
}

void MockSmuBackend::setValue(int channel, double value) {
  if (!std::isfinite(value))
    throw ValidationError("[MockSmu] source value must be finite");
  at(channel).value = value;
  if (channel == kLedChannel) {
    auto lock = bench_->lock();
    applyLed();
  }
}

void MockSmuBackend::setOutput(int channel, bool enabled) {
  at(channel).output = enabled;
  if (channel == kLedChannel) {
    auto lock = bench_->lock();
    applyLed();
  }
}

std::pair<double, double> MockSmuBackend::applyLed() {
  auto& ch = channels_[kLedChannel - 1];
  auto& led = bench_->led();
  if (!ch.output) {
    led.switchOff();
    return { 0.0, 0.0 };
  }

  const double limit = ch.settings.compliance;
  if (ch.mode == Quantity::Voltage) {
    auto op = led.driveVoltage(ch.value);
    if (ch.settings.complianceType == Quantity::Current && std::abs(op.current) > limit)
      op = led.driveCurrent(std::copysign(limit, op.current));
    else if (ch.settings.complianceType == Quantity::Voltage && std::abs(op.voltage) > limit)
      op = led.driveVoltage(std::copysign(limit, op.voltage));
    return { op.voltage, op.current };
  }

  // current source: the voltage rail gives way when the current is unreachable or over it
  const double wanted = ch.settings.complianceType == Quantity::Current
                            ? std::clamp(ch.value, -limit, limit)
                            : ch.value;
  const double rail = ch.settings.complianceType == Quantity::Voltage ? limit : kVoltageRail;
  const double vNeeded = led.voltageAtCurrent(wanted);
  if (!std::isfinite(vNeeded) || std::abs(vNeeded) > rail) {
    const auto op = led.driveVoltage(std::copysign(rail, wanted));
    return { op.voltage, op.current };
  }
  const auto op = led.driveCurrent(wanted);
  return { op.voltage, op.current };
}

std::pair<double, double> MockSmuBackend::measure(int channel) {
  auto& ch = at(channel);
  auto lock = bench_->lock();

  if (channel == kLedChannel)
    return applyLed();

  if (!ch.output)
    return { 0.0, 0.0 };

  const double limit = ch.settings.compliance;
  if (ch.mode == Quantity::Voltage) {
    double i = bench_->photodetector().photocurrent(ch.value);
    if (ch.settings.complianceType == Quantity::Current)
      i = std::clamp(i, -limit, limit);
    return { ch.value, i };
  }
  double i = ch.value;
  if (ch.settings.complianceType == Quantity::Current)
    i = std::clamp(i, -limit, limit);
  return { 0.0, i };
}
