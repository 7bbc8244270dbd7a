/* @file ScpiSmuBackend.cpp
 * @brief SCPI command formatting for the B29xx family.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

// ivlab headers
#include "core/Errors.hpp"
#include "hal/ScpiSmuBackend.hpp"

using namespace ivlab::hal;
using ivlab::core::ConnectionError;
using ivlab::core::ValidationError;

namespace {
  constexpr double kMinNplc = 0.001;
  constexpr double kMaxNplc = 100.0;
  constexpr int kMaxChannels = 4;

  std::string number(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.9g", v);
    return buf;
  }

  const char* scpiName(Quantity q) { return q == Quantity::Voltage ? "VOLT" : "CURR"; }
} // namespace

ScpiSmuBackend::ScpiSmuBackend(std::unique_ptr<io::InstrumentLink> link, int channels,
                               double lineFrequencyHz, std::chrono::milliseconds ioTimeout)
    : link_(std::move(link)), channels_(channels), lineFrequencyHz_(lineFrequencyHz), ioTimeout_(ioTimeout) {
  if (!link_)
    throw std::invalid_argument("[ScpiSmu] link is nullptr");
  if (channels_ < 1 || channels_ > kMaxChannels)
    throw std::invalid_argument("[ScpiSmu] channel count must be 1..4");
  if (lineFrequencyHz_ <= 0.0)
    throw std::invalid_argument("[ScpiSmu] line frequency must be > 0");
}

ScpiSmuBackend::~ScpiSmuBackend() {
  if (link_->isOpen())
    link_->close();
}

double ScpiSmuBackend::toNplc(double integrationTime, double lineFrequencyHz) {
  return std::clamp(integrationTime * lineFrequencyHz, kMinNplc, kMaxNplc);
}

void ScpiSmuBackend::check(int channel) const {
  if (channel < 1 || channel > channels_)
    throw ValidationError("[ScpiSmu] channel " + std::to_string(channel) + " out of range 1.." +
                          std::to_string(channels_));
  if (!link_->isOpen())
    throw ConnectionError("[ScpiSmu] link to " + link_->describe() + " is closed");
}

void ScpiSmuBackend::send(const std::string& line) { link_->send(io::Command{ line }); }

std::string ScpiSmuBackend::query(const std::string& line) {
  return link_->query(io::Command{ line }, ioTimeout_).payload;
}

void ScpiSmuBackend::open(std::chrono::milliseconds timeout) {
  link_->open();
  send("*RST");
  idn_ = link_->query(io::Command{ "*IDN?" }, timeout).payload;
  for (int ch = 1; ch <= channels_; ++ch) {
    modes_[ch - 1] = Quantity::Voltage;
    send("SOUR" + std::to_string(ch) + ":FUNC:MODE VOLT");
  }
}

void ScpiSmuBackend::close() {
  if (!link_->isOpen())
    return;
  send("ABOR");
  for (int ch = 1; ch <= channels_; ++ch)
    send("OUTP" + std::to_string(ch) + " OFF");
  link_->close();
}

std::string ScpiSmuBackend::identify() {
  if (idn_.empty())
    idn_ = query("*IDN?");
  return idn_;
}

void ScpiSmuBackend::configure(int channel, const ChannelSettings& settings) {
  check(channel);
  if (!(settings.compliance > 0.0))
    throw ValidationError("[ScpiSmu] compliance must be > 0");
  const auto ch = std::to_string(channel);
  send("SENS" + ch + ":" + scpiName(settings.complianceType) + ":PROT " + number(settings.compliance));
  const auto nplc = number(toNplc(settings.integrationTime, lineFrequencyHz_));
  send("SENS" + ch + ":VOLT:NPLC " + nplc);
  send("SENS" + ch + ":CURR:NPLC " + nplc);
}

void ScpiSmuBackend::setSourceMode(int channel, Quantity mode) {
  check(channel);
  send("SOUR" + std::to_string(channel) + ":FUNC:MODE " + scpiName(mode));
  modes_[channel - 1] = mode;
}

void ScpiSmuBackend::setValue(int channel, double value) {
  check(channel);
  if (!std::isfinite(value))
    throw ValidationError("[ScpiSmu] source value must be finite");
  send("SOUR" + std::to_string(channel) + ":" + scpiName(modes_[channel - 1]) + " " + number(value));
}

void ScpiSmuBackend::setOutput(int channel, bool enabled) {
  check(channel);
  send("OUTP" + std::to_string(channel) + (enabled ? " ON" : " OFF"));
}

std::pair<double, double> ScpiSmuBackend::measure(int channel) {
  check(channel);
  const auto suffix = " (@" + std::to_string(channel) + ")";
  const double v = link_->query(io::Command{ "MEAS:VOLT?" + suffix }, ioTimeout_).asDouble();
  const double i = link_->query(io::Command{ "MEAS:CURR?" + suffix }, ioTimeout_).asDouble();
  return { v, i };
}
