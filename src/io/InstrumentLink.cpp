/* @file InstrumentLink.cpp
 * @brief line-oriented request/response over a SerialChannel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// ivlab headers
#include "core/Errors.hpp"
#include "io/InstrumentLink.hpp"

using namespace ivlab::io;
using ivlab::core::ConnectionError;

SerialInstrumentLink::SerialInstrumentLink(std::string device, int baud,
                                           std::shared_ptr<core::ErrorMonitor> errMonitor,
                                           std::unique_ptr<SerialChannel> channel)
    : device_(std::move(device)), baud_(baud), errorMonitor_(std::move(errMonitor)),
      channel_(std::move(channel)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[InstrumentLink] error monitor is nullptr");
  if (!channel_)
    channel_ = std::make_unique<SerialChannel>("\n");
}

SerialInstrumentLink::~SerialInstrumentLink() { close(); }

void SerialInstrumentLink::open() {
  if (channel_->isOpen())
    return;

  const auto speed = toSpeed(baud_);
  if (!speed)
    fail("[InstrumentLink] unsupported baud rate " + std::to_string(baud_) + " for " + device_);

  if (!channel_->open(device_, *speed))
    fail("[InstrumentLink] serial device: " + device_ + " open failed");
  channel_->discardInput();
}

void SerialInstrumentLink::close() {
  if (channel_)
    channel_->close();
}

bool SerialInstrumentLink::isOpen() const { return channel_ && channel_->isOpen(); }

void SerialInstrumentLink::send(const Command& cmd) {
  if (!channel_->isOpen())
    throw ConnectionError("[InstrumentLink] " + device_ + " not open");

  if (cmd.payload.size() > kMaxCommandBytes)
    throw std::invalid_argument("[InstrumentLink] command exceeds " +
                                std::to_string(kMaxCommandBytes) + " byte threshold");

  if (!channel_->writeLine(cmd.toWire()))
    fail("[InstrumentLink] failed to write to serial device: " + device_);
}

Response SerialInstrumentLink::query(const Command& cmd, std::chrono::milliseconds timeout) {
  send(cmd);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      break;
    auto line = channel_->readLine(left);
    if (!line)
      break;
    // blank keep-alive lines are not answers
    if (auto resp = Response::fromWire(*line))
      return *resp;
  }
  fail("[InstrumentLink] " + device_ + " timed out waiting for reply to '" + cmd.payload + "'");
}

std::optional<Response> SerialInstrumentLink::poll(std::chrono::milliseconds timeout) {
  if (!channel_->isOpen())
    return std::nullopt;
  auto line = channel_->readLine(timeout);
  if (!line)
    return std::nullopt;
  return Response::fromWire(*line);
}

void SerialInstrumentLink::fail(const std::string& errMsg) {
  errorMonitor_->notifyFailure(errMsg);
  throw ConnectionError(errMsg);
}
