/* @file ArduinoRelayBackend.cpp
 * @brief numeric relay commands over two serial links.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <thread>

#include "core/Errors.hpp"
#include "hal/ArduinoRelayBackend.hpp"

using namespace ivlab::hal;

ArduinoRelayBackend::ArduinoRelayBackend(std::unique_ptr<io::InstrumentLink> pixelLink,
                                         std::unique_ptr<io::InstrumentLink> ledLink,
                                         std::chrono::milliseconds settle, std::chrono::milliseconds resetDelay)
    : pixelLink_(std::move(pixelLink)), ledLink_(std::move(ledLink)), settle_(settle), resetDelay_(resetDelay) {
  if (!pixelLink_)
    throw std::invalid_argument("[ArduinoRelay] pixel board link is nullptr");
}

ArduinoRelayBackend::~ArduinoRelayBackend() { close(); }

std::string ArduinoRelayBackend::commandFor(RelayBoard board, int relay, bool on) {
  const int n = relay + 1;
  if (!on)
    return std::to_string(n);
  return std::to_string((board == RelayBoard::Pixel ? kPixelOffset : kLedOffset) + n);
}

void ArduinoRelayBackend::open(std::chrono::milliseconds) {
  pixelLink_->open();
  if (ledLink_)
    ledLink_->open();
  std::this_thread::sleep_for(resetDelay_);
  // boot banner, if any
  while (pixelLink_->poll(std::chrono::milliseconds{ 0 }))
    ;
  if (ledLink_)
    while (ledLink_->poll(std::chrono::milliseconds{ 0 }))
      ;
}

void ArduinoRelayBackend::close() {
  if (pixelLink_->isOpen())
    pixelLink_->close();
  if (ledLink_ && ledLink_->isOpen())
    ledLink_->close();
}

ivlab::io::InstrumentLink& ArduinoRelayBackend::linkFor(RelayBoard board) {
  if (board == RelayBoard::Pixel)
    return *pixelLink_;
  if (!ledLink_)
    throw core::ConnectionError("[ArduinoRelay] no LED board configured");
  return *ledLink_;
}

void ArduinoRelayBackend::setRelay(RelayBoard board, int relay, bool on) {
  auto& link = linkFor(board);
  link.send(io::Command{ commandFor(board, relay, on) });
  std::this_thread::sleep_for(settle_);
  while (link.poll(std::chrono::milliseconds{ 0 }))
    ;
}
