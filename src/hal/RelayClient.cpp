/* @file RelayClient.cpp
 * @brief relay session ownership and exclusive selection.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include "core/Errors.hpp"
#include "hal/RelayClient.hpp"

using namespace ivlab::hal;
using ivlab::core::ConnectionError;
using ivlab::core::LogLevel;
using ivlab::core::ValidationError;

namespace {
  constexpr const char* kSource = "relays";

  nlohmann::json optionalJson(const std::optional<int>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
  }
} // namespace

RelayClient::RelayClient(RelayBackendFactory factory, std::shared_ptr<core::ErrorMonitor> errorMonitor,
                         std::shared_ptr<core::Logger> log, std::chrono::milliseconds defaultConnectTimeout)
    : factory_(std::move(factory)), errorMonitor_(std::move(errorMonitor)), log_(std::move(log)),
      defaultConnectTimeout_(defaultConnectTimeout) {
  if (!factory_)
    throw std::invalid_argument("[RelayClient] factory is required");
}

RelayClient::~RelayClient() { safeDisconnect(); }

void RelayClient::log(LogLevel level, const std::string& message, nlohmann::json fields) const {
  if (log_)
    log_->log(level, kSource, message, std::move(fields));
}

void RelayClient::connect(BackendKind kind, const std::string& address,
                          std::optional<std::chrono::milliseconds> timeout) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (session_)
    closeLocked();

  try {
    auto backend = factory_(kind, address);
    if (!backend)
      throw ConnectionError(std::string("[RelayClient] no ") + toString(kind) + " backend available");
    backend->open(timeout.value_or(defaultConnectTimeout_));
    Session s;
    s.backend = std::move(backend);
    s.address = address;
    session_ = std::move(s);
    allOffLocked(*session_);
  } catch (const ConnectionError& e) {
    session_.reset();
    log(LogLevel::Error, e.what(), { { "backend", toString(kind) }, { "address", address } });
    if (errorMonitor_)
      errorMonitor_->notifyFailure(e.what());
    throw;
  }
  log(LogLevel::Info, "connected", { { "backend", toString(kind) }, { "address", address } });
}

void RelayClient::disconnect() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!session_)
    return;
  allOffLocked(*session_);
  session_->backend->close();
  session_.reset();
  log(LogLevel::Info, "disconnected");
}

void RelayClient::safeDisconnect() {
  std::lock_guard<std::mutex> lock(mtx_);
  closeLocked();
}

void RelayClient::closeLocked() {
  if (!session_)
    return;
  try {
    allOffLocked(*session_);
  } catch (const std::exception& e) {
    log(LogLevel::Error, std::string("all-off failed during safe disconnect: ") + e.what());
  }
  try {
    session_->backend->close();
  } catch (const std::exception& e) {
    log(LogLevel::Error, std::string("close failed during safe disconnect: ") + e.what());
  }
  session_.reset();
  log(LogLevel::Warning, "session safe-disconnected");
}

bool RelayClient::isConnected() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return session_.has_value();
}

RelayClient::Session& RelayClient::requireSession() {
  if (!session_)
    throw ConnectionError("[RelayClient] relays not connected");
  return *session_;
}

/// Every relay on each fitted board is opened, not just the tracked ones.
void RelayClient::allOffLocked(Session& s) {
  if (s.backend->hasBoard(RelayBoard::Pixel))
    for (int p = 0; p < kPixelCount; ++p)
      s.backend->setRelay(RelayBoard::Pixel, p, false);
  s.selection.pixel.reset();
  if (s.backend->hasBoard(RelayBoard::Led))
    for (int l = 0; l < kLedCount; ++l)
      s.backend->setRelay(RelayBoard::Led, l, false);
  s.selection.led.reset();
}

void RelayClient::select(RelayBoard board, int index, int count, std::optional<int>& current) {
  if (index < 0 || index >= count)
    throw ValidationError(std::string("[RelayClient] ") + toString(board) + " " + std::to_string(index) +
                          " out of range 0.." + std::to_string(count - 1));
  auto& s = requireSession();
  if (!s.backend->hasBoard(board))
    throw ConnectionError(std::string("[RelayClient] no ") + toString(board) + " board fitted");
  if (current && *current == index)
    return;
  if (current) {
    s.backend->setRelay(board, *current, false);
    current.reset();
  }
  s.backend->setRelay(board, index, true);
  current = index;
  log(LogLevel::Info, std::string("selected ") + toString(board), { { "index", index } });
}

void RelayClient::selectPixel(int pixel) {
  std::lock_guard<std::mutex> lock(mtx_);
  select(RelayBoard::Pixel, pixel, kPixelCount, requireSession().selection.pixel);
}

void RelayClient::selectLed(int channel) {
  std::lock_guard<std::mutex> lock(mtx_);
  select(RelayBoard::Led, channel, kLedCount, requireSession().selection.led);
}

void RelayClient::allOff() {
  std::lock_guard<std::mutex> lock(mtx_);
  allOffLocked(requireSession());
  log(LogLevel::Info, "all relays off");
}

RelaySelection RelayClient::selection() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return session_ ? session_->selection : RelaySelection{};
}

nlohmann::json RelayClient::status() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!session_)
    return { { "connected", false }, { "pixel", nullptr }, { "led", nullptr } };
  return { { "connected", true },
           { "backend", toString(session_->backend->kind()) },
           { "address", session_->address },
           { "pixel", optionalJson(session_->selection.pixel) },
           { "led", optionalJson(session_->selection.led) } };
}
