/* @file SmuClient.cpp
 * @brief SMU session ownership, serialisation and the per-point sweep loop.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <stdexcept>

// ivlab headers
#include "core/Errors.hpp"
#include "hal/SmuClient.hpp"

using namespace ivlab::hal;
using ivlab::core::ConnectionError;
using ivlab::core::LogLevel;
using ivlab::core::ValidationError;

namespace {
  constexpr const char* kSource = "smu";
}

SmuClient::SmuClient(SmuBackendFactory factory, std::shared_ptr<core::AbortFlag> abortFlag,
                     std::shared_ptr<core::ErrorMonitor> errorMonitor, std::shared_ptr<core::Logger> log,
                     std::chrono::milliseconds defaultConnectTimeout)
    : factory_(std::move(factory)), abortFlag_(std::move(abortFlag)), errorMonitor_(std::move(errorMonitor)),
      log_(std::move(log)), defaultConnectTimeout_(defaultConnectTimeout) {
  if (!factory_ || !abortFlag_)
    throw std::invalid_argument("[SmuClient] factory and abort flag are required");
}

SmuClient::~SmuClient() { safeDisconnect(); }

void SmuClient::log(LogLevel level, const std::string& message, nlohmann::json fields) const {
  if (log_)
    log_->log(level, kSource, message, std::move(fields));
}

//---session---------------------------------------------------------------

void SmuClient::connect(BackendKind kind, const std::string& address, int channel,
                        std::optional<std::chrono::milliseconds> timeout) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (session_) {
    log(LogLevel::Info, "replacing active session");
    closeLocked();
  }

  try {
    auto backend = factory_(kind, address);
    if (!backend)
      throw ConnectionError(std::string("[SmuClient] no ") + toString(kind) + " backend available");
    if (channel < 1 || channel > backend->channelCount())
      throw ValidationError("[SmuClient] channel " + std::to_string(channel) + " out of range 1.." +
                            std::to_string(backend->channelCount()));

    backend->open(timeout.value_or(defaultConnectTimeout_));

    Session s;
    s.identity = backend->identify();
    s.channels.resize(static_cast<std::size_t>(backend->channelCount()));
    s.backend = std::move(backend);
    s.address = address;
    s.channel = channel;
    session_ = std::move(s);
  } catch (const ConnectionError& e) {
    log(LogLevel::Error, e.what(), { { "backend", toString(kind) }, { "address", address } });
    if (errorMonitor_)
      errorMonitor_->notifyFailure(e.what());
    throw;
  }

  log(LogLevel::Info, "connected", { { "backend", toString(kind) }, { "address", address },
                                     { "channel", channel }, { "identity", session_->identity } });
}

void SmuClient::disconnect() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!session_)
    return;
  auto& s = *session_;
  outputsOffLocked(s);
  s.backend->close();
  session_.reset();
  log(LogLevel::Info, "disconnected");
}

void SmuClient::safeDisconnect() {
  std::lock_guard<std::mutex> lock(mtx_);
  closeLocked();
}

void SmuClient::closeLocked() {
  if (!session_)
    return;
  try {
    outputsOffLocked(*session_);
  } catch (const std::exception& e) {
    log(LogLevel::Error, std::string("output off failed during safe disconnect: ") + e.what());
  }
  try {
    session_->backend->close();
  } catch (const std::exception& e) {
    log(LogLevel::Error, std::string("close failed during safe disconnect: ") + e.what());
  }
  session_.reset();
  log(LogLevel::Warning, "session safe-disconnected");
}

void SmuClient::safeOutputOff() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!session_)
    return;
  try {
    outputsOffLocked(*session_);
  } catch (const std::exception& e) {
    log(LogLevel::Error, std::string("safe output off failed: ") + e.what());
  }
}

/// Tries every channel even if one of them throws; rethrows the first failure.
void SmuClient::outputsOffLocked(Session& s) {
  std::optional<std::string> firstError;
  for (int ch = 1; ch <= static_cast<int>(s.channels.size()); ++ch) {
    try {
      s.backend->setOutput(ch, false);
      s.channels[static_cast<std::size_t>(ch - 1)].output = false;
    } catch (const std::exception& e) {
      if (!firstError)
        firstError = e.what();
    }
  }
  if (firstError)
    throw core::DeviceFault("[SmuClient] output off failed: " + *firstError);
}

void SmuClient::setCurrentSourceVoltageLimit(std::optional<double> volts) {
  if (volts && (!(*volts > 0.0) || !std::isfinite(*volts)))
    throw ValidationError("[SmuClient] voltage limit must be a positive number");
  std::lock_guard<std::mutex> lock(mtx_);
  voltageLimit_ = volts;
}

void SmuClient::limitVoltageLocked(Session& s, int ch) {
  auto& st = s.channels[static_cast<std::size_t>(ch - 1)];
  if (!voltageLimit_ || st.settings.complianceType == Quantity::Voltage)
    return;
  ChannelSettings settings = st.settings;
  settings.compliance = *voltageLimit_;
  settings.complianceType = Quantity::Voltage;
  s.backend->configure(ch, settings);
  st.settings = settings;
  log(LogLevel::Info, "voltage limit applied", { { "channel", ch }, { "compliance", settings.compliance } });
}

bool SmuClient::isConnected() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return session_.has_value();
}

SmuClient::Session& SmuClient::requireSession() {
  if (!session_)
    throw ConnectionError("[SmuClient] SMU not connected");
  return *session_;
}

int SmuClient::resolve(const Session& s, std::optional<int> channel) const {
  const int ch = channel.value_or(s.channel);
  if (ch < 1 || ch > static_cast<int>(s.channels.size()))
    throw ValidationError("[SmuClient] channel " + std::to_string(ch) + " out of range 1.." +
                          std::to_string(s.channels.size()));
  return ch;
}

//---channel operations------------------------------------------------------

void SmuClient::configure(const ChannelSettings& settings, std::optional<int> channel) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& s = requireSession();
  const int ch = resolve(s, channel);
  if (!(settings.compliance > 0.0) || !std::isfinite(settings.compliance))
    throw ValidationError("[SmuClient] compliance must be a positive number");
  if (settings.integrationTime < 0.0)
    throw ValidationError("[SmuClient] integration_time must be >= 0");
  s.backend->configure(ch, settings);
  s.channels[static_cast<std::size_t>(ch - 1)].settings = settings;
  log(LogLevel::Info, "configured", { { "channel", ch }, { "compliance", settings.compliance },
                                      { "compliance_type", toString(settings.complianceType) },
                                      { "integration_time", settings.integrationTime } });
}

void SmuClient::setSourceMode(Quantity mode, std::optional<int> channel) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& s = requireSession();
  const int ch = resolve(s, channel);
  if (mode == Quantity::Current)
    limitVoltageLocked(s, ch);
  s.backend->setSourceMode(ch, mode);
  auto& st = s.channels[static_cast<std::size_t>(ch - 1)];
  st.mode = mode;
  st.value = 0.0;
}

void SmuClient::setValue(double value, std::optional<int> channel) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& s = requireSession();
  const int ch = resolve(s, channel);
  s.backend->setValue(ch, value);
  s.channels[static_cast<std::size_t>(ch - 1)].value = value;
}

void SmuClient::setOutput(bool enabled, std::optional<int> channel) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& s = requireSession();
  const int ch = resolve(s, channel);
  s.backend->setOutput(ch, enabled);
  s.channels[static_cast<std::size_t>(ch - 1)].output = enabled;
  log(LogLevel::Info, enabled ? "output on" : "output off", { { "channel", ch } });
}

Measurement SmuClient::measure(std::optional<int> channel) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& s = requireSession();
  const int ch = resolve(s, channel);
  const auto [v, i] = s.backend->measure(ch);
  return Measurement{ s.channels[static_cast<std::size_t>(ch - 1)].value, v, i, epochSeconds() };
}

//---multi-point-------------------------------------------------------------

SweepResult SmuClient::sweep(const sweep::SweepSpec& spec, SweepOptions options) {
  const auto values = sweep::generate(spec);
  if (options.integrationTime <= 0.0)
    options.integrationTime = spec.integrationTime;
  return listSweep(values, options);
}

SweepResult SmuClient::listSweep(const std::vector<double>& values, const SweepOptions& options) {
  if (values.empty())
    throw ValidationError("[SmuClient] list sweep needs at least one value");
  for (double v : values)
    if (!std::isfinite(v))
      throw ValidationError("[SmuClient] list sweep values must be finite");
  if (options.delay < 0.0 || !std::isfinite(options.delay))
    throw ValidationError("[SmuClient] delay must be >= 0");
  if (options.compliance && !(*options.compliance > 0.0))
    throw ValidationError("[SmuClient] compliance must be > 0");

  std::lock_guard<std::mutex> lock(mtx_);
  auto& s = requireSession();
  const int ch = resolve(s, options.channel);
  auto& st = s.channels[static_cast<std::size_t>(ch - 1)];

  SweepResult result;
  result.channel = ch;
  result.sourceMode = options.sourceMode.value_or(st.mode);
  result.points.reserve(values.size());

  log(LogLevel::Info, "sweep start", { { "channel", ch }, { "points", values.size() },
                                       { "source_mode", toString(result.sourceMode) } });

  try {
    if (result.sourceMode == Quantity::Current && !options.compliance)
      limitVoltageLocked(s, ch);
    s.backend->setSourceMode(ch, result.sourceMode);
    st.mode = result.sourceMode;

    if (options.compliance || options.integrationTime > 0.0) {
      ChannelSettings settings = st.settings;
      if (options.compliance) {
        settings.compliance = *options.compliance;
        settings.complianceType = complementOf(result.sourceMode);
      }
      if (options.integrationTime > 0.0)
        settings.integrationTime = options.integrationTime;
      s.backend->configure(ch, settings);
      st.settings = settings;
    }

    s.backend->setOutput(ch, true);
    st.output = true;

    for (double value : values) {
      if (abortFlag_->requested()) {
        result.aborted = true;
        break;
      }
      s.backend->setValue(ch, value);
      st.value = value;
      if (options.delay > 0.0 && !abortFlag_->sleepFor(std::chrono::duration<double>(options.delay))) {
        result.aborted = true;
        break;
      }
      const auto [v, i] = s.backend->measure(ch);
      result.points.push_back(Measurement{ value, v, i, epochSeconds() });
    }
  } catch (const std::exception& e) {
    log(LogLevel::Error, std::string("sweep failed: ") + e.what(), { { "completed", result.points.size() } });
    try {
      s.backend->setOutput(ch, false);
      st.output = false;
    } catch (const std::exception& off) {
      log(LogLevel::Error, std::string("output off after failed sweep: ") + off.what());
    }
    throw;
  }

  s.backend->setOutput(ch, false);
  st.output = false;

  log(result.aborted ? LogLevel::Warning : LogLevel::Info, result.aborted ? "sweep aborted" : "sweep complete",
      { { "channel", ch }, { "completed", result.points.size() }, { "requested", values.size() } });
  return result;
}

nlohmann::json SmuClient::status() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!session_)
    return { { "connected", false } };

  const auto& s = *session_;
  nlohmann::json channels = nlohmann::json::array();
  for (std::size_t i = 0; i < s.channels.size(); ++i) {
    const auto& c = s.channels[i];
    channels.push_back({ { "channel", i + 1 },
                         { "source_mode", toString(c.mode) },
                         { "value", c.value },
                         { "output_enabled", c.output },
                         { "compliance", c.settings.compliance },
                         { "compliance_type", toString(c.settings.complianceType) },
                         { "integration_time", c.settings.integrationTime } });
  }
  return { { "connected", true },
           { "backend", toString(s.backend->kind()) },
           { "address", s.address },
           { "channel", s.channel },
           { "channels", s.channels.size() },
           { "identity", s.identity },
           { "channel_state", std::move(channels) } };
}
