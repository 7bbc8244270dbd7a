/* @file LabCoordinator.cpp
 * @brief subsystem wiring and the JSON-shaped control surface.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// ivlab headers
#include "core/Errors.hpp"
#include "core/LabCoordinator.hpp"
#include "hal/ArduinoRelayBackend.hpp"
#include "hal/MockSmuBackend.hpp"
#include "hal/ScpiSmuBackend.hpp"
#include "io/CsvLogSink.hpp"
#include "io/InstrumentLink.hpp"
#include "protocols/StandardActions.hpp"

using namespace ivlab::core;
using ivlab::hal::BackendKind;
using nlohmann::json;

namespace {
  constexpr const char* kSource = "coordinator";

  json failure(const std::string& message) { return { { "success", false }, { "message", message } }; }
} // namespace

LabCoordinator::LabCoordinator(LabConfig config) : LabCoordinator(std::move(config), Overrides{}) {}

LabCoordinator::LabCoordinator(LabConfig config, Overrides overrides) : config_(std::move(config)) {
  initialize(std::move(overrides));
}

LabCoordinator::~LabCoordinator() { shutdown(); }

std::shared_ptr<LogSink> LabCoordinator::makeLogSink() const {
  std::shared_ptr<LogSink> console;
  std::shared_ptr<LogSink> file;
  if (config_.log.console)
    console = std::make_shared<StreamLogSink>(std::clog);
  if (!config_.log.path.empty())
    file = std::make_shared<io::CsvLogSink>(config_.log.path);
  if (console && file)
    return std::make_shared<TeeLogSink>(console, file);
  return console ? console : file;
}

ivlab::hal::SmuBackendFactory LabCoordinator::defaultSmuFactory() {
  return [this](BackendKind kind, const std::string& address) -> std::unique_ptr<hal::SmuBackend> {
    if (kind == BackendKind::Mock)
      return std::make_unique<hal::MockSmuBackend>(bench_);
    const auto& smu = config_.smu;
    auto link = std::make_unique<io::SerialInstrumentLink>(address.empty() ? smu.address : address, smu.baud,
                                                           errorMonitor_);
    return std::make_unique<hal::ScpiSmuBackend>(std::move(link), smu.channels, smu.lineFrequencyHz, smu.ioTimeout);
  };
}

ivlab::hal::RelayBackendFactory LabCoordinator::defaultRelayFactory() {
  return [this](BackendKind kind, const std::string& address) -> std::unique_ptr<hal::RelayBackend> {
    if (kind == BackendKind::Mock)
      return std::make_unique<hal::MockRelayBackend>();
    const auto& rc = config_.relays;
    std::string pixelPort = rc.pixelPort;
    std::string ledPort = rc.ledPort;
    if (!address.empty()) {
      const auto comma = address.find(',');
      pixelPort = address.substr(0, comma);
      ledPort = comma == std::string::npos ? std::string{} : address.substr(comma + 1);
    }
    auto pixel = std::make_unique<io::SerialInstrumentLink>(pixelPort, rc.baud, errorMonitor_);
    std::unique_ptr<io::InstrumentLink> led;
    if (!ledPort.empty())
      led = std::make_unique<io::SerialInstrumentLink>(ledPort, rc.baud, errorMonitor_);
    return std::make_unique<hal::ArduinoRelayBackend>(std::move(pixel), std::move(led), rc.settle, rc.resetDelay);
  };
}

void LabCoordinator::initialize(Overrides overrides) {
  auto sink = overrides.logSink ? overrides.logSink : makeLogSink();
  if (sink) {
    log_ = std::make_shared<Logger>(sink, config_.log.queueCapacity, config_.log.level);
    log_->start();
  }

  errorMonitor_ = std::make_shared<ErrorMonitor>();
  runManager_ = std::make_shared<RunManager>(log_);
  errorMonitor_->registerEscalation([rm = std::weak_ptr<RunManager>(runManager_)](const std::string& msg) {
    if (auto locked = rm.lock())
      locked->fault(msg);
  });

  bench_ = std::make_shared<sim::MockBench>(config_.mock);

  smu_ = std::make_shared<hal::SmuClient>(overrides.smuFactory ? overrides.smuFactory : defaultSmuFactory(),
                                          runManager_->abortFlag(), errorMonitor_, log_,
                                          config_.smu.connectTimeout);
  relays_ = std::make_shared<hal::RelayClient>(
      overrides.relayFactory ? overrides.relayFactory : defaultRelayFactory(), errorMonitor_, log_,
      config_.relays.connectTimeout);
  smu_->setCurrentSourceVoltageLimit(config_.smu.voltageCompliance);

  calibration_ = std::make_shared<calibration::CalibrationManager>(config_.calibration.policy);
  if (!config_.calibration.path.empty()) {
    try {
      calibration_->loadFile(config_.calibration.path);
    } catch (const Error& e) {
      // a missing table only disables irradiance actions
      if (log_)
        log_->warn(kSource, std::string("calibration not loaded: ") + e.what());
    }
  }

  resultSink_ = overrides.resultSink ? overrides.resultSink : std::make_shared<io::FileResultSink>();

  registry_ = std::make_shared<protocols::ActionRegistry>();
  protocols::ActionServices services;
  services.smu = smu_;
  services.relays = relays_;
  services.calibration = calibration_;
  services.sink = resultSink_;
  services.abortFlag = runManager_->abortFlag();
  services.log = log_;
  services.dataDir = config_.dataDir;
  services.smuAddress = config_.smu.address;
  services.relayAddress = config_.relays.pixelPort +
                          (config_.relays.ledPort.empty() ? std::string{} : "," + config_.relays.ledPort);
  services.lineFrequencyHz = config_.smu.lineFrequencyHz;
  protocols::registerStandardActions(*registry_, services);

  auto repository = overrides.repository
                        ? overrides.repository
                        : std::make_shared<protocols::FileProtocolRepository>(config_.protocolsDir);
  loader_ = std::make_shared<protocols::ProtocolLoader>(std::move(repository));
  engine_ = std::make_shared<protocols::ProtocolEngine>(runManager_, registry_, loader_, log_);

  // hardware safety: output off after every run, full safe-disconnect on abort / reset
  engine_->registerRunEndHook("smu-output-off", [smu = smu_] { smu->safeOutputOff(); });
  // a dead link found while shutting down is logged, not escalated: reset must land in IDLE
  runManager_->registerShutdownHook("smu", [smu = smu_, monitor = errorMonitor_] {
    ErrorMonitor::Suppression quiet(*monitor);
    smu->safeDisconnect();
  });
  runManager_->registerShutdownHook("relays", [relays = relays_, monitor = errorMonitor_] {
    ErrorMonitor::Suppression quiet(*monitor);
    relays->safeDisconnect();
  });

  if (log_)
    log_->log(LogLevel::Info, kSource, "initialized",
              { { "protocols_dir", config_.protocolsDir }, { "actions", registry_->names().size() } });
}

//---run lifecycle--------------------------------------------------------------

json LabCoordinator::transition(const char* name, const std::function<void()>& fn) {
  try {
    fn();
  } catch (const StateError& e) {
    return failure(e.what());
  }
  if (log_)
    log_->info(kSource, std::string("transition requested: ") + name);
  return { { "success", true }, { "state", toString(runManager_->state()) } };
}

json LabCoordinator::status() const {
  auto j = runManager_->status().toJson();
  j["progress"] = engine_->progress().toJson();
  return j;
}

json LabCoordinator::arm() {
  return transition("arm", [this] { runManager_->arm(); });
}

json LabCoordinator::start(const std::string& protocol) {
  return transition("start", [this, &protocol] { runManager_->start(protocol); });
}

json LabCoordinator::complete() {
  return transition("complete", [this] { runManager_->complete(); });
}

json LabCoordinator::abort() {
  return transition("abort", [this] { runManager_->abort(); });
}

json LabCoordinator::reset() {
  auto out = transition("reset", [this] { runManager_->reset(); });
  errorMonitor_->clear();
  return out;
}

//---protocols--------------------------------------------------------------------

json LabCoordinator::listProtocols() { return { { "protocols", loader_->catalogue() } }; }

json LabCoordinator::reloadProtocols() {
  loader_->reload();
  return { { "success", true }, { "protocols", loader_->list() } };
}

json LabCoordinator::execute(const protocols::ProtocolDefinition& def, const json& params) {
  try {
    return engine_->execute(def, params).toJson();
  } catch (const Error& e) {
    return failure(e.what());
  }
}

json LabCoordinator::runProtocol(const std::string& id, const json& params) {
  std::shared_ptr<const protocols::ProtocolDefinition> def;
  try {
    def = loader_->load(id);
  } catch (const Error& e) {
    return failure(e.what());
  }
  return execute(*def, params);
}

json LabCoordinator::runInline(const json& document, const json& params) {
  try {
    const auto def = protocols::ProtocolDefinition::fromJson(document, "inline");
    return execute(def, params);
  } catch (const ValidationError& e) {
    return failure(e.what());
  }
}

json LabCoordinator::startProtocol(const std::string& id, const json& params) {
  std::shared_ptr<const protocols::ProtocolDefinition> def;
  try {
    def = loader_->load(id);
  } catch (const Error& e) {
    return failure(e.what());
  }

  std::lock_guard<std::mutex> lock(workerMtx_);
  if (shutDown_)
    return failure("[LabCoordinator] shutting down");
  if (workerBusy_)
    return failure("[LabCoordinator] a protocol is already running");
  const auto state = runManager_->state();
  if (state != RunState::IDLE && state != RunState::ARMED)
    return failure(std::string("[LabCoordinator] cannot run a protocol while ") + toString(state));

  if (worker_.joinable())
    worker_.join(); // previous run already finished
  workerBusy_ = true;
  worker_ = std::thread([this, def, params] {
    json result = execute(*def, params);
    std::lock_guard<std::mutex> done(workerMtx_);
    lastResult_ = std::move(result);
    workerBusy_ = false;
  });
  return { { "success", true }, { "message", "started" }, { "protocol", def->name } };
}

json LabCoordinator::progress() const { return engine_->progress().toJson(); }

json LabCoordinator::lastResult() const {
  std::lock_guard<std::mutex> lock(workerMtx_);
  return lastResult_ ? *lastResult_ : json(nullptr);
}

bool LabCoordinator::waitForBackgroundRun() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(workerMtx_);
    if (!worker_.joinable())
      return false;
    worker = std::move(worker_);
  }
  worker.join();
  return true;
}

void LabCoordinator::joinWorker() { waitForBackgroundRun(); }

void LabCoordinator::shutdown() {
  {
    std::lock_guard<std::mutex> lock(workerMtx_);
    if (shutDown_)
      return;
    shutDown_ = true;
  }

  const auto state = runManager_->state();
  if (state == RunState::RUNNING || state == RunState::ARMED) {
    try {
      runManager_->abort();
    } catch (const StateError& e) {
      if (log_)
        log_->warn(kSource, std::string("abort during shutdown: ") + e.what());
    }
  }
  joinWorker();

  {
    ErrorMonitor::Suppression quiet(*errorMonitor_);
    smu_->safeDisconnect();
    relays_->safeDisconnect();
  }

  if (log_) {
    log_->info(kSource, "shutdown");
    log_->stop();
  }
}
