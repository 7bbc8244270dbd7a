/* @file RunManager.cpp
 * @brief run-lifecycle FSM: IDLE → ARMED → RUNNING → (IDLE | ABORTED | ERROR) → IDLE
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// ivlab headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/RunManager.hpp"

namespace ivlab {
  namespace core {

    const char* toString(RunState s) {
      switch (s) {
      case RunState::IDLE:
        return "IDLE";
      case RunState::ARMED:
        return "ARMED";
      case RunState::RUNNING:
        return "RUNNING";
      case RunState::ABORTED:
        return "ABORTED";
      case RunState::ERROR:
        return "ERROR";
      default:
        return "Unknown";
      }
    }

    const char* toString(RunEvent e) {
      switch (e) {
      case RunEvent::Arm:
        return "arm";
      case RunEvent::Start:
        return "start";
      case RunEvent::Complete:
        return "complete";
      case RunEvent::Abort:
        return "abort";
      case RunEvent::Fault:
        return "fault";
      case RunEvent::Reset:
        return "reset";
      default:
        return "unknown";
      }
    }

    std::optional<RunState> nextState(RunState from, RunEvent event) {
      switch (event) {
      case RunEvent::Arm:
        if (from == RunState::IDLE)
          return RunState::ARMED;
        break;
      case RunEvent::Start:
        if (from == RunState::ARMED)
          return RunState::RUNNING;
        break;
      case RunEvent::Complete:
        if (from == RunState::RUNNING)
          return RunState::IDLE;
        break;
      case RunEvent::Abort:
        if (from == RunState::ARMED || from == RunState::RUNNING)
          return RunState::ABORTED;
        break;
      case RunEvent::Fault:
        return RunState::ERROR;
      case RunEvent::Reset:
        return RunState::IDLE;
      }
      return std::nullopt;
    }

    nlohmann::json RunStatus::toJson() const {
      nlohmann::json j;
      j["state"] = toString(state);
      j["version"] = version;
      j["protocol_name"] = protocolName.empty() ? nlohmann::json(nullptr) : nlohmann::json(protocolName);
      j["started_at"] = startedAt ? nlohmann::json(formatTimestamp(*startedAt)) : nlohmann::json(nullptr);
      j["last_error"] = lastError ? nlohmann::json(*lastError) : nlohmann::json(nullptr);
      j["abort_requested"] = abortRequested;
      j["steps_completed"] = stepsCompleted;
      j["total_steps"] = totalSteps;
      j["uptime_seconds"] = uptimeSeconds;
      return j;
    }

    RunManager::RunManager(std::shared_ptr<Logger> log)
        : log_(std::move(log)), abortFlag_(std::make_shared<AbortFlag>()),
          bootTime_(std::chrono::steady_clock::now()) {}

    void RunManager::arm() { transitionTo(RunEvent::Arm); }

    void RunManager::start(const std::string& protocol) { transitionTo(RunEvent::Start, protocol); }

    void RunManager::complete() { transitionTo(RunEvent::Complete); }

    void RunManager::abort() {
      transitionTo(RunEvent::Abort);
      runShutdownHooks("abort");
    }

    void RunManager::fault(const std::string& message) { transitionTo(RunEvent::Fault, message); }

    bool RunManager::faultRunning(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (currentState_ != RunState::RUNNING && currentState_ != RunState::ERROR)
        return false;
      transitionLocked(RunEvent::Fault, message);
      return true;
    }

    void RunManager::reset() {
      transitionTo(RunEvent::Reset);
      runShutdownHooks("reset");
    }

    RunState RunManager::state() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return currentState_;
    }

    RunStatus RunManager::status() const {
      std::lock_guard<std::mutex> lock(mtx_);
      RunStatus s;
      s.state = currentState_;
      s.version = version_;
      s.protocolName = protocolName_;
      s.startedAt = startedAt_;
      s.lastError = lastError_;
      s.abortRequested = abortFlag_->requested();
      s.stepsCompleted = stepsCompleted_;
      s.totalSteps = totalSteps_;
      s.uptimeSeconds =
          std::chrono::duration<double>(std::chrono::steady_clock::now() - bootTime_).count();
      return s;
    }

    void RunManager::setProgress(std::size_t completed, std::size_t total) {
      std::lock_guard<std::mutex> lock(mtx_);
      stepsCompleted_ = completed;
      totalSteps_ = total;
    }

    void RunManager::registerShutdownHook(std::string name, std::function<void()> hook) {
      std::lock_guard<std::mutex> lock(hooksMtx_);
      hooks_.push_back(Hook{ std::move(name), std::move(hook) });
    }

    void RunManager::transitionTo(RunEvent event, const std::string& detail) {
      std::lock_guard<std::mutex> lock(mtx_);
      transitionLocked(event, detail);
    }

    void RunManager::transitionLocked(RunEvent event, const std::string& detail) {
      const RunState from = currentState_;
      const auto to = nextState(from, event);
      if (!to) {
        std::string msg = std::string("[RunManager] cannot ") + toString(event) + " from " + toString(from);
        if (log_)
          log_->warn("run_manager", msg);
        throw StateError(msg);
      }

      switch (event) {
      case RunEvent::Arm:
        abortFlag_->clear();
        stepsCompleted_ = 0;
        totalSteps_ = 0;
        break;
      case RunEvent::Start:
        abortFlag_->clear();
        protocolName_ = detail;
        startedAt_ = std::chrono::system_clock::now();
        break;
      case RunEvent::Complete:
        protocolName_.clear();
        startedAt_.reset();
        break;
      case RunEvent::Abort:
        // the flag stays raised until the next arm/start so loops still see it
        abortFlag_->request();
        break;
      case RunEvent::Fault:
        lastError_ = detail;
        break;
      case RunEvent::Reset:
        // a run still in flight must stop at its next check
        if (from == RunState::RUNNING)
          abortFlag_->request();
        lastError_.reset();
        protocolName_.clear();
        startedAt_.reset();
        stepsCompleted_ = 0;
        totalSteps_ = 0;
        break;
      }

      currentState_ = *to;
      ++version_;

      if (log_) {
        log_->log(event == RunEvent::Fault ? LogLevel::Error : LogLevel::Info, "run_manager",
                  std::string("state transition: ") + toString(from) + " -> " + toString(*to),
                  { { "event", toString(event) }, { "version", version_ } });
      }
    }

    void RunManager::runShutdownHooks(const char* reason) {
      std::vector<Hook> hooks;
      {
        std::lock_guard<std::mutex> lock(hooksMtx_);
        hooks = hooks_;
      }
      for (auto& hook : hooks) {
        try {
          hook.fn();
        } catch (const std::exception& e) {
          if (log_)
            log_->error("run_manager", std::string("shutdown hook '") + hook.name + "' failed on " +
                                           reason + ": " + e.what());
        }
      }
    }

  } // namespace core
} // namespace ivlab
