#pragma once

/** @file  RunManager.hpp
 *  @brief Global run-lifecycle finite-state machine.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/AbortFlag.hpp"

namespace ivlab {
  namespace core {

    class Logger;

    enum class RunState { IDLE, ARMED, RUNNING, ABORTED, ERROR };
    enum class RunEvent { Arm, Start, Complete, Abort, Fault, Reset };

    const char* toString(RunState s);
    const char* toString(RunEvent e);

    /// Transition table; nullopt means "not allowed from here".
    std::optional<RunState> nextState(RunState from, RunEvent event);

    /** Consistent copy of everything a status poll may ask for. */
    struct RunStatus {
      RunState state{ RunState::IDLE };
      std::uint64_t version{ 0 };
      std::string protocolName;
      std::optional<std::chrono::system_clock::time_point> startedAt;
      std::optional<std::string> lastError;
      bool abortRequested{ false };
      std::size_t stepsCompleted{ 0 };
      std::size_t totalSteps{ 0 };
      double uptimeSeconds{ 0.0 };

      /// `{state, protocol_name, started_at, last_error, ...}`
      nlohmann::json toJson() const;
    };

    /**
 * @class RunManager
 * @brief Single-writer state machine gating every hardware / protocol action.
 *
 *  * Every read and write goes through one mutex; `status()` is a snapshot.
 *  * Disallowed (state, event) pairs throw StateError and leave state as is.
 *  * `abort()` and `reset()` run the registered shutdown hooks *after* the
 *    lock is released, so hooks may block on device sessions.
 */
    class RunManager {

    public:
      explicit RunManager(std::shared_ptr<Logger> log = nullptr);
      ~RunManager() = default;

      RunManager(const RunManager&) = delete;
      RunManager& operator=(const RunManager&) = delete;

      //---transitions-----------------------------------------------------
      void arm();                                  ///< IDLE → ARMED
      void start(const std::string& protocol = {}); ///< ARMED → RUNNING
      void complete();                             ///< RUNNING → IDLE
      void abort();                                ///< ARMED|RUNNING → ABORTED, raises abort flag
      void fault(const std::string& message);      ///< any → ERROR
      /// RUNNING|ERROR → ERROR; false and no change once a reset has ended the run.
      bool faultRunning(const std::string& message);
      void reset();                                ///< any → IDLE, safe-disconnect hooks

      //---queries---------------------------------------------------------
      RunState state() const;
      RunStatus status() const;
      bool abortRequested() const { return abortFlag_->requested(); }
      std::shared_ptr<AbortFlag> abortFlag() const { return abortFlag_; }

      /// Engine progress counters, mirrored into status().
      void setProgress(std::size_t completed, std::size_t total);

      /// Register a hardware safe-shutdown callback run on abort / reset.
      void registerShutdownHook(std::string name, std::function<void()> hook);

    private:
      void transitionTo(RunEvent event, const std::string& detail = {});
      void transitionLocked(RunEvent event, const std::string& detail);
      void runShutdownHooks(const char* reason);

      struct Hook {
        std::string name;
        std::function<void()> fn;
      };

      std::shared_ptr<Logger> log_;
      std::shared_ptr<AbortFlag> abortFlag_;
      const std::chrono::steady_clock::time_point bootTime_;

      mutable std::mutex mtx_;
      RunState currentState_{ RunState::IDLE };
      std::uint64_t version_{ 0 };
      std::string protocolName_;
      std::optional<std::chrono::system_clock::time_point> startedAt_;
      std::optional<std::string> lastError_;
      std::size_t stepsCompleted_{ 0 };
      std::size_t totalSteps_{ 0 };

      std::mutex hooksMtx_;
      std::vector<Hook> hooks_;
    };

  } // namespace core
} // namespace ivlab
