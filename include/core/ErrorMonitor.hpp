#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ivlab::core {

  /**
 * @class ErrorMonitor
 * @brief Device clients and transports call `notifyFailure()`; we call the
 *        registered escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so RunManager doesn't get a fault storm from
 *   a sweep retrying a dead link.
 * * `clear()` forgets the history (RunManager reset).
 * * A `Suppression` scope silences failures raised on its own thread, so
 *   safe-shutdown of a dead device cannot fault the run it is resetting.
 */
  class ErrorMonitor {
  public:
    /// RAII: failures notified from the owning thread are dropped while alive.
    class Suppression {
    public:
      explicit Suppression(ErrorMonitor& monitor);
      ~Suppression();
      Suppression(const Suppression&) = delete;
      Suppression& operator=(const Suppression&) = delete;

    private:
      ErrorMonitor& monitor_;
    };

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fatal fault (normally RunManager::fault).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Forget every message seen so far.
    void clear();

    /// Number of unique failures reported since construction or last `clear()`.
    std::size_t failureCount() const;

  private:
    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_;              ///< de-dupe list
    std::vector<std::thread::id> quietThreads_;  ///< one entry per live Suppression
    mutable std::mutex mtx_;
  };

} // namespace ivlab::core
