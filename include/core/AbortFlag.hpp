#pragma once
/** @file  AbortFlag.hpp
 *  @brief Shared cooperative cancellation flag.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <thread>

namespace ivlab {
  namespace core {

    /**
 * @class AbortFlag
 * @brief One flag per process, owned by RunManager and polled by the engine
 *        (per step) and the device clients (per point).
 *
 *  * Never preempts anything: readers decide where to stop.
 */
    class AbortFlag {
    public:
      void request() { flag_.store(true, std::memory_order_release); }
      void clear() { flag_.store(false, std::memory_order_release); }
      bool requested() const { return flag_.load(std::memory_order_acquire); }

      /// Sleeps up to \p total, waking every \p slice to look at the flag.
      /// @returns false if the wait was cut short by an abort.
      bool sleepFor(std::chrono::duration<double> total,
                    std::chrono::milliseconds slice = std::chrono::milliseconds{ 20 }) const {
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::duration_cast<std::chrono::steady_clock::duration>(total);
        while (std::chrono::steady_clock::now() < deadline) {
          if (requested())
            return false;
          auto left = deadline - std::chrono::steady_clock::now();
          std::this_thread::sleep_for(left < slice ? left : slice);
        }
        return !requested();
      }

    private:
      std::atomic<bool> flag_{ false };
    };

  } // namespace core
} // namespace ivlab
