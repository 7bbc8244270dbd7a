#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded FIFO between producer threads and one consumer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace ivlab {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue.
 *
 *  * `push()` never blocks: when full the oldest element is overwritten and
 *    counted in `dropped()`.
 *  * `popWait()` blocks the consumer until data arrives, the timeout expires,
 *    or `close()` is called.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

      void push(T value) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (size_ == slots_.size()) {
            head_ = (head_ + 1) % slots_.size();
            --size_;
            ++dropped_;
          }
          slots_[(head_ + size_) % slots_.size()] = std::move(value);
          ++size_;
        }
        cv_.notify_one();
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return popLocked();
      }

      std::optional<T> popWait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return size_ > 0 || closed_; });
        return popLocked();
      }

      void close() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          closed_ = true;
        }
        cv_.notify_all();
      }

      void reopen() {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = false;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_;
      }

      std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
      }

    private:
      std::optional<T> popLocked() {
        if (size_ == 0)
          return std::nullopt;
        std::optional<T> out{ std::move(slots_[head_]) };
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return out;
      }

      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
      std::size_t dropped_{ 0 };
      bool closed_{ false };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace ivlab
