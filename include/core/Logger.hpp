#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous structured event logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace core {

    enum class LogLevel { Debug, Info, Warning, Error };

    const char* toString(LogLevel level);

    /// Parses "debug" / "info" / "warning" / "error"; throws ValidationError otherwise.
    LogLevel logLevelFromString(const std::string& text);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{};
      LogLevel level{ LogLevel::Info };
      std::string source;  ///< subsystem name, e.g. "engine"
      std::string message;
      nlohmann::json fields = nlohmann::json::object();
    };

    /// ISO-8601 UTC rendering with milliseconds.
    std::string formatTimestamp(std::chrono::system_clock::time_point tp);

    /**
 * @class LogSink
 * @brief Where drained events end up. Only ever called from the worker thread.
 */
    class LogSink {
    public:
      virtual ~LogSink() = default;
      virtual void write(const LogEvent& event) = 0;
      virtual void flush() {}
    };

    /// One human-readable line per event.
    class StreamLogSink : public LogSink {
    public:
      explicit StreamLogSink(std::ostream& os) : os_(os) {}
      void write(const LogEvent& event) override;
      void flush() override { os_.flush(); }

    private:
      std::ostream& os_;
    };

    /// Fans one event out to several sinks.
    class TeeLogSink : public LogSink {
    public:
      TeeLogSink(std::shared_ptr<LogSink> a, std::shared_ptr<LogSink> b)
          : a_(std::move(a)), b_(std::move(b)) {}
      void write(const LogEvent& event) override;
      void flush() override;

    private:
      std::shared_ptr<LogSink> a_;
      std::shared_ptr<LogSink> b_;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    class Logger {

    public:
      explicit Logger(std::shared_ptr<LogSink> sink, std::size_t capacity = 1024,
                      LogLevel threshold = LogLevel::Info);
      ~Logger(); ///< stop() if still running

      // --- public API ---
      void start(); ///< launch worker thread
      void log(LogLevel level, const std::string& source, const std::string& message,
               nlohmann::json fields = nlohmann::json::object()); ///< enqueue event (non-blocking)
      void stop();  ///< drain + flush + join worker thread

      void debug(const std::string& source, const std::string& message) {
        log(LogLevel::Debug, source, message);
      }
      void info(const std::string& source, const std::string& message) {
        log(LogLevel::Info, source, message);
      }
      void warn(const std::string& source, const std::string& message) {
        log(LogLevel::Warning, source, message);
      }
      void error(const std::string& source, const std::string& message) {
        log(LogLevel::Error, source, message);
      }

      /// Events overwritten because the queue was full.
      std::size_t dropped() const;

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      std::shared_ptr<LogSink> sink_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      LogLevel threshold_;
      std::thread worker_;
      std::mutex lifecycleMtx_;
      std::atomic<bool> running_{ false };
    };

  } // namespace core
} // namespace ivlab
