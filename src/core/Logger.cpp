/* @file Logger.cpp
 * @brief ring-buffered event logger; one worker thread owns the sink.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

// ivlab headers
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

namespace ivlab {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARNING";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    LogLevel logLevelFromString(const std::string& text) {
      if (text == "debug")
        return LogLevel::Debug;
      if (text == "info")
        return LogLevel::Info;
      if (text == "warning" || text == "warn")
        return LogLevel::Warning;
      if (text == "error")
        return LogLevel::Error;
      throw ValidationError("[Logger] unknown log level: " + text);
    }

    std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
      const auto secs = std::chrono::system_clock::to_time_t(tp);
      const auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
      std::tm utc{};
      gmtime_r(&secs, &utc);
      char date[32];
      std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
      char out[48];
      std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(ms < 0 ? ms + 1000 : ms));
      return out;
    }

    void StreamLogSink::write(const LogEvent& event) {
      os_ << formatTimestamp(event.timestamp) << " - " << event.source << " - "
          << toString(event.level) << " - " << event.message;
      if (!event.fields.empty())
        os_ << ' ' << event.fields.dump();
      os_ << '\n';
    }

    void TeeLogSink::write(const LogEvent& event) {
      if (a_)
        a_->write(event);
      if (b_)
        b_->write(event);
    }

    void TeeLogSink::flush() {
      if (a_)
        a_->flush();
      if (b_)
        b_->flush();
    }

    Logger::Logger(std::shared_ptr<LogSink> sink, std::size_t capacity, LogLevel threshold)
        : sink_(std::move(sink)), buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)),
          threshold_(threshold) {
      if (!sink_)
        throw std::invalid_argument("[Logger] sink is nullptr");
    }

    Logger::~Logger() { stop(); }

    void Logger::start() {
      std::lock_guard<std::mutex> lock(lifecycleMtx_);
      if (running_)
        return;
      buffer_->reopen();
      running_ = true;
      worker_ = std::thread([this] { drain(); });
    }

    void Logger::log(LogLevel level, const std::string& source, const std::string& message,
                     nlohmann::json fields) {
      if (static_cast<int>(level) < static_cast<int>(threshold_))
        return;
      LogEvent ev;
      ev.timestamp = std::chrono::system_clock::now();
      ev.level = level;
      ev.source = source;
      ev.message = message;
      ev.fields = std::move(fields);
      buffer_->push(std::move(ev));
    }

    void Logger::stop() {
      std::lock_guard<std::mutex> lock(lifecycleMtx_);
      if (!running_) {
        return;
      }
      running_ = false;
      buffer_->close();
      if (worker_.joinable())
        worker_.join();
    }

    std::size_t Logger::dropped() const { return buffer_->dropped(); }

    void Logger::drain() {
      auto emit = [this](const LogEvent& ev) {
        try {
          sink_->write(ev);
        } catch (const std::exception& e) {
          std::cerr << "[Logger] sink write failed: " << e.what() << '\n';
        }
      };

      while (running_) {
        if (auto ev = buffer_->popWait(std::chrono::milliseconds{ 100 }))
          emit(*ev);
      }
      // shutdown: whatever is still queued goes out before the join returns
      while (auto ev = buffer_->tryPop())
        emit(*ev);

      try {
        sink_->flush();
      } catch (const std::exception& e) {
        std::cerr << "[Logger] sink flush failed: " << e.what() << '\n';
      }
    }

  } // namespace core
} // namespace ivlab
