/* @file CsvLogSink.cpp
 * @brief csv rows for drained log events.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <filesystem>
#include <stdexcept>

#include "io/CsvLogSink.hpp"

using namespace ivlab::io;

CsvLogSink::CsvLogSink(const std::string& path) {
  const bool fresh = !std::filesystem::exists(path);
  if (!csv_.open(path, /*append=*/true))
    throw std::runtime_error("[CsvLogSink] cannot open log file: " + path);
  if (fresh)
    csv_.writeRow({ "timestamp", "level", "source", "message", "fields" });
}

void CsvLogSink::write(const core::LogEvent& event) {
  csv_.writeRow({ core::formatTimestamp(event.timestamp), core::toString(event.level), event.source,
                  event.message, event.fields.empty() ? std::string{} : event.fields.dump() });
}

void CsvLogSink::flush() {
  if (!csv_.flush())
    throw std::runtime_error("[CsvLogSink] flush failed");
}
