#pragma once
/** @file  CsvLogSink.hpp
 *  @brief Logger sink appending `timestamp,level,source,message,fields` rows.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/Logger.hpp"
#include "io/CsvWriter.hpp"

namespace ivlab {
  namespace io {

    class CsvLogSink : public core::LogSink {
    public:
      /// Throws std::runtime_error if \p path cannot be opened for append.
      explicit CsvLogSink(const std::string& path);

      void write(const core::LogEvent& event) override;
      void flush() override;

    private:
      CsvWriter csv_;
    };

  } // namespace io
} // namespace ivlab
