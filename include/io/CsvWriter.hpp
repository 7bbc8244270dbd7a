#pragma once
/** @file  CsvWriter.hpp
 *  @brief Buffered CSV writer for result tables and log files.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace ivlab {
  namespace io {

    /**
 * @class CsvWriter
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for sweep tables and run logs (10 kB – 1 MB).
 *  * Uses `std::fwrite` in 4 kB chunks.
 */
    class CsvWriter {
    public:
      CsvWriter() = default;
      ~CsvWriter(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. Creates parent dirs. */
      bool open(const std::string& path, bool append = false);

      /** Queues one CSV row; fields are quoted when they need it. */
      void writeRow(const std::vector<std::string>& fields);

      /** Queues raw text (caller includes trailing '\n'). */
      void write(const std::string& text);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      /** Flush + fclose; false if buffered data could not be written. */
      bool close();

      bool isOpen() const { return fp_ != nullptr; }

      static std::string escape(const std::string& field);

      //---non-copyable, move-enabled---------------------------------------
      CsvWriter(const CsvWriter&) = delete;
      CsvWriter& operator=(const CsvWriter&) = delete;
      CsvWriter(CsvWriter&& other) noexcept;
      CsvWriter& operator=(CsvWriter&& other) noexcept;

    private:
      static constexpr std::size_t kChunk = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace ivlab
