#pragma once
/** @file  ResultSink.hpp
 *  @brief Persistence collaborator invoked by the `data/save` action.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace ivlab {
  namespace io {

    struct SaveRequest {
      std::string folder{ "./data" };
      std::string filename{ "output" };
      std::string format{ "csv" }; ///< "csv" | "json"
      bool appendTimestamp{ false };
    };

    struct SaveReceipt {
      std::string path;
      std::size_t rows{ 0 };
    };

    /**
 * @class ResultSink
 * @brief Writes a table (JSON array of flat objects) somewhere durable.
 */
    class ResultSink {
    public:
      virtual ~ResultSink() = default;
      virtual SaveReceipt save(const SaveRequest& request, const nlohmann::json& rows) = 0;
    };

    /**
 * @class FileResultSink
 * @brief CSV (via CsvWriter) or pretty JSON under `request.folder`.
 *
 *  * Columns: set_value, voltage, current, timestamp first when present, then
 *    every other key in first-seen order.
 */
    class FileResultSink : public ResultSink {
    public:
      SaveReceipt save(const SaveRequest& request, const nlohmann::json& rows) override;

      static std::vector<std::string> columnsOf(const nlohmann::json& rows);
      static std::string cellText(const nlohmann::json& value);
    };

  } // namespace io
} // namespace ivlab
