/* @file ResultSink.cpp
 * @brief file-backed result tables.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <vector>

// ivlab headers
#include "core/Errors.hpp"
#include "io/CsvWriter.hpp"
#include "io/ResultSink.hpp"

using namespace ivlab::io;

namespace {
  constexpr std::array<const char*, 4> kLeadingColumns{ "set_value", "voltage", "current", "timestamp" };

  std::string stamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
    return buf;
  }
} // namespace

std::vector<std::string> FileResultSink::columnsOf(const nlohmann::json& rows) {
  std::vector<std::string> seen;
  for (const auto& row : rows) {
    if (!row.is_object())
      continue;
    for (auto it = row.begin(); it != row.end(); ++it) {
      if (std::find(seen.begin(), seen.end(), it.key()) == seen.end())
        seen.push_back(it.key());
    }
  }

  std::vector<std::string> columns;
  for (const char* lead : kLeadingColumns) {
    auto it = std::find(seen.begin(), seen.end(), lead);
    if (it != seen.end()) {
      columns.push_back(*it);
      seen.erase(it);
    }
  }
  columns.insert(columns.end(), seen.begin(), seen.end());
  return columns;
}

std::string FileResultSink::cellText(const nlohmann::json& value) {
  if (value.is_null())
    return "";
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number_float()) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.10g", value.get<double>());
    return buf;
  }
  return value.dump();
}

SaveReceipt FileResultSink::save(const SaveRequest& request, const nlohmann::json& rows) {
  if (!rows.is_array() || rows.empty())
    throw ivlab::core::ValidationError("[ResultSink] no data to save");
  if (request.format != "csv" && request.format != "json")
    throw ivlab::core::ValidationError("[ResultSink] unknown format: " + request.format);

  std::string base = request.filename.empty() ? "output" : request.filename;
  const std::string ext = "." + request.format;
  if (base.size() > ext.size() && base.compare(base.size() - ext.size(), ext.size(), ext) == 0)
    base.erase(base.size() - ext.size());
  if (request.appendTimestamp)
    base += "_" + stamp();

  const auto path = (std::filesystem::path(request.folder) / (base + ext)).string();

  if (request.format == "json") {
    std::filesystem::create_directories(std::filesystem::path(request.folder));
    std::ofstream out(path, std::ios::trunc);
    if (!out)
      throw std::runtime_error("[ResultSink] cannot open " + path);
    out << rows.dump(2) << '\n';
    if (!out)
      throw std::runtime_error("[ResultSink] write failed: " + path);
    return SaveReceipt{ path, rows.size() };
  }

  CsvWriter csv;
  if (!csv.open(path))
    throw std::runtime_error("[ResultSink] cannot open " + path);

  const auto columns = columnsOf(rows);
  csv.writeRow(columns);
  for (const auto& row : rows) {
    std::vector<std::string> cells;
    cells.reserve(columns.size());
    for (const auto& col : columns)
      cells.push_back(row.is_object() && row.contains(col) ? cellText(row.at(col)) : std::string{});
    csv.writeRow(cells);
  }
  if (!csv.close())
    throw std::runtime_error("[ResultSink] write failed: " + path);
  return SaveReceipt{ path, rows.size() };
}
