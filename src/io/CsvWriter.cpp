/* @file CsvWriter.cpp
 * @brief chunked fwrite CSV output.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <system_error>
#include <utility>

// ivlab headers
#include "io/CsvWriter.hpp"

using namespace ivlab::io;

CsvWriter::~CsvWriter() { close(); }

CsvWriter::CsvWriter(CsvWriter&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

CsvWriter& CsvWriter::operator=(CsvWriter&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool CsvWriter::open(const std::string& path, bool append) {
  close();
  const std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec)
      return false;
  }
  fp_ = std::fopen(path.c_str(), append ? "ab" : "wb");
  buffer_.reserve(kChunk);
  return fp_ != nullptr;
}

std::string CsvWriter::escape(const std::string& field) {
  if (field.find_first_of(",\"\n\r") == std::string::npos)
    return field;
  std::string out = "\"";
  for (char c : field) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}

void CsvWriter::writeRow(const std::vector<std::string>& fields) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i)
      line += ',';
    line += escape(fields[i]);
  }
  line += '\n';
  write(line);
}

void CsvWriter::write(const std::string& text) {
  buffer_.insert(buffer_.end(), text.begin(), text.end());
  if (buffer_.size() >= kChunk)
    flush();
}

bool CsvWriter::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    const std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (n != buffer_.size())
      return false;
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

bool CsvWriter::close() {
  if (!fp_)
    return true;
  bool ok = flush();
  ok = std::fclose(fp_) == 0 && ok;
  fp_ = nullptr;
  buffer_.clear();
  return ok;
}
