/* @file Response.cpp
 * @brief numeric decoding of instrument replies.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

// ivlab headers
#include "core/Errors.hpp"
#include "io/Response.hpp"

using namespace ivlab::io;

namespace {
  constexpr double kOverflowSentinel = 9.9e37;

  double parseReading(const std::string& raw) {
    std::size_t b = raw.find_first_not_of(" \t");
    std::size_t e = raw.find_last_not_of(" \t");
    if (b == std::string::npos)
      throw ivlab::core::DeviceFault("[Response] empty reading");
    const std::string token = raw.substr(b, e - b + 1);

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(token.c_str(), &end);
    if (errno != 0 || end != token.c_str() + token.size() || !std::isfinite(v))
      throw ivlab::core::DeviceFault("[Response] unparseable reading: '" + token + "'");
    if (std::abs(v) >= kOverflowSentinel)
      throw ivlab::core::DeviceFault("[Response] instrument overload reading: " + token);
    return v;
  }
} // namespace

std::optional<Response> Response::fromWire(const std::string& line) {
  std::size_t b = line.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return std::nullopt;
  std::size_t e = line.find_last_not_of(" \t\r\n");
  Response r;
  r.payload = line.substr(b, e - b + 1);
  r.receivedAt = std::chrono::system_clock::now();
  return r;
}

double Response::asDouble() const { return parseReading(payload); }

std::vector<double> Response::asDoubles() const {
  std::vector<double> out;
  std::stringstream ss(payload);
  std::string field;
  while (std::getline(ss, field, ','))
    out.push_back(parseReading(field));
  if (out.empty())
    throw ivlab::core::DeviceFault("[Response] empty reading");
  return out;
}
