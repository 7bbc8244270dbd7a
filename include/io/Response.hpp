#pragma once
/** @file  Response.hpp
 *  @brief One inbound instrument line plus the time it arrived.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ivlab {
  namespace io {
    struct Response {
      std::string payload;
      std::chrono::system_clock::time_point receivedAt{};

      /// Strips CR/LF and surrounding blanks; nullopt for an empty line.
      static std::optional<Response> fromWire(const std::string& line);

      /// Parses a single numeric reading. Throws core::DeviceFault on garbage
      /// or on the 9.9e37 overflow sentinel instruments report in compliance.
      double asDouble() const;

      /// Comma separated numeric readings (e.g. `:READ?` → "v,i").
      std::vector<double> asDoubles() const;
    };
  } // namespace io
} // namespace ivlab
