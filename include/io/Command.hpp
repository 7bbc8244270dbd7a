#pragma once
/** @file  Command.hpp
 *  @brief One outbound instrument line (SCPI or relay-board numeric command).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

namespace ivlab {
  namespace io {
    struct Command {
      std::string payload;
      std::string terminator{ "\n" };
      std::string toWire() const { return payload + terminator; }
    };

  } // namespace io
} // namespace ivlab
