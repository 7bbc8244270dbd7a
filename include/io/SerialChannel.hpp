#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART line I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <utility>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace ivlab {
  namespace io {

    /// Maps a numeric baud rate to its termios constant; nullopt if unsupported.
    std::optional<speed_t> toSpeed(int baud);

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Frames I/O as ASCII lines; the terminator is `\n` for SCPI and the relay
 *    boards, a trailing `\r` on inbound lines is dropped.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      explicit SerialChannel(std::string terminator = "\n") : terminator_(std::move(terminator)) {}
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeLine(const std::string& line); // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
      virtual void discardInput(); ///< drop stale bytes (kernel queue + rx buffer)
      virtual bool isOpen() const { return fd_ >= 0; }
      virtual void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&&) = default;
      SerialChannel& operator=(SerialChannel&&) = default;

    private:
      std::optional<std::string> takeLine();

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      std::string terminator_;
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };
  } // namespace io
} // namespace ivlab
