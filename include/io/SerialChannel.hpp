#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking raw UART byte I/O wrapper (termios + poll under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace pzt {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Raw 8N1, no flow control, binary-safe (frames are not line based).
 *  * Writes loop until the whole buffer is out; reads are pure polling.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool writeBytes(const std::vector<std::uint8_t>& bytes); // returns false on EIO
      /// Whatever arrived within \p timeout; nullopt when nothing did or the port is gone.
      virtual std::optional<std::vector<std::uint8_t>> readAvailable(std::chrono::milliseconds timeout);
      virtual bool isOpen() const { return fd_ >= 0; }
      virtual void close();

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      int fd_{ -1 }; ///< POSIX fd (-1==closed)
    };
  } // namespace io
} // namespace pzt
