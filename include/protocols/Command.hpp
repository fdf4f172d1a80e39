#pragma once
/** @file  Command.hpp
 *  @brief Binary command frames understood by the 3-channel PZT controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// PZT headers
#include "protocols/Waveform.hpp"

namespace pzt {
  namespace protocols {

    /**
 * @struct Command
 * @brief One fire-and-forget wire frame: fixed header, channel byte, payload and
 *        a trailing XOR checksum over every preceding byte.
 *
 *  | frame          | len | header           | payload                      |
 *  |----------------|-----|------------------|------------------------------|
 *  | set voltage    | 11  | AA 01 0B 00 00   | 6-9 volts                    |
 *  | set bias/move  | 11  | AA 01 0B 01 00   | 6-9 bias                     |
 *  | waveform+freq  | 20  | AA 01 14 0F 00   | 6 code, 7-10 volts, 11-14 Hz |
 *
 *  Channel byte lives at offset 5 in all three.
 */
    struct Command {
      std::vector<std::uint8_t> bytes;

      const std::vector<std::uint8_t>& toWire() const { return bytes; }

      static Command setVoltage(std::uint8_t channel, double voltage);
      static Command setBias(std::uint8_t channel, double bias);
      static Command setWaveform(std::uint8_t channel, WaveformKind waveform, double voltage,
                                 double frequency);
    };

    inline constexpr std::size_t kShortFrameLength = 11;
    inline constexpr std::size_t kWaveformFrameLength = 20;
    inline constexpr std::size_t kChannelOffset = 5;
    inline constexpr std::uint8_t kChannelCount = 3;

    /// XOR-fold of \p len bytes starting at \p data.
    std::uint8_t xorChecksum(const std::uint8_t* data, std::size_t len);

    /// Lower-case hex dump ("aa010b...") for log lines.
    std::string toHex(const std::uint8_t* data, std::size_t len);
    inline std::string toHex(const std::vector<std::uint8_t>& v) { return toHex(v.data(), v.size()); }

  } // namespace protocols
} // namespace pzt
