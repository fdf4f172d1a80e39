#pragma once
/** @file  Waveform.hpp
 *  @brief Drive waveform selection and its single-character wire code.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string_view>

namespace pzt {
  namespace protocols {

    enum class WaveformKind : std::uint8_t { Sine, Square, Triangle, Sawtooth, Count };
    static_assert(static_cast<std::uint8_t>(WaveformKind::Count) == 4,
                  "Waveform count changed please update the wire code table");

    /// ASCII code sent in byte 6 of the waveform+frequency frame.
    inline char toWireCode(WaveformKind w) {
      switch (w) {
      case WaveformKind::Square:
        return 'F';
      case WaveformKind::Triangle:
        return 'S';
      case WaveformKind::Sawtooth:
        return 'J';
      case WaveformKind::Sine:
      default:
        return 'Z';
      }
    }

    inline const char* toString(WaveformKind w) {
      switch (w) {
      case WaveformKind::Sine:
        return "Sine";
      case WaveformKind::Square:
        return "Square";
      case WaveformKind::Triangle:
        return "Triangle";
      case WaveformKind::Sawtooth:
        return "Sawtooth";
      default:
        return "Unknown";
      }
    }

    /**
     * @brief Map a configuration code ("Z", "f", ...) to a WaveformKind.
     *
     * Case-insensitive, exactly one character. Anything else falls back
     * to Sine and print a warning; they are never rejected.
     */
    WaveformKind parseWaveform(std::string_view code);

  } // namespace protocols
} // namespace pzt
