/* @file Waveform.cpp
 * @brief lenient waveform-code parser
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <iostream>
#include <string>

// PZT headers
#include "protocols/Waveform.hpp"

namespace pzt::protocols {

  WaveformKind parseWaveform(std::string_view code) {
    if (code.size() == 1) {
      switch (std::toupper(static_cast<unsigned char>(code.front()))) {
      case 'Z':
        return WaveformKind::Sine;
      case 'F':
        return WaveformKind::Square;
      case 'S':
        return WaveformKind::Triangle;
      case 'J':
        return WaveformKind::Sawtooth;
      default:
        break;
      }
    }
    std::cerr << "[Waveform] invalid waveform '" << std::string(code)
              << "', defaulting to 'Z' (sine)\n";
    return WaveformKind::Sine;
  }

} // namespace pzt::protocols
