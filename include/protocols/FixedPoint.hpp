#pragma once
/** @file  FixedPoint.hpp
 *  @brief 4-byte sign-magnitude fixed-point codec used by every PZT command.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace pzt {
  namespace protocols {

    /// Base for every error raised while building a wire frame.
    class ProtocolError : public std::runtime_error {
    public:
      explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
    };

    /// Value cannot be represented on the wire (NaN, inf, |v| >= 32768).
    class EncodingError : public ProtocolError {
    public:
      explicit EncodingError(const std::string& what) : ProtocolError(what) {}
    };

    using FixedPointBytes = std::array<std::uint8_t, 4>;

    /**
 * @brief Encode a physical quantity into the controller's fixed-point format.
 *
 *  * byte0 = integer / 256 (+0x80 when negative), byte1 = integer % 256
 *  * byte2/byte3 = round((fraction + 1e-5) * 10000) big-endian
 *  * Resolution is 1e-4 units.
 *
 * @throws EncodingError for non-finite values or an integer part above 32767.
 */
    FixedPointBytes encodeFixedPoint(double value);

    /// Inverse of encodeFixedPoint(), used for diagnostics and tests.
    double decodeFixedPoint(const FixedPointBytes& bytes);

    /// Largest integer part the two integer bytes can carry (sign bit excluded).
    inline constexpr std::uint32_t kMaxIntegerPart = 0x7FFF;

  } // namespace protocols
} // namespace pzt
