/* @file FixedPoint.cpp
 * @brief sign-magnitude fixed-point encoder / decoder
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>

// PZT headers
#include "protocols/FixedPoint.hpp"

namespace pzt::protocols {

  namespace {
    constexpr double kFractionScale = 10000.0;
    constexpr double kTruncationEpsilon = 1e-5; // keeps 10.001 from landing on 10.0009
    constexpr std::uint8_t kSignBit = 0x80;
  } // namespace

  FixedPointBytes encodeFixedPoint(double value) {
    if (!std::isfinite(value))
      throw EncodingError("[FixedPoint] cannot encode non-finite value");

    const bool negative = value < 0.0;
    const double magnitude = std::fabs(value);
    const double whole = std::floor(magnitude);

    if (whole > static_cast<double>(kMaxIntegerPart))
      throw EncodingError("[FixedPoint] value " + std::to_string(value) +
                          " exceeds the +/-32767.9999 wire range");

    const auto integerPart = static_cast<std::uint32_t>(whole);
    const auto fractionalPart = static_cast<std::uint32_t>(
        std::round((magnitude - whole + kTruncationEpsilon) * kFractionScale));

    FixedPointBytes out{};
    out[0] = static_cast<std::uint8_t>(integerPart / 256);
    if (negative)
      out[0] = static_cast<std::uint8_t>(out[0] + kSignBit);
    out[1] = static_cast<std::uint8_t>(integerPart % 256);
    out[2] = static_cast<std::uint8_t>(fractionalPart / 256);
    out[3] = static_cast<std::uint8_t>(fractionalPart % 256);
    return out;
  }

  double decodeFixedPoint(const FixedPointBytes& bytes) {
    const bool negative = (bytes[0] & kSignBit) != 0;
    const unsigned integerPart = (static_cast<unsigned>(bytes[0] & 0x7F) << 8) | bytes[1];
    const unsigned fractionalPart = (static_cast<unsigned>(bytes[2]) << 8) | bytes[3];

    const double magnitude = integerPart + fractionalPart / kFractionScale;
    return negative ? -magnitude : magnitude;
  }

} // namespace pzt::protocols
