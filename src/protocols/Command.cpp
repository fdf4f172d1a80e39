/* @file Command.cpp
 * @brief frame builders for the voltage, move and waveform commands
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <utility>

// PZT headers
#include "protocols/Command.hpp"
#include "protocols/FixedPoint.hpp"

namespace pzt::protocols {

  namespace {

    constexpr std::array<std::uint8_t, 5> kVoltageHeader{ 0xAA, 0x01, 0x0B, 0x00, 0x00 };
    constexpr std::array<std::uint8_t, 5> kBiasHeader{ 0xAA, 0x01, 0x0B, 0x01, 0x00 };
    constexpr std::array<std::uint8_t, 5> kWaveformHeader{ 0xAA, 0x01, 0x14, 0x0F, 0x00 };

    std::uint8_t checkedChannel(std::uint8_t channel) {
      if (channel >= kChannelCount)
        throw ProtocolError("[Command] channel " + std::to_string(channel) + " out of range 0..2");
      return channel;
    }

    template <std::size_t N>
    std::vector<std::uint8_t> startFrame(const std::array<std::uint8_t, 5>& header,
                                         std::uint8_t channel) {
      std::vector<std::uint8_t> frame(N, 0x00);
      std::copy(header.begin(), header.end(), frame.begin());
      frame[kChannelOffset] = checkedChannel(channel);
      return frame;
    }

    void put(std::vector<std::uint8_t>& frame, std::size_t offset, const FixedPointBytes& v) {
      std::copy(v.begin(), v.end(), frame.begin() + static_cast<std::ptrdiff_t>(offset));
    }

    void seal(std::vector<std::uint8_t>& frame) {
      frame.back() = xorChecksum(frame.data(), frame.size() - 1);
    }

  } // namespace

  Command Command::setVoltage(std::uint8_t channel, double voltage) {
    auto frame = startFrame<kShortFrameLength>(kVoltageHeader, channel);
    put(frame, 6, encodeFixedPoint(voltage));
    seal(frame);
    return Command{ std::move(frame) };
  }

  Command Command::setBias(std::uint8_t channel, double bias) {
    auto frame = startFrame<kShortFrameLength>(kBiasHeader, channel);
    put(frame, 6, encodeFixedPoint(bias));
    seal(frame);
    return Command{ std::move(frame) };
  }

  Command Command::setWaveform(std::uint8_t channel, WaveformKind waveform, double voltage,
                               double frequency) {
    auto frame = startFrame<kWaveformFrameLength>(kWaveformHeader, channel);
    frame[6] = static_cast<std::uint8_t>(toWireCode(waveform));
    put(frame, 7, encodeFixedPoint(voltage));
    put(frame, 11, encodeFixedPoint(frequency));
    // bytes 15..18 reserved, left zero
    seal(frame);
    return Command{ std::move(frame) };
  }

  std::uint8_t xorChecksum(const std::uint8_t* data, std::size_t len) {
    std::uint8_t x = 0x00;
    for (std::size_t i = 0; i < len; ++i)
      x ^= data[i];
    return x;
  }

  std::string toHex(const std::uint8_t* data, std::size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
      out.push_back(kDigits[data[i] >> 4]);
      out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
  }

} // namespace pzt::protocols
